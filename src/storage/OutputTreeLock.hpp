#pragma once

#include <filesystem>

namespace AisLake
{

    // ============================================================================
    // OutputTreeLock: one pipeline instance per output tree
    // ============================================================================
    // Merge-on-write is read-modify-write on each artifact. Two processes
    // merging into the same hour would each read the old file and the last
    // rename would silently discard the other's rows. Inside one process the
    // scheduler runs at most one task per key; across processes this lock
    // makes the "one owner" precondition an enforced fact.
    //
    // flock(LOCK_EX | LOCK_NB) on <root>/.aislake.lock. The kernel drops the
    // lock when the fd closes, including when the process crashes, so a stale
    // lock file never blocks the next run.
    // ============================================================================
    class OutputTreeLock
    {
    public:
        static constexpr const char *kLockFileName = ".aislake.lock";

        // Creates the output root if needed. Throws OutputTreeBusy if another
        // process holds the lock, ArtifactWriteError if the lock file cannot
        // be created.
        explicit OutputTreeLock(const std::filesystem::path &output_root);
        ~OutputTreeLock();

        OutputTreeLock(const OutputTreeLock &) = delete;
        OutputTreeLock &operator=(const OutputTreeLock &) = delete;

        const std::filesystem::path &lock_path() const { return lock_path_; }

    private:
        std::filesystem::path lock_path_;
        int fd_ = -1;
    };

} // namespace AisLake
