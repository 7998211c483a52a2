#include "OutputTreeLock.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "../logging/Logger.hpp"
#include "../model/PipelineErrors.hpp"

namespace AisLake
{

    // =========================================================================
    // OutputTreeLock()
    // =========================================================================
    // WHY flock() AND NOT A PID FILE?
    // A PID file outlives a crashed run and needs stale-lock cleanup. An
    // flock is tied to the open file description: when the process exits,
    // however it exits, the kernel releases it. LOCK_NB makes a second run
    // fail at once instead of queueing behind the first.
    // =========================================================================
    OutputTreeLock::OutputTreeLock(const std::filesystem::path &output_root)
        : lock_path_(output_root / kLockFileName)
    {
        std::error_code ec;
        std::filesystem::create_directories(output_root, ec);
        if (ec)
        {
            throw ArtifactWriteError("[LOCK ERROR] Cannot create output root " +
                                     output_root.string() + ": " + ec.message());
        }

        fd_ = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0)
        {
            throw ArtifactWriteError("[LOCK ERROR] Cannot open " + lock_path_.string() +
                                     ": " + std::strerror(errno));
        }

        if (::flock(fd_, LOCK_EX | LOCK_NB) != 0)
        {
            const int err = errno;
            ::close(fd_);
            fd_ = -1;
            if (err == EWOULDBLOCK)
            {
                throw OutputTreeBusy("[LOCK ERROR] " + output_root.string() +
                                     " is in use by another ingest process");
            }
            throw ArtifactWriteError("[LOCK ERROR] flock " + lock_path_.string() +
                                     ": " + std::strerror(err));
        }

        log_debug("LOCK") << "Acquired " << lock_path_;
    }

    OutputTreeLock::~OutputTreeLock()
    {
        if (fd_ < 0)
            return;
        // Closing the descriptor releases the flock.
        if (::close(fd_) != 0)
            log_warn("LOCK") << "close " << lock_path_ << ": " << std::strerror(errno);
    }

} // namespace AisLake
