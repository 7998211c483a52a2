#include <gtest/gtest.h>
#include <memory>

#include "TestSupport.hpp"
#include "model/PipelineErrors.hpp"
#include "storage/OutputTreeLock.hpp"

using namespace AisLake;
using namespace AisLake::Testing;

TEST(OutputTreeLockTest, CreatesRootAndLockFile)
{
    ScopedTempDir dir;
    const auto root = dir / "lake";

    OutputTreeLock lock(root);
    EXPECT_TRUE(std::filesystem::is_directory(root));
    EXPECT_TRUE(std::filesystem::exists(root / OutputTreeLock::kLockFileName));
    EXPECT_EQ(lock.lock_path().filename().string(), ".aislake.lock");
}

TEST(OutputTreeLockTest, SecondHolderIsRefused)
{
    ScopedTempDir dir;
    OutputTreeLock first(dir.path());
    EXPECT_THROW(OutputTreeLock second(dir.path()), OutputTreeBusy);
}

TEST(OutputTreeLockTest, ReleasedOnDestruction)
{
    ScopedTempDir dir;
    {
        OutputTreeLock first(dir.path());
    }
    // The lock file stays; only the flock is released.
    EXPECT_NO_THROW(OutputTreeLock again(dir.path()));
}

TEST(OutputTreeLockTest, DifferentTreesDoNotConflict)
{
    ScopedTempDir a;
    ScopedTempDir b;
    OutputTreeLock lock_a(a.path());
    EXPECT_NO_THROW(OutputTreeLock lock_b(b.path()));
}

TEST(OutputTreeLockTest, UncreatableRootIsWriteError)
{
    ScopedTempDir dir;
    write_text_file(dir / "file", "x");
    EXPECT_THROW(OutputTreeLock lock(dir / "file" / "lake"), ArtifactWriteError);
}
