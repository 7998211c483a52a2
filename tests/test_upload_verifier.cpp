#include <gtest/gtest.h>
#include <memory>
#include <string>

#include "TestSupport.hpp"
#include "model/PipelineErrors.hpp"
#include "storage/UploadVerifier.hpp"

using namespace AisLake;
using namespace AisLake::Testing;

class UploadVerifierTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        std::filesystem::create_directories(remote_dir_.path() / "bucket");
        remote_ = std::make_shared<FlakyRemoteFs>(remote_dir_.path());
        verifier_ = std::make_unique<UploadVerifier>(remote_, "bucket", local_.path());
    }

    std::filesystem::path artifact(const std::string &content = "parquet bytes")
    {
        auto path = local_ / "year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet";
        write_text_file(path, content);
        return path;
    }

    std::filesystem::path remote_copy() const
    {
        return remote_dir_ / "bucket/year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet";
    }

    ScopedTempDir local_;
    ScopedTempDir remote_dir_;
    std::shared_ptr<FlakyRemoteFs> remote_;
    std::unique_ptr<UploadVerifier> verifier_;
};

TEST_F(UploadVerifierTest, ObjectKeyIsPathUnderOutputRoot)
{
    const auto path = local_ / "year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet";
    EXPECT_EQ(verifier_->object_key(path), "year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet");
    EXPECT_EQ(verifier_->remote_path(path),
              "bucket/year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet");
    EXPECT_THROW((void)verifier_->object_key(remote_dir_ / "elsewhere.parquet"), UploadError);
}

TEST_F(UploadVerifierTest, RejectsMissingRemoteOrBucket)
{
    EXPECT_THROW(UploadVerifier(nullptr, "bucket", local_.path()), ConfigError);
    EXPECT_THROW(UploadVerifier(remote_, "", local_.path()), ConfigError);
}

TEST_F(UploadVerifierTest, VerifiedUploadDeletesLocalCopy)
{
    const auto path = artifact("0123456789");

    const auto result = verifier_->upload(path);
    EXPECT_EQ(result.bytes, 10);
    EXPECT_TRUE(result.local_deleted);
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_EQ(read_text_file(remote_copy()), "0123456789");
}

TEST_F(UploadVerifierTest, FailedProbeKeepsLocalCopy)
{
    const auto path = artifact();
    remote_->probe_fault = FlakyRemoteFs::ProbeFault::Error;

    EXPECT_THROW((void)verifier_->upload(path), VerificationError);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(UploadVerifierTest, ProbeNotFindingObjectKeepsLocalCopy)
{
    const auto path = artifact();
    remote_->probe_fault = FlakyRemoteFs::ProbeFault::Missing;

    EXPECT_THROW((void)verifier_->upload(path), VerificationError);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(UploadVerifierTest, SizeMismatchKeepsLocalCopy)
{
    const auto path = artifact();
    remote_->probe_fault = FlakyRemoteFs::ProbeFault::WrongSize;

    EXPECT_THROW((void)verifier_->upload(path), VerificationError);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(UploadVerifierTest, FailedPutKeepsLocalCopy)
{
    const auto path = artifact();
    remote_->fail_put = true;

    EXPECT_THROW((void)verifier_->upload(path), UploadError);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(remote_copy()));
}

TEST_F(UploadVerifierTest, RestoreWithoutRemoteObjectReturnsFalse)
{
    const auto path = local_ / "year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet";
    EXPECT_FALSE(verifier_->restore(path));
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(UploadVerifierTest, RestoreBringsBackUploadedArtifact)
{
    const auto path = artifact("remote rows");
    ASSERT_TRUE(verifier_->upload(path).local_deleted);

    EXPECT_TRUE(verifier_->restore(path));
    EXPECT_EQ(read_text_file(path), "remote rows");

    std::filesystem::path tmp = path;
    tmp += ".download";
    EXPECT_FALSE(std::filesystem::exists(tmp));
}

TEST_F(UploadVerifierTest, RestoreFailsWhenStoreCannotBeQueried)
{
    const auto path = local_ / "year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet";
    remote_->probe_fault = FlakyRemoteFs::ProbeFault::Error;

    EXPECT_THROW((void)verifier_->restore(path), UploadError);
    EXPECT_FALSE(std::filesystem::exists(path));
}
