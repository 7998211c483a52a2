#pragma once

// Shared fixtures for the AisLake test suite.

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <arrow/filesystem/subtree.h>

#include "model/AisRecord.hpp"

namespace AisLake::Testing
{

    inline constexpr const char *kCsvHeader =
        "MMSI,BaseDateTime,LAT,LON,SOG,COG,Heading,VesselName,IMO,CallSign,"
        "VesselType,Status,Length,Width,Draft,Cargo,TransceiverClass";

    // Unique directory under the system temp dir, removed recursively on
    // destruction.
    class ScopedTempDir
    {
    public:
        ScopedTempDir();
        ~ScopedTempDir();

        ScopedTempDir(const ScopedTempDir &) = delete;
        ScopedTempDir &operator=(const ScopedTempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }
        std::filesystem::path operator/(const std::filesystem::path &p) const { return path_ / p; }

    private:
        std::filesystem::path path_;
    };

    void write_text_file(const std::filesystem::path &path, const std::string &content);
    std::string read_text_file(const std::filesystem::path &path);

    // One CSV data line in NOAA layout with plausible values.
    std::string csv_line(const std::string &mmsi, const std::string &timestamp,
                         const std::string &vessel_name = "TEST VESSEL");

    // Header + lines, '\n' terminated.
    std::string csv_document(const std::vector<std::string> &lines);

    // A fully populated record; 'epoch_s' is whole UTC seconds.
    AisRecord make_record(const std::string &mmsi, long long epoch_s);

    // MMSI of every record, in order.
    std::vector<std::string> mmsis(const std::vector<AisRecord> &rows);

    // ------------------------------------------------------------------------
    // FlakyRemoteFs: object store stand-in rooted in a local directory
    // ------------------------------------------------------------------------
    // Paths are "bucket/key" relative to the root, like on S3. Parent
    // directories are created on write, as an object store would not need
    // them. Faults can be switched on per operation.
    // ------------------------------------------------------------------------
    class FlakyRemoteFs : public arrow::fs::SubTreeFileSystem
    {
    public:
        enum class ProbeFault
        {
            None,
            Error,     // GetFileInfo returns an IOError
            Missing,   // GetFileInfo says NotFound
            WrongSize  // GetFileInfo reports one byte more than stored
        };

        explicit FlakyRemoteFs(const std::filesystem::path &root);

        using arrow::fs::SubTreeFileSystem::GetFileInfo;
        arrow::Result<arrow::fs::FileInfo> GetFileInfo(const std::string &path) override;

        using arrow::fs::SubTreeFileSystem::OpenOutputStream;
        arrow::Result<std::shared_ptr<arrow::io::OutputStream>> OpenOutputStream(
            const std::string &path,
            const std::shared_ptr<const arrow::KeyValueMetadata> &metadata) override;

        std::atomic<bool> fail_put{false};
        std::atomic<ProbeFault> probe_fault{ProbeFault::None};
        std::atomic<int> puts{0};
    };

} // namespace AisLake::Testing
