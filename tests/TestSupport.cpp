#include "TestSupport.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <arrow/filesystem/localfs.h>
#include <arrow/io/interfaces.h>
#include <arrow/status.h>

namespace AisLake::Testing
{

    ScopedTempDir::ScopedTempDir()
    {
        std::random_device rd;
        std::mt19937_64 rng(rd());
        const auto base = std::filesystem::temp_directory_path();
        for (int attempt = 0; attempt < 100; ++attempt)
        {
            auto candidate = base / ("aislake_test_" + std::to_string(rng()));
            if (std::filesystem::create_directory(candidate))
            {
                path_ = candidate;
                return;
            }
        }
        throw std::runtime_error("cannot create a temporary directory under " + base.string());
    }

    ScopedTempDir::~ScopedTempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    void write_text_file(const std::filesystem::path &path, const std::string &content)
    {
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        if (!out)
            throw std::runtime_error("cannot write " + path.string());
        out << content;
    }

    std::string read_text_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw std::runtime_error("cannot read " + path.string());
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    std::string csv_line(const std::string &mmsi, const std::string &timestamp,
                         const std::string &vessel_name)
    {
        return mmsi + "," + timestamp + ",29.75,-95.36,10.2,180.5,179," + vessel_name +
               ",IMO9000001,WDC1234,70,0,120.0,20.0,5.5,70,A";
    }

    std::string csv_document(const std::vector<std::string> &lines)
    {
        std::string doc = std::string(kCsvHeader) + "\n";
        for (const auto &line : lines)
            doc += line + "\n";
        return doc;
    }

    AisRecord make_record(const std::string &mmsi, long long epoch_s)
    {
        AisRecord r;
        r.mmsi = mmsi;
        r.base_date_time = epoch_s * 1'000'000'000LL;
        r.lat = 29.75;
        r.lon = -95.36;
        r.sog = 10.2;
        r.cog = 180.5;
        r.heading = 179.0;
        r.vessel_name = "TEST VESSEL";
        r.imo = "IMO9000001";
        r.call_sign = "WDC1234";
        r.vessel_type = 70;
        r.status = 0;
        r.length = 120.0;
        r.width = 20.0;
        r.draft = 5.5;
        r.cargo = "70";
        r.transceiver_class = "A";
        return r;
    }

    std::vector<std::string> mmsis(const std::vector<AisRecord> &rows)
    {
        std::vector<std::string> out;
        out.reserve(rows.size());
        for (const auto &r : rows)
            out.push_back(r.mmsi);
        return out;
    }

    FlakyRemoteFs::FlakyRemoteFs(const std::filesystem::path &root)
        : arrow::fs::SubTreeFileSystem(std::filesystem::absolute(root).generic_string(),
                                       std::make_shared<arrow::fs::LocalFileSystem>())
    {
    }

    arrow::Result<arrow::fs::FileInfo> FlakyRemoteFs::GetFileInfo(const std::string &path)
    {
        switch (probe_fault.load())
        {
        case ProbeFault::Error:
            return arrow::Status::IOError("injected probe failure for ", path);
        case ProbeFault::Missing:
            return arrow::fs::FileInfo(path, arrow::fs::FileType::NotFound);
        case ProbeFault::WrongSize:
        {
            ARROW_ASSIGN_OR_RAISE(auto info, arrow::fs::SubTreeFileSystem::GetFileInfo(path));
            if (info.IsFile())
                info.set_size(info.size() + 1);
            return info;
        }
        case ProbeFault::None:
            break;
        }
        return arrow::fs::SubTreeFileSystem::GetFileInfo(path);
    }

    arrow::Result<std::shared_ptr<arrow::io::OutputStream>> FlakyRemoteFs::OpenOutputStream(
        const std::string &path,
        const std::shared_ptr<const arrow::KeyValueMetadata> &metadata)
    {
        ++puts;
        if (fail_put.load())
            return arrow::Status::IOError("injected put failure for ", path);

        const auto slash = path.rfind('/');
        if (slash != std::string::npos)
            ARROW_RETURN_NOT_OK(CreateDir(path.substr(0, slash), /*recursive=*/true));
        return arrow::fs::SubTreeFileSystem::OpenOutputStream(path, metadata);
    }

} // namespace AisLake::Testing
