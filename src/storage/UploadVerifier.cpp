#include "UploadVerifier.hpp"

#include <system_error>

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/api.h>

#include "../logging/Logger.hpp"
#include "../model/PipelineErrors.hpp"
#include "../output/ArrowCheck.hpp"

#define UPLOAD_CHECK(expr) AISLAKE_THROW_IF_NOT_OK(expr, UploadError, "[UPLOAD ERROR]")

namespace AisLake
{

    namespace
    {
        // An output stream that is destroyed without Close() would, on S3,
        // complete the multipart upload with whatever was sent so far.
        // This guard aborts it instead unless release() was reached.
        class AbortOnExit
        {
        public:
            explicit AbortOnExit(std::shared_ptr<arrow::io::OutputStream> stream)
                : stream_(std::move(stream))
            {
            }

            ~AbortOnExit()
            {
                if (!stream_ || stream_->closed())
                    return;
                auto status = stream_->Abort();
                if (!status.ok())
                    log_warn("UPLOAD") << "Abort of partial transfer failed: " << status.ToString();
            }

            void release() { stream_.reset(); }

            AbortOnExit(const AbortOnExit &) = delete;
            AbortOnExit &operator=(const AbortOnExit &) = delete;

        private:
            std::shared_ptr<arrow::io::OutputStream> stream_;
        };

        int64_t copy_stream(arrow::io::InputStream &in, arrow::io::OutputStream &out)
        {
            int64_t total = 0;
            while (true)
            {
                auto chunk = value_or_throw<UploadError>(
                    in.Read(UploadVerifier::kTransferChunk), "[UPLOAD ERROR] Read failed");
                if (chunk->size() == 0)
                    break;
                UPLOAD_CHECK(out.Write(chunk));
                total += chunk->size();
            }
            return total;
        }

        std::filesystem::path normalized(const std::filesystem::path &p)
        {
            return std::filesystem::absolute(p).lexically_normal();
        }
    } // namespace

    UploadVerifier::UploadVerifier(std::shared_ptr<arrow::fs::FileSystem> remote,
                                   std::string bucket,
                                   std::filesystem::path output_root)
        : remote_(std::move(remote)),
          bucket_(std::move(bucket)),
          output_root_(normalized(output_root))
    {
        if (!remote_)
            throw ConfigError("[UPLOAD ERROR] No remote filesystem given");
        while (!bucket_.empty() && bucket_.back() == '/')
            bucket_.pop_back();
        if (bucket_.empty())
            throw ConfigError("[UPLOAD ERROR] Bucket name is empty");
    }

    std::string UploadVerifier::object_key(const std::filesystem::path &artifact) const
    {
        const auto relative = normalized(artifact).lexically_relative(output_root_);
        if (relative.empty() || *relative.begin() == "..")
        {
            throw UploadError("[UPLOAD ERROR] " + artifact.string() +
                              " is not under the output root " + output_root_.string());
        }
        return relative.generic_string();
    }

    std::string UploadVerifier::remote_path(const std::filesystem::path &artifact) const
    {
        return bucket_ + "/" + object_key(artifact);
    }

    // =========================================================================
    // upload()
    // =========================================================================
    //   local file ──copy──► <bucket>/<key> ──GetFileInfo──► size matches?
    //                                                          │
    //                                     yes: delete local ◄──┤
    //                                     no:  keep local, throw
    //
    // WHY PROBE AFTER THE PUT?
    // A successful close() on an S3 output stream means the multipart upload
    // was accepted, not that a later HEAD sees an object of the right size.
    // The local file is the only other copy of the hour, so it is removed
    // only once the store answers with the expected size.
    // =========================================================================
    UploadResult UploadVerifier::upload(const std::filesystem::path &artifact) const
    {
        UploadResult result;
        result.remote_path = remote_path(artifact);

        std::error_code ec;
        const auto local_size = std::filesystem::file_size(artifact, ec);
        if (ec)
            throw UploadError("[UPLOAD ERROR] Cannot stat " + artifact.string() + ": " + ec.message());

        log_info("UPLOAD") << "Uploading " << artifact.filename() << " to " << result.remote_path;

        // ------------------------------------------------------------------
        // STEP 1: put
        // ------------------------------------------------------------------
        {
            auto in = value_or_throw<UploadError>(
                arrow::io::ReadableFile::Open(artifact.string()),
                "[UPLOAD ERROR] Cannot open " + artifact.string());
            auto out = value_or_throw<UploadError>(
                remote_->OpenOutputStream(result.remote_path),
                "[UPLOAD ERROR] Cannot open " + result.remote_path);

            AbortOnExit abort_guard(out);
            result.bytes = copy_stream(*in, *out);
            UPLOAD_CHECK(out->Close());
            abort_guard.release();
            UPLOAD_CHECK(in->Close());
        }
        log_info("UPLOAD") << "Upload complete: " << result.remote_path << " (" << result.bytes << " bytes)";

        // ------------------------------------------------------------------
        // STEP 2: head, independent confirmation
        // ------------------------------------------------------------------
        auto info = remote_->GetFileInfo(result.remote_path);
        if (!info.ok())
        {
            throw VerificationError("[VERIFY ERROR] Probe failed for " + result.remote_path +
                                    ", keeping local file: " + info.status().ToString());
        }
        if (info->type() != arrow::fs::FileType::File)
        {
            throw VerificationError("[VERIFY ERROR] " + result.remote_path +
                                    " not found after upload, keeping local file");
        }
        if (info->size() != static_cast<int64_t>(local_size))
        {
            throw VerificationError("[VERIFY ERROR] " + result.remote_path + " has " +
                                    std::to_string(info->size()) + " bytes, local file has " +
                                    std::to_string(local_size) + "; keeping local file");
        }
        log_info("UPLOAD") << "Verified " << result.remote_path;

        // ------------------------------------------------------------------
        // STEP 3: reclaim local disk
        // ------------------------------------------------------------------
        // The remote copy is confirmed, so a failed delete loses nothing.
        if (std::filesystem::remove(artifact, ec))
        {
            result.local_deleted = true;
            log_info("UPLOAD") << "Deleted local file " << artifact;
        }
        else
        {
            log_warn("UPLOAD") << "Verified upload but could not delete " << artifact
                               << (ec ? ": " + ec.message() : std::string(": already gone"));
        }
        return result;
    }

    bool UploadVerifier::restore(const std::filesystem::path &artifact) const
    {
        const auto source = remote_path(artifact);

        auto info = remote_->GetFileInfo(source);
        if (!info.ok())
        {
            throw UploadError("[UPLOAD ERROR] Cannot query " + source + ": " +
                              info.status().ToString());
        }
        if (info->type() == arrow::fs::FileType::NotFound)
            return false;
        if (info->type() != arrow::fs::FileType::File)
            throw UploadError("[UPLOAD ERROR] " + source + " exists but is not a file");

        std::error_code ec;
        std::filesystem::create_directories(artifact.parent_path(), ec);
        if (ec)
        {
            throw UploadError("[UPLOAD ERROR] Cannot create " + artifact.parent_path().string() +
                              ": " + ec.message());
        }

        // Download next to the target and rename, like the Parquet writer.
        std::filesystem::path tmp = artifact;
        tmp += ".download";
        try
        {
            auto in = value_or_throw<UploadError>(
                remote_->OpenInputStream(source),
                "[UPLOAD ERROR] Cannot open " + source);
            auto out = value_or_throw<UploadError>(
                arrow::io::FileOutputStream::Open(tmp.string()),
                "[UPLOAD ERROR] Cannot create " + tmp.string());

            const int64_t bytes = copy_stream(*in, *out);
            UPLOAD_CHECK(out->Close());
            UPLOAD_CHECK(in->Close());

            std::filesystem::rename(tmp, artifact, ec);
            if (ec)
            {
                throw UploadError("[UPLOAD ERROR] Cannot move " + tmp.string() + " to " +
                                  artifact.string() + ": " + ec.message());
            }
            log_info("UPLOAD") << "Restored " << source << " (" << bytes << " bytes) for merge";
        }
        catch (const UploadError &)
        {
            std::filesystem::remove(tmp, ec);
            throw;
        }
        return true;
    }

} // namespace AisLake
