#pragma once

// ============================================================================
// Error taxonomy for the ingest pipeline
// ============================================================================
//
// Every failure the pipeline can report is a PipelineError, so main() can
// catch one base type for "expected" failures and still tell them apart:
//
//   Producer stage (fatal to the run of one input file):
//     SourceReadError      the CSV cannot be opened / read / parsed
//     MalformedTimestamp   a row's BaseDateTime has the wrong shape
//
//   Consumer stage (isolated to one partition task):
//     ArtifactReadError    existing Parquet file unreadable (recovered:
//                           treated as zero existing rows)
//     ArtifactWriteError   new Parquet file could not be written
//     UploadError          transmitting to the object store failed
//     VerificationError    upload not confirmed by the existence probe
//
//   Setup:
//     ConfigError          invalid or incomplete configuration
//     OutputTreeBusy       another instance owns the output tree
// ============================================================================

#include <stdexcept>
#include <string>

namespace AisLake
{

    class PipelineError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class SourceReadError : public PipelineError
    {
    public:
        using PipelineError::PipelineError;
    };

    class MalformedTimestamp : public PipelineError
    {
    public:
        explicit MalformedTimestamp(std::string text)
            : PipelineError("[TIMESTAMP ERROR] Cannot parse '" + text +
                            "', expected YYYY-MM-DDTHH:MM:SS"),
              text_(std::move(text))
        {
        }

        const std::string &text() const noexcept { return text_; }

    private:
        std::string text_;
    };

    class ArtifactReadError : public PipelineError
    {
    public:
        using PipelineError::PipelineError;
    };

    class ArtifactWriteError : public PipelineError
    {
    public:
        using PipelineError::PipelineError;
    };

    class UploadError : public PipelineError
    {
    public:
        using PipelineError::PipelineError;
    };

    class VerificationError : public PipelineError
    {
    public:
        using PipelineError::PipelineError;
    };

    class ConfigError : public PipelineError
    {
    public:
        using PipelineError::PipelineError;
    };

    class OutputTreeBusy : public PipelineError
    {
    public:
        using PipelineError::PipelineError;
    };

} // namespace AisLake
