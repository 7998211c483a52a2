#pragma once

// ── Arrow status -> pipeline exception ────────────────────────────────────────
// Arrow reports failures as arrow::Status / arrow::Result<T> instead of
// throwing. These macros turn a failed status into the pipeline exception
// that matches the stage we are in (ArtifactWriteError while writing,
// UploadError while uploading...), so callers only deal with exceptions.
//
// do { ... } while (0) keeps a multi-statement macro usable as one statement
// (safe inside an un-braced if/else).

#include <string>
#include <arrow/result.h>
#include <arrow/status.h>

#define AISLAKE_THROW_IF_NOT_OK(expr, ErrorType, prefix)     \
    do                                                       \
    {                                                        \
        ::arrow::Status _aislake_s = (expr);                 \
        if (!_aislake_s.ok())                                \
        {                                                    \
            throw ErrorType(std::string(prefix) + " " #expr  \
                            " -> " + _aislake_s.ToString()); \
        }                                                    \
    } while (0)

namespace AisLake
{

    // Unwraps an arrow::Result<T> or throws ErrorType with 'context'.
    template <typename ErrorType, typename T>
    T value_or_throw(::arrow::Result<T> result, const std::string &context)
    {
        if (!result.ok())
            throw ErrorType(context + " -> " + result.status().ToString());
        return std::move(result).ValueOrDie();
    }

} // namespace AisLake
