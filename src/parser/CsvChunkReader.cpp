#include "CsvChunkReader.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <unordered_map>
#include "../logging/Logger.hpp"
#include "../model/PipelineErrors.hpp"

namespace AisLake
{

    namespace
    {
        const std::unordered_map<std::string_view, AisColumn> &known_columns()
        {
            static const std::unordered_map<std::string_view, AisColumn> columns = {
                {"MMSI", AisColumn::Mmsi},
                {"BaseDateTime", AisColumn::BaseDateTime},
                {"LAT", AisColumn::Lat},
                {"LON", AisColumn::Lon},
                {"SOG", AisColumn::Sog},
                {"COG", AisColumn::Cog},
                {"Heading", AisColumn::Heading},
                {"VesselName", AisColumn::VesselName},
                {"IMO", AisColumn::Imo},
                {"CallSign", AisColumn::CallSign},
                {"VesselType", AisColumn::VesselType},
                {"Status", AisColumn::Status},
                {"Length", AisColumn::Length},
                {"Width", AisColumn::Width},
                {"Draft", AisColumn::Draft},
                {"Cargo", AisColumn::Cargo},
                {"TransceiverClass", AisColumn::TransceiverClass}};
            return columns;
        }

        [[noreturn]] void fail_row(const std::filesystem::path &path, size_t line,
                                   const std::string &what)
        {
            throw SourceReadError("[PARSER ERROR] " + path.string() + ":" +
                                  std::to_string(line) + ": " + what);
        }

        // Empty field = null. Anything else must be a complete number:
        // "12.5abc" is rejected instead of silently read as 12.5.
        template <typename T>
        std::optional<T> parse_number(const std::string &field,
                                      const std::filesystem::path &path,
                                      size_t line, std::string_view column)
        {
            if (field.empty())
                return std::nullopt;

            T value{};
            const char *begin = field.data();
            const char *end = begin + field.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc{} || ptr != end)
            {
                fail_row(path, line, "column " + std::string(column) +
                                         ": not a number: '" + field + "'");
            }
            return value;
        }
    } // namespace

    CsvChunkReader::CsvChunkReader(const std::filesystem::path &file_path, size_t chunk_rows)
        : path_(file_path), chunk_rows_(chunk_rows)
    {
        if (chunk_rows_ == 0)
            throw SourceReadError("[PARSER ERROR] chunk size must be at least 1 row");

        // Binary mode: we handle \r\n ourselves, byte counts stay exact.
        file_.open(path_, std::ios::binary);
        if (!file_.is_open())
            throw SourceReadError("[PARSER ERROR] Cannot open: " + path_.string());

        buffer_.reserve(kBlockSize);
        read_header();
    }

    // =========================================================================
    // next_line: one logical line out of the block buffer
    // =========================================================================
    // Returns a view INTO buffer_. It is only valid until the next call,
    // because refill() compacts and grows the buffer. Callers parse the line
    // into owning strings straight away.
    // =========================================================================
    bool CsvChunkReader::next_line(std::string_view &line)
    {
        while (true)
        {
            const size_t nl = buffer_.find('\n', pos_);
            if (nl != std::string::npos)
            {
                line = std::string_view(buffer_).substr(pos_, nl - pos_);
                pos_ = nl + 1;
                break;
            }

            if (eof_)
            {
                if (pos_ >= buffer_.size())
                    return false;
                // Last line without a trailing newline
                line = std::string_view(buffer_).substr(pos_);
                pos_ = buffer_.size();
                break;
            }

            refill();
        }

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        ++line_number_;
        return true;
    }

    void CsvChunkReader::refill()
    {
        // Drop what has been consumed, keep the partial line at the tail.
        buffer_.erase(0, pos_);
        pos_ = 0;

        const size_t old_size = buffer_.size();
        buffer_.resize(old_size + kBlockSize);
        file_.read(buffer_.data() + old_size, static_cast<std::streamsize>(kBlockSize));
        const auto got = static_cast<size_t>(file_.gcount());
        buffer_.resize(old_size + got);

        if (file_.bad())
            throw SourceReadError("[PARSER ERROR] Read failed mid-stream: " + path_.string());

        // A short read sets eof (and fail). Anything else that sets fail
        // without delivering bytes is a real error.
        if (file_.eof())
            eof_ = true;
        else if (got == 0)
            throw SourceReadError("[PARSER ERROR] Read returned no data: " + path_.string());
    }

    void CsvChunkReader::read_header()
    {
        std::string_view header;
        while (next_line(header) && header.empty())
        {
        }
        if (header.empty())
            throw SourceReadError("[PARSER ERROR] Empty file, no header: " + path_.string());

        // Excel likes to prepend a UTF-8 byte order mark.
        if (header.starts_with("\xEF\xBB\xBF"))
            header.remove_prefix(3);

        split_fields(header);

        const auto &known = known_columns();
        bool has_timestamp = false;
        std::string ignored;

        layout_.clear();
        layout_.reserve(fields_.size());
        for (const auto &name : fields_)
        {
            auto it = known.find(name);
            if (it == known.end())
            {
                layout_.push_back(AisColumn::Ignored);
                ignored += ignored.empty() ? name : ", " + name;
                continue;
            }
            layout_.push_back(it->second);
            has_timestamp = has_timestamp || it->second == AisColumn::BaseDateTime;
        }

        if (!has_timestamp)
            throw SourceReadError("[PARSER ERROR] No BaseDateTime column in " + path_.string());

        if (!ignored.empty())
            log_warn("PARSER") << "Ignoring unknown columns in " << path_.filename() << ": " << ignored;

        log_info("PARSER") << "Opened " << path_ << " (" << layout_.size() << " columns, "
                           << chunk_rows_ << " rows per batch)";
    }

    // =========================================================================
    // split_fields: RFC 4180-style field splitting into fields_
    // =========================================================================
    // Plain fields are copied as-is. A field that starts with '"' runs to
    // the matching closing quote; "" inside it is a literal quote. Quoted
    // fields may contain commas (vessel names sometimes do) but not
    // newlines; the NOAA files never split a record across lines.
    // =========================================================================
    void CsvChunkReader::split_fields(std::string_view line)
    {
        fields_.clear();
        size_t i = 0;

        while (true)
        {
            std::string field;

            if (i < line.size() && line[i] == '"')
            {
                ++i;
                bool closed = false;
                while (i < line.size())
                {
                    if (line[i] == '"')
                    {
                        if (i + 1 < line.size() && line[i + 1] == '"')
                        {
                            field += '"';
                            i += 2;
                            continue;
                        }
                        ++i;
                        closed = true;
                        break;
                    }
                    field += line[i++];
                }
                if (!closed)
                    fail_row(path_, line_number_, "unterminated quoted field");
                if (i < line.size() && line[i] != ',')
                    fail_row(path_, line_number_, "unexpected character after closing quote");
            }
            else
            {
                const size_t comma = line.find(',', i);
                const size_t stop = (comma == std::string_view::npos) ? line.size() : comma;
                field.assign(line.substr(i, stop - i));
                i = stop;
            }

            fields_.push_back(std::move(field));

            if (i >= line.size())
                break;
            ++i; // skip the comma
            if (i == line.size())
            {
                // Trailing comma = one more empty field
                fields_.emplace_back();
                break;
            }
        }
    }

    SourceRow CsvChunkReader::parse_row(std::string_view line)
    {
        split_fields(line);

        if (fields_.size() != layout_.size())
        {
            fail_row(path_, line_number_,
                     "expected " + std::to_string(layout_.size()) + " fields, got " +
                         std::to_string(fields_.size()));
        }

        SourceRow row{};
        row.line_number = line_number_;
        AisRecord &r = row.record;

        for (size_t col = 0; col < fields_.size(); ++col)
        {
            std::string &f = fields_[col];
            switch (layout_[col])
            {
            case AisColumn::Mmsi:
                r.mmsi = std::move(f);
                break;
            case AisColumn::BaseDateTime:
                row.timestamp_text = std::move(f);
                break;
            case AisColumn::Lat:
                r.lat = parse_number<double>(f, path_, line_number_, "LAT");
                break;
            case AisColumn::Lon:
                r.lon = parse_number<double>(f, path_, line_number_, "LON");
                break;
            case AisColumn::Sog:
                r.sog = parse_number<double>(f, path_, line_number_, "SOG");
                break;
            case AisColumn::Cog:
                r.cog = parse_number<double>(f, path_, line_number_, "COG");
                break;
            case AisColumn::Heading:
                r.heading = parse_number<double>(f, path_, line_number_, "Heading");
                break;
            case AisColumn::VesselName:
                r.vessel_name = std::move(f);
                break;
            case AisColumn::Imo:
                r.imo = std::move(f);
                break;
            case AisColumn::CallSign:
                r.call_sign = std::move(f);
                break;
            case AisColumn::VesselType:
                r.vessel_type = parse_number<int32_t>(f, path_, line_number_, "VesselType");
                break;
            case AisColumn::Status:
                r.status = parse_number<int32_t>(f, path_, line_number_, "Status");
                break;
            case AisColumn::Length:
                r.length = parse_number<double>(f, path_, line_number_, "Length");
                break;
            case AisColumn::Width:
                r.width = parse_number<double>(f, path_, line_number_, "Width");
                break;
            case AisColumn::Draft:
                r.draft = parse_number<double>(f, path_, line_number_, "Draft");
                break;
            case AisColumn::Cargo:
                r.cargo = std::move(f);
                break;
            case AisColumn::TransceiverClass:
                r.transceiver_class = std::move(f);
                break;
            case AisColumn::Ignored:
                break;
            }
        }

        return row;
    }

    std::optional<RowBatch> CsvChunkReader::next_batch()
    {
        RowBatch batch;
        batch.reserve(std::min<size_t>(chunk_rows_, 65'536));

        std::string_view line;
        while (batch.size() < chunk_rows_ && next_line(line))
        {
            if (line.empty())
                continue;
            batch.push_back(parse_row(line));
        }

        if (batch.empty())
            return std::nullopt;

        rows_read_ += batch.size();
        ++batches_read_;
        return batch;
    }

} // namespace AisLake
