#include "cellar/tools/command_log_formatter.hpp"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace cellar::tools {

namespace {

// Builds one JSON object on a single line. Keys are trusted literals; values are escaped.
class JsonLineWriter final {
public:
    JsonLineWriter() { out_ << '{'; }

    void string(std::string_view key, std::string_view value)
    {
        begin_field(key);
        quote(value);
    }

    void boolean(std::string_view key, bool value)
    {
        begin_field(key);
        out_ << (value ? "true" : "false");
    }

    void number(std::string_view key, double value)
    {
        begin_field(key);
        out_ << std::fixed << std::setprecision(3) << value;
    }

    void number(std::string_view key, std::uint64_t value)
    {
        begin_field(key);
        out_ << value;
    }

    // Unset time points are written as null.
    void timestamp(std::string_view key, std::chrono::system_clock::time_point value)
    {
        begin_field(key);
        if (value == std::chrono::system_clock::time_point{}) {
            out_ << "null";
            return;
        }
        out_ << '"' << utc_timestamp(value) << '"';
    }

    void strings(std::string_view key, const std::vector<std::string>& values)
    {
        begin_field(key);
        out_ << '[';
        for (std::size_t index = 0U; index < values.size(); ++index) {
            if (index != 0U) {
                out_ << ',';
            }
            quote(values[index]);
        }
        out_ << ']';
    }

    std::string finish()
    {
        out_ << '}';
        return out_.str();
    }

private:
    void begin_field(std::string_view key)
    {
        if (has_fields_) {
            out_ << ',';
        }
        has_fields_ = true;
        out_ << '"' << key << "\":";
    }

    void quote(std::string_view text)
    {
        static constexpr std::string_view kHexDigits = "0123456789ABCDEF";

        out_ << '"';
        for (const char raw : text) {
            const auto ch = static_cast<unsigned char>(raw);
            if (ch == '"' || ch == '\\') {
                out_ << '\\' << raw;
            } else if (ch == '\n') {
                out_ << "\\n";
            } else if (ch == '\r') {
                out_ << "\\r";
            } else if (ch == '\t') {
                out_ << "\\t";
            } else if (ch < 0x20U) {
                out_ << "\\u00" << kHexDigits[ch >> 4U] << kHexDigits[ch & 0x0FU];
            } else {
                out_ << raw;
            }
        }
        out_ << '"';
    }

    // 2024-01-31T12:00:00.000042Z
    static std::string utc_timestamp(std::chrono::system_clock::time_point value)
    {
        using namespace std::chrono;

        const auto day = floor<days>(value);
        const year_month_day date{day};
        const hh_mm_ss time_of_day{floor<microseconds>(value - day)};

        std::ostringstream text;
        text << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-' << std::setw(2)
             << static_cast<unsigned>(date.month()) << '-' << std::setw(2) << static_cast<unsigned>(date.day()) << 'T'
             << std::setw(2) << time_of_day.hours().count() << ':' << std::setw(2) << time_of_day.minutes().count()
             << ':' << std::setw(2) << time_of_day.seconds().count() << '.' << std::setw(6)
             << time_of_day.subseconds().count() << 'Z';
        return text.str();
    }

    std::ostringstream out_{};
    bool has_fields_ = false;
};

}  // namespace

std::string format_command_log_json(const cellar::shell::CommandMetrics& metrics)
{
    JsonLineWriter writer;
    writer.string("correlation_id", metrics.correlation_id);
    writer.string("category", metrics.command_category);
    writer.string("command", metrics.command_text);
    writer.string("summary", metrics.summary);
    writer.boolean("success", metrics.success);
    writer.boolean("fatal", metrics.fatal);
    writer.number("duration_ms", metrics.duration_ms);
    writer.number("rows_touched", metrics.rows_touched);
    writer.timestamp("started_at", metrics.started_at);
    writer.timestamp("finished_at", metrics.finished_at);
    writer.strings("output_lines", metrics.output_lines);
    return writer.finish();
}

}  // namespace cellar::tools
