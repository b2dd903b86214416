#include "cellar/shell/shell_engine.hpp"

#include "cellar/storage/page_format.hpp"

#include <cctype>
#include <sstream>
#include <type_traits>
#include <variant>

using cellar::parser::InsertStatement;
using cellar::parser::SelectStatement;
using cellar::storage::PagerTelemetrySnapshot;

namespace cellar::shell {

namespace {

constexpr std::string_view kExecuted = "Executed.";

[[nodiscard]] std::string error_line(std::string_view message)
{
    return "Error: " + std::string{message};
}

[[nodiscard]] std::string describe_insert_error(const std::error_code& ec)
{
    if (ec == std::errc::no_buffer_space) {
        return "table full";
    }
    if (ec == std::errc::file_exists) {
        return "duplicate key";
    }
    if (ec == std::errc::operation_not_supported) {
        return "need to implement splitting a leaf node";
    }
    return ec.message();
}

// Capacity and duplicate-key rejections leave the table untouched; anything else came from the
// file system and ends the session.
[[nodiscard]] bool is_recoverable(const std::error_code& ec) noexcept
{
    return ec == std::errc::no_buffer_space || ec == std::errc::file_exists || ec == std::errc::operation_not_supported;
}

void finalize_duration(CommandMetrics& metrics, std::chrono::steady_clock::time_point start)
{
    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;
}

[[nodiscard]] std::vector<std::string> format_constants()
{
    using namespace cellar::storage;
    return {"Constants:",
            "ROW_SIZE: " + std::to_string(kRowSize),
            "COMMON_NODE_HEADER_SIZE: " + std::to_string(kCommonNodeHeaderSize),
            "LEAF_NODE_HEADER_SIZE: " + std::to_string(kLeafNodeHeaderSize),
            "LEAF_NODE_CELL_SIZE: " + std::to_string(kLeafNodeCellSize),
            "LEAF_NODE_SPACE_FOR_CELLS: " + std::to_string(kLeafNodeSpaceForCells),
            "LEAF_NODE_MAX_CELLS: " + std::to_string(kLeafNodeMaxCells)};
}

[[nodiscard]] std::vector<std::string> format_leaf(const std::vector<std::uint32_t>& keys)
{
    std::vector<std::string> lines;
    lines.reserve(keys.size() + 2U);
    lines.emplace_back("Tree:");
    lines.push_back("leaf (size " + std::to_string(keys.size()) + ")");
    for (std::size_t index = 0U; index < keys.size(); ++index) {
        std::ostringstream line;
        line << "  - " << index << " : " << keys[index];
        lines.push_back(line.str());
    }
    return lines;
}

[[nodiscard]] std::vector<std::string> format_stats(const PagerTelemetrySnapshot& snapshot, std::uint32_t num_pages)
{
    return {"Pager:",
            "pages: " + std::to_string(num_pages),
            "page_loads: " + std::to_string(snapshot.page_loads),
            "cache_hits: " + std::to_string(snapshot.cache_hits),
            "disk_reads: " + std::to_string(snapshot.disk_reads),
            "pages_flushed: " + std::to_string(snapshot.pages_flushed),
            "bytes_read: " + std::to_string(snapshot.bytes_read),
            "bytes_written: " + std::to_string(snapshot.bytes_written)};
}

}  // namespace

ShellEngine::ShellEngine(storage::Table& table)
    : table_{table}
{}

ShellEngine::ShellEngine(storage::Table& table, Config config)
    : table_{table}
    , config_{std::move(config)}
{}

CommandMetrics ShellEngine::execute(const std::string& line)
{
    const auto started_at = std::chrono::system_clock::now();
    const auto trimmed = trim(line);
    const auto kind = classify(trimmed);

    CommandMetrics metrics{};
    switch (kind) {
    case CommandKind::Empty:
        metrics.success = true;
        metrics.summary = "Empty command.";
        break;
    case CommandKind::Meta:
        metrics = execute_meta(trimmed);
        break;
    case CommandKind::Statement:
    default:
        metrics = execute_statement(trimmed);
        break;
    }

    metrics.command_text = trimmed;
    metrics.command_category = std::string{command_kind_to_string(kind)};
    metrics.correlation_id = "cmd-" + std::to_string(correlation_counter_.fetch_add(1U));
    metrics.started_at = started_at;
    metrics.finished_at = std::chrono::system_clock::now();

    if (config_.command_logger && kind != CommandKind::Empty) {
        config_.command_logger(metrics);
    }
    return metrics;
}

std::string ShellEngine::trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }

    return std::string{text.substr(start, end - start)};
}

ShellEngine::CommandKind ShellEngine::classify(std::string_view text) noexcept
{
    if (text.empty()) {
        return CommandKind::Empty;
    }
    if (text.front() == '.') {
        return CommandKind::Meta;
    }
    return CommandKind::Statement;
}

std::string_view ShellEngine::command_kind_to_string(CommandKind kind) noexcept
{
    switch (kind) {
    case CommandKind::Empty:
        return "empty";
    case CommandKind::Meta:
        return "meta";
    case CommandKind::Statement:
    default:
        return "statement";
    }
}

CommandMetrics ShellEngine::execute_statement(const std::string& text)
{
    const auto start = std::chrono::steady_clock::now();
    const auto parsed = parser::parse_statement(text);
    if (!parsed.success()) {
        CommandMetrics metrics{};
        metrics.success = false;
        metrics.summary = parsed.message;
        metrics.output_lines.push_back(error_line(parsed.message));
        finalize_duration(metrics, start);
        return metrics;
    }

    auto metrics = std::visit(
        [this](const auto& statement) {
            using StatementType = std::decay_t<decltype(statement)>;
            if constexpr (std::is_same_v<StatementType, InsertStatement>) {
                return execute_insert(statement);
            } else {
                return execute_select();
            }
        },
        *parsed.statement);
    finalize_duration(metrics, start);
    return metrics;
}

CommandMetrics ShellEngine::execute_insert(const InsertStatement& statement)
{
    CommandMetrics metrics{};
    if (auto ec = table_.insert(statement.row); ec) {
        metrics.success = false;
        metrics.fatal = !is_recoverable(ec);
        metrics.summary = describe_insert_error(ec);
        metrics.output_lines.push_back(error_line(metrics.summary));
        return metrics;
    }

    metrics.success = true;
    metrics.rows_touched = 1U;
    metrics.summary = "Inserted 1 row";
    metrics.output_lines.emplace_back(kExecuted);
    return metrics;
}

CommandMetrics ShellEngine::execute_select()
{
    CommandMetrics metrics{};
    auto ec = table_.select_all([&metrics](const storage::Row& row) {
        metrics.output_lines.push_back(storage::format_row(row));
        ++metrics.rows_touched;
    });
    if (ec) {
        metrics.success = false;
        metrics.fatal = true;
        metrics.summary = ec.message();
        metrics.output_lines.push_back(error_line(metrics.summary));
        return metrics;
    }

    metrics.success = true;
    std::ostringstream summary;
    summary << "Selected " << metrics.rows_touched << " row" << (metrics.rows_touched == 1U ? "" : "s");
    metrics.summary = summary.str();
    metrics.output_lines.emplace_back(kExecuted);
    return metrics;
}

CommandMetrics ShellEngine::execute_meta(const std::string& command)
{
    CommandMetrics metrics{};
    const auto start = std::chrono::steady_clock::now();

    if (command == ".exit") {
        metrics.success = true;
        metrics.exit_requested = true;
        metrics.summary = "Exit requested.";
        finalize_duration(metrics, start);
        return metrics;
    }

    if (command == ".constants") {
        metrics.success = true;
        metrics.summary = "Listed layout constants";
        metrics.output_lines = format_constants();
        finalize_duration(metrics, start);
        return metrics;
    }

    if (command == ".btree") {
        std::vector<std::uint32_t> keys;
        if (auto ec = table_.root_leaf_keys(keys); ec) {
            metrics.success = false;
            metrics.fatal = true;
            metrics.summary = ec.message();
            metrics.output_lines.push_back(error_line(metrics.summary));
            finalize_duration(metrics, start);
            return metrics;
        }
        metrics.success = true;
        metrics.summary = "Dumped root leaf with " + std::to_string(keys.size()) + " cell" + (keys.size() == 1U ? "" : "s");
        metrics.output_lines = format_leaf(keys);
        finalize_duration(metrics, start);
        return metrics;
    }

    if (command == ".stats") {
        metrics.success = true;
        metrics.summary = "Listed pager counters";
        metrics.output_lines = format_stats(table_.pager().telemetry(), table_.pager().num_pages());
        finalize_duration(metrics, start);
        return metrics;
    }

    metrics.success = false;
    metrics.summary = "unrecognized command '" + command + "'";
    metrics.output_lines.push_back(error_line(metrics.summary));
    finalize_duration(metrics, start);
    return metrics;
}

}  // namespace cellar::shell
