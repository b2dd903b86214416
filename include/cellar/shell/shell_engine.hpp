#pragma once

#include "cellar/parser/grammar.hpp"
#include "cellar/storage/table.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cellar::shell {

struct CommandMetrics final {
    bool success = false;
    bool exit_requested = false;
    bool fatal = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_touched = 0U;
    std::vector<std::string> output_lines{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

// Interprets one input line at a time against a table. Statements never mutate the table
// unless they parse cleanly.
class ShellEngine final {
public:
    struct Config final {
        std::function<void(const CommandMetrics&)> command_logger{};
    };

    explicit ShellEngine(storage::Table& table);
    ShellEngine(storage::Table& table, Config config);

    CommandMetrics execute(const std::string& line);

private:
    enum class CommandKind : std::uint8_t {
        Empty = 0,
        Statement,
        Meta
    };

    static std::string trim(std::string_view text);
    static CommandKind classify(std::string_view text) noexcept;
    static std::string_view command_kind_to_string(CommandKind kind) noexcept;

    CommandMetrics execute_statement(const std::string& text);
    CommandMetrics execute_insert(const parser::InsertStatement& statement);
    CommandMetrics execute_select();
    CommandMetrics execute_meta(const std::string& command);

    storage::Table& table_;
    Config config_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace cellar::shell
