#include "cellar/shell/shell_engine.hpp"
#include "cellar/storage/table.hpp"
#include "cellar/tools/command_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace {

constexpr const char* kPrompt = "db > ";

enum class LoopOutcome {
    Continue,
    Exit,
    Fatal
};

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".cellar_history";
    return path;
}

std::string describe_open_error(const std::error_code& ec)
{
    if (ec == std::errc::illegal_byte_sequence) {
        return "db file is not a whole number of pages. Corrupt file.";
    }
    if (ec == std::errc::bad_message) {
        return "db file root page is not a valid leaf node. Corrupt file.";
    }
    if (ec == std::errc::file_too_large) {
        return "db file holds more pages than the table can address.";
    }
    return ec.message();
}

LoopOutcome render_result(const cellar::shell::CommandMetrics& metrics)
{
    for (const auto& line : metrics.output_lines) {
        std::cout << line << '\n';
    }
    std::cout.flush();

    if (metrics.fatal) {
        std::cerr << "error: " << metrics.summary << " (command: " << metrics.command_text << ")" << '\n';
        return LoopOutcome::Fatal;
    }
    if (metrics.exit_requested) {
        return LoopOutcome::Exit;
    }
    return LoopOutcome::Continue;
}

bool load_script_commands(std::istream& input, std::vector<std::string>& commands, std::string& error_message)
{
    error_message.clear();

    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        commands.push_back(line);
    }

    if (input.bad()) {
        error_message = "I/O error while reading script";
        return false;
    }

    if (input.fail() && !input.eof()) {
        error_message = "Failed to read script to completion";
        return false;
    }

    return true;
}

int run_repl(bool quiet, cellar::shell::ShellEngine& engine)
{
    replxx::Replxx repl;

    const auto history = history_path();
    if (!history.empty()) {
        (void)repl.history_load(history.string());
    }

    if (!quiet) {
        std::cout << "cellar shell. Enter insert/select statements or .exit to quit.\n";
    }

    while (true) {
        const char* line = repl.input(kPrompt);
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const std::string text{line};
        if (text.find_first_not_of(" \t") != std::string::npos) {
            repl.history_add(text);
        }

        const auto outcome = render_result(engine.execute(text));
        if (outcome == LoopOutcome::Fatal) {
            std::cerr << "[debug] run_repl exiting with code=1\n";
            return 1;
        }
        if (outcome == LoopOutcome::Exit) {
            break;
        }
    }

    if (!history.empty()) {
        (void)repl.history_save(history.string());
    }
    std::cerr << "[debug] run_repl exiting with code=0\n";
    return 0;
}

// Non-interactive stdin: same prompt protocol as the terminal session so transcripts can be diffed.
int run_stream(std::istream& input, cellar::shell::ShellEngine& engine)
{
    std::string line;
    while (true) {
        std::cout << kPrompt;
        std::cout.flush();
        if (!std::getline(input, line)) {
            break;
        }

        const auto outcome = render_result(engine.execute(line));
        if (outcome == LoopOutcome::Fatal) {
            std::cerr << "[debug] run_stream exiting with code=1\n";
            return 1;
        }
        if (outcome == LoopOutcome::Exit) {
            break;
        }
    }

    if (input.bad()) {
        std::cerr << "error: I/O error while reading standard input" << '\n';
        return 1;
    }
    std::cerr << "[debug] run_stream exiting with code=0\n";
    return 0;
}

int run_batch(const std::vector<std::string>& commands, cellar::shell::ShellEngine& engine)
{
    int exit_code = 0;
    for (const auto& command : commands) {
        const auto result = engine.execute(command);
        const auto outcome = render_result(result);
        if (outcome == LoopOutcome::Fatal) {
            exit_code = 1;
            break;
        }
        if (!result.success) {
            exit_code = 1;
        }
        if (outcome == LoopOutcome::Exit) {
            break;
        }
    }
    std::cerr << "[debug] run_batch exiting with code=" << exit_code << '\n';
    return exit_code;
}

int run_session(cellar::storage::Table& table,
                const cellar::shell::ShellEngine::Config& engine_config,
                const std::vector<std::string>& commands,
                bool batch,
                bool quiet)
{
    cellar::shell::ShellEngine engine{table, engine_config};

    if (batch) {
        return run_batch(commands, engine);
    }
    if (::isatty(STDIN_FILENO) != 0) {
        return run_repl(quiet, engine);
    }
    return run_stream(std::cin, engine);
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Single-table record store with an interactive command shell."};

    std::string database_path;
    bool quiet = false;
    bool key_order = false;
    std::vector<std::string> execute_commands;
    std::vector<std::string> script_files;
    std::string log_json_path;

    app.add_option("database", database_path, "Database file to open (created if absent)")
        ->type_name("PATH");
    app.add_flag("-q,--quiet", quiet, "Suppress startup banner");
    app.add_option("-c,--command", execute_commands, "Execute the provided command and exit")
        ->type_name("COMMAND")
        ->expected(1);
    app.add_option("-f,--file", script_files, "Execute commands from the specified script file (use '-' for stdin)")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("--log-json", log_json_path, "Write structured command logs as JSON Lines (use '-' for stdout)");
    app.add_flag("--key-order", key_order, "Insert rows at their key position instead of appending");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        const auto code = app.exit(error);
        std::cerr << "[debug] exiting main via CLI parse error path code=" << code << '\n';
        return code;
    }

    if (database_path.empty()) {
        std::cout << "Must supply a database filename." << '\n';
        return 1;
    }

    cellar::shell::ShellEngine::Config engine_config;
    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;

    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                std::cerr << "[debug] exiting main due to log open failure code=1\n";
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }

        engine_config.command_logger = [log_stream, &log_mutex](const cellar::shell::CommandMetrics& metrics) {
            const auto line = cellar::tools::format_command_log_json(metrics);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }

    std::vector<std::string> commands_to_run;
    bool stdin_consumed = false;
    for (const auto& script_path : script_files) {
        std::istream* input = nullptr;
        std::ifstream script_stream;
        if (script_path == "-") {
            if (stdin_consumed) {
                std::cerr << "error: stdin script '-' specified more than once" << '\n';
                return 1;
            }
            stdin_consumed = true;
            input = &std::cin;
        } else {
            script_stream.open(script_path);
            if (!script_stream.is_open()) {
                std::cerr << "error: failed to open script file '" << script_path << "'" << '\n';
                return 1;
            }
            input = &script_stream;
        }

        std::string error;
        if (!load_script_commands(*input, commands_to_run, error)) {
            std::cerr << "error: " << error << " ('" << (script_path == "-" ? "<stdin>" : script_path) << "')" << '\n';
            return 1;
        }
    }
    commands_to_run.insert(commands_to_run.end(), execute_commands.begin(), execute_commands.end());
    const bool batch = !script_files.empty() || !execute_commands.empty();

    cellar::storage::Table::Config table_config{};
    table_config.insert_policy = key_order ? cellar::storage::InsertPolicy::KeyOrder
                                           : cellar::storage::InsertPolicy::Append;

    try {
        std::error_code open_error;
        auto table = cellar::storage::Table::open(database_path, table_config, open_error);
        if (!table) {
            std::cerr << "error: unable to open database '" << database_path << "': " << describe_open_error(open_error)
                      << '\n';
            std::cerr << "[debug] exiting main due to open failure code=1\n";
            return 1;
        }

        auto code = run_session(*table, engine_config, commands_to_run, batch, quiet);

        if (auto ec = table->close(); ec) {
            std::cerr << "error: failed to flush database '" << database_path << "': " << ec.message() << '\n';
            code = 1;
        }

        std::cerr << "[debug] exiting main code=" << code << '\n';
        return code;
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        std::cerr << "[debug] exiting main due to exception code=1\n";
        return 1;
    }
}
