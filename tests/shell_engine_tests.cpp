#include "cellar/shell/shell_engine.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

using cellar::shell::CommandMetrics;
using cellar::shell::ShellEngine;
using cellar::storage::InsertPolicy;
using cellar::storage::Table;

namespace {

std::filesystem::path make_unique_db_path()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("cellar_shell_" + std::to_string(stamp) + ".db");
}

struct TempShellDatabase final {
    explicit TempShellDatabase(Table::Config config = {})
        : path{make_unique_db_path()}
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        table = Table::open(path, config, ec);
        REQUIRE_FALSE(ec);
        REQUIRE(table);
    }

    ~TempShellDatabase()
    {
        table.reset();
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::filesystem::path path;
    std::unique_ptr<Table> table;
};

std::vector<std::string> run_script(ShellEngine& engine, const std::vector<std::string>& commands)
{
    std::vector<std::string> output;
    for (const auto& command : commands) {
        auto metrics = engine.execute(command);
        output.insert(output.end(), metrics.output_lines.begin(), metrics.output_lines.end());
    }
    return output;
}

}  // namespace

TEST_CASE("Shell inserts and retrieves a row")
{
    TempShellDatabase db;
    ShellEngine engine{*db.table};

    const auto insert = engine.execute("insert 1 user1 person1@example.com");
    CHECK(insert.success);
    CHECK_FALSE(insert.fatal);
    CHECK(insert.rows_touched == 1U);
    CHECK(insert.output_lines == std::vector<std::string>{"Executed."});

    const auto select = engine.execute("select");
    CHECK(select.success);
    CHECK(select.rows_touched == 1U);
    CHECK(select.summary == "Selected 1 row");
    CHECK(select.output_lines == std::vector<std::string>{"(1, user1, person1@example.com)", "Executed."});
}

TEST_CASE("Shell select on an empty table only acknowledges")
{
    TempShellDatabase db;
    ShellEngine engine{*db.table};

    const auto select = engine.execute("select");
    CHECK(select.success);
    CHECK(select.rows_touched == 0U);
    CHECK(select.output_lines == std::vector<std::string>{"Executed."});
}

TEST_CASE("Shell reports prepare errors without touching the table")
{
    TempShellDatabase db;
    ShellEngine engine{*db.table};

    const auto output = run_script(engine,
                                   {"insert -1 cstack foo@bar.com",
                                    "insert 1 " + std::string(33U, 'a') + " foo@bar.com",
                                    "insert 1 user1",
                                    "delete 1",
                                    "select"});

    CHECK(output == std::vector<std::string>{"Error: id must be positive",
                                             "Error: string is too long",
                                             "Error: syntax error",
                                             "Error: unrecognized keyword at start of 'delete 1'",
                                             "Executed."});

    std::uint32_t count = 1U;
    REQUIRE_FALSE(db.table->row_count(count));
    CHECK(count == 0U);
}

TEST_CASE("Shell reports a full table and keeps running")
{
    TempShellDatabase db;
    ShellEngine engine{*db.table};

    for (std::uint32_t id = 1U; id <= cellar::storage::kLeafNodeMaxCells; ++id) {
        const auto metrics = engine.execute("insert " + std::to_string(id) + " user" + std::to_string(id) + " a@b.com");
        REQUIRE(metrics.success);
    }

    const auto full = engine.execute("insert 14 user14 a@b.com");
    CHECK_FALSE(full.success);
    CHECK_FALSE(full.fatal);
    CHECK_FALSE(full.exit_requested);
    CHECK(full.output_lines == std::vector<std::string>{"Error: table full"});

    const auto select = engine.execute("select");
    CHECK(select.rows_touched == cellar::storage::kLeafNodeMaxCells);
}

TEST_CASE("Shell reports duplicate keys under key ordering")
{
    TempShellDatabase db{Table::Config{.insert_policy = InsertPolicy::KeyOrder}};
    ShellEngine engine{*db.table};

    CHECK(engine.execute("insert 5 a b").success);
    const auto duplicate = engine.execute("insert 5 c d");
    CHECK_FALSE(duplicate.success);
    CHECK_FALSE(duplicate.fatal);
    CHECK(duplicate.output_lines == std::vector<std::string>{"Error: duplicate key"});
}

TEST_CASE("Constants meta command prints the layout")
{
    TempShellDatabase db;
    ShellEngine engine{*db.table};

    const auto metrics = engine.execute(".constants");
    CHECK(metrics.success);
    CHECK(metrics.command_category == "meta");
    CHECK(metrics.output_lines == std::vector<std::string>{"Constants:",
                                                           "ROW_SIZE: 293",
                                                           "COMMON_NODE_HEADER_SIZE: 6",
                                                           "LEAF_NODE_HEADER_SIZE: 10",
                                                           "LEAF_NODE_CELL_SIZE: 297",
                                                           "LEAF_NODE_SPACE_FOR_CELLS: 4086",
                                                           "LEAF_NODE_MAX_CELLS: 13"});
}

TEST_CASE("Btree meta command dumps cells in storage order")
{
    SECTION("append policy")
    {
        TempShellDatabase db;
        ShellEngine engine{*db.table};
        const auto output = run_script(engine, {"insert 3 user3 person3@example.com",
                                                "insert 1 user1 person1@example.com",
                                                "insert 2 user2 person2@example.com",
                                                ".btree"});

        CHECK(output == std::vector<std::string>{"Executed.",
                                                 "Executed.",
                                                 "Executed.",
                                                 "Tree:",
                                                 "leaf (size 3)",
                                                 "  - 0 : 3",
                                                 "  - 1 : 1",
                                                 "  - 2 : 2"});
    }

    SECTION("key order policy")
    {
        TempShellDatabase db{Table::Config{.insert_policy = InsertPolicy::KeyOrder}};
        ShellEngine engine{*db.table};
        const auto output = run_script(engine, {"insert 3 a b", "insert 1 a b", "insert 2 a b", ".btree"});

        CHECK(output == std::vector<std::string>{"Executed.",
                                                 "Executed.",
                                                 "Executed.",
                                                 "Tree:",
                                                 "leaf (size 3)",
                                                 "  - 0 : 1",
                                                 "  - 1 : 2",
                                                 "  - 2 : 3"});
    }

    SECTION("empty table")
    {
        TempShellDatabase db;
        ShellEngine engine{*db.table};
        CHECK(engine.execute(".btree").output_lines == std::vector<std::string>{"Tree:", "leaf (size 0)"});
    }
}

TEST_CASE("Exit meta command requests shutdown")
{
    TempShellDatabase db;
    ShellEngine engine{*db.table};

    const auto metrics = engine.execute("  .exit  ");
    CHECK(metrics.success);
    CHECK(metrics.exit_requested);
    CHECK(metrics.output_lines.empty());
    CHECK(metrics.command_text == ".exit");
}

TEST_CASE("Unknown meta command is reported")
{
    TempShellDatabase db;
    ShellEngine engine{*db.table};

    const auto metrics = engine.execute(".tables");
    CHECK_FALSE(metrics.success);
    CHECK_FALSE(metrics.exit_requested);
    CHECK_FALSE(metrics.fatal);
    CHECK(metrics.output_lines == std::vector<std::string>{"Error: unrecognized command '.tables'"});
}

TEST_CASE("Stats meta command reports pager counters")
{
    TempShellDatabase db;
    ShellEngine engine{*db.table};
    REQUIRE(engine.execute("insert 1 a b").success);

    const auto metrics = engine.execute(".stats");
    REQUIRE(metrics.success);
    REQUIRE(metrics.output_lines.size() == 8U);
    CHECK(metrics.output_lines[0] == "Pager:");
    CHECK(metrics.output_lines[1] == "pages: 1");
    CHECK(metrics.output_lines[2].starts_with("page_loads: "));
    CHECK(metrics.output_lines[4] == "disk_reads: 0");
}

TEST_CASE("Empty input does nothing")
{
    TempShellDatabase db;
    ShellEngine engine{*db.table};

    const auto metrics = engine.execute("   ");
    CHECK(metrics.success);
    CHECK(metrics.command_category == "empty");
    CHECK(metrics.output_lines.empty());
}

TEST_CASE("Command logger sees every non-empty command")
{
    TempShellDatabase db;
    std::vector<CommandMetrics> logged;
    ShellEngine engine{*db.table, ShellEngine::Config{[&logged](const CommandMetrics& metrics) {
                           logged.push_back(metrics);
                       }}};

    (void)engine.execute("insert 1 a b");
    (void)engine.execute("");
    (void)engine.execute("bogus");
    (void)engine.execute(".constants");

    REQUIRE(logged.size() == 3U);
    CHECK(logged[0].command_category == "statement");
    CHECK(logged[0].success);
    CHECK(logged[1].command_text == "bogus");
    CHECK_FALSE(logged[1].success);
    CHECK(logged[2].command_category == "meta");

    CHECK(logged[0].correlation_id == "cmd-1");
    CHECK(logged[1].correlation_id == "cmd-3");
    CHECK(logged[0].finished_at >= logged[0].started_at);
}

TEST_CASE("Rows written through the shell survive a reopen")
{
    TempShellDatabase db;
    {
        ShellEngine engine{*db.table};
        REQUIRE(engine.execute("insert 1 user1 person1@example.com").success);
    }
    REQUIRE_FALSE(db.table->close());

    std::error_code ec;
    db.table = Table::open(db.path, {}, ec);
    REQUIRE_FALSE(ec);
    REQUIRE(db.table);

    ShellEngine engine{*db.table};
    CHECK(engine.execute("select").output_lines ==
          std::vector<std::string>{"(1, user1, person1@example.com)", "Executed."});
}
