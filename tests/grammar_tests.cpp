#include "cellar/parser/grammar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>

using cellar::parser::InsertStatement;
using cellar::parser::PrepareError;
using cellar::parser::SelectStatement;
using cellar::parser::parse_statement;

namespace {

const InsertStatement& require_insert(const cellar::parser::StatementParseResult& result)
{
    REQUIRE(result.success());
    const auto* insert = std::get_if<InsertStatement>(&*result.statement);
    REQUIRE(insert != nullptr);
    return *insert;
}

}  // namespace

TEST_CASE("Parser accepts an insert statement")
{
    const auto result = parse_statement("insert 1 user1 person1@example.com");
    const auto& insert = require_insert(result);

    CHECK(result.error == PrepareError::None);
    CHECK(insert.row.id == 1U);
    CHECK(cellar::storage::row_username(insert.row) == "user1");
    CHECK(cellar::storage::row_email(insert.row) == "person1@example.com");
}

TEST_CASE("Parser tolerates surrounding and repeated whitespace")
{
    const auto result = parse_statement("  insert\t 7   alice   alice@example.com  \n");
    const auto& insert = require_insert(result);
    CHECK(insert.row.id == 7U);
    CHECK(cellar::storage::row_username(insert.row) == "alice");

    const auto select = parse_statement("  select  ");
    REQUIRE(select.success());
    CHECK(std::holds_alternative<SelectStatement>(*select.statement));
}

TEST_CASE("Parser accepts a bare select")
{
    const auto result = parse_statement("select");
    REQUIRE(result.success());
    CHECK(std::holds_alternative<SelectStatement>(*result.statement));
}

TEST_CASE("Select takes no arguments")
{
    const auto result = parse_statement("select *");
    CHECK_FALSE(result.success());
    CHECK(result.error == PrepareError::SyntaxError);
    CHECK(result.message == "syntax error");
}

TEST_CASE("Negative ids are rejected before any other check")
{
    const auto result = parse_statement("insert -1 cstack foo@bar.com");
    CHECK_FALSE(result.success());
    CHECK(result.error == PrepareError::NegativeId);
    CHECK(result.message == "id must be positive");
}

TEST_CASE("Zero and the largest u32 are valid ids")
{
    CHECK(require_insert(parse_statement("insert 0 a b")).row.id == 0U);
    CHECK(require_insert(parse_statement("insert 4294967295 a b")).row.id == 4294967295U);
}

TEST_CASE("Ids beyond u32 are syntax errors")
{
    CHECK(parse_statement("insert 4294967296 a b").error == PrepareError::SyntaxError);
    CHECK(parse_statement("insert 99999999999999999999999 a b").error == PrepareError::SyntaxError);
}

TEST_CASE("Column length limits are enforced")
{
    const std::string username_max(32U, 'a');
    const std::string email_max(255U, 'a');
    const std::string username_long(33U, 'a');
    const std::string email_long(256U, 'a');

    SECTION("maximum lengths fit")
    {
        const auto& insert = require_insert(parse_statement("insert 1 " + username_max + " " + email_max));
        CHECK(cellar::storage::row_username(insert.row) == username_max);
        CHECK(cellar::storage::row_email(insert.row) == email_max);
    }

    SECTION("overlong username")
    {
        const auto result = parse_statement("insert 1 " + username_long + " " + email_max);
        CHECK(result.error == PrepareError::StringTooLong);
        CHECK(result.message == "string is too long");
    }

    SECTION("overlong email")
    {
        const auto result = parse_statement("insert 1 " + username_max + " " + email_long);
        CHECK(result.error == PrepareError::StringTooLong);
    }
}

TEST_CASE("Wrong argument counts are syntax errors")
{
    CHECK(parse_statement("insert").error == PrepareError::SyntaxError);
    CHECK(parse_statement("insert 1 user1").error == PrepareError::SyntaxError);
    CHECK(parse_statement("insert 1 user1 a@b.com extra").error == PrepareError::SyntaxError);
}

TEST_CASE("Non-numeric ids are syntax errors")
{
    CHECK(parse_statement("insert abc user1 a@b.com").error == PrepareError::SyntaxError);
    CHECK(parse_statement("insert 12x user1 a@b.com").error == PrepareError::SyntaxError);
    CHECK(parse_statement("insert - user1 a@b.com").error == PrepareError::SyntaxError);
}

TEST_CASE("Unknown keywords echo the input")
{
    const auto result = parse_statement("update 1 foo bar");
    CHECK_FALSE(result.success());
    CHECK(result.error == PrepareError::UnrecognizedKeyword);
    CHECK(result.message == "unrecognized keyword at start of 'update 1 foo bar'");
}

TEST_CASE("Keywords are case sensitive")
{
    CHECK(parse_statement("SELECT").error == PrepareError::UnrecognizedKeyword);
    CHECK(parse_statement("Insert 1 a b").error == PrepareError::UnrecognizedKeyword);
}
