#pragma once

#include "cellar/storage/row_codec.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cellar::parser {

enum class PrepareError : std::uint8_t {
    None = 0,
    NegativeId,
    StringTooLong,
    SyntaxError,
    UnrecognizedKeyword
};

struct InsertStatement final {
    storage::Row row{};
};

struct SelectStatement final {
};

using Statement = std::variant<InsertStatement, SelectStatement>;

struct StatementParseResult final {
    std::optional<Statement> statement{};
    PrepareError error = PrepareError::None;
    std::string message{};

    [[nodiscard]] bool success() const noexcept { return statement.has_value(); }
};

// Parses one command line: "insert <id> <username> <email>" or "select".
[[nodiscard]] StatementParseResult parse_statement(std::string_view input);

[[nodiscard]] std::string_view prepare_error_to_string(PrepareError error) noexcept;

}  // namespace cellar::parser
