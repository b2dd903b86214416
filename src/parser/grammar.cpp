#include "cellar/parser/grammar.hpp"

#include <tao/pegtl.hpp>

#include <charconv>
#include <limits>
#include <system_error>

namespace cellar::parser {

namespace {

namespace pegtl = tao::pegtl;

struct separator : pegtl::plus<pegtl::space> {
};

struct optional_space : pegtl::star<pegtl::space> {
};

struct kw_insert : pegtl::string<'i', 'n', 's', 'e', 'r', 't'> {
};

struct kw_select : pegtl::string<'s', 'e', 'l', 'e', 'c', 't'> {
};

struct id_token : pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>, pegtl::plus<pegtl::digit>> {
};

struct text_token : pegtl::plus<pegtl::not_one<' ', '\t', '\n', '\r', '\v', '\f'>> {
};

struct username_token : text_token {
};

struct email_token : text_token {
};

struct insert_grammar
    : pegtl::seq<optional_space,
                 kw_insert,
                 separator,
                 id_token,
                 separator,
                 username_token,
                 separator,
                 email_token,
                 optional_space,
                 pegtl::eof> {
};

struct select_grammar : pegtl::seq<optional_space, kw_select, optional_space, pegtl::eof> {
};

struct InsertParseState final {
    std::string id_text{};
    std::string username{};
    std::string email{};
};

template <typename Rule>
struct insert_action {
    template <typename Input>
    static void apply(const Input&, InsertParseState&)
    {
    }
};

template <>
struct insert_action<id_token> {
    template <typename Input>
    static void apply(const Input& in, InsertParseState& state)
    {
        state.id_text = in.string();
    }
};

template <>
struct insert_action<username_token> {
    template <typename Input>
    static void apply(const Input& in, InsertParseState& state)
    {
        state.username = in.string();
    }
};

template <>
struct insert_action<email_token> {
    template <typename Input>
    static void apply(const Input& in, InsertParseState& state)
    {
        state.email = in.string();
    }
};

[[nodiscard]] std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n\v\f");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n\v\f");
    return std::string{text.substr(first, last - first + 1U)};
}

[[nodiscard]] StatementParseResult make_failure(PrepareError error, std::string message)
{
    StatementParseResult result{};
    result.error = error;
    result.message = std::move(message);
    return result;
}

[[nodiscard]] StatementParseResult make_failure(PrepareError error)
{
    return make_failure(error, std::string{prepare_error_to_string(error)});
}

[[nodiscard]] StatementParseResult parse_insert(std::string_view input)
{
    pegtl::memory_input in(input.data(), input.size(), "insert");
    InsertParseState state{};

    try {
        if (!pegtl::parse<insert_grammar, insert_action>(in, state)) {
            return make_failure(PrepareError::SyntaxError);
        }
    } catch (const pegtl::parse_error&) {
        return make_failure(PrepareError::SyntaxError);
    }

    // Parsed as signed so a leading '-' is reported as a negative id rather than a syntax error.
    std::int64_t id = 0;
    const auto* begin = state.id_text.data();
    const auto* end = begin + state.id_text.size();
    if (!state.id_text.empty() && state.id_text.front() == '+') {
        ++begin;
    }
    const auto [last, ec] = std::from_chars(begin, end, id);
    if (ec != std::errc{} || last != end) {
        return make_failure(PrepareError::SyntaxError);
    }
    if (id < 0) {
        return make_failure(PrepareError::NegativeId);
    }
    if (id > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        return make_failure(PrepareError::SyntaxError);
    }

    InsertStatement statement{};
    if (auto row_error = storage::make_row(static_cast<std::uint32_t>(id), state.username, state.email, statement.row);
        row_error) {
        return make_failure(PrepareError::StringTooLong);
    }

    StatementParseResult result{};
    result.statement = Statement{std::move(statement)};
    return result;
}

[[nodiscard]] StatementParseResult parse_select(std::string_view input)
{
    pegtl::memory_input in(input.data(), input.size(), "select");

    try {
        if (!pegtl::parse<select_grammar>(in)) {
            return make_failure(PrepareError::SyntaxError);
        }
    } catch (const pegtl::parse_error&) {
        return make_failure(PrepareError::SyntaxError);
    }

    StatementParseResult result{};
    result.statement = Statement{SelectStatement{}};
    return result;
}

}  // namespace

std::string_view prepare_error_to_string(PrepareError error) noexcept
{
    switch (error) {
    case PrepareError::None:
        return "ok";
    case PrepareError::NegativeId:
        return "id must be positive";
    case PrepareError::StringTooLong:
        return "string is too long";
    case PrepareError::SyntaxError:
        return "syntax error";
    case PrepareError::UnrecognizedKeyword:
    default:
        return "unrecognized keyword";
    }
}

StatementParseResult parse_statement(std::string_view input)
{
    const auto trimmed = trim_copy(input);
    const std::string_view view{trimmed};

    if (view.starts_with("insert")) {
        return parse_insert(view);
    }
    if (view.starts_with("select")) {
        return parse_select(view);
    }

    return make_failure(PrepareError::UnrecognizedKeyword, "unrecognized keyword at start of '" + trimmed + "'");
}

}  // namespace cellar::parser
