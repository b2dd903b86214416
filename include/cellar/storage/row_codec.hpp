#pragma once

#include "cellar/storage/page_format.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace cellar::storage {

struct Row final {
    std::uint32_t id = 0U;
    std::array<char, kUsernameSize> username{};
    std::array<char, kEmailSize> email{};

    friend bool operator==(const Row&, const Row&) = default;
};

// Fails with value_too_large when a column exceeds its bound. out_row is untouched on failure.
[[nodiscard]] std::error_code make_row(std::uint32_t id,
                                       std::string_view username,
                                       std::string_view email,
                                       Row& out_row);

void serialize_row(const Row& row, std::span<std::byte> destination);
[[nodiscard]] Row deserialize_row(std::span<const std::byte> source);

[[nodiscard]] std::string_view row_username(const Row& row) noexcept;
[[nodiscard]] std::string_view row_email(const Row& row) noexcept;

// Renders "(id, username, email)".
[[nodiscard]] std::string format_row(const Row& row);

}  // namespace cellar::storage
