#include "cellar/storage/row_codec.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace cellar::storage {

namespace {

template <std::size_t N>
[[nodiscard]] std::string_view until_nul(const std::array<char, N>& field) noexcept
{
    const auto end = std::find(field.begin(), field.end(), '\0');
    return std::string_view{field.data(), static_cast<std::size_t>(end - field.begin())};
}

template <std::size_t N>
void copy_padded(std::string_view text, std::array<char, N>& field) noexcept
{
    field.fill('\0');
    std::memcpy(field.data(), text.data(), text.size());
}

}  // namespace

std::error_code make_row(std::uint32_t id, std::string_view username, std::string_view email, Row& out_row)
{
    if (username.size() > kColumnUsernameSize || email.size() > kColumnEmailSize) {
        return std::make_error_code(std::errc::value_too_large);
    }

    Row row{};
    row.id = id;
    copy_padded(username, row.username);
    copy_padded(email, row.email);
    out_row = row;
    return {};
}

void serialize_row(const Row& row, std::span<std::byte> destination)
{
    if (destination.size() != kRowSize) {
        throw std::logic_error{"serialize_row requires a buffer of exactly kRowSize bytes"};
    }

    store_u32_le(destination, kIdOffset, row.id);
    std::memcpy(destination.data() + kUsernameOffset, row.username.data(), kUsernameSize);
    std::memcpy(destination.data() + kEmailOffset, row.email.data(), kEmailSize);
}

Row deserialize_row(std::span<const std::byte> source)
{
    if (source.size() != kRowSize) {
        throw std::logic_error{"deserialize_row requires a buffer of exactly kRowSize bytes"};
    }

    Row row{};
    row.id = load_u32_le(source, kIdOffset);
    std::memcpy(row.username.data(), source.data() + kUsernameOffset, kUsernameSize);
    std::memcpy(row.email.data(), source.data() + kEmailOffset, kEmailSize);
    return row;
}

std::string_view row_username(const Row& row) noexcept
{
    return until_nul(row.username);
}

std::string_view row_email(const Row& row) noexcept
{
    return until_nul(row.email);
}

std::string format_row(const Row& row)
{
    std::ostringstream stream;
    stream << '(' << row.id << ", " << row_username(row) << ", " << row_email(row) << ')';
    return stream.str();
}

}  // namespace cellar::storage
