#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>

namespace cellar::storage {

class Table;

// Logical position inside a table. Borrows the table; invalidated by any structural change to
// the page it points at.
struct Cursor final {
    Table* table = nullptr;
    std::uint32_t page_index = 0U;
    std::uint32_t cell_index = 0U;
    bool end_of_table = false;
};

// Row payload of the current cell. Throws std::logic_error when the cursor is at end of table.
[[nodiscard]] std::error_code cursor_value(const Cursor& cursor, std::span<std::byte>& out_value);

[[nodiscard]] std::error_code cursor_advance(Cursor& cursor);

}  // namespace cellar::storage
