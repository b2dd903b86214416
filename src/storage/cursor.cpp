#include "cellar/storage/cursor.hpp"

#include "cellar/storage/leaf_node.hpp"
#include "cellar/storage/table.hpp"

#include <stdexcept>

namespace cellar::storage {

std::error_code cursor_value(const Cursor& cursor, std::span<std::byte>& out_value)
{
    if (cursor.table == nullptr) {
        throw std::logic_error{"cursor is not bound to a table"};
    }
    if (cursor.end_of_table) {
        throw std::logic_error{"cursor_value called at end of table"};
    }

    std::span<std::byte> page;
    if (auto ec = cursor.table->pager().get_page(cursor.page_index, page); ec) {
        return ec;
    }

    out_value = leaf_node_value(page, cursor.cell_index);
    return {};
}

std::error_code cursor_advance(Cursor& cursor)
{
    if (cursor.table == nullptr) {
        throw std::logic_error{"cursor is not bound to a table"};
    }

    std::span<std::byte> page;
    if (auto ec = cursor.table->pager().get_page(cursor.page_index, page); ec) {
        return ec;
    }

    ++cursor.cell_index;
    if (cursor.cell_index >= leaf_node_num_cells(page)) {
        cursor.end_of_table = true;
    }
    return {};
}

}  // namespace cellar::storage
