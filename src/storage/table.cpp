#include "cellar/storage/table.hpp"

#include "cellar/storage/leaf_node.hpp"

#include <iostream>
#include <stdexcept>

namespace cellar::storage {

std::unique_ptr<Table> Table::open(const std::filesystem::path& path, Config config, std::error_code& out_error)
{
    auto pager = Pager::open(path, out_error);
    if (!pager) {
        return nullptr;
    }

    const bool fresh_file = pager->num_pages() == 0U;
    auto table = std::make_unique<Table>(std::move(pager), config);

    std::span<std::byte> root;
    out_error = table->pager_->get_page(table->root_page_index_, root);
    if (out_error) {
        table->closed_ = true;
        return nullptr;
    }

    if (fresh_file) {
        // New database file. Page 0 becomes the root leaf.
        initialize_leaf_node(root);
        set_node_root(root, true);
    } else if (node_type(root) != NodeType::Leaf || leaf_node_num_cells(root) > kLeafNodeMaxCells) {
        std::cerr << "[debug] rejecting root page path=" << path.string()
                  << " type=" << static_cast<unsigned>(node_type(root)) << " cells=" << leaf_node_num_cells(root)
                  << '\n';
        // Nothing was modified; skip the write-back in the destructor.
        table->closed_ = true;
        out_error = std::make_error_code(std::errc::bad_message);
        return nullptr;
    }

    out_error.clear();
    return table;
}

Table::Table(std::unique_ptr<Pager> pager, Config config)
    : pager_{std::move(pager)}
    , config_{config}
{}

Table::~Table()
{
    if (closed_ || !pager_) {
        return;
    }

    try {
        if (auto ec = close(); ec) {
            std::cerr << "[debug] table close failed path=" << pager_->path().string() << " error=" << ec.message()
                      << '\n';
        }
    } catch (const std::exception& error) {
        std::cerr << "[debug] table close aborted path=" << pager_->path().string() << " error=" << error.what()
                  << '\n';
    }
}

std::error_code Table::root_page(std::span<std::byte>& out_page)
{
    if (closed_) {
        throw std::logic_error{"operation on a closed table"};
    }
    return pager_->get_page(root_page_index_, out_page);
}

std::error_code Table::table_start(Cursor& out_cursor)
{
    std::span<std::byte> root;
    if (auto ec = root_page(root); ec) {
        return ec;
    }

    out_cursor.table = this;
    out_cursor.page_index = root_page_index_;
    out_cursor.cell_index = 0U;
    out_cursor.end_of_table = leaf_node_num_cells(root) == 0U;
    return {};
}

std::error_code Table::table_end(Cursor& out_cursor)
{
    std::span<std::byte> root;
    if (auto ec = root_page(root); ec) {
        return ec;
    }

    out_cursor.table = this;
    out_cursor.page_index = root_page_index_;
    out_cursor.cell_index = leaf_node_num_cells(root);
    out_cursor.end_of_table = true;
    return {};
}

std::error_code Table::table_find(std::uint32_t key, Cursor& out_cursor)
{
    std::span<std::byte> root;
    if (auto ec = root_page(root); ec) {
        return ec;
    }

    const auto num_cells = leaf_node_num_cells(root);
    out_cursor.table = this;
    out_cursor.page_index = root_page_index_;
    out_cursor.cell_index = leaf_node_find(root, key);
    out_cursor.end_of_table = out_cursor.cell_index >= num_cells;
    return {};
}

std::error_code Table::insert(const Row& row)
{
    std::span<std::byte> root;
    if (auto ec = root_page(root); ec) {
        return ec;
    }

    const auto num_cells = leaf_node_num_cells(root);
    if (num_cells >= kLeafNodeMaxCells) {
        return std::make_error_code(std::errc::no_buffer_space);
    }

    Cursor cursor{};
    if (config_.insert_policy == InsertPolicy::KeyOrder) {
        if (auto ec = table_find(row.id, cursor); ec) {
            return ec;
        }
        if (cursor.cell_index < num_cells && leaf_node_key(root, cursor.cell_index) == row.id) {
            return std::make_error_code(std::errc::file_exists);
        }
    } else {
        if (auto ec = table_end(cursor); ec) {
            return ec;
        }
    }

    return leaf_node_insert(root, cursor.cell_index, row.id, row);
}

std::error_code Table::select_all(const RowVisitor& visitor)
{
    Cursor cursor{};
    if (auto ec = table_start(cursor); ec) {
        return ec;
    }

    while (!cursor.end_of_table) {
        std::span<std::byte> value;
        if (auto ec = cursor_value(cursor, value); ec) {
            return ec;
        }
        visitor(deserialize_row(value));
        if (auto ec = cursor_advance(cursor); ec) {
            return ec;
        }
    }
    return {};
}

std::error_code Table::root_leaf_keys(std::vector<std::uint32_t>& out_keys)
{
    std::span<std::byte> root;
    if (auto ec = root_page(root); ec) {
        return ec;
    }
    out_keys = read_leaf_node_keys(root);
    return {};
}

std::error_code Table::row_count(std::uint32_t& out_count)
{
    std::span<std::byte> root;
    if (auto ec = root_page(root); ec) {
        return ec;
    }
    out_count = leaf_node_num_cells(root);
    return {};
}

std::error_code Table::close()
{
    if (closed_) {
        return close_error_;
    }
    closed_ = true;

    for (std::uint32_t page_index = 0U; page_index < pager_->num_pages(); ++page_index) {
        if (!pager_->is_cached(page_index)) {
            continue;
        }
        if (auto ec = pager_->flush(page_index, kPageSize); ec) {
            std::cerr << "[debug] page flush failed path=" << pager_->path().string() << " page=" << page_index
                      << " error=" << ec.message() << '\n';
            if (!close_error_) {
                close_error_ = ec;
            }
        }
    }

    if (auto ec = pager_->sync(); ec && !close_error_) {
        close_error_ = ec;
    }
    return close_error_;
}

}  // namespace cellar::storage
