#pragma once

#include "cellar/storage/cursor.hpp"
#include "cellar/storage/pager.hpp"
#include "cellar/storage/row_codec.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <system_error>
#include <vector>

namespace cellar::storage {

enum class InsertPolicy : std::uint8_t {
    Append = 0,  // rows land after the last cell, whatever their key
    KeyOrder     // binary-search the key position, duplicates rejected
};

// Single-table store rooted at one leaf page. Owns its pager; the file is flushed on close().
class Table final {
public:
    struct Config final {
        InsertPolicy insert_policy = InsertPolicy::Append;
    };

    using RowVisitor = std::function<void(const Row&)>;

    // bad_message when page 0 of an existing file is not a leaf holding at most kLeafNodeMaxCells.
    [[nodiscard]] static std::unique_ptr<Table> open(const std::filesystem::path& path,
                                                     Config config,
                                                     std::error_code& out_error);

    Table(std::unique_ptr<Pager> pager, Config config);

    // Closes the table if close() was not called; failures are logged, not thrown.
    ~Table();

    Table(const Table&) = delete;
    Table& operator=(const Table&) = delete;
    Table(Table&&) = delete;
    Table& operator=(Table&&) = delete;

    [[nodiscard]] std::error_code table_start(Cursor& out_cursor);
    [[nodiscard]] std::error_code table_end(Cursor& out_cursor);
    [[nodiscard]] std::error_code table_find(std::uint32_t key, Cursor& out_cursor);

    // no_buffer_space when the root leaf is full, file_exists for a duplicate key under KeyOrder.
    [[nodiscard]] std::error_code insert(const Row& row);
    [[nodiscard]] std::error_code select_all(const RowVisitor& visitor);

    [[nodiscard]] std::error_code root_leaf_keys(std::vector<std::uint32_t>& out_keys);
    [[nodiscard]] std::error_code row_count(std::uint32_t& out_count);

    // Writes every cached page back and syncs the file, even after a failed write. Runs once; later
    // calls return the first error of that run.
    [[nodiscard]] std::error_code close();

    [[nodiscard]] bool is_closed() const noexcept { return closed_; }
    [[nodiscard]] std::uint32_t root_page_index() const noexcept { return root_page_index_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] Pager& pager() noexcept { return *pager_; }
    [[nodiscard]] const Pager& pager() const noexcept { return *pager_; }

private:
    [[nodiscard]] std::error_code root_page(std::span<std::byte>& out_page);

    std::unique_ptr<Pager> pager_{};
    Config config_{};
    std::uint32_t root_page_index_ = kRootPageIndex;
    bool closed_ = false;
    std::error_code close_error_{};
};

}  // namespace cellar::storage
