#include "cellar/storage/leaf_node.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace cellar::storage {

namespace {

void require_page(std::span<const std::byte> page)
{
    if (page.size() != kPageSize) {
        throw std::out_of_range{"node accessor requires a full page, got " + std::to_string(page.size()) + " bytes"};
    }
}

void require_cell(std::uint32_t cell_index)
{
    if (cell_index >= kLeafNodeMaxCells) {
        throw std::out_of_range{"leaf cell index " + std::to_string(cell_index) + " exceeds capacity " +
                                std::to_string(kLeafNodeMaxCells)};
    }
}

[[nodiscard]] constexpr std::size_t cell_offset(std::uint32_t cell_index) noexcept
{
    return kLeafNodeHeaderSize + static_cast<std::size_t>(cell_index) * kLeafNodeCellSize;
}

}  // namespace

NodeType node_type(std::span<const std::byte> page)
{
    require_page(page);
    return static_cast<NodeType>(page[kNodeTypeOffset]);
}

void set_node_type(std::span<std::byte> page, NodeType type)
{
    require_page(page);
    page[kNodeTypeOffset] = static_cast<std::byte>(type);
}

bool is_node_root(std::span<const std::byte> page)
{
    require_page(page);
    return page[kIsRootOffset] != std::byte{0};
}

void set_node_root(std::span<std::byte> page, bool is_root)
{
    require_page(page);
    page[kIsRootOffset] = is_root ? std::byte{1} : std::byte{0};
}

std::uint32_t node_parent(std::span<const std::byte> page)
{
    require_page(page);
    return load_u32_le(page, kParentPointerOffset);
}

void set_node_parent(std::span<std::byte> page, std::uint32_t parent_page_index)
{
    require_page(page);
    store_u32_le(page, kParentPointerOffset, parent_page_index);
}

void initialize_leaf_node(std::span<std::byte> page)
{
    set_node_type(page, NodeType::Leaf);
    set_node_root(page, false);
    set_node_parent(page, 0U);
    set_leaf_node_num_cells(page, 0U);
}

std::uint32_t leaf_node_num_cells(std::span<const std::byte> page)
{
    require_page(page);
    return load_u32_le(page, kLeafNodeNumCellsOffset);
}

void set_leaf_node_num_cells(std::span<std::byte> page, std::uint32_t num_cells)
{
    require_page(page);
    if (num_cells > kLeafNodeMaxCells) {
        throw std::out_of_range{"leaf cell count " + std::to_string(num_cells) + " exceeds capacity"};
    }
    store_u32_le(page, kLeafNodeNumCellsOffset, num_cells);
}

std::span<std::byte> leaf_node_cell(std::span<std::byte> page, std::uint32_t cell_index)
{
    require_page(page);
    require_cell(cell_index);
    return page.subspan(cell_offset(cell_index), kLeafNodeCellSize);
}

std::span<const std::byte> leaf_node_cell(std::span<const std::byte> page, std::uint32_t cell_index)
{
    require_page(page);
    require_cell(cell_index);
    return page.subspan(cell_offset(cell_index), kLeafNodeCellSize);
}

std::uint32_t leaf_node_key(std::span<const std::byte> page, std::uint32_t cell_index)
{
    return load_u32_le(leaf_node_cell(page, cell_index), kLeafNodeKeyOffset);
}

void set_leaf_node_key(std::span<std::byte> page, std::uint32_t cell_index, std::uint32_t key)
{
    store_u32_le(leaf_node_cell(page, cell_index), kLeafNodeKeyOffset, key);
}

std::span<std::byte> leaf_node_value(std::span<std::byte> page, std::uint32_t cell_index)
{
    return leaf_node_cell(page, cell_index).subspan(kLeafNodeValueOffset, kLeafNodeValueSize);
}

std::span<const std::byte> leaf_node_value(std::span<const std::byte> page, std::uint32_t cell_index)
{
    return leaf_node_cell(page, cell_index).subspan(kLeafNodeValueOffset, kLeafNodeValueSize);
}

std::error_code leaf_node_insert(std::span<std::byte> page, std::uint32_t cell_index, std::uint32_t key, const Row& row)
{
    const auto num_cells = leaf_node_num_cells(page);
    if (num_cells >= kLeafNodeMaxCells) {
        // TODO: split the leaf and promote the separator key into a new internal root.
        return std::make_error_code(std::errc::operation_not_supported);
    }

    if (cell_index > num_cells) {
        throw std::out_of_range{"leaf insert position " + std::to_string(cell_index) + " past cell count " +
                                std::to_string(num_cells)};
    }

    if (cell_index < num_cells) {
        const auto source = cell_offset(cell_index);
        const auto length = static_cast<std::size_t>(num_cells - cell_index) * kLeafNodeCellSize;
        std::memmove(page.data() + source + kLeafNodeCellSize, page.data() + source, length);
    }

    set_leaf_node_num_cells(page, num_cells + 1U);
    set_leaf_node_key(page, cell_index, key);
    serialize_row(row, leaf_node_value(page, cell_index));
    return {};
}

std::uint32_t leaf_node_find(std::span<const std::byte> page, std::uint32_t key)
{
    std::uint32_t min_index = 0U;
    std::uint32_t one_past_max_index = leaf_node_num_cells(page);

    while (one_past_max_index != min_index) {
        const auto index = min_index + (one_past_max_index - min_index) / 2U;
        const auto key_at_index = leaf_node_key(page, index);
        if (key == key_at_index) {
            return index;
        }
        if (key < key_at_index) {
            one_past_max_index = index;
        } else {
            min_index = index + 1U;
        }
    }

    return min_index;
}

std::vector<std::uint32_t> read_leaf_node_keys(std::span<const std::byte> page)
{
    const auto num_cells = leaf_node_num_cells(page);
    std::vector<std::uint32_t> keys;
    keys.reserve(num_cells);
    for (std::uint32_t index = 0U; index < num_cells; ++index) {
        keys.push_back(leaf_node_key(page, index));
    }
    return keys;
}

}  // namespace cellar::storage
