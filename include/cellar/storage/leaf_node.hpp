#pragma once

#include "cellar/storage/page_format.hpp"
#include "cellar/storage/row_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace cellar::storage {

// Accessors over a page interpreted as a B-tree node. Every accessor requires a full kPageSize
// span and a cell index below kLeafNodeMaxCells; violations throw std::out_of_range.

[[nodiscard]] NodeType node_type(std::span<const std::byte> page);
void set_node_type(std::span<std::byte> page, NodeType type);

[[nodiscard]] bool is_node_root(std::span<const std::byte> page);
void set_node_root(std::span<std::byte> page, bool is_root);

[[nodiscard]] std::uint32_t node_parent(std::span<const std::byte> page);
void set_node_parent(std::span<std::byte> page, std::uint32_t parent_page_index);

void initialize_leaf_node(std::span<std::byte> page);

[[nodiscard]] std::uint32_t leaf_node_num_cells(std::span<const std::byte> page);
void set_leaf_node_num_cells(std::span<std::byte> page, std::uint32_t num_cells);

[[nodiscard]] std::span<std::byte> leaf_node_cell(std::span<std::byte> page, std::uint32_t cell_index);
[[nodiscard]] std::span<const std::byte> leaf_node_cell(std::span<const std::byte> page, std::uint32_t cell_index);

[[nodiscard]] std::uint32_t leaf_node_key(std::span<const std::byte> page, std::uint32_t cell_index);
void set_leaf_node_key(std::span<std::byte> page, std::uint32_t cell_index, std::uint32_t key);

[[nodiscard]] std::span<std::byte> leaf_node_value(std::span<std::byte> page, std::uint32_t cell_index);
[[nodiscard]] std::span<const std::byte> leaf_node_value(std::span<const std::byte> page, std::uint32_t cell_index);

// Shifts cells [cell_index, num_cells) one slot right and writes key/row into the gap.
// Returns operation_not_supported when the leaf is full: splitting is not implemented.
[[nodiscard]] std::error_code leaf_node_insert(std::span<std::byte> page,
                                               std::uint32_t cell_index,
                                               std::uint32_t key,
                                               const Row& row);

// Binary search. Index of key when present, otherwise the slot that keeps keys ordered.
// Only meaningful for leaves whose keys are ascending.
[[nodiscard]] std::uint32_t leaf_node_find(std::span<const std::byte> page, std::uint32_t key);

[[nodiscard]] std::vector<std::uint32_t> read_leaf_node_keys(std::span<const std::byte> page);

}  // namespace cellar::storage
