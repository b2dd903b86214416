#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

namespace cellar::storage {

constexpr std::size_t kPageSize = 4096;
constexpr std::uint32_t kTableMaxPages = 100U;
constexpr std::uint32_t kRootPageIndex = 0U;

constexpr std::size_t kColumnUsernameSize = 32;
constexpr std::size_t kColumnEmailSize = 255;

constexpr std::size_t kIdSize = sizeof(std::uint32_t);
constexpr std::size_t kUsernameSize = kColumnUsernameSize + 1U;
constexpr std::size_t kEmailSize = kColumnEmailSize + 1U;
constexpr std::size_t kIdOffset = 0;
constexpr std::size_t kUsernameOffset = kIdOffset + kIdSize;
constexpr std::size_t kEmailOffset = kUsernameOffset + kUsernameSize;
constexpr std::size_t kRowSize = kIdSize + kUsernameSize + kEmailSize;

enum class NodeType : std::uint8_t {
    Internal = 0,
    Leaf = 1
};

// Common node header
constexpr std::size_t kNodeTypeSize = sizeof(std::uint8_t);
constexpr std::size_t kNodeTypeOffset = 0;
constexpr std::size_t kIsRootSize = sizeof(std::uint8_t);
constexpr std::size_t kIsRootOffset = kNodeTypeOffset + kNodeTypeSize;
constexpr std::size_t kParentPointerSize = sizeof(std::uint32_t);
constexpr std::size_t kParentPointerOffset = kIsRootOffset + kIsRootSize;
constexpr std::size_t kCommonNodeHeaderSize = kNodeTypeSize + kIsRootSize + kParentPointerSize;

// Leaf node header
constexpr std::size_t kLeafNodeNumCellsSize = sizeof(std::uint32_t);
constexpr std::size_t kLeafNodeNumCellsOffset = kCommonNodeHeaderSize;
constexpr std::size_t kLeafNodeHeaderSize = kCommonNodeHeaderSize + kLeafNodeNumCellsSize;

// Leaf node body
constexpr std::size_t kLeafNodeKeySize = sizeof(std::uint32_t);
constexpr std::size_t kLeafNodeKeyOffset = 0;
constexpr std::size_t kLeafNodeValueSize = kRowSize;
constexpr std::size_t kLeafNodeValueOffset = kLeafNodeKeyOffset + kLeafNodeKeySize;
constexpr std::size_t kLeafNodeCellSize = kLeafNodeKeySize + kLeafNodeValueSize;
constexpr std::size_t kLeafNodeSpaceForCells = kPageSize - kLeafNodeHeaderSize;
constexpr std::uint32_t kLeafNodeMaxCells = static_cast<std::uint32_t>(kLeafNodeSpaceForCells / kLeafNodeCellSize);

static_assert(kRowSize == 293U, "Row layout must remain 293 bytes");
static_assert(kEmailOffset == 37U, "Email column expected at offset 37");
static_assert(kCommonNodeHeaderSize == 6U, "Common node header expected to be 6 bytes");
static_assert(kLeafNodeHeaderSize == 10U, "Leaf node header expected to be 10 bytes");
static_assert(kLeafNodeCellSize == 297U, "Leaf cell expected to be 297 bytes");
static_assert(kLeafNodeSpaceForCells == 4086U, "Leaf body expected to span 4086 bytes");
static_assert(kLeafNodeMaxCells == 13U, "A 4 KiB leaf must hold 13 cells");

[[nodiscard]] constexpr std::uint64_t page_offset(std::uint32_t page_index) noexcept
{
    return static_cast<std::uint64_t>(page_index) * kPageSize;
}

// On-disk integers are little-endian regardless of host byte order.
[[nodiscard]] inline std::uint32_t load_u32_le(std::span<const std::byte> bytes, std::size_t offset)
{
    if (offset + sizeof(std::uint32_t) > bytes.size()) {
        throw std::out_of_range{"load_u32_le offset outside of buffer"};
    }
    return static_cast<std::uint32_t>(bytes[offset]) |
           (static_cast<std::uint32_t>(bytes[offset + 1U]) << 8U) |
           (static_cast<std::uint32_t>(bytes[offset + 2U]) << 16U) |
           (static_cast<std::uint32_t>(bytes[offset + 3U]) << 24U);
}

inline void store_u32_le(std::span<std::byte> bytes, std::size_t offset, std::uint32_t value)
{
    if (offset + sizeof(std::uint32_t) > bytes.size()) {
        throw std::out_of_range{"store_u32_le offset outside of buffer"};
    }
    bytes[offset] = static_cast<std::byte>(value & 0xFFU);
    bytes[offset + 1U] = static_cast<std::byte>((value >> 8U) & 0xFFU);
    bytes[offset + 2U] = static_cast<std::byte>((value >> 16U) & 0xFFU);
    bytes[offset + 3U] = static_cast<std::byte>((value >> 24U) & 0xFFU);
}

}  // namespace cellar::storage
