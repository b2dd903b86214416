#pragma once

#include "cellar/storage/page_format.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <system_error>

namespace cellar::storage {

struct PagerTelemetrySnapshot final {
    std::uint64_t page_loads = 0U;
    std::uint64_t cache_hits = 0U;
    std::uint64_t disk_reads = 0U;
    std::uint64_t pages_flushed = 0U;
    std::uint64_t bytes_read = 0U;
    std::uint64_t bytes_written = 0U;
};

// Page cache over a single database file. Owns the descriptor and every cached page buffer.
class Pager final {
public:
    using PageBuffer = std::array<std::byte, kPageSize>;

    // Creates the file when absent and restricts a regular file to owner read/write.
    [[nodiscard]] static std::unique_ptr<Pager> open(const std::filesystem::path& path, std::error_code& out_error);

    // Takes ownership of an open descriptor whose length was already validated by open().
    Pager(std::filesystem::path path, int fd, std::uint64_t file_length);
    ~Pager();

    Pager(const Pager&) = delete;
    Pager& operator=(const Pager&) = delete;
    Pager(Pager&&) = delete;
    Pager& operator=(Pager&&) = delete;

    // Throws std::out_of_range when page_index >= kTableMaxPages.
    [[nodiscard]] std::error_code get_page(std::uint32_t page_index, std::span<std::byte>& out_page);

    // Throws std::logic_error when the page was never loaded or size exceeds kPageSize.
    [[nodiscard]] std::error_code flush(std::uint32_t page_index, std::size_t size);

    [[nodiscard]] std::error_code sync() const;

    [[nodiscard]] bool is_cached(std::uint32_t page_index) const noexcept;
    [[nodiscard]] std::uint32_t num_pages() const noexcept { return num_pages_; }
    [[nodiscard]] std::uint64_t file_length() const noexcept { return file_length_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] PagerTelemetrySnapshot telemetry() const noexcept { return telemetry_; }

private:
    [[nodiscard]] std::error_code read_page(std::uint32_t page_index, PageBuffer& buffer);

    std::filesystem::path path_{};
    int fd_ = -1;
    std::uint64_t file_length_ = 0U;
    std::uint32_t num_pages_ = 0U;
    std::array<std::unique_ptr<PageBuffer>, kTableMaxPages> pages_{};
    PagerTelemetrySnapshot telemetry_{};
};

}  // namespace cellar::storage
