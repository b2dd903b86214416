#include "cellar/storage/pager.hpp"

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cellar::storage {

namespace {

[[nodiscard]] std::error_code last_system_error()
{
    return std::error_code(errno, std::generic_category());
}

}  // namespace

std::unique_ptr<Pager> Pager::open(const std::filesystem::path& path, std::error_code& out_error)
{
    const auto path_native = path.native();
    const int fd = ::open(path_native.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        out_error = last_system_error();
        return nullptr;
    }

    struct stat file_stat{};
    if (::fstat(fd, &file_stat) != 0) {
        out_error = last_system_error();
        (void)::close(fd);
        return nullptr;
    }

    if (S_ISREG(file_stat.st_mode) && (file_stat.st_mode & 0777) != 0600 && ::fchmod(fd, 0600) != 0) {
        out_error = last_system_error();
        (void)::close(fd);
        return nullptr;
    }

    const auto file_length = static_cast<std::uint64_t>(file_stat.st_size);
    if (file_length % kPageSize != 0U) {
        // A partial trailing page means the file was not written by us, or was torn.
        out_error = std::make_error_code(std::errc::illegal_byte_sequence);
        (void)::close(fd);
        return nullptr;
    }

    if (file_length / kPageSize > kTableMaxPages) {
        out_error = std::make_error_code(std::errc::file_too_large);
        (void)::close(fd);
        return nullptr;
    }

    out_error.clear();
    return std::make_unique<Pager>(path, fd, file_length);
}

Pager::Pager(std::filesystem::path path, int fd, std::uint64_t file_length)
    : path_{std::move(path)}
    , fd_{fd}
    , file_length_{file_length}
    , num_pages_{static_cast<std::uint32_t>(file_length / kPageSize)}
{}

Pager::~Pager()
{
    if (fd_ >= 0 && ::close(fd_) != 0) {
        std::cerr << "[debug] pager close failed path=" << path_.string() << " errno=" << errno << '\n';
    }
}

bool Pager::is_cached(std::uint32_t page_index) const noexcept
{
    return page_index < kTableMaxPages && pages_[page_index] != nullptr;
}

std::error_code Pager::get_page(std::uint32_t page_index, std::span<std::byte>& out_page)
{
    if (page_index >= kTableMaxPages) {
        throw std::out_of_range{"Tried to fetch page number out of bounds. " + std::to_string(page_index) +
                                " >= " + std::to_string(kTableMaxPages)};
    }

    auto& slot = pages_[page_index];
    if (slot) {
        ++telemetry_.cache_hits;
        out_page = std::span<std::byte>{slot->data(), slot->size()};
        return {};
    }

    auto buffer = std::make_unique<PageBuffer>();
    buffer->fill(std::byte{0});

    const auto pages_on_disk = static_cast<std::uint32_t>(file_length_ / kPageSize);
    if (page_index < pages_on_disk) {
        if (auto ec = read_page(page_index, *buffer); ec) {
            return ec;
        }
    }

    slot = std::move(buffer);
    ++telemetry_.page_loads;
    if (page_index >= num_pages_) {
        num_pages_ = page_index + 1U;
    }

    out_page = std::span<std::byte>{slot->data(), slot->size()};
    return {};
}

std::error_code Pager::read_page(std::uint32_t page_index, PageBuffer& buffer)
{
    std::size_t total_read = 0U;
    const auto base_offset = static_cast<off_t>(page_offset(page_index));

    while (total_read < buffer.size()) {
        const auto current_offset = base_offset + static_cast<off_t>(total_read);
        const ssize_t read_count = ::pread(fd_, buffer.data() + total_read, buffer.size() - total_read, current_offset);
        if (read_count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_system_error();
        }
        if (read_count == 0) {
            // Short file: the remainder of the page stays zero.
            break;
        }
        total_read += static_cast<std::size_t>(read_count);
    }

    ++telemetry_.disk_reads;
    telemetry_.bytes_read += total_read;
    return {};
}

std::error_code Pager::flush(std::uint32_t page_index, std::size_t size)
{
    if (!is_cached(page_index)) {
        throw std::logic_error{"Tried to flush null page " + std::to_string(page_index)};
    }
    if (size > kPageSize) {
        throw std::logic_error{"Tried to flush more than one page of data"};
    }

    const auto& buffer = *pages_[page_index];
    std::size_t total_written = 0U;
    const auto base_offset = static_cast<off_t>(page_offset(page_index));

    while (total_written < size) {
        const auto current_offset = base_offset + static_cast<off_t>(total_written);
        const auto chunk = std::min<std::size_t>(size - total_written,
                                                 static_cast<std::size_t>(std::numeric_limits<ssize_t>::max()));
        const ssize_t write_count = ::pwrite(fd_, buffer.data() + total_written, chunk, current_offset);
        if (write_count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_system_error();
        }
        total_written += static_cast<std::size_t>(write_count);
    }

    const auto end_offset = page_offset(page_index) + size;
    file_length_ = std::max(file_length_, end_offset);
    ++telemetry_.pages_flushed;
    telemetry_.bytes_written += total_written;
    return {};
}

std::error_code Pager::sync() const
{
    if (::fsync(fd_) != 0) {
        return last_system_error();
    }
    return {};
}

}  // namespace cellar::storage
