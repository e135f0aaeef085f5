// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/disk/error.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace ranger::disk {

// Output sink for downloaded chunks.
//
// A regular file takes positional writes (pwrite), so chunks may land in any
// order. Standard output is a stream and only accepts writes at the current
// end.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Create or truncate path. A non-zero size preallocates the file.
    [[nodiscard]] std::error_code open(std::string_view path, std::uint64_t size) noexcept;

    // Write to standard output instead of a file
    [[nodiscard]] std::error_code open_stdout() noexcept;

    // Write data at offset (thread-safe for files)
    [[nodiscard]] std::error_code write(std::uint64_t offset, std::span<const std::byte> data) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] bool is_stream() const noexcept { return stream_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept {
        return bytes_written_.load(std::memory_order_relaxed);
    }

private:
    int fd_{-1};
    bool stream_{false};
    std::string path_;
    std::atomic<std::uint64_t> bytes_written_{0};
};

// errno -> DiskErrc
[[nodiscard]] std::error_code from_errno(int err) noexcept;

} // namespace ranger::disk
