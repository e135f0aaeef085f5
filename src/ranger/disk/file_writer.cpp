// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace ranger::disk {

std::error_code from_errno(int err) noexcept {
    switch (err) {
        case ENOENT:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:        return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case EINVAL:       return make_error_code(DiskErrc::invalid_path);
        case EBADF:        return make_error_code(DiskErrc::handle_invalid);
        default:           return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open(std::string_view path, std::uint64_t size) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::already_open);
    }
    if (path.empty()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    path_ = path;

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return from_errno(errno);
    }

    if (size > 0 && ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        auto ec = from_errno(errno);
        ::close(fd);
        return ec;
    }

    fd_ = fd;
    stream_ = false;
    bytes_written_.store(0, std::memory_order_relaxed);
    return {};
}

std::error_code FileWriter::open_stdout() noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::already_open);
    }

    fd_ = STDOUT_FILENO;
    stream_ = true;
    path_ = "-";
    bytes_written_.store(0, std::memory_order_relaxed);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset, std::span<const std::byte> data) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (stream_ && offset != bytes_written_.load(std::memory_order_relaxed)) {
        return make_error_code(DiskErrc::not_sequential);
    }

    // Short writes are retried until everything is out
    std::size_t done = 0;
    while (done < data.size()) {
        ssize_t n = stream_
            ? ::write(fd_, data.data() + done, data.size() - done)
            : ::pwrite(fd_, data.data() + done, data.size() - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno);
        }
        if (n == 0) {
            return make_error_code(DiskErrc::write_error);
        }
        done += static_cast<std::size_t>(n);
    }

    bytes_written_.fetch_add(done, std::memory_order_relaxed);
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (stream_) {
        return {};
    }
    if (::fsync(fd_) != 0) {
        return make_error_code(DiskErrc::sync_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (!is_open()) {
        return;
    }

    // Never close the process's stdout
    if (!stream_) {
        ::close(fd_);
    }
    fd_ = -1;
    stream_ = false;
}

} // namespace ranger::disk
