// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace ranger::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    already_open,
    write_error,
    sync_error,
    handle_invalid,
    not_sequential,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ranger::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:        return "Success";
            case DiskErrc::file_not_found: return "File not found";
            case DiskErrc::access_denied:  return "Access denied";
            case DiskErrc::disk_full:      return "Disk full";
            case DiskErrc::invalid_path:   return "Invalid path";
            case DiskErrc::already_open:   return "File already open";
            case DiskErrc::write_error:    return "Write error";
            case DiskErrc::sync_error:     return "Sync error";
            case DiskErrc::handle_invalid: return "Invalid handle";
            case DiskErrc::not_sequential: return "Out-of-order write to a stream";
            default:                       return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace ranger::disk

namespace std {

template<>
struct is_error_code_enum<ranger::disk::DiskErrc> : true_type {};

} // namespace std
