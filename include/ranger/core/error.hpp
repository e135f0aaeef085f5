// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ranger::core {

// Failures reported by an object client (one subrequest)
enum class ClientErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    permission_denied,
    server_error,
    range_not_satisfiable,
    invalid_response,
    invalid_endpoint,
    cancelled,
};

// Terminal failures of a whole transfer
enum class TransferErrc {
    success = 0,
    discovery_failed,
    chunk_failed,
    invalid_request,
    checksum_mismatch,
    cancelled,
};

namespace detail {

struct ClientErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ranger::client";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<ClientErrc>(ev)) {
            case ClientErrc::success:               return "Success";
            case ClientErrc::network_error:         return "Network error";
            case ClientErrc::timeout:               return "Operation timed out";
            case ClientErrc::not_found:             return "Object not found (404)";
            case ClientErrc::permission_denied:     return "Permission denied";
            case ClientErrc::server_error:          return "Server error (5xx)";
            case ClientErrc::range_not_satisfiable: return "Range not satisfiable (416)";
            case ClientErrc::invalid_response:      return "Invalid response";
            case ClientErrc::invalid_endpoint:      return "Invalid endpoint";
            case ClientErrc::cancelled:             return "Request cancelled";
            default:                                return "Unknown error";
        }
    }
};

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ranger::transfer";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:           return "Success";
            case TransferErrc::discovery_failed:  return "Object discovery failed";
            case TransferErrc::chunk_failed:      return "Chunk download failed";
            case TransferErrc::invalid_request:   return "Invalid request";
            case TransferErrc::checksum_mismatch: return "Checksum mismatch";
            case TransferErrc::cancelled:         return "Transfer cancelled";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ClientErrcCategory& client_errc_category() noexcept {
    static detail::ClientErrcCategory category;
    return category;
}

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ClientErrc e) noexcept {
    return {static_cast<int>(e), client_errc_category()};
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

// A terminal transfer failure: discriminant plus the underlying cause
struct TransferError {
    std::error_code code;                 // TransferErrc
    std::error_code source;               // cause, usually ClientErrc
    std::optional<std::uint64_t> sequence; // failing chunk, if any
    std::string detail;

    [[nodiscard]] TransferErrc kind() const noexcept;

    // "Chunk download failed (seq 2): Server error (5xx): ..."
    [[nodiscard]] std::string message() const;

    [[nodiscard]] static TransferError discovery(std::error_code source, std::string detail = {});
    [[nodiscard]] static TransferError chunk_failed(std::uint64_t sequence, std::error_code source,
                                                    std::string detail = {});
    [[nodiscard]] static TransferError invalid_request(std::string detail);
    [[nodiscard]] static TransferError checksum_mismatch(std::string detail);
};

} // namespace ranger::core

namespace std {

template<>
struct is_error_code_enum<ranger::core::ClientErrc> : true_type {};

template<>
struct is_error_code_enum<ranger::core::TransferErrc> : true_type {};

} // namespace std
