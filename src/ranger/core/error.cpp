// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/error.hpp>

namespace ranger::core {

TransferErrc TransferError::kind() const noexcept {
    if (code.category() != transfer_errc_category()) {
        return TransferErrc::success;
    }
    return static_cast<TransferErrc>(code.value());
}

std::string TransferError::message() const {
    std::string result = code.message();
    if (sequence) {
        result += " (seq ";
        result += std::to_string(*sequence);
        result += ")";
    }
    if (source) {
        result += ": ";
        result += source.message();
    }
    if (!detail.empty()) {
        result += ": ";
        result += detail;
    }
    return result;
}

TransferError TransferError::discovery(std::error_code source, std::string detail) {
    return {make_error_code(TransferErrc::discovery_failed), source, std::nullopt, std::move(detail)};
}

TransferError TransferError::chunk_failed(std::uint64_t sequence, std::error_code source,
                                          std::string detail) {
    return {make_error_code(TransferErrc::chunk_failed), source, sequence, std::move(detail)};
}

TransferError TransferError::invalid_request(std::string detail) {
    return {make_error_code(TransferErrc::invalid_request), {}, std::nullopt, std::move(detail)};
}

TransferError TransferError::checksum_mismatch(std::string detail) {
    return {make_error_code(TransferErrc::checksum_mismatch), {}, std::nullopt, std::move(detail)};
}

} // namespace ranger::core
