// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/download_request.hpp>

namespace ranger::core {

std::expected<std::optional<ByteRange>, TransferError> DownloadRequest::validate() const {
    if (bucket.empty()) {
        return std::unexpected(TransferError::invalid_request("bucket name is empty"));
    }
    if (key.empty()) {
        return std::unexpected(TransferError::invalid_request("object key is empty"));
    }

    if (part_number) {
        if (range) {
            return std::unexpected(TransferError::invalid_request(
                "part number cannot be combined with a range"));
        }
        if (*part_number == 0) {
            return std::unexpected(TransferError::invalid_request("part numbers start at 1"));
        }
        return std::optional<ByteRange>{};
    }

    if (!range) {
        return std::optional<ByteRange>{};
    }

    auto parsed = ByteRange::parse(*range);
    if (!parsed) {
        return std::unexpected(TransferError::invalid_request("invalid range '" + *range + "'"));
    }
    return std::optional<ByteRange>{*parsed};
}

} // namespace ranger::core
