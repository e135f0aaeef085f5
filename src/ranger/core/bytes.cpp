// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/bytes.hpp>
#include <algorithm>
#include <cstring>

namespace ranger::core {

Bytes::Bytes(std::vector<std::byte> data)
    : size_(data.size()) {
    if (size_ > 0) {
        storage_ = std::make_shared<const std::vector<std::byte>>(std::move(data));
    }
}

Bytes Bytes::copy_from(std::string_view text) {
    std::vector<std::byte> data(text.size());
    if (!text.empty()) {
        std::memcpy(data.data(), text.data(), text.size());
    }
    return Bytes(std::move(data));
}

Bytes Bytes::copy_from(std::span<const std::byte> data) {
    return Bytes(std::vector<std::byte>(data.begin(), data.end()));
}

const std::byte* Bytes::data() const noexcept {
    return storage_ ? storage_->data() + offset_ : nullptr;
}

std::string_view Bytes::as_string_view() const noexcept {
    if (!storage_) return {};
    return {reinterpret_cast<const char*>(data()), size_};
}

Bytes Bytes::slice(std::size_t offset, std::size_t length) const noexcept {
    Bytes result;
    if (offset >= size_) return result;

    result.storage_ = storage_;
    result.offset_ = offset_ + offset;
    result.size_ = std::min(length, size_ - offset);
    return result;
}

bool operator==(const Bytes& lhs, const Bytes& rhs) noexcept {
    if (lhs.size_ != rhs.size_) return false;
    if (lhs.size_ == 0) return true;
    return std::memcmp(lhs.data(), rhs.data(), lhs.size_) == 0;
}

} // namespace ranger::core
