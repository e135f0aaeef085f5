// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ranger::core {

// Immutable, reference-counted byte buffer. Copies and slices share storage.
class Bytes {
public:
    Bytes() = default;
    explicit Bytes(std::vector<std::byte> data);

    [[nodiscard]] static Bytes copy_from(std::string_view text);
    [[nodiscard]] static Bytes copy_from(std::span<const std::byte> data);

    [[nodiscard]] const std::byte* data() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] std::span<const std::byte> span() const noexcept { return {data(), size_}; }
    [[nodiscard]] std::string_view as_string_view() const noexcept;
    [[nodiscard]] std::string to_string() const { return std::string(as_string_view()); }

    // View of [offset, offset + length) sharing this buffer; clamped to size()
    [[nodiscard]] Bytes slice(std::size_t offset, std::size_t length) const noexcept;

    // Number of Bytes objects sharing the storage (0 when empty)
    [[nodiscard]] long use_count() const noexcept { return storage_.use_count(); }

    // Content comparison
    friend bool operator==(const Bytes& lhs, const Bytes& rhs) noexcept;

private:
    std::shared_ptr<const std::vector<std::byte>> storage_;
    std::size_t offset_{0};
    std::size_t size_{0};
};

} // namespace ranger::core
