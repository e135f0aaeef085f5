// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/bytes.hpp>
#include <ranger/core/error.hpp>
#include <ranger/core/object_meta.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ranger::core {

enum class ChecksumAlgorithm : std::uint8_t {
    crc32,
    crc32c,
    sha1,
    sha256
};

[[nodiscard]] std::string_view to_string(ChecksumAlgorithm algorithm) noexcept;

// Incremental hasher. finalize() returns the base64 digest, as S3 reports it.
class Checksum {
public:
    virtual ~Checksum() = default;

    virtual void update(std::span<const std::byte> data) noexcept = 0;
    [[nodiscard]] virtual std::string finalize() = 0;
};

// nullptr when no backing implementation is available (crc32c)
[[nodiscard]] std::unique_ptr<Checksum> make_checksum(ChecksumAlgorithm algorithm);

[[nodiscard]] std::string base64_encode(std::span<const std::byte> data);

struct ExpectedChecksum {
    ChecksumAlgorithm algorithm;
    std::string value;  // base64
};

// First whole-object checksum the metadata carries that we can compute.
// Composite (per-part) checksums are skipped.
[[nodiscard]] std::optional<ExpectedChecksum> full_object_checksum(const ObjectMetadata& meta);

// Hashes delivered chunks in order and compares at the end
class ChecksumValidator {
public:
    ChecksumValidator(ExpectedChecksum expected, std::unique_ptr<Checksum> hasher) noexcept;

    void update(const Bytes& chunk) noexcept;

    [[nodiscard]] std::expected<void, TransferError> finish();

    [[nodiscard]] ChecksumAlgorithm algorithm() const noexcept { return expected_.algorithm; }

private:
    ExpectedChecksum expected_;
    std::unique_ptr<Checksum> hasher_;
};

// Validator for a transfer that covers the whole object, or nullptr when
// validation does not apply
[[nodiscard]] std::unique_ptr<ChecksumValidator> make_validator(const ObjectMetadata& meta);

} // namespace ranger::core
