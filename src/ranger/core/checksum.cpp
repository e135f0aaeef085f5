// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/core/checksum.hpp>
#include <ranger/core/log.hpp>
#include <openssl/evp.h>
#include <zlib.h>
#include <algorithm>
#include <array>
#include <limits>
#include <vector>

namespace ranger::core {

namespace {

class Crc32Checksum final : public Checksum {
public:
    Crc32Checksum() noexcept : crc_(::crc32(0L, Z_NULL, 0)) {}

    void update(std::span<const std::byte> data) noexcept override {
        // zlib takes uInt lengths
        constexpr std::size_t max_block = std::numeric_limits<uInt>::max();
        while (!data.empty()) {
            auto block = std::min(data.size(), max_block);
            crc_ = ::crc32(crc_, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(block));
            data = data.subspan(block);
        }
    }

    std::string finalize() override {
        // Big-endian, like the x-amz-checksum-crc32 header
        std::array<std::byte, 4> digest{
            static_cast<std::byte>((crc_ >> 24) & 0xFF),
            static_cast<std::byte>((crc_ >> 16) & 0xFF),
            static_cast<std::byte>((crc_ >> 8) & 0xFF),
            static_cast<std::byte>(crc_ & 0xFF),
        };
        return base64_encode(digest);
    }

private:
    uLong crc_;
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

class EvpChecksum final : public Checksum {
public:
    explicit EvpChecksum(const EVP_MD* md)
        : ctx_(EVP_MD_CTX_new()) {
        ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), md, nullptr) == 1;
    }

    void update(std::span<const std::byte> data) noexcept override {
        if (!ok_ || data.empty()) return;
        ok_ = EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) == 1;
    }

    std::string finalize() override {
        if (!ok_) return {};

        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
            return {};
        }
        return base64_encode(std::as_bytes(std::span(digest.data(), length)));
    }

private:
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx_;
    bool ok_{false};
};

// Composite checksums look like "base64-<parts>"
bool is_composite(const ObjectMetadata& meta, const std::string& value) noexcept {
    if (meta.checksum_type == "COMPOSITE") return true;
    return value.find('-') != std::string::npos;
}

} // namespace

std::string_view to_string(ChecksumAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ChecksumAlgorithm::crc32:  return "CRC32";
        case ChecksumAlgorithm::crc32c: return "CRC32C";
        case ChecksumAlgorithm::sha1:   return "SHA1";
        case ChecksumAlgorithm::sha256: return "SHA256";
    }
    return "UNKNOWN";
}

std::unique_ptr<Checksum> make_checksum(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::crc32:  return std::make_unique<Crc32Checksum>();
        case ChecksumAlgorithm::sha1:   return std::make_unique<EvpChecksum>(EVP_sha1());
        case ChecksumAlgorithm::sha256: return std::make_unique<EvpChecksum>(EVP_sha256());
        case ChecksumAlgorithm::crc32c: return nullptr;
    }
    return nullptr;
}

std::string base64_encode(std::span<const std::byte> data) {
    if (data.empty()) return {};

    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    if (written < 0) return {};
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

std::optional<ExpectedChecksum> full_object_checksum(const ObjectMetadata& meta) {
    // Strongest first
    const std::pair<ChecksumAlgorithm, const std::string*> candidates[] = {
        {ChecksumAlgorithm::sha256, &meta.checksum_sha256},
        {ChecksumAlgorithm::sha1, &meta.checksum_sha1},
        {ChecksumAlgorithm::crc32c, &meta.checksum_crc32c},
        {ChecksumAlgorithm::crc32, &meta.checksum_crc32},
    };

    for (const auto& [algorithm, value] : candidates) {
        if (value->empty()) continue;
        if (is_composite(meta, *value)) {
            logger()->debug("skipping composite {} checksum {}", to_string(algorithm), *value);
            continue;
        }
        if (algorithm == ChecksumAlgorithm::crc32c) {
            logger()->debug("no CRC32C implementation available, skipping");
            continue;
        }
        return ExpectedChecksum{algorithm, *value};
    }
    return std::nullopt;
}

//=============================================================================
// ChecksumValidator
//=============================================================================

ChecksumValidator::ChecksumValidator(ExpectedChecksum expected, std::unique_ptr<Checksum> hasher) noexcept
    : expected_(std::move(expected))
    , hasher_(std::move(hasher)) {}

void ChecksumValidator::update(const Bytes& chunk) noexcept {
    if (hasher_) {
        hasher_->update(chunk.span());
    }
}

std::expected<void, TransferError> ChecksumValidator::finish() {
    if (!hasher_) return {};

    std::string actual = hasher_->finalize();
    hasher_.reset();

    if (actual != expected_.value) {
        logger()->error("{} checksum mismatch: expected {}, computed {}",
                        to_string(expected_.algorithm), expected_.value, actual);
        return std::unexpected(TransferError::checksum_mismatch(
            std::string(to_string(expected_.algorithm)) + " expected " + expected_.value
            + ", computed " + actual));
    }

    logger()->debug("{} checksum verified", to_string(expected_.algorithm));
    return {};
}

std::unique_ptr<ChecksumValidator> make_validator(const ObjectMetadata& meta) {
    auto expected = full_object_checksum(meta);
    if (!expected) return nullptr;

    auto hasher = make_checksum(expected->algorithm);
    if (!hasher) return nullptr;

    return std::make_unique<ChecksumValidator>(std::move(*expected), std::move(hasher));
}

} // namespace ranger::core
