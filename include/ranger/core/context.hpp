// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/config.hpp>
#include <ranger/core/object_client.hpp>
#include <cstdint>
#include <memory>

namespace ranger::core {

// Immutable settings copied into every task of a transfer
struct TransferContext {
    std::shared_ptr<ObjectClient> client;
    std::uint64_t target_part_size{DEFAULT_PART_SIZE};
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    ChecksumPolicy checksum_policy{ChecksumPolicy::validate_full_object};
};

} // namespace ranger::core
