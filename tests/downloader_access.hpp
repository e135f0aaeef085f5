// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ranger/core/downloader.hpp>
#include <utility>

namespace ranger::testing {

// Builds a Downloader from a raw context, below the part size floor, so
// small objects split into many parts
struct DownloaderAccess {
    static core::Downloader make(core::TransferContext ctx) noexcept {
        return core::Downloader(std::move(ctx));
    }
};

} // namespace ranger::testing
