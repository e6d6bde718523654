#pragma once

#include "transfer_status.hpp"

#include <cstdint>
#include <string>

namespace rangefetch {

struct Progress {
    std::string url;
    std::string filename;
    std::string filepath;
    std::int64_t total_bytes{-1};
    std::int64_t downloaded_bytes{0};
    TransferStatus status{TransferStatus::Idle};
    std::string error_message;
};

// Percentage in [0, 100]; 0 while the total size is still unknown.
[[nodiscard]] float computeProgress(std::int64_t total_bytes, std::int64_t downloaded_bytes) noexcept;

} // namespace rangefetch
