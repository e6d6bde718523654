#pragma once

#include <string_view>

namespace rangefetch {

enum class TransferStatus {
    Idle,
    Downloading,
    Paused,
    Cancelled,
    Complete,
    Error
};

[[nodiscard]] std::string_view toString(TransferStatus status) noexcept;

// Complete, Cancelled and Error do not change again without a new download().
[[nodiscard]] bool isTerminal(TransferStatus status) noexcept;

} // namespace rangefetch
