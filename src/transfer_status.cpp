#include "rangefetch/transfer_status.hpp"

namespace rangefetch {

std::string_view toString(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Idle:
            return "Idle";
        case TransferStatus::Downloading:
            return "Downloading";
        case TransferStatus::Paused:
            return "Paused";
        case TransferStatus::Cancelled:
            return "Cancelled";
        case TransferStatus::Complete:
            return "Complete";
        case TransferStatus::Error:
            return "Error";
    }
    return "Unknown";
}

bool isTerminal(TransferStatus status) noexcept {
    return status == TransferStatus::Complete || status == TransferStatus::Cancelled ||
           status == TransferStatus::Error;
}

} // namespace rangefetch
