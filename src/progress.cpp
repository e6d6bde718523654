#include "rangefetch/progress.hpp"

#include <algorithm>

namespace rangefetch {

float computeProgress(std::int64_t total_bytes, std::int64_t downloaded_bytes) noexcept {
    if (total_bytes <= 0) {
        return 0.0F;
    }
    const double ratio = static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes);
    return static_cast<float>(std::clamp(ratio * 100.0, 0.0, 100.0));
}

} // namespace rangefetch
