#pragma once

#include <string>

namespace rangefetch::detail {

void ensureCurlInitialized();

// Host and (still percent-encoded) path of an absolute URL, parsed with libcurl's URL API.
// Throw std::invalid_argument for a URL libcurl rejects.
[[nodiscard]] std::string urlHost(const std::string& url);
[[nodiscard]] std::string urlPath(const std::string& url);

} // namespace rangefetch::detail
