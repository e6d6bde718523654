#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace rangefetch {

inline constexpr const char* kVersion = "1.0.0";

class Connector;

struct DownloaderOptions {
    // Upper bound of a single read/write chunk in the streaming loop.
    std::size_t buffer_size{1024};

    // Hosts whose JSON error bodies carry a "message" field. Matched as substrings of the URL host.
    std::vector<std::string> api_hosts{"github.com"};

    std::chrono::seconds connect_timeout{30};
    // A read that sees no bytes for this long fails the transfer.
    std::chrono::seconds low_speed_timeout{60};
    bool follow_redirects{true};
    std::string user_agent{std::string{"rangefetch/"} + kVersion};

    // Defaults to a CurlConnector built from the fields above.
    std::shared_ptr<Connector> connector{};
};

} // namespace rangefetch
