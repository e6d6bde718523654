#include "rangefetch/detail/curl_utils.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <mutex>

namespace rangefetch::detail {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

std::string urlPart(const std::string& url, CURLUPart part, const char* what) {
    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw std::runtime_error("Failed to allocate curl URL handle");
    }

    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        throw std::invalid_argument("Malformed URL: " + url);
    }

    char* value = nullptr;
    const CURLUcode rc = curl_url_get(handle.get(), part, &value, 0);
    if (rc != CURLUE_OK || value == nullptr) {
        throw std::invalid_argument(std::string{"URL has no "} + what + ": " + url);
    }

    std::string result{value};
    curl_free(value);
    return result;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::string urlHost(const std::string& url) {
    return urlPart(url, CURLUPART_HOST, "host");
}

std::string urlPath(const std::string& url) {
    return urlPart(url, CURLUPART_PATH, "path");
}

} // namespace rangefetch::detail
