#include "rangefetch/connection.hpp"
#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

namespace {

constexpr int kPollTimeoutMs = 1000;

std::string charsetFromContentType(const char* content_type) {
    if (content_type == nullptr) {
        return {};
    }

    std::string lowered{content_type};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto pos = lowered.find("charset=");
    if (pos == std::string::npos) {
        return {};
    }

    std::string charset = std::string{content_type}.substr(pos + std::strlen("charset="));
    const auto end = charset.find(';');
    if (end != std::string::npos) {
        charset.erase(end);
    }
    charset.erase(std::remove_if(charset.begin(), charset.end(),
                                 [](unsigned char c) { return c == '"' || c == '\'' || std::isspace(c); }),
                  charset.end());
    return charset;
}

// Drives a single easy handle through a multi handle so the body can be
// pulled by the caller instead of pushed through a callback.
class CurlConnection final : public Connection {
public:
    CurlConnection(const std::string& url, std::int64_t offset, const DownloaderOptions& options)
        : easy_{curl_easy_init(), &curl_easy_cleanup},
          multi_{curl_multi_init(), &curl_multi_cleanup},
          range_(fmt::format("{}-", offset)) {
        if (!easy_ || !multi_) {
            throw TransportError("Failed to allocate curl handle");
        }

        curl_easy_setopt(easy_.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(easy_.get(), CURLOPT_RANGE, range_.c_str());
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEFUNCTION, &CurlConnection::writeCallback);
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_.get(), CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
        curl_easy_setopt(easy_.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(easy_.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
        curl_easy_setopt(easy_.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout.count()));
        curl_easy_setopt(easy_.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(easy_.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.low_speed_timeout.count()));

        const CURLMcode mc = curl_multi_add_handle(multi_.get(), easy_.get());
        if (mc != CURLM_OK) {
            throw TransportError(fmt::format("curl multi error: {}", curl_multi_strerror(mc)));
        }
        attached_ = true;

        // Headers are complete once the first body bytes arrive or the transfer ends.
        try {
            pump();
        } catch (const TransportError&) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
            throw;
        }

        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status_);
        curl_off_t length = -1;
        curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        content_length_ = length;
        char* content_type = nullptr;
        curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_TYPE, &content_type);
        charset_ = charsetFromContentType(content_type);
    }

    ~CurlConnection() override {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    [[nodiscard]] long statusCode() const override { return status_; }
    [[nodiscard]] std::int64_t contentLength() const override { return content_length_; }
    [[nodiscard]] std::string charset() const override { return charset_; }

    std::ptrdiff_t read(char* buffer, std::size_t size) override {
        if (size == 0) {
            return 0;
        }

        pump();
        const std::size_t available = pending_.size() - pending_pos_;
        if (available == 0) {
            return -1;
        }

        const std::size_t count = std::min(size, available);
        std::memcpy(buffer, pending_.data() + pending_pos_, count);
        pending_pos_ += count;
        if (pending_pos_ == pending_.size()) {
            pending_.clear();
            pending_pos_ = 0;
        }
        return static_cast<std::ptrdiff_t>(count);
    }

    std::string readAll() override {
        std::string body;
        while (true) {
            pump();
            if (pending_pos_ == pending_.size()) {
                break;
            }
            body.append(pending_, pending_pos_, std::string::npos);
            pending_.clear();
            pending_pos_ = 0;
        }
        return body;
    }

private:
    using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using MultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlConnection*>(userdata);
        if (!self) {
            return 0;
        }
        const size_t total = size * nmemb;
        self->pending_.append(ptr, total);
        return total;
    }

    // Runs the transfer until body bytes are buffered or it has finished.
    void pump() {
        while (pending_pos_ == pending_.size() && !done_) {
            int running = 0;
            CURLMcode mc = curl_multi_perform(multi_.get(), &running);
            if (mc != CURLM_OK) {
                throw TransportError(fmt::format("curl multi error: {}", curl_multi_strerror(mc)));
            }
            collectResult();

            if (pending_pos_ == pending_.size() && !done_) {
                mc = curl_multi_poll(multi_.get(), nullptr, 0, kPollTimeoutMs, nullptr);
                if (mc != CURLM_OK) {
                    throw TransportError(fmt::format("curl multi error: {}", curl_multi_strerror(mc)));
                }
            }
        }

        if (pending_pos_ == pending_.size() && done_ && result_ != CURLE_OK) {
            throw TransportError(fmt::format("curl error: {}", curl_easy_strerror(result_)));
        }
    }

    void collectResult() {
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.get()) {
                done_ = true;
                result_ = msg->data.result;
            }
        }
    }

    EasyHandle easy_;
    MultiHandle multi_;
    std::string range_;
    bool attached_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};

    std::string pending_;
    std::size_t pending_pos_{0};

    long status_{0};
    std::int64_t content_length_{-1};
    std::string charset_;
};

} // namespace

CurlConnector::CurlConnector(DownloaderOptions options) : options_(std::move(options)) {
    options_.connector.reset();
}

std::unique_ptr<Connection> CurlConnector::open(const std::string& url, std::int64_t offset) {
    detail::ensureCurlInitialized();
    spdlog::debug("GET {} (Range: {})", url, formatRangeHeader(offset));

    auto connection = std::make_unique<CurlConnection>(url, offset, options_);
    spdlog::debug("{} answered {} with Content-Length {}", url, connection->statusCode(),
                  connection->contentLength());
    return connection;
}

std::string formatRangeHeader(std::int64_t offset) {
    return fmt::format("bytes={}-", offset);
}

} // namespace rangefetch
