#include "rangefetch/http_downloader.hpp"

#include "rangefetch/boolean_literal.hpp"
#include "rangefetch/byte_streamer.hpp"
#include "rangefetch/connection.hpp"
#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/response_classifier.hpp"
#include "rangefetch/transfer_state.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <json/json.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Bodies are returned as UTF-8. Single-byte Latin charsets are transcoded,
// anything else is passed through as received.
std::string decodeText(std::string body, const std::string& charset) {
    const std::string name = toLower(charset);
    if (name.empty() || name == "utf-8" || name == "utf8") {
        return body;
    }

    if (name == "iso-8859-1" || name == "latin1" || name == "us-ascii" || name == "ascii") {
        std::string decoded;
        decoded.reserve(body.size());
        for (unsigned char c : body) {
            if (c < 0x80) {
                decoded.push_back(static_cast<char>(c));
            } else {
                decoded.push_back(static_cast<char>(0xC0 | (c >> 6)));
                decoded.push_back(static_cast<char>(0x80 | (c & 0x3F)));
            }
        }
        return decoded;
    }

    spdlog::debug("No decoder for charset {}, passing body through", charset);
    return body;
}

bool toBoolean(const std::string& body) {
    const auto value = parseBooleanLiteral(body);
    if (!value) {
        throw std::runtime_error("Response is not a boolean literal!");
    }
    return *value;
}

Json::Value toJsonArray(const std::string& body) {
    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw std::runtime_error("Invalid JSON response: " + errors);
    }
    if (!root.isArray()) {
        throw std::runtime_error("Response is not a JSON array!");
    }
    return root;
}

} // namespace

class HttpDownloader::Impl {
public:
    Impl(std::string download_dir, std::string url, DownloaderOptions options)
        : target_{std::move(url), normalizeDirectory(std::move(download_dir))},
          options_(std::move(options)),
          connector_(options_.connector ? options_.connector
                                        : ConnectorPtr{std::make_shared<CurlConnector>(options_)}) {}

    ~Impl() {
        state_.cancelIfActive();
        joinWorker();
    }

    bool start(bool fresh) {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (state_.status() == TransferStatus::Downloading) {
            return false;
        }

        // A paused or cancelled worker leaves after its current chunk.
        joinWorker();

        const auto run = state_.begin(fresh);
        if (!run) {
            return false;
        }

        spdlog::info("{} {} from byte {}", fresh ? "Starting" : "Resuming", target_.url,
                     state_.transferredBytes());
        try {
            worker_ = std::thread([this, id = *run]() {
                ByteStreamer streamer(state_, *connector_, options_.buffer_size);
                streamer.run(target_, id);
            });
        } catch (const std::system_error& ex) {
            spdlog::error("Cannot start download thread: {}", ex.what());
            state_.fail(*run, ex.what());
            return false;
        }
        return true;
    }

    void pause() { state_.pause(); }

    void cancel() { state_.cancel(); }

    void wait() {
        std::lock_guard<std::mutex> lock(control_mutex_);
        joinWorker();
    }

    template <typename T>
    std::optional<T> process(bool json_request, const std::function<T(const std::string&)>& convert) {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (state_.status() == TransferStatus::Downloading) {
            return std::nullopt;
        }
        joinWorker();

        const auto run = state_.begin(true);
        if (!run) {
            return std::nullopt;
        }

        try {
            auto connection = connector_->open(target_.url, state_.transferredBytes());
            const bool api_mode =
                json_request && isApiHost(detail::urlHost(target_.url), options_.api_hosts);

            const Outcome outcome = classifyResponse(connection->statusCode(), api_mode,
                                                     [&connection] { return connection->readAll(); });
            if (outcome.isFatal()) {
                spdlog::error("{}: {}", target_.url, outcome.message);
                state_.fail(*run, outcome.message);
                throw RateLimitError(outcome.message);
            }
            if (!outcome.ok()) {
                spdlog::warn("{}: {}", target_.url, outcome.message);
                state_.fail(*run, outcome.message);
                return std::nullopt;
            }

            T result = convert(decodeText(connection->readAll(), connection->charset()));
            state_.completeIfActive(*run);
            return result;
        } catch (const RateLimitError&) {
            throw;
        } catch (const std::exception& ex) {
            spdlog::error("Request to {} failed: {}", target_.url, ex.what());
            state_.fail(*run, ex.what());
            return std::nullopt;
        }
    }

    [[nodiscard]] Progress snapshot() const {
        Progress progress;
        progress.url = target_.url;
        state_.fill(progress);
        return progress;
    }

    [[nodiscard]] const TransferState& state() const noexcept { return state_; }
    [[nodiscard]] const TransferTarget& target() const noexcept { return target_; }

private:
    void joinWorker() {
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    const TransferTarget target_;
    const DownloaderOptions options_;
    const ConnectorPtr connector_;

    TransferState state_;
    // Serializes download/resume/process/wait; pause and cancel never take it.
    std::mutex control_mutex_;
    std::thread worker_;
};

HttpDownloader::HttpDownloader(std::string url, DownloaderOptions options)
    : impl_(std::make_unique<Impl>(std::string{}, std::move(url), std::move(options))) {}

HttpDownloader::HttpDownloader(std::string download_dir, std::string url, DownloaderOptions options)
    : impl_(std::make_unique<Impl>(std::move(download_dir), std::move(url), std::move(options))) {}

HttpDownloader::~HttpDownloader() = default;

bool HttpDownloader::download() { return impl_->start(true); }

void HttpDownloader::pause() { impl_->pause(); }

bool HttpDownloader::resume() { return impl_->start(false); }

void HttpDownloader::cancel() { impl_->cancel(); }

void HttpDownloader::wait() { impl_->wait(); }

std::optional<std::string> HttpDownloader::processTextAsString() {
    return impl_->process<std::string>(false, [](const std::string& body) { return body; });
}

std::optional<bool> HttpDownloader::processTextAsBoolean() {
    return impl_->process<bool>(false, &toBoolean);
}

std::optional<Json::Value> HttpDownloader::processJsonAsArray() {
    return impl_->process<Json::Value>(true, &toJsonArray);
}

float HttpDownloader::getProgress() const {
    const Progress progress = impl_->snapshot();
    return computeProgress(progress.total_bytes, progress.downloaded_bytes);
}

Progress HttpDownloader::snapshot() const { return impl_->snapshot(); }

TransferStatus HttpDownloader::status() const { return impl_->state().status(); }

std::string HttpDownloader::errorMessage() const { return impl_->state().errorMessage(); }

const std::string& HttpDownloader::url() const noexcept { return impl_->target().url; }

const std::string& HttpDownloader::downloadDir() const noexcept { return impl_->target().download_dir; }

std::string HttpDownloader::filename() const { return impl_->state().filename(); }

std::string HttpDownloader::filepath() const { return impl_->state().filepath(); }

} // namespace rangefetch
