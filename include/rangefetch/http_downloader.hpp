#pragma once

#include "download_task.hpp"
#include "options.hpp"
#include "transfer_status.hpp"

#include <json/value.h>

#include <memory>
#include <optional>
#include <string>

namespace rangefetch {

// Downloads one URL into a directory on a background thread, with
// pause/resume/cancel, and offers one-shot in-memory reads of the same URL.
class HttpDownloader final : public DownloadTask {
public:
    explicit HttpDownloader(std::string url, DownloaderOptions options = {});
    HttpDownloader(std::string download_dir, std::string url, DownloaderOptions options = {});
    // Cancels a transfer still in progress and joins its thread.
    ~HttpDownloader() override;

    HttpDownloader(const HttpDownloader&) = delete;
    HttpDownloader& operator=(const HttpDownloader&) = delete;

    // Starts a fresh transfer. Returns false if one is already downloading.
    bool download() override;
    // Signals only; the worker notices before its next chunk.
    void pause() override;
    // Continues from the bytes already on disk. Returns false if already downloading.
    bool resume() override;
    void cancel() override;
    // Blocks until the background thread has exited.
    void wait() override;

    // Synchronous whole-body reads. Empty on a failed request, body or
    // conversion; throws RateLimitError when a known API host answers 403.
    std::optional<std::string> processTextAsString();
    std::optional<bool> processTextAsBoolean();
    std::optional<Json::Value> processJsonAsArray();

    [[nodiscard]] float getProgress() const;
    [[nodiscard]] Progress snapshot() const override;
    [[nodiscard]] TransferStatus status() const;
    [[nodiscard]] std::string errorMessage() const;

    [[nodiscard]] const std::string& url() const noexcept;
    [[nodiscard]] const std::string& downloadDir() const noexcept;
    [[nodiscard]] std::string filename() const;
    [[nodiscard]] std::string filepath() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangefetch
