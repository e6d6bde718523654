#include "rangefetch/byte_streamer.hpp"
#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/response_classifier.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include <sys/types.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

ByteStreamer::ByteStreamer(TransferState& state, Connector& connector, std::size_t buffer_size)
    : state_(state), connector_(connector), buffer_size_(std::max<std::size_t>(1, buffer_size)) {}

ByteStreamer::~ByteStreamer() { close(); }

void ByteStreamer::run(const TransferTarget& target, TransferState::RunId run) noexcept {
    try {
        stream(target, run);
    } catch (const std::exception& ex) {
        spdlog::error("Download of {} failed: {}", target.url, ex.what());
        state_.fail(run, ex.what());
    }
    close();
}

void ByteStreamer::close() noexcept {
    if (FILE* fp = file_.release()) {
        if (std::fclose(fp) != 0) {
            spdlog::warn("Failed to close destination file: {}", std::strerror(errno));
        }
    }
    connection_.reset();
}

void ByteStreamer::stream(const TransferTarget& target, TransferState::RunId run) {
    const std::int64_t offset = state_.transferredBytes();
    const std::int64_t total = state_.totalBytes();
    if (total >= 0 && offset >= total) {
        // Everything was received before the pause; a server would answer 416.
        if (state_.completeIfActive(run)) {
            spdlog::info("{} already holds all {} bytes", target.url, total);
        }
        return;
    }

    connection_ = connector_.open(target.url, offset);

    const Outcome outcome = classifyResponse(connection_->statusCode(), false,
                                             [this] { return connection_->readAll(); });
    if (!outcome.ok()) {
        spdlog::warn("{}: {}", target.url, outcome.message);
        state_.fail(run, outcome.message);
        return;
    }

    const std::int64_t content_length = connection_->contentLength();
    if (content_length < 1) {
        spdlog::warn("{}: invalid content length {}", target.url, content_length);
        state_.fail(run, "Invalid Content Length!");
        return;
    }

    std::int64_t position = offset;
    if (offset > 0 && connection_->statusCode() != 206) {
        // A 200 on a ranged request carries the whole entity.
        spdlog::warn("{} ignored the range request, restarting from byte 0", target.url);
        state_.restart(run, content_length);
        position = 0;
    } else {
        state_.setTotalIfUnknown(run, content_length);
    }

    const std::string filename = filenameFromUrl(target.url);
    state_.assignFile(run, filename, composeFilepath(target.download_dir, filename));
    openDestination(state_.filepath(), position);

    std::vector<char> buffer(buffer_size_);
    while (state_.isActive(run)) {
        const std::int64_t remaining = state_.totalBytes() - state_.transferredBytes();
        if (remaining <= 0) {
            break;
        }

        const auto chunk = static_cast<std::size_t>(
            std::min<std::int64_t>(static_cast<std::int64_t>(buffer_size_), remaining));
        const std::ptrdiff_t read = connection_->read(buffer.data(), chunk);
        if (read < 0) {
            break;
        }

        writeChunk(buffer.data(), static_cast<std::size_t>(read));
        state_.addTransferred(run, read);
    }

    if (state_.completeIfActive(run)) {
        spdlog::info("Downloaded {} ({} bytes)", state_.filepath(), state_.transferredBytes());
    } else {
        spdlog::info("Download of {} stopped at {} bytes: {}", target.url, state_.transferredBytes(),
                     toString(state_.status()));
    }
}

void ByteStreamer::openDestination(const std::string& filepath, std::int64_t offset) {
    // Writing from byte 0 replaces whatever an earlier attempt left behind.
    file_.reset(std::fopen(filepath.c_str(), offset == 0 ? "wb" : "r+b"));
    if (!file_ && offset > 0 && errno == ENOENT) {
        file_.reset(std::fopen(filepath.c_str(), "w+b"));
    }
    if (!file_) {
        throw std::runtime_error(
            fmt::format("Cannot open destination file {}: {}", filepath, std::strerror(errno)));
    }

    if (fseeko(file_.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
        throw std::runtime_error(fmt::format("Failed to seek {} to byte {}", filepath, offset));
    }
}

void ByteStreamer::writeChunk(const char* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    const size_t written = std::fwrite(data, 1, size, file_.get());
    if (written != size) {
        throw std::runtime_error("Failed to write output file");
    }
}

std::string filenameFromUrl(const std::string& url) {
    const std::string path = detail::urlPath(url);
    const std::string filename = path.substr(path.rfind('/') + 1);
    if (filename.empty()) {
        throw std::runtime_error(fmt::format("Cannot derive a filename from {}", url));
    }
    return filename;
}

std::string normalizeDirectory(std::string dir) {
    while (!dir.empty() && dir.back() == '/') {
        dir.pop_back();
    }
    return dir;
}

std::string composeFilepath(const std::string& dir, const std::string& filename) {
    if (dir.empty()) {
        return filename;
    }
    return dir + '/' + filename;
}

} // namespace rangefetch
