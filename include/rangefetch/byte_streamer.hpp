#pragma once

#include "connection.hpp"
#include "transfer_state.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace rangefetch {

struct TransferTarget {
    std::string url;
    // Normalized, no trailing separator. Empty means the working directory.
    std::string download_dir;
};

// Moves the body of one ranged GET into the destination file, starting at
// the byte count already recorded in the state. Runs on the worker thread.
class ByteStreamer {
public:
    ByteStreamer(TransferState& state, Connector& connector, std::size_t buffer_size);
    ~ByteStreamer();

    ByteStreamer(const ByteStreamer&) = delete;
    ByteStreamer& operator=(const ByteStreamer&) = delete;

    // Never throws; failures end in TransferStatus::Error.
    void run(const TransferTarget& target, TransferState::RunId run) noexcept;

    // Releases the file and the connection independently. Safe if neither was opened.
    void close() noexcept;

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    void stream(const TransferTarget& target, TransferState::RunId run);
    void openDestination(const std::string& filepath, std::int64_t offset);
    void writeChunk(const char* data, std::size_t size);

    TransferState& state_;
    Connector& connector_;
    std::size_t buffer_size_;

    std::unique_ptr<FILE, FileDeleter> file_{};
    std::unique_ptr<Connection> connection_{};
};

// Last path segment of the URL, query and fragment excluded.
[[nodiscard]] std::string filenameFromUrl(const std::string& url);

// Strips trailing '/' characters.
[[nodiscard]] std::string normalizeDirectory(std::string dir);

// dir + '/' + filename, or just filename when dir is empty.
[[nodiscard]] std::string composeFilepath(const std::string& dir, const std::string& filename);

} // namespace rangefetch
