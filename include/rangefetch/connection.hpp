#pragma once

#include "options.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace rangefetch {

// An open GET response whose status line and headers are already known.
class Connection {
public:
    virtual ~Connection() = default;

    [[nodiscard]] virtual long statusCode() const = 0;
    // Declared Content-Length, -1 when the server sent none.
    [[nodiscard]] virtual std::int64_t contentLength() const = 0;
    // Charset parameter of Content-Type, empty when absent.
    [[nodiscard]] virtual std::string charset() const = 0;

    // Reads up to size bytes. Returns -1 at end of stream.
    virtual std::ptrdiff_t read(char* buffer, std::size_t size) = 0;
    // Drains the rest of the body.
    virtual std::string readAll() = 0;
};

class Connector {
public:
    virtual ~Connector() = default;

    // Issues GET url with "Range: bytes=<offset>-". Throws TransportError.
    virtual std::unique_ptr<Connection> open(const std::string& url, std::int64_t offset) = 0;
};

using ConnectorPtr = std::shared_ptr<Connector>;

class CurlConnector final : public Connector {
public:
    explicit CurlConnector(DownloaderOptions options = {});

    std::unique_ptr<Connection> open(const std::string& url, std::int64_t offset) override;

private:
    DownloaderOptions options_;
};

// "bytes=<offset>-"
[[nodiscard]] std::string formatRangeHeader(std::int64_t offset);

} // namespace rangefetch
