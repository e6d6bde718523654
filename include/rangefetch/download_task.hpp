#pragma once

#include "progress.hpp"

#include <memory>

namespace rangefetch {

class DownloadTask {
public:
    virtual ~DownloadTask() = default;

    virtual bool download() = 0;
    virtual void pause() = 0;
    virtual bool resume() = 0;
    virtual void cancel() = 0;
    virtual void wait() = 0;
    [[nodiscard]] virtual Progress snapshot() const = 0;
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace rangefetch
