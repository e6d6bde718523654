#include "rangefetch/transfer_state.hpp"

#include <utility>

namespace rangefetch {

std::optional<TransferState::RunId> TransferState::begin(bool fresh) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == TransferStatus::Downloading) {
        return std::nullopt;
    }

    if (fresh) {
        total_bytes_ = -1;
        transferred_bytes_ = 0;
        filename_.clear();
        filepath_.clear();
    }
    error_message_.clear();
    status_ = TransferStatus::Downloading;
    return ++run_id_;
}

void TransferState::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = TransferStatus::Paused;
}

void TransferState::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = TransferStatus::Cancelled;
}

void TransferState::cancelIfActive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == TransferStatus::Downloading) {
        status_ = TransferStatus::Cancelled;
    }
}

bool TransferState::isActive(RunId run) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isCurrent(run) && status_ == TransferStatus::Downloading;
}

bool TransferState::completeIfActive(RunId run) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isCurrent(run) || status_ != TransferStatus::Downloading) {
        return false;
    }
    status_ = TransferStatus::Complete;
    return true;
}

void TransferState::fail(RunId run, std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isCurrent(run)) {
        return;
    }
    status_ = TransferStatus::Error;
    error_message_ = std::move(message);
}

void TransferState::setTotalIfUnknown(RunId run, std::int64_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isCurrent(run) && total_bytes_ == -1) {
        total_bytes_ = total;
    }
}

void TransferState::restart(RunId run, std::int64_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isCurrent(run)) {
        total_bytes_ = total;
        transferred_bytes_ = 0;
    }
}

void TransferState::addTransferred(RunId run, std::int64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isCurrent(run)) {
        transferred_bytes_ += bytes;
    }
}

void TransferState::assignFile(RunId run, std::string filename, std::string filepath) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isCurrent(run) && filepath_.empty()) {
        filename_ = std::move(filename);
        filepath_ = std::move(filepath);
    }
}

TransferStatus TransferState::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::int64_t TransferState::totalBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

std::int64_t TransferState::transferredBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transferred_bytes_;
}

std::string TransferState::errorMessage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_message_;
}

std::string TransferState::filename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filename_;
}

std::string TransferState::filepath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filepath_;
}

void TransferState::fill(Progress& progress) const {
    std::lock_guard<std::mutex> lock(mutex_);
    progress.filename = filename_;
    progress.filepath = filepath_;
    progress.total_bytes = total_bytes_;
    progress.downloaded_bytes = transferred_bytes_;
    progress.status = status_;
    progress.error_message = error_message_;
}

} // namespace rangefetch
