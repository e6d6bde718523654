#pragma once

#include "progress.hpp"
#include "transfer_status.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace rangefetch {

// Status, counters and file naming of one transfer, shared between the
// controller's callers and its worker thread. Every run started by begin()
// gets a fresh id; the worker-side mutators ignore calls carrying a stale id.
class TransferState {
public:
    using RunId = std::uint64_t;

    // Enters Downloading unless already there. A fresh start resets the
    // counters to (-1, 0) and forgets the file path; a resume keeps both.
    [[nodiscard]] std::optional<RunId> begin(bool fresh);

    // Unconditional status signals from the caller's thread.
    void pause();
    void cancel();

    // Cancels only if a run is in progress.
    void cancelIfActive();

    [[nodiscard]] bool isActive(RunId run) const;
    // Downloading -> Complete for the given run. Returns false if the run was paused, cancelled or superseded.
    bool completeIfActive(RunId run);
    void fail(RunId run, std::string message);

    // Sets the total size only while it is still unknown.
    void setTotalIfUnknown(RunId run, std::int64_t total);
    // Discards received bytes after the server ignored the range request.
    void restart(RunId run, std::int64_t total);
    void addTransferred(RunId run, std::int64_t bytes);
    // Assigns filename and filepath unless this download already has them.
    void assignFile(RunId run, std::string filename, std::string filepath);

    [[nodiscard]] TransferStatus status() const;
    [[nodiscard]] std::int64_t totalBytes() const;
    [[nodiscard]] std::int64_t transferredBytes() const;
    [[nodiscard]] std::string errorMessage() const;
    [[nodiscard]] std::string filename() const;
    [[nodiscard]] std::string filepath() const;

    // Fills the transfer fields of a Progress under one lock.
    void fill(Progress& progress) const;

private:
    [[nodiscard]] bool isCurrent(RunId run) const noexcept { return run == run_id_; }

    mutable std::mutex mutex_;
    RunId run_id_{0};
    TransferStatus status_{TransferStatus::Idle};
    std::int64_t total_bytes_{-1};
    std::int64_t transferred_bytes_{0};
    std::string error_message_;
    std::string filename_;
    std::string filepath_;
};

} // namespace rangefetch
