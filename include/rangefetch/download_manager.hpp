#pragma once

#include "download_task.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace rangefetch {

// Starts a batch of tasks and redraws a console progress panel until none is downloading.
class DownloadManager {
public:
    explicit DownloadManager(std::ostream& out);

    void addTask(DownloadTaskPtr task);
    // interrupted is polled between redraws; once set, every task is cancelled.
    void start(const std::atomic<bool>& interrupted,
               std::chrono::milliseconds interval = std::chrono::milliseconds(200));
    void cancelAll();

    [[nodiscard]] bool allCompleted() const;
    void printErrors(std::ostream& err) const;

    [[nodiscard]] std::string buildProgressPanel() const;
    [[nodiscard]] static std::string formatTaskLine(const Progress& progress);
    [[nodiscard]] static std::string formatSize(std::int64_t bytes);

private:
    [[nodiscard]] bool hasActiveTasks() const;
    void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    std::ostream& out_;
    std::vector<DownloadTaskPtr> tasks_;
};

} // namespace rangefetch
