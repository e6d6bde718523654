#include "rangefetch/download_manager.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <ostream>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangefetch {

DownloadManager::DownloadManager(std::ostream& out) : out_(out) {}

void DownloadManager::addTask(DownloadTaskPtr task) {
    if (task) {
        tasks_.push_back(std::move(task));
    }
}

void DownloadManager::start(const std::atomic<bool>& interrupted, std::chrono::milliseconds interval) {
    for (auto& task : tasks_) {
        if (!task->download()) {
            spdlog::warn("{} is already downloading", task->snapshot().url);
        }
    }

    std::size_t previous_lines = 0;
    bool cancelled = false;
    while (true) {
        if (interrupted.load() && !cancelled) {
            spdlog::info("Interrupted, cancelling {} tasks", tasks_.size());
            cancelAll();
            cancelled = true;
        }

        redrawPanel(buildProgressPanel(), previous_lines);

        if (!hasActiveTasks()) {
            break;
        }

        std::this_thread::sleep_for(interval);
    }

    for (auto& task : tasks_) {
        task->wait();
    }
    redrawPanel(buildProgressPanel(), previous_lines);
    out_ << std::flush;
}

void DownloadManager::cancelAll() {
    for (auto& task : tasks_) {
        task->cancel();
    }
}

bool DownloadManager::allCompleted() const {
    return std::all_of(tasks_.begin(), tasks_.end(), [](const DownloadTaskPtr& task) {
        return task->snapshot().status == TransferStatus::Complete;
    });
}

void DownloadManager::printErrors(std::ostream& err) const {
    for (const auto& task : tasks_) {
        const auto progress = task->snapshot();
        if (progress.status == TransferStatus::Error) {
            err << fmt::format("{}: {}\n", progress.url, progress.error_message);
        }
    }
}

std::string DownloadManager::buildProgressPanel() const {
    std::string panel;
    panel.reserve(tasks_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("rangefetch ({} tasks)\n", tasks_.size());
    panel.append("--------------------------------------------------\n");

    std::int64_t total_all = 0;
    std::int64_t downloaded_all = 0;

    for (const auto& task : tasks_) {
        const auto progress = task->snapshot();
        panel += formatTaskLine(progress);
        panel.push_back('\n');

        if (progress.total_bytes > 0) {
            total_all += progress.total_bytes;
            downloaded_all += progress.downloaded_bytes;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(computeProgress(total_all, downloaded_all)));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string DownloadManager::formatTaskLine(const Progress& progress) {
    std::string line;
    line.reserve(256);

    std::string display_name = progress.filename;
    if (display_name.empty() && !progress.url.empty()) {
        display_name = std::filesystem::path{progress.url}.filename().string();
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (progress.total_bytes > 0) {
        const float percent = computeProgress(progress.total_bytes, progress.downloaded_bytes);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(percent / 100.0F * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                            display_name,
                            bar,
                            static_cast<int>(percent),
                            formatSize(progress.downloaded_bytes),
                            formatSize(progress.total_bytes));
    } else {
        line += fmt::format("{:<20} [Initializing...]", display_name);
    }

    switch (progress.status) {
        case TransferStatus::Error:
            line += fmt::format("  ❌ {}", progress.error_message);
            break;
        case TransferStatus::Complete:
            line.append("  ✅ Done");
            break;
        case TransferStatus::Paused:
        case TransferStatus::Cancelled:
            line += fmt::format("  {}", toString(progress.status));
            break;
        default:
            break;
    }

    return line;
}

std::string DownloadManager::formatSize(std::int64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (value >= GB) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (value >= MB) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (value >= KB) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

bool DownloadManager::hasActiveTasks() const {
    return std::any_of(tasks_.begin(), tasks_.end(), [](const DownloadTaskPtr& task) {
        return task->snapshot().status == TransferStatus::Downloading;
    });
}

void DownloadManager::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        out_ << "\033[" << previous_lines << "F\033[J";
    }
    out_ << panel;
    previous_lines = current_lines;
}

} // namespace rangefetch
