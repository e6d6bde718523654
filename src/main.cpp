#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/download_manager.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/http_downloader.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) { g_interrupted.store(true); }

enum class Mode { Download, Text, Boolean, Json };

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-d <directory>] [-b <bytes>] [-v|-q] [--text|--bool|--json] <url> [<url> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -b <bytes>       Read/write chunk size (default: 1024)\n"
              << "  -v               Debug logging\n"
              << "  -q               Only log warnings and errors\n"
              << "  --text           Print the body of a single URL\n"
              << "  --bool           Print the body of a single URL parsed as a boolean literal\n"
              << "  --json           Print the body of a single URL parsed as a JSON array\n"
              << "  -h, --help       Show this message\n"
              << "Environment:\n"
              << "  RANGEFETCH_LOG_LEVEL   trace|debug|info|warn|error|off (default: info)" << std::endl;
}

void configureLogging(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        throw std::runtime_error("Unknown log level: " + level);
    }
}

int runSingle(Mode mode, const std::string& url, rangefetch::DownloaderOptions options) {
    rangefetch::HttpDownloader downloader(url, std::move(options));
    bool produced = false;

    switch (mode) {
        case Mode::Text:
            if (auto text = downloader.processTextAsString()) {
                std::cout << *text << std::endl;
                produced = true;
            }
            break;
        case Mode::Boolean:
            if (auto value = downloader.processTextAsBoolean()) {
                std::cout << (*value ? "true" : "false") << std::endl;
                produced = true;
            }
            break;
        case Mode::Json:
            if (auto array = downloader.processJsonAsArray()) {
                std::cout << array->toStyledString();
                produced = true;
            }
            break;
        case Mode::Download:
            break;
    }

    if (!produced) {
        std::cerr << url << ": " << downloader.errorMessage() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        rangefetch::detail::ensureCurlInitialized();

        // stdout carries the progress panel and request output.
        spdlog::set_default_logger(spdlog::stderr_color_mt("rangefetch"));
        const char* env_level = std::getenv("RANGEFETCH_LOG_LEVEL");
        configureLogging(env_level ? env_level : "info");

        rangefetch::DownloaderOptions options;
        std::filesystem::path download_dir;
        Mode mode = Mode::Download;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-d") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 2;
                }

                download_dir = argv[arg_index + 1];
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + download_dir.string() + " - " + ec.message());
                }
                arg_index += 2;
            } else if (option == "-b") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 2;
                }

                long long bytes = 0;
                try {
                    bytes = std::stoll(argv[arg_index + 1]);
                } catch (const std::exception&) {
                    throw std::runtime_error("Invalid buffer size: " + std::string(argv[arg_index + 1]));
                }

                if (bytes <= 0) {
                    throw std::runtime_error("Buffer size must be positive.");
                }

                options.buffer_size = static_cast<std::size_t>(bytes);
                arg_index += 2;
            } else if (option == "-v") {
                spdlog::set_level(spdlog::level::debug);
                ++arg_index;
            } else if (option == "-q") {
                spdlog::set_level(spdlog::level::warn);
                ++arg_index;
            } else if (option == "--text") {
                mode = Mode::Text;
                ++arg_index;
            } else if (option == "--bool") {
                mode = Mode::Boolean;
                ++arg_index;
            } else if (option == "--json") {
                mode = Mode::Json;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 2;
            }
        }

        const int url_count = argc - arg_index;
        if (url_count < 1 || (mode != Mode::Download && url_count != 1)) {
            printUsage(argv[0]);
            return 2;
        }

        if (mode != Mode::Download) {
            return runSingle(mode, argv[arg_index], std::move(options));
        }

        std::signal(SIGINT, onSignal);

        rangefetch::DownloadManager manager(std::cout);
        for (int i = arg_index; i < argc; ++i) {
            manager.addTask(std::make_shared<rangefetch::HttpDownloader>(download_dir.string(), argv[i], options));
        }

        manager.start(g_interrupted);
        manager.printErrors(std::cerr);
        return manager.allCompleted() ? 0 : 1;
    } catch (const rangefetch::RateLimitError& ex) {
        std::cerr << "Rate limited: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
