#include "rangedl/console_view.hpp"
#include "rangedl/curl_transport.hpp"
#include "rangedl/logging.hpp"
#include "rangedl/queue_scheduler.hpp"
#include "rangedl/sqlite_task_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
}

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url> [<url> ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: ./downloads)\n"
              << "  -t <count>       Connections per download, 1-32 (default: 8)\n"
              << "  -j <count>       Maximum concurrent downloads (default: 3)\n"
              << "  -l <bytes/s>     Per-download speed limit, 0 = unlimited\n"
              << "  -r               Resume unfinished downloads from earlier runs\n"
              << "  --db <path>      Task database (default: rangedl.db)\n"
              << "  --log <path>     Log file (default: rangedl.log)\n"
              << "  -v               Debug logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parseInt(const std::string& text, const std::string& what) {
    try {
        return std::stoi(text);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + what + ": " + text);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::filesystem::path download_dir;
        std::filesystem::path db_path = "rangedl.db";
        std::filesystem::path log_path = "rangedl.log";
        int connections = 0;
        int max_concurrent = 0;
        long long speed_limit = -1;
        bool resume_known = false;
        auto log_level = spdlog::level::info;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];
            const bool takes_value = option == "-d" || option == "-t" || option == "-j" || option == "-l" ||
                                     option == "--db" || option == "--log";
            if (takes_value && arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            if (option == "-d") {
                download_dir = argv[arg_index + 1];
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + download_dir.string() + " - " + ec.message());
                }
            } else if (option == "-t") {
                connections = parseInt(argv[arg_index + 1], "connection count");
                if (connections < rangedl::DownloadSession::kMinConnections ||
                    connections > rangedl::DownloadSession::kMaxConnections) {
                    throw std::runtime_error("Connection count must be between 1 and 32.");
                }
            } else if (option == "-j") {
                max_concurrent = parseInt(argv[arg_index + 1], "concurrency");
                if (max_concurrent <= 0) {
                    throw std::runtime_error("Concurrency must be positive.");
                }
            } else if (option == "-l") {
                speed_limit = parseInt(argv[arg_index + 1], "speed limit");
                if (speed_limit < 0) {
                    throw std::runtime_error("Speed limit cannot be negative.");
                }
            } else if (option == "--db") {
                db_path = argv[arg_index + 1];
            } else if (option == "--log") {
                log_path = argv[arg_index + 1];
            } else if (option == "-r") {
                resume_known = true;
            } else if (option == "-v") {
                log_level = spdlog::level::debug;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += takes_value ? 2 : 1;
        }

        if (arg_index >= argc && !resume_known) {
            printUsage(argv[0]);
            return 1;
        }

        rangedl::initLogging(log_path, log_level);

        auto store = std::make_shared<rangedl::SqliteTaskStore>(db_path.string());
        if (!download_dir.empty()) {
            store->setSetting("download_dir", std::filesystem::absolute(download_dir).string());
        }
        if (connections > 0) {
            store->setSetting("default_connections", std::to_string(connections));
        }
        if (max_concurrent > 0) {
            store->setSetting("max_concurrent", std::to_string(max_concurrent));
        }
        if (speed_limit >= 0) {
            store->setSetting("speed_limit", std::to_string(speed_limit));
        }
        const auto task_speed_limit = static_cast<std::uint64_t>(
            std::max(0, std::stoi(store->getSetting("speed_limit", "0"))));

        rangedl::QueueScheduler scheduler(store, std::make_shared<rangedl::CurlTransport>());
        scheduler.loadFromStore();

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        std::set<std::string> watched;
        if (resume_known) {
            scheduler.startAll();
            for (const auto& task : scheduler.tasks()) {
                if (!rangedl::isFinished(task.status)) {
                    watched.insert(task.id);
                }
            }
        }
        for (int i = arg_index; i < argc; ++i) {
            rangedl::AddRequest request;
            request.url = argv[i];
            request.speed_limit = task_speed_limit;
            watched.insert(scheduler.add(request));
        }
        scheduler.startBackgroundLoop();

        rangedl::ConsoleView view(std::cout);
        const auto watchedTasks = [&] {
            std::vector<rangedl::DownloadTask> result;
            for (auto& task : scheduler.tasks()) {
                if (watched.count(task.id) != 0) {
                    result.push_back(std::move(task));
                }
            }
            return result;
        };

        while (true) {
            const auto tasks = watchedTasks();
            view.render(tasks);

            if (g_interrupted.load()) {
                spdlog::info("Interrupted, saving state");
                scheduler.stopAll();
                view.render(watchedTasks());
                view.finish();
                std::cerr << "Interrupted; run again with -r to resume." << std::endl;
                return 130;
            }
            const bool done = std::all_of(tasks.begin(), tasks.end(), [](const rangedl::DownloadTask& task) {
                return rangedl::isFinished(task.status);
            });
            if (done) {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        view.finish();
        scheduler.stopBackgroundLoop();

        int exit_code = 0;
        for (const auto& task : watchedTasks()) {
            if (task.status == rangedl::DownloadStatus::Error) {
                std::cerr << task.filename << ": " << task.error_message << std::endl;
                exit_code = 1;
            }
        }
        return exit_code;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
