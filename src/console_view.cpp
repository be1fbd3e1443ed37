#include "rangedl/console_view.hpp"
#include "rangedl/format.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>

#include <fmt/format.h>

namespace rangedl {

namespace {

constexpr std::size_t kNameWidth = 24;
constexpr int kBarWidth = 30;

std::string displayName(const DownloadTask& task) {
    std::string name = task.filename;
    if (name.empty() && !task.filepath.empty()) {
        name = std::filesystem::path{task.filepath}.filename().string();
    }
    if (name.empty()) {
        name = "(unnamed)";
    }
    if (name.size() > kNameWidth) {
        name = name.substr(0, kNameWidth - 3) + "...";
    }
    return name;
}

} // namespace

ConsoleView::ConsoleView(std::ostream& out) : out_(out) {}

void ConsoleView::render(const std::vector<DownloadTask>& tasks) {
    const std::string panel = buildPanel(tasks);
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

void ConsoleView::finish() {
    previous_lines_ = 0;
    out_ << std::flush;
}

std::string ConsoleView::buildPanel(const std::vector<DownloadTask>& tasks) {
    std::string panel;
    panel.reserve(tasks.size() * 160 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("rangedl ({} tasks)\n", tasks.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    double speed_all = 0.0;

    for (const auto& task : tasks) {
        panel += formatTaskLine(task);
        panel.push_back('\n');

        total_all += task.total_size;
        downloaded_all += std::min(task.downloaded, task.total_size > 0 ? task.total_size : task.downloaded);
        if (task.status == DownloadStatus::Downloading) {
            speed_all += task.speed;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%  {}", static_cast<int>(ratio * 100.0), formatSpeed(speed_all));
    } else {
        panel += fmt::format("Overall: N/A  {}", formatSpeed(speed_all));
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ConsoleView::formatTaskLine(const DownloadTask& task) {
    const std::string name = displayName(task);

    if (task.total_size == 0) {
        return fmt::format("{:<24} [{:^30}] {}  {}  {}", name, "size unknown",
                           formatSize(task.downloaded),
                           formatSpeed(task.speed), toString(task.status));
    }

    const double ratio = std::min(1.0, static_cast<double>(task.downloaded) /
                                           static_cast<double>(task.total_size));
    const int percent = static_cast<int>(ratio * 100.0);
    const int bar_pos = static_cast<int>(ratio * kBarWidth);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    std::string line = fmt::format("{:<24} [{}] {:>3}% ({}/{})", name, bar, percent,
                                   formatSize(task.downloaded), formatSize(task.total_size));
    switch (task.status) {
    case DownloadStatus::Downloading:
        line += fmt::format("  {}  ETA {}", formatSpeed(task.speed), formatEta(task.eta));
        break;
    case DownloadStatus::Completed:
        line.append(u8"  ✅ Done");
        break;
    case DownloadStatus::Error:
        line += fmt::format(u8"  ❌ {}", task.error_message);
        break;
    default:
        line += fmt::format("  {}", toString(task.status));
        break;
    }
    return line;
}

} // namespace rangedl
