#pragma once

#include "download_task.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace rangedl {

// Redraws a fixed-height progress panel in place using ANSI cursor movement.
class ConsoleView {
public:
    explicit ConsoleView(std::ostream& out);

    void render(const std::vector<DownloadTask>& tasks);
    // Leaves the last panel on screen; the next render starts a new one.
    void finish();

    [[nodiscard]] static std::string buildPanel(const std::vector<DownloadTask>& tasks);
    [[nodiscard]] static std::string formatTaskLine(const DownloadTask& task);

private:
    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace rangedl
