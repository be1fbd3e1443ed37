#pragma once

#include <filesystem>

#include <spdlog/common.h>

namespace rangedl {

// Routes the default spdlog logger to a file so the console stays free for
// the progress panel. Falls back to stderr when the file cannot be opened.
void initLogging(const std::filesystem::path& log_file, spdlog::level::level_enum level = spdlog::level::info);

} // namespace rangedl
