#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>

namespace toolbar_layout {

// Logger used by the layout core and loaders. Falls back to spdlog's default
// logger until init_file_logging() succeeds.
std::shared_ptr<spdlog::logger> layout_logger();

// Installs a truncating file logger. Returns false (and keeps the current
// logger) if the sink cannot be created.
bool init_file_logging(const std::filesystem::path& log_file,
    spdlog::level::level_enum level = spdlog::level::info);

// Walks up from the working directory looking for CMakeLists.txt + src/.
std::filesystem::path find_project_root();

} // namespace toolbar_layout
