#include <toolbar_layout/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <utility>

namespace toolbar_layout {

namespace {

const char* const logger_name = "toolbar_layout";

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

} // namespace

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> layout_logger() {
    auto& logger = logger_slot();
    if (logger) return logger;
    return spdlog::default_logger();
}

bool init_file_logging(const std::filesystem::path& log_file, spdlog::level::level_enum level) {
    try {
        if (log_file.has_parent_path())
            std::filesystem::create_directories(log_file.parent_path());
        spdlog::drop(logger_name);
        auto logger = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
        logger->set_level(level);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Toolbar layout logger initialized. file={}", log_file.string());
        logger_slot() = std::move(logger);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::default_logger()->warn("File logging unavailable ({}): {}", log_file.string(), ex.what());
        return false;
    } catch (const std::filesystem::filesystem_error& ex) {
        spdlog::default_logger()->warn("File logging unavailable ({}): {}", log_file.string(), ex.what());
        return false;
    }
}

} // namespace toolbar_layout
