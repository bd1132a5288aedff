#include "Logger.hpp"
#include "Utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

const std::vector<std::string>& logger_names()
{
    static const std::vector<std::string> names = {"core_logger", "history_logger"};
    return names;
}

spdlog::level::level_enum resolve_level()
{
    if (const char* env = std::getenv("FILEOPS_LOG_LEVEL")) {
        return spdlog::level::from_str(env);
    }
    return spdlog::level::info;
}
}


std::string Logger::get_log_directory()
{
    if (const char* env = std::getenv("FILEOPS_LOG_DIR"); env && *env) {
        return env;
    }
    return Utils::path_to_utf8(Utils::utf8_to_path(Utils::default_config_dir()) / "logs");
}


void Logger::setup_loggers()
{
    const auto level = resolve_level();
    if (spdlog::get("core_logger")) {
        spdlog::set_level(level);
        return;
    }

    const std::filesystem::path log_dir = Utils::utf8_to_path(get_log_directory());
    std::filesystem::create_directories(log_dir);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        Utils::path_to_utf8(log_dir / "fileops.log"), kMaxLogFileSize, kMaxLogFiles);

    for (const auto& name : logger_names()) {
        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::set_level(const std::string& level_name)
{
    const auto level = spdlog::level::from_str(level_name);
    for (const auto& name : logger_names()) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}
