#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/logger.h>

class Logger {
public:
    /**
     * @brief Creates the shared sinks and registers the named loggers.
     *
     * Registers `core_logger` and `history_logger`. Safe to call more than once;
     * later calls only refresh the level.
     */
    static void setup_loggers();

    /**
     * @brief Returns a registered logger, or nullptr when setup_loggers() has not run.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_log_directory();

    static void set_level(const std::string& level_name);
};

#endif
