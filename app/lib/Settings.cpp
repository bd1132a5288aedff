#include "Settings.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

constexpr int kMaxDigitWidth = 18;

bool placeholders_in_order(const std::string& tmpl)
{
    const auto name_pos = tmpl.find("{name}");
    const auto number_pos = tmpl.find("{number");
    const auto ext_pos = tmpl.find("{ext}");
    return name_pos != std::string::npos && number_pos != std::string::npos &&
           ext_pos != std::string::npos && name_pos < number_pos && number_pos < ext_pos;
}

template <typename T>
T read_ranged(const IniConfig& config, const char* section, const char* key,
              T fallback, std::int64_t min_value, std::int64_t max_value)
{
    if (!config.hasValue(section, key)) {
        return fallback;
    }
    const auto value = config.getInt(section, key);
    if (!value || *value < min_value || *value > max_value) {
        settings_log(spdlog::level::warn, "Invalid value for [{}] {}; using default", section, key);
        return fallback;
    }
    return static_cast<T>(*value);
}
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = Utils::utf8_to_path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }

    trash_dir = Utils::path_to_utf8(config_dir / "trash");
    state_file = Utils::path_to_utf8(config_dir / "state.json");
}


std::string Settings::define_config_path()
{
    return Utils::path_to_utf8(Utils::utf8_to_path(Utils::default_config_dir()) / "config.ini");
}


std::string Settings::get_config_dir() const
{
    return Utils::path_to_utf8(config_dir);
}


std::string Settings::get_config_path() const
{
    return config_path;
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    const std::string tmpl = config.getValue("Numbering", "Template", numbering_template);
    if (placeholders_in_order(tmpl)) {
        numbering_template = tmpl;
    } else {
        settings_log(spdlog::level::warn,
                     "Numbering template '{}' must contain {{name}}, {{number}} and {{ext}} in order; using default",
                     tmpl);
    }

    digit_width = read_ranged<int>(config, "Numbering", "DigitWidth", digit_width, 1, kMaxDigitWidth);
    if (config.hasValue("Numbering", "DigitWidth") && numbering_template.find("{number:") != std::string::npos) {
        settings_log(spdlog::level::warn,
                     "Numbering template '{}' sets its own width; DigitWidth {} only applies to a plain {{number}}",
                     numbering_template, digit_width);
    }
    rollover_threshold = read_ranged<std::uint64_t>(config, "Numbering", "RolloverThreshold",
                                                    rollover_threshold, 1, INT64_MAX);
    start_number = read_ranged<std::uint64_t>(config, "Numbering", "StartNumber",
                                              start_number, 0, INT64_MAX);

    max_history_size = read_ranged<std::size_t>(config, "History", "MaxSize", max_history_size, 1, 100000);
    if (auto merge = config.getBool("History", "MergeEnabled")) {
        history_merge_enabled = *merge;
    }
    history_merge_window = std::chrono::milliseconds(
        read_ranged<std::int64_t>(config, "History", "MergeWindowMs",
                                  history_merge_window.count(), 0, 3600000));
    history_snapshot_size = read_ranged<std::size_t>(config, "History", "SnapshotSize",
                                                     history_snapshot_size, 0, 10000);

    trash_dir = config.getValue("Storage", "TrashDir", trash_dir);
    state_file = config.getValue("Storage", "StateFile", state_file);

    settings_log(spdlog::level::debug, "Loaded settings from {}", config_path);
    return true;
}


bool Settings::save()
{
    config.setValue("Numbering", "Template", numbering_template);
    config.setValue("Numbering", "DigitWidth", std::to_string(digit_width));
    config.setValue("Numbering", "RolloverThreshold", std::to_string(rollover_threshold));
    config.setValue("Numbering", "StartNumber", std::to_string(start_number));

    config.setValue("History", "MaxSize", std::to_string(max_history_size));
    config.setValue("History", "MergeEnabled", history_merge_enabled ? "true" : "false");
    config.setValue("History", "MergeWindowMs", std::to_string(history_merge_window.count()));
    config.setValue("History", "SnapshotSize", std::to_string(history_snapshot_size));

    config.setValue("Storage", "TrashDir", trash_dir);
    config.setValue("Storage", "StateFile", state_file);

    return config.save(config_path);
}


std::string Settings::get_numbering_template() const
{
    return numbering_template;
}

void Settings::set_numbering_template(const std::string& value)
{
    numbering_template = value;
}

int Settings::get_digit_width() const
{
    return digit_width;
}

void Settings::set_digit_width(int value)
{
    digit_width = value;
}

std::uint64_t Settings::get_rollover_threshold() const
{
    return rollover_threshold;
}

void Settings::set_rollover_threshold(std::uint64_t value)
{
    rollover_threshold = value;
}

std::uint64_t Settings::get_start_number() const
{
    return start_number;
}

void Settings::set_start_number(std::uint64_t value)
{
    start_number = value;
}

std::size_t Settings::get_max_history_size() const
{
    return max_history_size;
}

void Settings::set_max_history_size(std::size_t value)
{
    max_history_size = value;
}

bool Settings::get_history_merge_enabled() const
{
    return history_merge_enabled;
}

void Settings::set_history_merge_enabled(bool value)
{
    history_merge_enabled = value;
}

std::chrono::milliseconds Settings::get_history_merge_window() const
{
    return history_merge_window;
}

void Settings::set_history_merge_window(std::chrono::milliseconds value)
{
    history_merge_window = value;
}

std::size_t Settings::get_history_snapshot_size() const
{
    return history_snapshot_size;
}

void Settings::set_history_snapshot_size(std::size_t value)
{
    history_snapshot_size = value;
}

std::string Settings::get_trash_dir() const
{
    return trash_dir;
}

void Settings::set_trash_dir(const std::string& path)
{
    trash_dir = path;
}

std::string Settings::get_state_file() const
{
    return state_file;
}

void Settings::set_state_file(const std::string& path)
{
    state_file = path;
}


EngineConfig Settings::engine_config() const
{
    EngineConfig result;
    result.numbering.name_template = numbering_template;
    result.numbering.digit_width = digit_width;
    result.numbering.rollover_threshold = rollover_threshold;
    result.numbering.start_number = start_number;
    result.history.max_size = max_history_size;
    result.history.merge_enabled = history_merge_enabled;
    result.history.merge_window = history_merge_window;
    result.history_snapshot_size = history_snapshot_size;
    result.trash_dir = trash_dir;
    result.state_file = state_file;
    return result;
}
