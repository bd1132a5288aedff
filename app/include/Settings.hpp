#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    std::string get_numbering_template() const;
    void set_numbering_template(const std::string& value);

    int get_digit_width() const;
    void set_digit_width(int value);

    std::uint64_t get_rollover_threshold() const;
    void set_rollover_threshold(std::uint64_t value);

    std::uint64_t get_start_number() const;
    void set_start_number(std::uint64_t value);

    std::size_t get_max_history_size() const;
    void set_max_history_size(std::size_t value);

    bool get_history_merge_enabled() const;
    void set_history_merge_enabled(bool value);

    std::chrono::milliseconds get_history_merge_window() const;
    void set_history_merge_window(std::chrono::milliseconds value);

    std::size_t get_history_snapshot_size() const;
    void set_history_snapshot_size(std::size_t value);

    std::string get_trash_dir() const;
    void set_trash_dir(const std::string& path);

    std::string get_state_file() const;
    void set_state_file(const std::string& path);

    std::string define_config_path();
    std::string get_config_dir() const;
    std::string get_config_path() const;

    EngineConfig engine_config() const;

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    std::string numbering_template{"{name}_{number:05d}{ext}"};
    int digit_width{5};
    std::uint64_t rollover_threshold{99999};
    std::uint64_t start_number{1};
    std::size_t max_history_size{100};
    bool history_merge_enabled{false};
    std::chrono::milliseconds history_merge_window{1000};
    std::size_t history_snapshot_size{20};
    std::string trash_dir;
    std::string state_file;
};

#endif
