#include "StateStore.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "OperationEngine.hpp"
#include "Utils.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

NumberingRecord parse_record(const Json::Value& item)
{
    NumberingRecord record;
    record.directory = item.get("directory", "").asString();
    record.base_name = item.get("base_name", "").asString();
    record.highest = item.get("highest", Json::Value(Json::UInt64{0})).asUInt64();
    record.width = item.get("width", 0).asInt();
    return record;
}

} // namespace


StateStore::StateStore(std::string path)
    : path_(std::move(path))
{
}


PersistedState StateStore::load() const
{
    PersistedState state;
    const fs::path file_path = Utils::utf8_to_path(path_);
    if (!Utils::entry_exists(file_path)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("No state file at '{}'", path_);
        }
        return state;
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::STATE_PARSE_ERROR, "Cannot open state file", path_);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Failed to parse state file '{}': {}", path_, errors);
        }
        THROW_APP_ERROR(ErrorCodes::Code::STATE_PARSE_ERROR, path_);
    }
    if (!root.isObject()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::STATE_PARSE_ERROR, "State file root is not an object", path_);
    }

    const int version = root.get("version", 0).asInt();
    if (version != kFormatVersion) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::STATE_PARSE_ERROR,
                            "Unsupported state file version " + std::to_string(version), path_);
    }

    const Json::Value& numbering = root["numbering"];
    if (numbering.isArray()) {
        for (const auto& item : numbering) {
            if (!item.isObject()) {
                continue;
            }
            NumberingRecord record = parse_record(item);
            if (!record.directory.empty() && !record.base_name.empty()) {
                state.numbering.push_back(std::move(record));
            }
        }
    }

    const Json::Value& history = root["history"];
    if (history.isArray()) {
        for (const auto& item : history) {
            if (item.isString()) {
                state.history.push_back(item.asString());
            }
        }
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded {} numbering record(s) and {} history entr(ies) from '{}'",
                     state.numbering.size(), state.history.size(), path_);
    }
    return state;
}


void StateStore::save(const PersistedState& state) const
{
    Json::Value root(Json::objectValue);
    root["version"] = kFormatVersion;

    Json::Value numbering(Json::arrayValue);
    for (const auto& record : state.numbering) {
        Json::Value item(Json::objectValue);
        item["directory"] = record.directory;
        item["base_name"] = record.base_name;
        item["highest"] = Json::UInt64(record.highest);
        item["width"] = record.width;
        numbering.append(item);
    }
    root["numbering"] = numbering;

    Json::Value history(Json::arrayValue);
    for (const auto& description : state.history) {
        history.append(description);
    }
    root["history"] = history;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    const std::string content = Json::writeString(builder, root);

    const fs::path file_path = Utils::utf8_to_path(path_);
    std::error_code ec;
    if (file_path.has_parent_path()) {
        fs::create_directories(file_path.parent_path(), ec);
        if (ec) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::STATE_SAVE_FAILED,
                                "Cannot create state directory: " + ec.message(), path_);
        }
    }

    fs::path temp_path = file_path;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::STATE_SAVE_FAILED, "Cannot write state file", path_);
        }
        out << content << '\n';
        if (!out.good()) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::STATE_SAVE_FAILED, "Short write to state file", path_);
        }
    }
    fs::rename(temp_path, file_path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        THROW_APP_ERROR_MSG(ErrorCodes::Code::STATE_SAVE_FAILED,
                            "Cannot replace state file: " + ec.message(), path_);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Saved state to '{}'", path_);
    }
}


bool StateStore::restore_into(OperationEngine& engine) const
{
    try {
        PersistedState state = load();
        engine.seed_numbering(state.numbering);
        engine.restore_history_snapshot(std::move(state.history));
        return true;
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Starting with empty state: {}", ex.what());
        }
        return false;
    }
}


void StateStore::save_from(const OperationEngine& engine, std::size_t history_limit) const
{
    PersistedState state;
    state.numbering = engine.numbering_records();
    state.history = engine.history_snapshot(history_limit);
    save(state);
}
