#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP

#include "NumberingService.hpp"

#include <string>
#include <vector>

class OperationEngine;

struct PersistedState {
    std::vector<NumberingRecord> numbering;
    std::vector<std::string> history;
};

/**
 * @brief Reads and writes the engine state that survives restarts.
 *
 * The file is JSON:
 * `{"version": 1, "numbering": [{"directory", "base_name", "highest", "width"}], "history": ["..."]}`
 */
class StateStore {
public:
    static constexpr int kFormatVersion = 1;

    explicit StateStore(std::string path);

    /**
     * @brief Parses the state file. A missing file yields an empty state.
     * @throws ErrorCodes::AppException STATE_PARSE_ERROR on malformed content.
     */
    PersistedState load() const;

    // Writes atomically through a temporary file. Throws STATE_SAVE_FAILED.
    void save(const PersistedState& state) const;

    /**
     * @brief Seeds numbering counters and the history snapshot of @p engine.
     * @return False when the file could not be parsed; the engine keeps its state.
     */
    bool restore_into(OperationEngine& engine) const;

    // Saves the engine's counters and its newest @p history_limit descriptions.
    void save_from(const OperationEngine& engine, std::size_t history_limit) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

#endif
