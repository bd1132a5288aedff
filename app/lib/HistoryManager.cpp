#include "HistoryManager.hpp"
#include "Logger.hpp"

#include <algorithm>


HistoryManager::HistoryManager(HistoryConfig config)
    : config_(config)
{
    if (config_.max_size == 0) {
        config_.max_size = 1;
    }
}


bool HistoryManager::record(const Operation& operation)
{
    auto logger = Logger::get_logger("history_logger");
    if (!operation.undoable()) {
        if (logger) {
            logger->debug("Not recording non-undoable operation: {}", operation.description());
        }
        return false;
    }

    if (!redo_stack_.empty()) {
        if (logger) {
            logger->debug("Clearing {} redo entr(ies) after new operation", redo_stack_.size());
        }
        redo_stack_.clear();
    }

    if (config_.merge_enabled && try_merge(operation)) {
        return true;
    }

    undo_stack_.push_back(operation);
    while (undo_stack_.size() > config_.max_size) {
        if (logger) {
            logger->debug("Evicting oldest history entry: {}", undo_stack_.front().description());
        }
        undo_stack_.pop_front();
    }

    if (logger) {
        logger->debug("Recorded: {} ({} undo entr(ies))", operation.description(), undo_stack_.size());
    }
    return true;
}


bool HistoryManager::try_merge(const Operation& operation)
{
    if (undo_stack_.empty() || operation.kind() != OperationKind::Rename) {
        return false;
    }
    const Operation& previous = undo_stack_.back();
    if (previous.kind() != OperationKind::Rename || !previous.target_path() ||
        operation.source_paths().size() != 1 ||
        operation.source_paths().front() != *previous.target_path()) {
        return false;
    }
    if (operation.timestamp() - previous.timestamp() > config_.merge_window) {
        return false;
    }

    Operation merged = Operation::merge_renames(previous, operation);
    const PathPair& net = merged.undo_payload().entries.front();
    auto logger = Logger::get_logger("history_logger");
    if (net.from == net.to) {
        // The second rename restored the original name; nothing is left to undo.
        if (logger) {
            logger->debug("Renames cancel out, dropping: {}", previous.description());
        }
        undo_stack_.pop_back();
        return true;
    }

    if (logger) {
        logger->debug("Merged rename into: {}", merged.description());
    }
    undo_stack_.back() = std::move(merged);
    return true;
}


std::optional<Operation> HistoryManager::undo()
{
    if (undo_stack_.empty()) {
        if (auto logger = Logger::get_logger("history_logger")) {
            logger->debug("Nothing to undo");
        }
        return std::nullopt;
    }
    Operation operation = undo_stack_.back();
    undo_stack_.pop_back();
    redo_stack_.push_back(operation);
    if (auto logger = Logger::get_logger("history_logger")) {
        logger->debug("Undo: {}", operation.description());
    }
    return operation;
}


std::optional<Operation> HistoryManager::redo()
{
    if (redo_stack_.empty()) {
        if (auto logger = Logger::get_logger("history_logger")) {
            logger->debug("Nothing to redo");
        }
        return std::nullopt;
    }
    Operation operation = redo_stack_.back();
    redo_stack_.pop_back();
    // Came off the undo stack earlier, so no eviction is needed.
    undo_stack_.push_back(operation);
    if (auto logger = Logger::get_logger("history_logger")) {
        logger->debug("Redo: {}", operation.description());
    }
    return operation;
}


std::optional<Operation> HistoryManager::peek_undo() const
{
    if (undo_stack_.empty()) {
        return std::nullopt;
    }
    return undo_stack_.back();
}


std::optional<Operation> HistoryManager::peek_redo() const
{
    if (redo_stack_.empty()) {
        return std::nullopt;
    }
    return redo_stack_.back();
}


std::optional<Operation> HistoryManager::discard_next_undo()
{
    if (undo_stack_.empty()) {
        return std::nullopt;
    }
    Operation operation = undo_stack_.back();
    undo_stack_.pop_back();
    if (auto logger = Logger::get_logger("history_logger")) {
        logger->warn("Discarded undo entry: {}", operation.description());
    }
    return operation;
}


std::optional<Operation> HistoryManager::discard_next_redo()
{
    if (redo_stack_.empty()) {
        return std::nullopt;
    }
    Operation operation = redo_stack_.back();
    redo_stack_.pop_back();
    if (auto logger = Logger::get_logger("history_logger")) {
        logger->warn("Discarded redo entry: {}", operation.description());
    }
    return operation;
}


std::vector<Operation> HistoryManager::undo_history() const
{
    return std::vector<Operation>(undo_stack_.begin(), undo_stack_.end());
}


std::vector<Operation> HistoryManager::redo_history() const
{
    return std::vector<Operation>(redo_stack_.begin(), redo_stack_.end());
}


std::vector<std::string> HistoryManager::recent_descriptions(std::size_t limit) const
{
    std::vector<std::string> descriptions;
    const std::size_t count = std::min(limit, undo_stack_.size());
    descriptions.reserve(count);
    for (auto it = undo_stack_.end() - static_cast<std::ptrdiff_t>(count); it != undo_stack_.end(); ++it) {
        descriptions.push_back(it->description());
    }
    return descriptions;
}


void HistoryManager::clear()
{
    undo_stack_.clear();
    redo_stack_.clear();
    if (auto logger = Logger::get_logger("history_logger")) {
        logger->debug("History cleared");
    }
}
