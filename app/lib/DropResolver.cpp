#include "DropResolver.hpp"
#include "Logger.hpp"
#include "OperationEngine.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

TestHooks::VolumeProbe& volume_probe_slot() {
    static TestHooks::VolumeProbe probe;
    return probe;
}

std::optional<std::uint64_t> volume_of(const std::string& path)
{
    if (auto& probe = volume_probe_slot()) {
        return probe(path);
    }
    return Utils::device_id(Utils::utf8_to_path(path));
}

bool is_inside_any(const fs::path& target, const std::vector<std::string>& sources)
{
    return std::any_of(sources.begin(), sources.end(), [&target](const std::string& source) {
        return Utils::is_same_or_descendant(target, Utils::utf8_to_path(source));
    });
}

} // namespace

namespace TestHooks {

void set_volume_probe(VolumeProbe probe) {
    volume_probe_slot() = std::move(probe);
}

void reset_volume_probe() {
    volume_probe_slot() = VolumeProbe{};
}

} // namespace TestHooks


DropResolver::DropResolver(OperationEngine& engine)
    : engine_(engine)
{
}


DropAction DropResolver::infer_action(const std::vector<std::string>& sources,
                                      const std::string& target_dir) const
{
    const auto target_volume = volume_of(target_dir);
    if (!target_volume) {
        return DropAction::Copy;
    }
    for (const auto& source : sources) {
        const auto source_volume = volume_of(source);
        if (!source_volume || *source_volume != *target_volume) {
            return DropAction::Copy;
        }
    }
    return DropAction::Move;
}


DropDecision DropResolver::resolve(const std::vector<std::string>& dragged_paths,
                                   const std::string& target_path,
                                   DropAction requested_action) const
{
    DropDecision decision;
    auto logger = Logger::get_logger("core_logger");

    if (requested_action == DropAction::None) {
        decision.reason = "No drop action requested";
        return decision;
    }
    if (dragged_paths.empty() || target_path.empty()) {
        decision.reason = "Nothing dragged or no drop target";
        return decision;
    }

    fs::path target = Utils::normalize_path(Utils::utf8_to_path(target_path));
    std::error_code ec;
    const auto status = fs::status(target, ec);
    if (!fs::exists(status)) {
        decision.reason = fmt::format("Drop target '{}' does not exist", target_path);
        return decision;
    }
    if (!fs::is_directory(status)) {
        // Dropping onto a file means dropping into the directory holding it.
        target = target.parent_path();
    }

    std::vector<std::string> sources;
    sources.reserve(dragged_paths.size());
    for (const auto& path : dragged_paths) {
        sources.push_back(Utils::path_to_utf8(Utils::normalize_path(Utils::utf8_to_path(path))));
    }

    DropAction action = requested_action;
    if (action == DropAction::Auto) {
        action = infer_action(sources, Utils::path_to_utf8(target));
    }

    if (action == DropAction::Move) {
        std::vector<std::string> movable;
        for (const auto& source : sources) {
            const fs::path source_path = Utils::utf8_to_path(source);
            if (Utils::is_same_or_descendant(target, source_path)) {
                if (logger) {
                    logger->info("Refusing to move '{}' into itself", source);
                }
                continue;
            }
            if (source_path.parent_path() == target) {
                continue;
            }
            movable.push_back(source);
        }
        if (movable.empty()) {
            decision.reason = is_inside_any(target, sources)
                ? "Drop target is inside a dragged item"
                : "Items are already in the drop target";
            decision.target_dir = Utils::path_to_utf8(target);
            return decision;
        }
        sources = std::move(movable);
    } else if (is_inside_any(target, sources)) {
        // Copy or link beside the outermost dragged item the target sits in.
        std::string outermost;
        for (const auto& source : sources) {
            if (Utils::is_same_or_descendant(target, Utils::utf8_to_path(source)) &&
                (outermost.empty() || source.size() < outermost.size())) {
                outermost = source;
            }
        }
        target = Utils::utf8_to_path(outermost).parent_path();
        decision.redirected = true;
        if (target.empty() || is_inside_any(target, sources)) {
            decision.reason = "Drop target is inside a dragged item and has no safe parent";
            decision.redirected = false;
            return decision;
        }
        if (logger) {
            logger->info("Drop target inside '{}'; {} into '{}' instead",
                         outermost, to_string(action), Utils::path_to_utf8(target));
        }
    }

    decision.action = action;
    decision.sources = std::move(sources);
    decision.target_dir = Utils::path_to_utf8(target);
    decision.reason = requested_action == DropAction::Auto
        ? fmt::format("Inferred {} from source and target volumes", to_string(action))
        : fmt::format("Requested {}", to_string(action));
    bind_engine_call(decision);

    if (logger) {
        logger->debug("Drop of {} item(s) onto '{}' resolved to {} ({})",
                      dragged_paths.size(), target_path, to_string(decision.action), decision.reason);
    }
    return decision;
}


void DropResolver::bind_engine_call(DropDecision& decision) const
{
    OperationEngine* engine = &engine_;
    const auto sources = decision.sources;
    const auto target = decision.target_dir;
    switch (decision.action) {
        case DropAction::Copy:
            decision.engine_call = [engine, sources, target] { return engine->copy(sources, target); };
            break;
        case DropAction::Move:
            decision.engine_call = [engine, sources, target] { return engine->move(sources, target); };
            break;
        case DropAction::Link:
            decision.engine_call = [engine, sources, target] { return engine->link(sources, target); };
            break;
        default:
            decision.engine_call = nullptr;
            break;
    }
}


OperationResult DropResolver::execute(const DropDecision& decision) const
{
    if (decision.action == DropAction::None || !decision.engine_call) {
        OperationResult result;
        result.success = true;
        result.warnings.push_back(decision.reason.empty() ? std::string("Drop ignored") : decision.reason);
        return result;
    }
    return decision.engine_call();
}


OperationResult DropResolver::drop(const std::vector<std::string>& dragged_paths,
                                   const std::string& target_path,
                                   DropAction requested_action) const
{
    return execute(resolve(dragged_paths, target_path, requested_action));
}
