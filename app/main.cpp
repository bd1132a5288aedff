#include "AppException.hpp"
#include "DropResolver.hpp"
#include "ErrorCode.hpp"
#include "Logger.hpp"
#include "OperationDispatcher.hpp"
#include "OperationEngine.hpp"
#include "Settings.hpp"
#include "StateStore.hpp"
#include "Utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <future>
#include <iostream>
#include <string>
#include <vector>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

constexpr int kExitUsage = 2;

volatile std::sig_atomic_t g_interrupted = 0;

void handle_interrupt(int)
{
    g_interrupted = 1;
}

struct ParsedArguments {
    bool verbose{false};
    bool permanent{false};
    bool confirmed{false};
    DropAction drop_action{DropAction::Auto};
    std::string command;
    std::vector<std::string> operands;
};

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            parsed.verbose = true;
        } else if (std::strcmp(arg, "--permanent") == 0) {
            parsed.permanent = true;
        } else if (std::strcmp(arg, "--yes") == 0 || std::strcmp(arg, "-y") == 0) {
            parsed.confirmed = true;
        } else if (std::strcmp(arg, "--copy") == 0) {
            parsed.drop_action = DropAction::Copy;
        } else if (std::strcmp(arg, "--move") == 0) {
            parsed.drop_action = DropAction::Move;
        } else if (std::strcmp(arg, "--link") == 0) {
            parsed.drop_action = DropAction::Link;
        } else if (parsed.command.empty()) {
            parsed.command = arg;
        } else {
            parsed.operands.emplace_back(arg);
        }
    }
    return parsed;
}

void print_usage()
{
    std::cerr <<
        "Usage: fileops [--verbose] <command> [options] <operands>\n"
        "\n"
        "Commands:\n"
        "  copy <source>... <target-dir>       Copy, numbering on name collisions\n"
        "  move <source>... <target-dir>       Move, numbering on name collisions\n"
        "  link <source>... <target-dir>       Create symbolic links\n"
        "  drop [--copy|--move|--link] <source>... <target>\n"
        "                                      Resolve a drop like a file manager\n"
        "  delete [--permanent [--yes]] <path>...\n"
        "  rename <path> <new-name>\n"
        "  duplicate <path>\n"
        "  touch <dir> <name>                  Create an empty file\n"
        "  mkdir <dir> <name>                  Create a directory\n"
        "  history                             Show recent operations\n";
}

void print_result(const OperationResult& result)
{
    for (const auto& path : result.result_paths) {
        std::cout << path << '\n';
    }
    for (const auto& warning : result.warnings) {
        std::cerr << "warning: " << warning << '\n';
    }
    for (const auto& error : result.errors) {
        std::cerr << "error [" << ErrorCodes::ErrorCatalog::code_name(error.code) << "] "
                  << (error.path.empty() ? std::string() : error.path + ": ")
                  << error.message << '\n';
    }
}

using Command = std::function<OperationResult(OperationEngine&)>;

bool build_command(const ParsedArguments& args, const DropResolver& resolver, Command& command)
{
    const auto& ops = args.operands;
    const auto split_target = [&ops]() {
        return std::make_pair(std::vector<std::string>(ops.begin(), ops.end() - 1), ops.back());
    };

    if (args.command == "copy" || args.command == "move" || args.command == "link") {
        if (ops.size() < 2) {
            return false;
        }
        const auto split = split_target();
        const std::vector<std::string> sources = split.first;
        const std::string target = split.second;
        const std::string name = args.command;
        command = [name, sources, target](OperationEngine& engine) {
            if (name == "copy") {
                return engine.copy(sources, target);
            }
            if (name == "move") {
                return engine.move(sources, target);
            }
            return engine.link(sources, target);
        };
        return true;
    }
    if (args.command == "drop") {
        if (ops.size() < 2) {
            return false;
        }
        const auto split = split_target();
        const std::vector<std::string> sources = split.first;
        const std::string target = split.second;
        const DropAction action = args.drop_action;
        command = [&resolver, sources, target, action](OperationEngine&) {
            const DropDecision decision = resolver.resolve(sources, target, action);
            std::cerr << "drop: " << to_string(decision.action) << " (" << decision.reason << ")\n";
            return resolver.execute(decision);
        };
        return true;
    }
    if (args.command == "delete") {
        if (ops.empty()) {
            return false;
        }
        const bool permanent = args.permanent;
        const bool confirmed = args.confirmed;
        command = [ops, permanent, confirmed](OperationEngine& engine) {
            return engine.delete_items(ops, permanent, confirmed);
        };
        return true;
    }
    if (args.command == "rename") {
        if (ops.size() != 2) {
            return false;
        }
        command = [ops](OperationEngine& engine) { return engine.rename(ops[0], ops[1]); };
        return true;
    }
    if (args.command == "duplicate") {
        if (ops.size() != 1) {
            return false;
        }
        command = [ops](OperationEngine& engine) { return engine.duplicate(ops[0]); };
        return true;
    }
    if (args.command == "touch" || args.command == "mkdir") {
        if (ops.size() != 2) {
            return false;
        }
        const bool directory = args.command == "mkdir";
        command = [ops, directory](OperationEngine& engine) {
            return directory ? engine.create_directory(ops[0], ops[1])
                             : engine.create_file(ops[0], ops[1]);
        };
        return true;
    }
    return false;
}

// Waits for the queued command while forwarding Ctrl+C as a cooperative cancel.
OperationResult wait_for_result(OperationDispatcher& dispatcher, std::future<OperationResult>& future)
{
    bool cancel_sent = false;
    while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_interrupted && !cancel_sent) {
            std::cerr << "Cancelling...\n";
            dispatcher.cancel_all();
            cancel_sent = true;
        }
    }
    return future.get();
}

int run_application(int argc, char** argv)
{
    const ParsedArguments args = parse_command_line(argc, argv);
    if (args.command.empty() || args.command == "help" || args.command == "--help") {
        print_usage();
        return args.command.empty() ? kExitUsage : EXIT_SUCCESS;
    }
    if (args.verbose) {
        Logger::set_level("debug");
    }

    Settings settings;
    if (!settings.load()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Using default settings; '{}' not loaded", settings.get_config_path());
        }
    }
    const EngineConfig config = settings.engine_config();

    OperationEngine engine(config);
    const StateStore state_store(config.state_file);
    state_store.restore_into(engine);

    if (args.command == "history") {
        const auto entries = engine.history_snapshot(config.history_snapshot_size);
        if (entries.empty()) {
            std::cout << "No recorded operations\n";
        }
        for (const auto& description : entries) {
            std::cout << description << '\n';
        }
        return EXIT_SUCCESS;
    }

    DropResolver resolver(engine);
    Command command;
    if (!build_command(args, resolver, command)) {
        print_usage();
        return kExitUsage;
    }

    std::signal(SIGINT, handle_interrupt);
    OperationResult result;
    {
        OperationDispatcher dispatcher(engine);
        auto future = dispatcher.submit(command);
        result = wait_for_result(dispatcher, future);
    }
    print_result(result);

    try {
        state_store.save_from(engine, config.history_snapshot_size);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("{}", ex.get_full_details());
        }
    }

    return result.success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace


int main(int argc, char **argv) {
    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }

    try {
        return run_application(argc, argv);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("{}", ex.get_full_details());
        }
        std::cerr << ex.get_user_message() << '\n';
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Unhandled exception: {}", ex.what());
        }
        return EXIT_FAILURE;
    }
}
