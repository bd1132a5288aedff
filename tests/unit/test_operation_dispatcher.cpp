#include <catch2/catch.hpp>
#include "AppException.hpp"
#include "OperationDispatcher.hpp"
#include "OperationEngine.hpp"
#include "TestHelpers.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {

EngineConfig make_config(const TempDir& temp)
{
    EngineConfig config;
    config.trash_dir = temp.str(".trash");
    config.state_file = temp.str("state.json");
    return config;
}

OperationResult succeeded()
{
    OperationResult result;
    result.success = true;
    return result;
}

} // namespace

TEST_CASE("queued tasks run in submission order") {
    TempDir temp;
    OperationEngine engine(make_config(temp));
    OperationDispatcher dispatcher(engine);

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::future<OperationResult>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(dispatcher.submit([i, &order, &order_mutex](OperationEngine&) {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
            return succeeded();
        }));
    }
    for (auto& future : futures) {
        CHECK(future.get().success);
    }
    CHECK(order == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("dispatched engine calls mutate the file system") {
    TempDir temp;
    write_file(temp.path() / "src" / "a.txt");
    fs::create_directories(temp.path() / "dst");
    OperationEngine engine(make_config(temp));
    OperationDispatcher dispatcher(engine);

    const std::string source = temp.str("src/a.txt");
    const std::string target = temp.str("dst");
    auto future = dispatcher.submit([source, target](OperationEngine& e) { return e.copy({source}, target); });
    const auto result = future.get();
    REQUIRE(result.success);
    CHECK(fs::exists(temp.path() / "dst" / "a.txt"));
    CHECK(engine.can_undo());
}

TEST_CASE("cancel_all completes queued tasks as cancelled") {
    TempDir temp;
    OperationEngine engine(make_config(temp));
    OperationDispatcher dispatcher(engine);

    std::promise<void> started;
    std::promise<void> gate;
    std::shared_future<void> gate_future = gate.get_future().share();
    auto running = dispatcher.submit([&started, gate_future](OperationEngine&) {
        started.set_value();
        gate_future.wait();
        return succeeded();
    });
    started.get_future().wait();

    bool ran = false;
    auto queued_a = dispatcher.submit([&ran](OperationEngine&) { ran = true; return succeeded(); });
    auto queued_b = dispatcher.submit([&ran](OperationEngine&) { ran = true; return succeeded(); });
    CHECK(dispatcher.pending() == 2);

    CHECK(dispatcher.cancel_all() == 2);
    gate.set_value();

    CHECK(running.get().success);
    const auto a = queued_a.get();
    CHECK_FALSE(a.success);
    CHECK(a.has_error(Code::CANCELLED));
    CHECK(queued_b.get().has_error(Code::CANCELLED));

    dispatcher.shutdown();
    CHECK_FALSE(ran);
}

TEST_CASE("task exceptions reach the caller through the future") {
    TempDir temp;
    OperationEngine engine(make_config(temp));
    OperationDispatcher dispatcher(engine);

    auto failing = dispatcher.submit([](OperationEngine&) -> OperationResult {
        throw std::runtime_error("boom");
    });
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);

    auto after = dispatcher.submit([](OperationEngine&) { return succeeded(); });
    CHECK(after.get().success);
}

TEST_CASE("submitting after shutdown throws") {
    TempDir temp;
    OperationEngine engine(make_config(temp));
    OperationDispatcher dispatcher(engine);
    dispatcher.shutdown();
    CHECK(dispatcher.is_idle());

    try {
        dispatcher.submit([](OperationEngine&) { return succeeded(); });
        FAIL("expected submit to throw");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == Code::DISPATCHER_STOPPED);
    }
}

TEST_CASE("cancel_all reaches a task that has not started its engine call yet") {
    TempDir temp;
    for (int i = 0; i < 50; ++i) {
        write_file(temp.path() / "src" / ("file" + std::to_string(i) + ".txt"));
    }
    fs::create_directories(temp.path() / "dst");
    OperationEngine engine(make_config(temp));
    OperationDispatcher dispatcher(engine);

    std::vector<std::string> sources;
    for (int i = 0; i < 50; ++i) {
        sources.push_back(temp.str("src/file" + std::to_string(i) + ".txt"));
    }
    const std::string target = temp.str("dst");

    std::promise<void> started;
    std::promise<void> gate;
    std::shared_future<void> gate_future = gate.get_future().share();
    auto future = dispatcher.submit([&started, gate_future, sources, target](OperationEngine& e) {
        started.set_value();
        gate_future.wait();
        return e.copy(sources, target);
    });
    started.get_future().wait();

    CHECK_FALSE(engine.is_busy());
    CHECK(dispatcher.cancel_all() == 0);
    gate.set_value();

    const auto result = future.get();
    CHECK_FALSE(result.success);
    CHECK(result.has_error(Code::CANCELLED));
    CHECK(fs::is_empty(temp.path() / "dst"));

    auto next = dispatcher.submit([sources, target](OperationEngine& e) {
        return e.copy({sources.front()}, target);
    });
    CHECK(next.get().success);
    CHECK(fs::exists(temp.path() / "dst" / "file0.txt"));
}

TEST_CASE("a cancel request while nothing runs does not affect later tasks") {
    TempDir temp;
    write_file(temp.path() / "src" / "a.txt");
    fs::create_directories(temp.path() / "dst");
    OperationEngine engine(make_config(temp));
    OperationDispatcher dispatcher(engine);

    CHECK(dispatcher.cancel_all() == 0);
    engine.request_cancel();

    const std::string source = temp.str("src/a.txt");
    const std::string target = temp.str("dst");
    auto future = dispatcher.submit([source, target](OperationEngine& e) { return e.copy({source}, target); });
    CHECK(future.get().success);
}
