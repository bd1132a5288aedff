#include <catch2/catch.hpp>
#include "DropResolver.hpp"
#include "OperationEngine.hpp"
#include "TestHelpers.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

struct VolumeProbeGuard {
    ~VolumeProbeGuard() { TestHooks::reset_volume_probe(); }
};

struct DropFixture {
    TempDir temp;
    fs::path src;
    fs::path dst;
    OperationEngine engine;
    DropResolver resolver;

    DropFixture()
        : src(temp.path() / "src"),
          dst(temp.path() / "dst"),
          engine(make_config()),
          resolver(engine)
    {
        fs::create_directories(src);
        fs::create_directories(dst);
    }

    EngineConfig make_config() const
    {
        EngineConfig config;
        config.trash_dir = temp.str(".trash");
        config.state_file = temp.str("state.json");
        return config;
    }
};

std::string normalized(const fs::path& path)
{
    return Utils::path_to_utf8(Utils::normalize_path(path));
}

} // namespace

TEST_CASE("moving a folder onto its own subfolder is a no-op") {
    DropFixture fx;
    write_file(fx.src / "a" / "sub" / "keep.txt");

    const auto decision = fx.resolver.resolve({(fx.src / "a").string()},
                                              (fx.src / "a" / "sub").string(), DropAction::Move);
    CHECK(decision.action == DropAction::None);
    CHECK(decision.reason == "Drop target is inside a dragged item");
    CHECK_FALSE(decision.engine_call);

    const auto result = fx.resolver.execute(decision);
    CHECK(result.success);
    REQUIRE(result.warnings.size() == 1);
    CHECK(fs::exists(fx.src / "a" / "sub" / "keep.txt"));
    CHECK_FALSE(fx.engine.can_undo());
}

TEST_CASE("dropping a folder onto itself never moves it") {
    DropFixture fx;
    fs::create_directories(fx.src / "a");

    const auto result = fx.resolver.drop({(fx.src / "a").string()}, (fx.src / "a").string(), DropAction::Move);
    CHECK(result.success);
    CHECK(fs::is_directory(fx.src / "a"));
    CHECK_FALSE(fx.engine.can_undo());
}

TEST_CASE("moving into the current parent does nothing") {
    DropFixture fx;
    write_file(fx.src / "file.txt");

    const auto decision = fx.resolver.resolve({(fx.src / "file.txt").string()}, fx.src.string(), DropAction::Move);
    CHECK(decision.action == DropAction::None);
    CHECK(decision.reason == "Items are already in the drop target");
}

TEST_CASE("a move leaves out only the conflicting items") {
    DropFixture fx;
    fs::create_directories(fx.dst / "inner");
    write_file(fx.src / "loose.txt");

    const auto decision = fx.resolver.resolve({fx.dst.string(), (fx.src / "loose.txt").string()},
                                              (fx.dst / "inner").string(), DropAction::Move);
    REQUIRE(decision.action == DropAction::Move);
    REQUIRE(decision.sources.size() == 1);
    CHECK(decision.sources.front() == normalized(fx.src / "loose.txt"));

    const auto result = fx.resolver.execute(decision);
    REQUIRE(result.success);
    CHECK(fs::exists(fx.dst / "inner" / "loose.txt"));
    CHECK(fs::is_directory(fx.dst / "inner"));
}

TEST_CASE("copying a folder into its own subtree copies beside it instead") {
    DropFixture fx;
    write_file(fx.src / "a" / "sub" / "file.txt", "payload");

    const auto decision = fx.resolver.resolve({(fx.src / "a").string()},
                                              (fx.src / "a" / "sub").string(), DropAction::Copy);
    REQUIRE(decision.action == DropAction::Copy);
    CHECK(decision.redirected);
    CHECK(decision.target_dir == normalized(fx.src));

    const auto result = fx.resolver.execute(decision);
    REQUIRE(result.success);
    REQUIRE(result.result_paths.size() == 1);
    CHECK(fs::path(result.result_paths.front()).filename().string() == "a_00001");
    CHECK(read_file(fx.src / "a_00001" / "sub" / "file.txt") == "payload");
    CHECK_FALSE(fs::exists(fx.src / "a" / "sub" / "a"));
}

TEST_CASE("dropping onto a file targets its directory") {
    DropFixture fx;
    write_file(fx.src / "file.txt");
    write_file(fx.dst / "existing.txt");

    const auto decision = fx.resolver.resolve({(fx.src / "file.txt").string()},
                                              (fx.dst / "existing.txt").string(), DropAction::Copy);
    REQUIRE(decision.action == DropAction::Copy);
    CHECK(decision.target_dir == normalized(fx.dst));
    CHECK_FALSE(decision.redirected);
}

TEST_CASE("a missing drop target resolves to no action") {
    DropFixture fx;
    write_file(fx.src / "file.txt");

    const auto decision = fx.resolver.resolve({(fx.src / "file.txt").string()},
                                              (fx.temp.path() / "nowhere").string(), DropAction::Copy);
    CHECK(decision.action == DropAction::None);
    CHECK_FALSE(decision.reason.empty());
}

TEST_CASE("auto drops move within a volume and copy across volumes") {
    DropFixture fx;
    VolumeProbeGuard guard;
    write_file(fx.src / "file.txt");
    const std::string dst_prefix = normalized(fx.dst);

    SECTION("same volume") {
        TestHooks::set_volume_probe([](const std::string&) { return std::optional<std::uint64_t>(7); });
        const auto result = fx.resolver.drop({(fx.src / "file.txt").string()}, fx.dst.string(), DropAction::Auto);
        REQUIRE(result.success);
        CHECK_FALSE(fs::exists(fx.src / "file.txt"));
        CHECK(fs::exists(fx.dst / "file.txt"));
    }

    SECTION("different volumes") {
        TestHooks::set_volume_probe([dst_prefix](const std::string& path) {
            return std::optional<std::uint64_t>(path.rfind(dst_prefix, 0) == 0 ? 2 : 1);
        });
        const auto decision = fx.resolver.resolve({(fx.src / "file.txt").string()}, fx.dst.string(), DropAction::Auto);
        CHECK(decision.action == DropAction::Copy);
        const auto result = fx.resolver.execute(decision);
        REQUIRE(result.success);
        CHECK(fs::exists(fx.src / "file.txt"));
        CHECK(fs::exists(fx.dst / "file.txt"));
    }

    SECTION("unknown volume") {
        TestHooks::set_volume_probe([](const std::string&) { return std::optional<std::uint64_t>(); });
        const auto decision = fx.resolver.resolve({(fx.src / "file.txt").string()}, fx.dst.string(), DropAction::Auto);
        CHECK(decision.action == DropAction::Copy);
    }
}

TEST_CASE("link drops create symbolic links in the target") {
    DropFixture fx;
    write_file(fx.src / "file.txt");

    const auto result = fx.resolver.drop({(fx.src / "file.txt").string()}, fx.dst.string(), DropAction::Link);
    REQUIRE(result.success);
    CHECK(fs::is_symlink(fx.dst / "file.txt"));
}

TEST_CASE("an explicit none or an empty drag does nothing") {
    DropFixture fx;
    write_file(fx.src / "file.txt");

    CHECK(fx.resolver.resolve({(fx.src / "file.txt").string()}, fx.dst.string(), DropAction::None).action
          == DropAction::None);
    CHECK(fx.resolver.resolve({}, fx.dst.string(), DropAction::Copy).action == DropAction::None);
    CHECK(fs::exists(fx.src / "file.txt"));
}
