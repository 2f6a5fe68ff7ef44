#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "test_support.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace std::chrono_literals;

namespace {

struct TmpConfig {
    test_support::TmpDir dir;
    std::string path;

    explicit TmpConfig(const std::string& content) {
        path = (dir.path / "config.json").string();
        std::ofstream(path) << content;
    }
};

} // namespace

TEST_CASE("MagicConfig", "[config]") {

    SECTION("DefaultValues") {
        MagicConfig cfg;
        REQUIRE_FALSE(cfg.cwd.has_value());
        REQUIRE_FALSE(cfg.tech.has_value());
        REQUIRE_FALSE(cfg.magic.has_value());
        REQUIRE(cfg.port == 9999);
        REQUIRE(cfg.startup_timeout == 60000ms);
        REQUIRE_FALSE(cfg.verbose);
        REQUIRE(cfg.binary() == "magic");
    }

    SECTION("FluentSettersReturnNewValue") {
        MagicConfig base;
        auto cfg = base.with_cwd("/fake/path/dir").with_tech("sky130A").with_port(1234);

        REQUIRE(cfg.cwd);
        REQUIRE(cfg.cwd->string() == "/fake/path/dir");
        REQUIRE(cfg.tech == "sky130A");
        REQUIRE(cfg.port == 1234);

        // The base value is untouched
        REQUIRE_FALSE(base.cwd.has_value());
        REQUIRE_FALSE(base.tech.has_value());
        REQUIRE(base.port == 9999);
    }

    SECTION("LastWriteWins") {
        auto cfg = MagicConfig{}.with_tech("scmos").with_tech("sky130A").with_port(1).with_port(2);
        REQUIRE(cfg.tech == "sky130A");
        REQUIRE(cfg.port == 2);
    }

    SECTION("BinaryOverride") {
        auto cfg = MagicConfig{}.with_magic("/opt/magic/bin/magic");
        REQUIRE(cfg.binary() == "/opt/magic/bin/magic");
    }

    SECTION("NoValidationAtBuilderStage") {
        auto cfg = MagicConfig{}.with_cwd("/does/not/exist").with_port(0);
        REQUIRE(cfg.cwd);
        REQUIRE(cfg.cwd->string() == "/does/not/exist");
        REQUIRE(cfg.port == 0);
    }

    SECTION("LoadFullConfig") {
        TmpConfig f(R"({
            "magic": "/usr/local/bin/magic",
            "tech": "sky130A",
            "cwd": "/work/layout",
            "port": 10001,
            "startup_timeout_ms": 5000,
            "verbose": true
        })");

        auto cfg = MagicConfig::load(f.path);
        REQUIRE(cfg.magic);
        REQUIRE(cfg.magic->string() == "/usr/local/bin/magic");
        REQUIRE(cfg.tech == "sky130A");
        REQUIRE(cfg.cwd);
        REQUIRE(cfg.cwd->string() == "/work/layout");
        REQUIRE(cfg.port == 10001);
        REQUIRE(cfg.startup_timeout == 5000ms);
        REQUIRE(cfg.verbose);
    }

    SECTION("LoadPartialConfig") {
        TmpConfig f(R"({ "tech": "scmos" })");

        auto cfg = MagicConfig::load(f.path);
        REQUIRE(cfg.tech == "scmos");
        // Other fields retain defaults
        REQUIRE(cfg.port == 9999);
        REQUIRE_FALSE(cfg.magic.has_value());
        REQUIRE_FALSE(cfg.cwd.has_value());
    }

    SECTION("LoadPortOutOfRange") {
        TmpConfig f(R"({ "port": 70000, "tech": "scmos" })");

        auto cfg = MagicConfig::load(f.path);
        REQUIRE(cfg.port == 9999);
        REQUIRE(cfg.tech == "scmos");
    }

    SECTION("LoadTypeMismatchFallsBackToDefaults") {
        TmpConfig f(R"({ "tech": "scmos", "port": "x" })");

        auto cfg = MagicConfig::load(f.path);
        // Nothing read before the bad key survives
        REQUIRE_FALSE(cfg.tech.has_value());
        REQUIRE(cfg.port == 9999);
    }

    SECTION("LoadNegativeTimeoutKeepsDefault") {
        TmpConfig f(R"({ "startup_timeout_ms": -1, "tech": "scmos" })");

        auto cfg = MagicConfig::load(f.path);
        REQUIRE(cfg.startup_timeout == 60000ms);
        REQUIRE(cfg.tech == "scmos");
    }

    SECTION("LoadOversizedTimeoutKeepsDefault") {
        TmpConfig f(R"({ "startup_timeout_ms": 8589934592 })");

        auto cfg = MagicConfig::load(f.path);
        REQUIRE(cfg.startup_timeout == 60000ms);
    }

    SECTION("LoadZeroTimeoutMeansWaitForever") {
        TmpConfig f(R"({ "startup_timeout_ms": 0 })");

        auto cfg = MagicConfig::load(f.path);
        REQUIRE(cfg.startup_timeout == 0ms);
    }

    SECTION("LoadInvalidJson") {
        TmpConfig f("not json {{{");

        auto cfg = MagicConfig::load(f.path);
        REQUIRE(cfg.port == 9999);
        REQUIRE_FALSE(cfg.tech.has_value());
    }

    SECTION("LoadMissingFile") {
        auto cfg = MagicConfig::load("/tmp/mv_test_nonexistent_config_file.json");
        REQUIRE(cfg.port == 9999);
        REQUIRE_FALSE(cfg.tech.has_value());
    }

    SECTION("LoadDefaultFromXdgConfigHome") {
        test_support::TmpDir home;
        std::filesystem::create_directories(home.path / "magic-vlsi");
        std::ofstream(home.path / "magic-vlsi" / "config.json") << R"({ "port": 4242 })";
        test_support::ScopedEnv env("XDG_CONFIG_HOME", home.path.string());

        auto cfg = MagicConfig::load_default();
        REQUIRE(cfg.port == 4242);
    }

    SECTION("ScopedEnvRestoresPreviousValue") {
        test_support::ScopedEnv outer("MV_TEST_CONFIG_VAR", "outer");
        {
            test_support::ScopedEnv inner("MV_TEST_CONFIG_VAR", "inner");
            REQUIRE(std::string(std::getenv("MV_TEST_CONFIG_VAR")) == "inner");
        }
        REQUIRE(std::getenv("MV_TEST_CONFIG_VAR") != nullptr);
        REQUIRE(std::string(std::getenv("MV_TEST_CONFIG_VAR")) == "outer");
    }
}
