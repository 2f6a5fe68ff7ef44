#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

MagicConfig MagicConfig::with_cwd(fs::path dir) const {
    MagicConfig cfg = *this;
    cfg.cwd = std::move(dir);
    return cfg;
}

MagicConfig MagicConfig::with_tech(std::string name) const {
    MagicConfig cfg = *this;
    cfg.tech = std::move(name);
    return cfg;
}

MagicConfig MagicConfig::with_magic(fs::path binary) const {
    MagicConfig cfg = *this;
    cfg.magic = std::move(binary);
    return cfg;
}

MagicConfig MagicConfig::with_port(uint16_t p) const {
    MagicConfig cfg = *this;
    cfg.port = p;
    return cfg;
}

MagicConfig MagicConfig::with_startup_timeout(std::chrono::milliseconds timeout) const {
    MagicConfig cfg = *this;
    cfg.startup_timeout = timeout;
    return cfg;
}

MagicConfig MagicConfig::with_verbose(bool on) const {
    MagicConfig cfg = *this;
    cfg.verbose = on;
    return cfg;
}

std::string MagicConfig::binary() const {
    return magic ? magic->string() : std::string(DEFAULT_BINARY);
}

MagicConfig MagicConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return MagicConfig{};
    }

    // Filled in only on a clean parse; any error yields plain defaults.
    MagicConfig cfg;
    try {
        auto j = json::parse(f);

        if (j.contains("magic")) cfg.magic = j["magic"].get<std::string>();
        if (j.contains("tech")) cfg.tech = j["tech"].get<std::string>();
        if (j.contains("cwd")) cfg.cwd = j["cwd"].get<std::string>();

        if (j.contains("port")) {
            auto port = j["port"].get<int64_t>();
            if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
                std::println(stderr, "config: port {} out of range, using {}", port, cfg.port);
            } else {
                cfg.port = static_cast<uint16_t>(port);
            }
        }

        if (j.contains("startup_timeout_ms")) {
            auto ms = j["startup_timeout_ms"].get<int64_t>();
            if (ms < 0 || ms > std::numeric_limits<uint32_t>::max()) {
                std::println(stderr, "config: startup_timeout_ms {} out of range, using {}",
                             ms, cfg.startup_timeout.count());
            } else {
                cfg.startup_timeout = std::chrono::milliseconds(ms);
            }
        }

        if (j.contains("verbose")) cfg.verbose = j["verbose"].get<bool>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}, using defaults", e.what());
        return MagicConfig{};
    }

    return cfg;
}

MagicConfig MagicConfig::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return MagicConfig{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return MagicConfig{};
}
