#pragma once

#include "error.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

class MagicInstance;

// Startup parameters for a MagicInstance. Setters return a modified copy so
// a configuration can be built fluently:
//
//   auto magic = MagicConfig{}.with_tech("sky130A").with_port(10001).build();
struct MagicConfig {
    static constexpr uint16_t DEFAULT_PORT = 9999;
    static constexpr const char* DEFAULT_BINARY = "magic";

    std::optional<std::filesystem::path> cwd;    // inherit caller's when unset
    std::optional<std::string> tech;             // passed as -T <tech>
    std::optional<std::filesystem::path> magic;  // looked up on PATH when unset
    uint16_t port = DEFAULT_PORT;

    // How long to wait for magic to open its command port. Zero waits forever.
    std::chrono::milliseconds startup_timeout{60000};

    bool verbose = false;

    MagicConfig with_cwd(std::filesystem::path dir) const;
    MagicConfig with_tech(std::string name) const;
    MagicConfig with_magic(std::filesystem::path binary) const;
    MagicConfig with_port(uint16_t p) const;
    MagicConfig with_startup_timeout(std::chrono::milliseconds timeout) const;
    MagicConfig with_verbose(bool on) const;

    // Binary to exec: the configured path, or DEFAULT_BINARY.
    std::string binary() const;

    // Spawns magic and connects to it. Defined in magic_instance.cpp.
    std::expected<MagicInstance, MagicError> build() const;

    static MagicConfig load(const std::string& path);
    static MagicConfig load_default();
};
