#include "config.hpp"
#include "magic_instance.hpp"

#include <charconv>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <print>
#include <string>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] [script]", prog);
    std::println(stderr, "Runs each line of <script> (or stdin) as a magic command and prints the reply.");
    std::println(stderr, "Options:");
    std::println(stderr, "  -m, --magic PATH     magic binary (default: magic on PATH)");
    std::println(stderr, "  -T, --tech NAME      technology to load");
    std::println(stderr, "  -d, --cwd DIR        working directory for magic");
    std::println(stderr, "  -p, --port N         command port (default: 9999)");
    std::println(stderr, "  -t, --timeout MS     startup timeout, 0 waits forever");
    std::println(stderr, "  -c, --config PATH    config file path");
    std::println(stderr, "  -v, --verbose        log startup progress");
    std::println(stderr, "  -h, --help           show this help");
}

template <typename T>
static std::optional<T> parse_number(const std::string& s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string script_path;
    std::optional<std::string> magic, tech, cwd;
    std::optional<uint16_t> port;
    std::optional<uint32_t> timeout_ms;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--magic" || arg == "-m") && has_value) {
            magic = argv[++i];
        } else if ((arg == "--tech" || arg == "-T") && has_value) {
            tech = argv[++i];
        } else if ((arg == "--cwd" || arg == "-d") && has_value) {
            cwd = argv[++i];
        } else if ((arg == "--config" || arg == "-c") && has_value) {
            config_path = argv[++i];
        } else if ((arg == "--port" || arg == "-p") && has_value) {
            port = parse_number<uint16_t>(argv[++i]);
            if (!port) {
                std::println(stderr, "Invalid port: {}", argv[i]);
                return 1;
            }
        } else if ((arg == "--timeout" || arg == "-t") && has_value) {
            timeout_ms = parse_number<uint32_t>(argv[++i]);
            if (!timeout_ms) {
                std::println(stderr, "Invalid timeout: {}", argv[i]);
                return 1;
            }
        } else if (!arg.empty() && arg[0] != '-' && script_path.empty()) {
            script_path = arg;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    MagicConfig config = config_path.empty() ? MagicConfig::load_default()
                                             : MagicConfig::load(config_path);
    if (magic) config = config.with_magic(*magic);
    if (tech) config = config.with_tech(*tech);
    if (cwd) config = config.with_cwd(*cwd);
    if (port) config = config.with_port(*port);
    if (timeout_ms) config = config.with_startup_timeout(std::chrono::milliseconds(*timeout_ms));
    if (verbose) config = config.with_verbose(true);

    std::ifstream script;
    if (!script_path.empty()) {
        script.open(script_path);
        if (!script.is_open()) {
            std::println(stderr, "Could not open script {}", script_path);
            return 1;
        }
    }
    std::istream& in = script_path.empty() ? std::cin : script;

    auto instance = config.build();
    if (!instance) {
        std::println(stderr, "Error: {}", instance.error().describe());
        return 1;
    }

    std::string line;
    while (std::getline(in, line)) {
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') continue;
        if (line.back() == '\r') line.pop_back();

        auto reply = instance->command(line.substr(start));
        if (!reply) {
            std::println(stderr, "Error: {}", reply.error().describe());
            return 1;
        }
        std::println("{}", *reply);
    }

    return 0;
}
