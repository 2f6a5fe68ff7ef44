#include <catch2/catch_test_macros.hpp>

#include "bootstrap.hpp"
#include "config.hpp"
#include "line_connection.hpp"
#include "magic_instance.hpp"
#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <unistd.h>

TEST_CASE("Bootstrap payload", "[bootstrap]") {

    SECTION("PortAssignmentComesFirst") {
        auto p = bootstrap::payload(10042);
        REQUIRE(p.rfind("set svcPort 10042\n", 0) == 0);
    }

    SECTION("ScriptFollowsVerbatim") {
        auto p = bootstrap::payload(9999);
        std::string header = "set svcPort 9999\n";
        REQUIRE(p.size() == header.size() + bootstrap::SERVER_SCRIPT.size());
        REQUIRE(p.substr(header.size()) == bootstrap::SERVER_SCRIPT);
    }

    SECTION("ScriptListensOnLoopbackPort") {
        std::string script(bootstrap::SERVER_SCRIPT);
        REQUIRE(script.find("socket -server") != std::string::npos);
        REQUIRE(script.find("-myaddr 127.0.0.1 $svcPort") != std::string::npos);
        REQUIRE(script.find("vwait") != std::string::npos);
    }
}

namespace {

// A stand-in "magic" that runs tclsh on its stdin and ignores magic's flags,
// so the server script is evaluated by a real Tcl interpreter.
std::filesystem::path write_tclsh_wrapper(const std::filesystem::path& dir) {
    auto path = dir / "magic";
    std::ofstream(path) << "#!/bin/sh\nexec '" << TCLSH_PATH << "'\n";
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

// Plain loopback socket for sending raw bytes to the server.
int connect_raw(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

} // namespace

TEST_CASE("Command server under tclsh", "[bootstrap][tcl]") {
    if (std::string_view(TCLSH_PATH).empty()) {
        SKIP("tclsh not found at configure time");
    }

    test_support::TmpDir dir;
    auto magic = MagicConfig{}
        .with_magic(write_tclsh_wrapper(dir.path))
        .with_port(test_support::free_port())
        .with_startup_timeout(std::chrono::milliseconds(5000))
        .build();
    REQUIRE(magic);

    SECTION("EvaluatesAtGlobalScope") {
        REQUIRE(magic->command("set a 5").value() == "5");
        REQUIRE(magic->command("expr {$a * 2}").value() == "10");
        REQUIRE(magic->command("info level").value() == "0");
    }

    SECTION("FailedCommandRepliesWithError") {
        REQUIRE(magic->command("error boom").value() == "error: boom");

        // Still one reply per request afterwards
        REQUIRE(magic->command("set b 7").value() == "7");
    }

    SECTION("NewlinesInResultBecomeSpaces") {
        REQUIRE(magic->command("string repeat x\\n 3").value() == "x x x ");
    }

    SECTION("TwoRequestsInOneWrite") {
        int fd = connect_raw(magic->port());
        REQUIRE(fd >= 0);
        LineConnection conn(fd);

        std::string both = "set c 1\nset d 2\n";
        REQUIRE(::send(fd, both.data(), both.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(both.size()));

        REQUIRE(conn.read_line().value() == "1");
        REQUIRE(conn.read_line().value() == "2");
    }
}
