#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstring>
#include <string>
#include <poll.h>
#include <pty.h>
#include <unistd.h>
#include "actuator_link.h"

namespace {
std::string readAvailable(int fd, size_t expected) {
    std::string out;
    char buf[64];
    while (out.size() < expected) {
        pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, 1000) <= 0) {
            break;
        }
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}
}  // namespace

TEST_CASE("ActuatorLink writes the command verbatim and reads reply lines", "[serial]") {
    int masterFd = -1;
    int slaveFd = -1;
    char slaveName[64];
    REQUIRE(openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr) == 0);

    ActuatorLink link;
    REQUIRE(link.connect(slaveName, 115200));
    REQUIRE(link.isConnected());
    REQUIRE(link.portName() == slaveName);

    REQUIRE(link.write("!r\n"));
    REQUIRE(readAvailable(masterFd, 3) == "!r\n");

    const char* reply = "OK\r\nsecond\n";
    REQUIRE(write(masterFd, reply, std::strlen(reply)) == static_cast<ssize_t>(std::strlen(reply)));
    const auto first = link.readLine(std::chrono::milliseconds(500));
    REQUIRE(first.has_value());
    REQUIRE(*first == "OK");
    const auto second = link.readLine(std::chrono::milliseconds(500));
    REQUIRE(second.has_value());
    REQUIRE(*second == "second");

    REQUIRE_FALSE(link.readLine(std::chrono::milliseconds(50)).has_value());

    link.disconnect();
    REQUIRE_FALSE(link.isConnected());
    REQUIRE_FALSE(link.write("!r\n"));

    close(slaveFd);
    close(masterFd);
}

TEST_CASE("ActuatorLink reports connection failures", "[serial]") {
    ActuatorLink link;
    REQUIRE_FALSE(link.connect("/dev/does-not-exist-stand", 115200));
    REQUIRE_FALSE(link.isConnected());
    REQUIRE_FALSE(link.readLine(std::chrono::milliseconds(10)).has_value());

    speed_t speed = B0;
    REQUIRE(ActuatorLink::baudConstant(9600, speed));
    REQUIRE(speed == B9600);
    REQUIRE_FALSE(ActuatorLink::baudConstant(12345, speed));
    REQUIRE_FALSE(link.connect("/dev/null", 12345));
}
