#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include "config.h"

namespace {
bool fileExists(const std::string& path) {
    std::ifstream in(path);
    return in.good();
}
}  // namespace

TEST_CASE("ConfigStore creates and persists defaults when the file is missing", "[config]") {
    const std::string path = "test_stand_defaults.conf";
    std::remove(path.c_str());

    ConfigStore config(path);
    REQUIRE(config.load() == true);
    REQUIRE(config.isLoaded());
    REQUIRE(fileExists(path));
    REQUIRE(config.serialPort() == "/dev/ttyUSB0");
    REQUIRE(config.baudrate() == 115200);
    REQUIRE(config.getDouble("loop", "step", 0.0) == 0.25);
    REQUIRE(config.getInt("loop", "max_loops_per_run", 0) == 250);
    REQUIRE(config.getString("loop", "log_file") == "stand.log");

    ConfigStore reloaded(path);
    REQUIRE(reloaded.load() == true);
    REQUIRE(reloaded.getDouble("loop", "current_frequency", 0.0) == 1.0);

    std::remove(path.c_str());
}

TEST_CASE("ConfigStore parses sections and keys case-insensitively", "[config]") {
    const std::string path = "test_stand_parse.conf";
    std::ofstream file(path);
    file << "# bench settings\n";
    file << "[Serial]\n";
    file << "Port = /dev/ttyACM0\n";
    file << "baudrate = 9600\n";
    file << "[loop]\n";
    file << "step = 0.5\n";
    file.close();

    ConfigStore config(path);
    REQUIRE(config.load() == true);
    REQUIRE(config.serialPort() == "/dev/ttyACM0");
    REQUIRE(config.baudrate() == 9600);
    REQUIRE(config.getDouble("LOOP", "step", 0.0) == 0.5);
    REQUIRE(config.hasSection("serial"));
    REQUIRE_FALSE(config.hasOption("loop", "ir_delay"));

    std::remove(path.c_str());
}

TEST_CASE("ConfigStore falls back on malformed values", "[config]") {
    const std::string path = "test_stand_invalid.conf";
    std::ofstream file(path);
    file << "[loop]\n";
    file << "step = fast\n";
    file << "max_loops_per_run = 12x\n";
    file << "duration = -3\n";
    file << "[sound]\n";
    file << "amplitude = 4.0\n";
    file.close();

    ConfigStore config(path);
    REQUIRE(config.load() == true);
    REQUIRE(config.getDouble("loop", "step", 0.25) == 0.25);
    REQUIRE(config.getInt("loop", "max_loops_per_run", 250) == 250);

    const RunConfig cfg = config.snapshotRunConfig();
    REQUIRE(cfg.step == 0.25);
    REQUIRE(cfg.max_steps_per_run == 250);
    REQUIRE(cfg.tone_duration == 1.0);
    REQUIRE(cfg.amplitude == 0.8f);

    std::remove(path.c_str());
}

TEST_CASE("ConfigStore values survive save and load", "[config]") {
    const std::string path = "test_stand_roundtrip.conf";
    std::remove(path.c_str());

    ConfigStore config(path);
    config.loadDefaults();
    config.setDouble("loop", "current_frequency", 12.75);
    config.set("serial", "port", "/dev/ttyS3");
    config.set("notes", "operator", "bench two");
    REQUIRE(config.save() == true);

    ConfigStore reloaded(path);
    REQUIRE(reloaded.load() == true);
    REQUIRE(reloaded.getDouble("loop", "current_frequency", 0.0) == 12.75);
    REQUIRE(reloaded.serialPort() == "/dev/ttyS3");
    REQUIRE(reloaded.getString("notes", "operator") == "bench two");

    std::remove(path.c_str());
}

TEST_CASE("ConfigStore decodes the escaped actuation command", "[config]") {
    ConfigStore config("unused.conf");
    config.loadDefaults();
    REQUIRE(config.actuationCommand() == "!r\n");

    config.set("commands", "ir_engage", "\\x41\\r\\n");
    REQUIRE(config.actuationCommand() == "A\r\n");
    REQUIRE(config.snapshotRunConfig().actuation_command == "A\r\n");

    REQUIRE(ConfigStore::unescape("a\\\\b\\t") == "a\\b\t");
}

TEST_CASE("ConfigStore formats stored numbers compactly", "[config]") {
    REQUIRE(ConfigStore::formatNumber(1.0) == "1.0");
    REQUIRE(ConfigStore::formatNumber(2.5) == "2.5");
    REQUIRE(ConfigStore::formatNumber(0.1 + 0.2) == "0.3");
    REQUIRE(ConfigStore::formatNumber(150.25) == "150.25");
}
