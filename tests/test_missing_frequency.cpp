#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <vector>
#include "missing_frequency.h"
#include "trigger_log.h"

namespace fs = std::filesystem;

TEST_CASE("expected includes the end of the lattice", "[missing]") {
    REQUIRE(MissingFrequencyAnalyzer::expected(0.0, 10.0, 2.5) == std::set<double>{0.0, 2.5, 5.0, 7.5, 10.0});

    // 0.1 accumulates error; 1.0 must still be the last element.
    const std::set<double> tenths = MissingFrequencyAnalyzer::expected(0.1, 1.0, 0.1);
    REQUIRE(tenths.size() == 10);
    REQUIRE(*tenths.rbegin() == 1.0);

    REQUIRE(MissingFrequencyAnalyzer::expected(1.0, 0.5, 0.25).empty());
    REQUIRE(MissingFrequencyAnalyzer::expected(1.0, 2.0, 0.0).empty());
}

TEST_CASE("missing is the sorted difference against captured files", "[missing]") {
    const fs::path dir = fs::temp_directory_path() / "stand_missing_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::ofstream(dir / "0000.00-20240101_120000.mp4").put('x');
    std::ofstream(dir / "5.0-clip.mp4").put('x');
    std::ofstream(dir / "10_take2.mov").put('x');
    std::ofstream(dir / "notes.txt").put('x');
    std::ofstream(dir / "7.5.mp4").put('x');

    const std::set<double> captured = MissingFrequencyAnalyzer::captured(dir.string());
    REQUIRE(captured == std::set<double>{0.0, 5.0, 10.0});

    const std::set<double> expected = MissingFrequencyAnalyzer::expected(0.0, 10.0, 2.5);
    REQUIRE(MissingFrequencyAnalyzer::missing(expected, captured) == std::vector<double>{2.5, 7.5});

    fs::remove_all(dir);
}

TEST_CASE("captured tolerates a missing directory", "[missing]") {
    REQUIRE(MissingFrequencyAnalyzer::captured("/nonexistent/stand/videos").empty());
}

TEST_CASE("parseCaptureName rounds to the set resolution", "[missing]") {
    double frequency = 0.0;
    REQUIRE(MissingFrequencyAnalyzer::parseCaptureName("0012.50-20240101_120000.mp4", frequency));
    REQUIRE(frequency == 12.5);
    REQUIRE(MissingFrequencyAnalyzer::parseCaptureName("3.333333-x", frequency));
    REQUIRE(frequency == 3.33);
    REQUIRE_FALSE(MissingFrequencyAnalyzer::parseCaptureName("clip-12.5.mp4", frequency));
    REQUIRE_FALSE(MissingFrequencyAnalyzer::parseCaptureName(".5-x", frequency));
}

TEST_CASE("logged reads frequencies back from the trigger log", "[missing]") {
    const std::string path = "test_stand_logged.log";
    std::remove(path.c_str());
    TriggerLog log(path);
    REQUIRE(log.append(1.0));
    REQUIRE(log.append(1.25));
    REQUIRE(log.append(7.0));
    {
        std::ofstream junk(path, std::ios::app);
        junk << "garbage line\n";
    }

    const std::set<double> expected = MissingFrequencyAnalyzer::expected(1.0, 2.0, 0.25);
    const std::set<double> logged = MissingFrequencyAnalyzer::logged(path, expected);
    // 7.0 is off the lattice and is kept as read.
    REQUIRE(logged == std::set<double>{1.0, 1.25, 7.0});

    const std::vector<LogEntry> entries = TriggerLog::readEntries(path);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].timestamp.size() == 19);

    std::remove(path.c_str());
}

TEST_CASE("Quarter-hertz frequencies that fired are not reported missing", "[missing]") {
    const std::string path = "test_stand_quarter.log";
    std::remove(path.c_str());
    TriggerLog log(path);
    for (double frequency : {1.0, 1.25, 1.5, 1.75, 2.0}) {
        REQUIRE(log.append(frequency));
    }

    const std::set<double> expected = MissingFrequencyAnalyzer::expected(1.0, 2.0, 0.25);
    REQUIRE(MissingFrequencyAnalyzer::missing(expected, MissingFrequencyAnalyzer::logged(path, expected)).empty());

    // Only the first half fired: the rest must still be reported.
    std::remove(path.c_str());
    REQUIRE(log.append(1.0));
    REQUIRE(log.append(1.25));
    REQUIRE(MissingFrequencyAnalyzer::missing(expected, MissingFrequencyAnalyzer::logged(path, expected)) ==
            std::vector<double>{1.5, 1.75, 2.0});

    std::remove(path.c_str());
}

TEST_CASE("TriggerLog formats one line per firing", "[missing]") {
    const auto when = std::chrono::system_clock::now();
    const std::string line = TriggerLog::formatEntry(when, 12.25);
    REQUIRE(line.size() == 19 + 2 + 4 + 1);
    REQUIRE(line.substr(19) == ": 12.2\n");

    LogEntry entry;
    REQUIRE(TriggerLog::parseLine("2024-05-01 10:11:12: 42.0", entry));
    REQUIRE(entry.timestamp == "2024-05-01 10:11:12");
    REQUIRE(entry.frequency == 42.0);
    REQUIRE_FALSE(TriggerLog::parseLine("2024-05-01 10:11:12: abc", entry));
}

TEST_CASE("buildRerunSteps is bounded and keeps frequencies verbatim", "[missing]") {
    RunConfig cfg;
    cfg.tone_duration = 2.0;
    cfg.post_sleep = 3.0;
    cfg.ir_delay = 4.0;

    const std::vector<double> missing = {2.5, 7.5, 12.25};
    const auto steps = MissingFrequencyAnalyzer::buildRerunSteps(missing, cfg, 2);
    REQUIRE(steps.size() == 2);
    REQUIRE(steps[0].frequency == 2.5);
    REQUIRE(steps[1].frequency == 7.5);
    REQUIRE(steps[1].tone_duration == 2.0);
    REQUIRE(steps[1].post_sleep == 3.0);
    REQUIRE(steps[1].ir_delay == 4.0);

    REQUIRE(MissingFrequencyAnalyzer::buildRerunSteps(missing, cfg, 10).size() == 3);
}

TEST_CASE("formatRanges compacts consecutive frequencies", "[missing]") {
    REQUIRE(MissingFrequencyAnalyzer::formatRanges({1.0, 1.25, 1.5, 3.0, 4.0, 4.25}, 0.25) ==
            "1.00-1.50, 3.00, 4.00-4.25");
    REQUIRE(MissingFrequencyAnalyzer::formatRanges({}, 0.25).empty());

    std::vector<double> scattered;
    for (int i = 0; i < 12; i++) {
        scattered.push_back(i * 10.0);
    }
    const std::string text = MissingFrequencyAnalyzer::formatRanges(scattered, 0.25);
    REQUIRE(text.rfind("0.00, 10.00", 0) == 0);
    REQUIRE(text.find("90.00 ...") != std::string::npos);
    REQUIRE(text.find("100.00") == std::string::npos);
}
