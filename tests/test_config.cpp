#include "config/Config.h"

#include <catch2/catch.hpp>

#include <initializer_list>
#include <string>
#include <vector>

using namespace notesketch;

namespace {

/// argv-style wrapper over string literals
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    Args(std::initializer_list<const char*> list) {
        storage.emplace_back("notesketch");
        for (const char* arg : list)
            storage.emplace_back(arg);
        for (auto& s : storage)
            argv.push_back(s.data());
    }

    int argc() const { return static_cast<int>(argv.size()); }
};

} // namespace

TEST_CASE("Config defaults", "[config]") {
    Config cfg;
    CHECK(cfg.clock == "system");
    CHECK(cfg.resolution == 0.01);
    CHECK(cfg.tempo == 4.0);
    CHECK(cfg.xSnap == 1.0);
    CHECK(cfg.ySnap == 216.0);
    CHECK(cfg.viewport == "log");
    CHECK(cfg.scoreFile == "score.toml");
    CHECK(cfg.oscPort == "7780");
    CHECK(cfg.oscEnabled);
}

TEST_CASE("Config reads every section", "[config]") {
    auto cfg = Config::parse(R"(
[audio]
clock = "jack"
midi_output_device = "USB MIDI"

[scheduler]
resolution = 0.005

[player]
tempo = 2.5

[editor]
x_snap = 0.5
y_snap = 110.0
viewport = "linear"
score_file = "tune.toml"

[osc]
port = 9000

[tui]
refresh_ms = 20
)");

    CHECK(cfg.clock == "jack");
    CHECK(cfg.midiOutputDevice == "USB MIDI");
    CHECK(cfg.resolution == 0.005);
    CHECK(cfg.tempo == 2.5);
    CHECK(cfg.xSnap == 0.5);
    CHECK(cfg.ySnap == 110.0);
    CHECK(cfg.viewport == "linear");
    CHECK(cfg.scoreFile == "tune.toml");
    CHECK(cfg.oscPort == "9000");
    CHECK(cfg.tuiRefreshMs == 20);
}

TEST_CASE("Out-of-range config values keep their defaults", "[config]") {
    auto cfg = Config::parse(R"(
[audio]
clock = "sundial"

[scheduler]
resolution = 2.0

[player]
tempo = -1.0

[editor]
y_snap = 0.0
viewport = "spiral"

[tui]
refresh_ms = 1
)");

    const Config defaults;
    CHECK(cfg.clock == defaults.clock);
    CHECK(cfg.resolution == defaults.resolution);
    CHECK(cfg.tempo == defaults.tempo);
    CHECK(cfg.ySnap == defaults.ySnap);
    CHECK(cfg.viewport == defaults.viewport);
    CHECK(cfg.tuiRefreshMs == defaults.tuiRefreshMs);
}

TEST_CASE("Unparseable config falls back to defaults", "[config]") {
    auto cfg = Config::parse("[editor\nx_snap = ");
    CHECK(cfg.xSnap == Config{}.xSnap);
}

TEST_CASE("Command line overrides the config", "[config]") {
    Config cfg;
    int exitCode = -1;

    SECTION("options and port") {
        Args args{"--jack", "--no-osc", "--score", "tune.toml", "--midi-out", "Synth", "9001"};
        REQUIRE(cfg.parseArgs(args.argc(), args.argv.data(), exitCode));
        CHECK(cfg.clock == "jack");
        CHECK_FALSE(cfg.oscEnabled);
        CHECK(cfg.scoreFile == "tune.toml");
        CHECK(cfg.midiOutputDevice == "Synth");
        CHECK(cfg.oscPort == "9001");
    }

    SECTION("help exits cleanly") {
        Args args{"--device", "-h"};
        CHECK_FALSE(cfg.parseArgs(args.argc(), args.argv.data(), exitCode));
        CHECK(cfg.showHelp);
        CHECK(exitCode == 0);
        CHECK(cfg.clock == "device");
    }

    SECTION("missing option argument") {
        Args args{"--score"};
        CHECK_FALSE(cfg.parseArgs(args.argc(), args.argv.data(), exitCode));
        CHECK(exitCode == 1);
    }

    SECTION("unknown option") {
        Args args{"--loud"};
        CHECK_FALSE(cfg.parseArgs(args.argc(), args.argv.data(), exitCode));
        CHECK(exitCode == 1);
    }

    SECTION("list midi") {
        Args args{"--list-midi"};
        CHECK(cfg.parseArgs(args.argc(), args.argv.data(), exitCode));
        CHECK(cfg.listMidi);
    }
}
