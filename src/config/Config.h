#pragma once

#include <string>
#include <string_view>

namespace notesketch {

struct Config {
    // [audio]
    std::string clock = "system";         // "system", "device", "jack"
    std::string midiOutputDevice;         // "" = virtual device

    // [scheduler]
    double resolution = 0.01;             // seconds per tick

    // [player]
    double tempo = 4.0;                   // beats per second

    // [editor]
    double xSnap = 1.0;                   // beats, 0 = free
    double ySnap = 216.0;                 // Hz
    std::string viewport = "log";         // "log" or "linear"
    std::string scoreFile = "score.toml";

    // [osc]
    std::string oscPort = "7780";

    // [tui]
    int tuiRefreshMs = 41;

    // CLI-only fields
    bool oscEnabled = true;
    bool listMidi = false;
    bool showHelp = false;

    /// Load config from the TOML file (if it exists).
    /// Missing file or missing fields silently use defaults.
    static Config load();

    /// Load from an explicit path. Parse errors warn and return defaults.
    static Config loadFile(const std::string& path);

    /// Build a config from TOML text. Parse errors warn and return defaults.
    static Config parse(std::string_view text);

    /// Returns the path to the config file.
    static std::string configFilePath();

    /// Parse CLI arguments, mutating this config in-place.
    /// Returns true if the program should continue, false if it should exit.
    /// Sets exitCode to the exit code when returning false.
    bool parseArgs(int argc, char* argv[], int& exitCode);
};

} // namespace notesketch
