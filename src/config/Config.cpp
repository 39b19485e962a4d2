#include "config/Config.h"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <initializer_list>
#include <string>

namespace notesketch {

namespace {

/// Read a number into `out` when it lies in [lo, hi]; warn and keep the
/// current value otherwise.
template <typename T>
void readInRange(const toml::table& tbl, const char* section, const char* key,
                 T lo, T hi, T& out) {
    auto v = tbl[section][key].value<T>();
    if (!v)
        return;
    if (*v >= lo && *v <= hi) {
        out = *v;
        return;
    }
    const std::string current = std::to_string(out);
    fprintf(stderr, "Warning: invalid %s.%s %s, using default %s\n",
            section, key, std::to_string(*v).c_str(), current.c_str());
}

/// Read a string into `out` when it is one of `allowed`.
void readChoice(const toml::table& tbl, const char* section, const char* key,
                std::initializer_list<const char*> allowed, std::string& out) {
    auto v = tbl[section][key].value<std::string>();
    if (!v)
        return;
    for (const char* option : allowed) {
        if (*v == option) {
            out = *v;
            return;
        }
    }
    fprintf(stderr, "Warning: invalid %s.%s '%s', using default '%s'\n",
            section, key, v->c_str(), out.c_str());
}

void applyTable(Config& cfg, const toml::table& tbl) {
    readChoice(tbl, "audio", "clock", {"system", "device", "jack"}, cfg.clock);
    if (auto v = tbl["audio"]["midi_output_device"].value<std::string>())
        cfg.midiOutputDevice = *v;

    readInRange(tbl, "scheduler", "resolution", 0.001, 0.5, cfg.resolution);
    readInRange(tbl, "player", "tempo", 0.01, 64.0, cfg.tempo);

    // x_snap = 0 turns the time grid off
    readInRange(tbl, "editor", "x_snap", 0.0, 16.0, cfg.xSnap);
    readInRange(tbl, "editor", "y_snap", 1.0, 20000.0, cfg.ySnap);
    readChoice(tbl, "editor", "viewport", {"log", "linear"}, cfg.viewport);
    if (auto v = tbl["editor"]["score_file"].value<std::string>()) {
        if (!v->empty())
            cfg.scoreFile = *v;
    }

    // Port may be written as a string or an integer
    if (auto node = tbl["osc"]["port"]) {
        if (auto v = node.value<std::string>())
            cfg.oscPort = *v;
        else if (auto n = node.value<int64_t>())
            cfg.oscPort = std::to_string(*n);
    }

    int64_t refresh = cfg.tuiRefreshMs;
    readInRange<int64_t>(tbl, "tui", "refresh_ms", 10, 1000, refresh);
    cfg.tuiRefreshMs = static_cast<int>(refresh);
}

} // namespace

std::string Config::configFilePath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/notesketch/config.toml";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/notesketch/config.toml";
    }
    return {};
}

Config Config::load() {
    std::string path = configFilePath();
    if (path.empty() || !std::filesystem::exists(path)) {
        return Config{};
    }
    return loadFile(path);
}

Config Config::loadFile(const std::string& path) {
    Config cfg;
    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        fprintf(stderr, "Warning: failed to parse %s: %s\n",
                path.c_str(), err.what());
        return cfg;
    }
    applyTable(cfg, tbl);
    return cfg;
}

Config Config::parse(std::string_view text) {
    Config cfg;
    toml::table tbl;
    try {
        tbl = toml::parse(text);
    } catch (const toml::parse_error& err) {
        fprintf(stderr, "Warning: failed to parse config: %s\n", err.what());
        return cfg;
    }
    applyTable(cfg, tbl);
    return cfg;
}

bool Config::parseArgs(int argc, char* argv[], int& exitCode) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--jack") {
            clock = "jack";
        } else if (arg == "--device") {
            clock = "device";
        } else if (arg == "--no-osc") {
            oscEnabled = false;
        } else if (arg == "--midi-out") {
            if (i + 1 < argc) {
                midiOutputDevice = argv[++i];
            } else {
                fprintf(stderr, "--midi-out requires a device name argument\n");
                exitCode = 1;
                return false;
            }
        } else if (arg == "--score") {
            if (i + 1 < argc) {
                scoreFile = argv[++i];
            } else {
                fprintf(stderr, "--score requires a file argument\n");
                exitCode = 1;
                return false;
            }
        } else if (arg == "--list-midi") {
            listMidi = true;
        } else if (arg == "--help" || arg == "-h") {
            showHelp = true;
            exitCode = 0;
            return false;
        } else if (!arg.empty() && arg[0] != '-') {
            oscPort = arg;
        } else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            exitCode = 1;
            return false;
        }
    }
    return true;
}

} // namespace notesketch
