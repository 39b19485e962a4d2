#include "config/Config.h"
#include "core/AudioClock.h"
#include "editor/NoteEditor.h"
#include "tui/Tui.h"
#include "server/OscServer.h"
#include "audio/JackClock.h"
#include "audio/MidiInstrument.h"

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_core/juce_core.h>

#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running = false;
}

/// Advances the DeviceClock from the audio device and outputs silence
class ClockCallback : public juce::AudioIODeviceCallback {
public:
    explicit ClockCallback(notesketch::DeviceClock& clock) : clock_(clock) {}

    void audioDeviceIOCallbackWithContext(
            const float* const*,
            int,
            float* const* outputChannelData,
            int numOutputChannels,
            int numSamples,
            const juce::AudioIODeviceCallbackContext&) override {
        for (int ch = 0; ch < numOutputChannels; ++ch) {
            if (outputChannelData[ch])
                juce::FloatVectorOperations::clear(outputChannelData[ch], numSamples);
        }
        clock_.advance(numSamples);
    }

    void audioDeviceAboutToStart(juce::AudioIODevice* device) override {
        clock_.setSampleRate(device->getCurrentSampleRate());
        fprintf(stderr, "Audio device starting: %s\n",
                device->getName().toRawUTF8());
        fprintf(stderr, "  Sample rate: %.0f Hz\n", device->getCurrentSampleRate());
        fprintf(stderr, "  Buffer size: %d samples\n",
                device->getCurrentBufferSizeSamples());
    }

    void audioDeviceStopped() override {
        fprintf(stderr, "Audio device stopped\n");
    }

private:
    notesketch::DeviceClock& clock_;
};

static void printUsage(const notesketch::Config& cfg) {
    fprintf(stdout, "Usage: notesketch [OPTIONS] [PORT]\n");
    fprintf(stdout, "Options:\n");
    fprintf(stdout, "  --jack                Use the JACK frame clock\n");
    fprintf(stdout, "  --device              Use the audio device clock\n");
    fprintf(stdout, "  --midi-out NAME       Use specific MIDI output device (substring match)\n");
    fprintf(stdout, "  --list-midi           List available MIDI output devices\n");
    fprintf(stdout, "  --no-osc              Do not accept remote input\n");
    fprintf(stdout, "  --score FILE          Score file to load and save (default: %s)\n",
            cfg.scoreFile.c_str());
    fprintf(stdout, "\nA virtual MIDI output device named 'NoteSketch' is created automatically.\n");
    fprintf(stdout, "  --help                Show this help message\n");
    fprintf(stdout, "\nPORT: OSC input port (default: %s)\n", cfg.oscPort.c_str());
    fprintf(stdout, "\nConfig file: %s\n", notesketch::Config::configFilePath().c_str());
    fprintf(stdout, "\nExamples:\n");
    fprintf(stdout, "  notesketch                           Edit score.toml, OSC on port %s\n", cfg.oscPort.c_str());
    fprintf(stdout, "  notesketch --score tune.toml 9000    Edit tune.toml, OSC on port 9000\n");
    fprintf(stdout, "  notesketch --jack                    Schedule against the JACK clock\n");
    fprintf(stdout, "  notesketch --midi-out \"USB MIDI\"     Play through a hardware synth\n");
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Load config file, then apply CLI overrides
    auto cfg = notesketch::Config::load();
    int exitCode = 0;
    if (!cfg.parseArgs(argc, argv, exitCode)) {
        if (cfg.showHelp) {
            printUsage(cfg);
        }
        return exitCode;
    }

    juce::ScopedJuceInitialiser_GUI juceInit;

    // Handle --list-midi
    if (cfg.listMidi) {
        auto devices = juce::MidiOutput::getAvailableDevices();
        if (devices.isEmpty()) {
            fprintf(stdout, "No MIDI output devices found.\n");
        } else {
            fprintf(stdout, "Available MIDI output devices:\n");
            for (const auto& d : devices) {
                fprintf(stdout, "  %s\n", d.name.toRawUTF8());
            }
        }
        return 0;
    }

    // --- Audio clock ---
    std::unique_ptr<notesketch::AudioClock> clock;
    juce::AudioDeviceManager deviceManager;
    std::unique_ptr<ClockCallback> clockCallback;

    if (cfg.clock == "jack") {
        auto jackClock = std::make_unique<notesketch::JackClock>();
        if (jackClock->init()) {
            clock = std::move(jackClock);
        } else {
            fprintf(stderr, "Warning: JACK unavailable, using the system clock\n");
            cfg.clock = "system";
        }
    } else if (cfg.clock == "device") {
        auto deviceClock = std::make_unique<notesketch::DeviceClock>();
        auto error = deviceManager.initialise(0, 2, nullptr, true);
        if (error.isEmpty() && deviceManager.getCurrentAudioDevice()) {
            clockCallback = std::make_unique<ClockCallback>(*deviceClock);
            deviceManager.addAudioCallback(clockCallback.get());
            clock = std::move(deviceClock);
        } else {
            fprintf(stderr, "Warning: audio device unavailable (%s), using the system clock\n",
                    error.toRawUTF8());
            cfg.clock = "system";
        }
    }
    if (!clock) {
        clock = std::make_unique<notesketch::SystemClock>();
    }

    // Log sink: stderr until the TUI is up
    notesketch::Tui* tuiPtr = nullptr;
    notesketch::OscServer* oscPtr = nullptr;
    auto log = [&tuiPtr, &oscPtr](const std::string& msg) {
        if (tuiPtr) tuiPtr->addMessage(msg);
        else fprintf(stderr, "%s\n", msg.c_str());
        if (oscPtr) oscPtr->addMessage(msg);
    };

    // --- Instrument: MIDI output, or the log when there is none ---
    std::unique_ptr<notesketch::Instrument> instrument;
    std::string instrumentName;
    if (auto output = notesketch::MidiInstrument::openOutput(cfg.midiOutputDevice, "NoteSketch")) {
        auto midi = std::make_unique<notesketch::MidiInstrument>(std::move(output));
        instrumentName = "MIDI output: " + midi->name();
        instrument = std::move(midi);
    } else {
        instrument = std::make_unique<notesketch::LogInstrument>(log);
        instrumentName = "No MIDI output, notes go to the log";
    }

    // --- Editor ---
    notesketch::EditorOptions options;
    options.xSnap = cfg.xSnap;
    options.ySnap = cfg.ySnap;
    options.viewport = cfg.viewport == "linear" ? notesketch::Viewport::Kind::Linear
                                                : notesketch::Viewport::Kind::Log;
    options.resolution = cfg.resolution;
    options.tempo = cfg.tempo;
    options.scoreFile = cfg.scoreFile;

    notesketch::EditorCallbacks callbacks;
    callbacks.onMessage = log;
    callbacks.onStateChanged = []() {
        // The TUI redraws every frame and state is pushed every frame
    };

    notesketch::RemoteInputQueue remoteInput;
    std::unique_ptr<notesketch::OscServer> oscServer;
    int status = 0;

    try {
        notesketch::NoteEditor editor(*clock, *instrument, options, callbacks);
        if (std::filesystem::exists(cfg.scoreFile)) {
            editor.loadScore(cfg.scoreFile);
        }

        if (cfg.oscEnabled) {
            oscServer = std::make_unique<notesketch::OscServer>(remoteInput, cfg.oscPort);
            if (oscServer->start()) {
                oscPtr = oscServer.get();
            } else {
                oscServer.reset();
            }
        }

        notesketch::Tui tui(editor);
        if (!tui.init()) {
            throw std::runtime_error("Failed to initialize TUI");
        }
        tuiPtr = &tui;

        tui.addMessage("NoteSketch started - " + cfg.clock + " clock");
        tui.addMessage(instrumentName);
        if (oscServer) {
            tui.addMessage("OSC input on port " + cfg.oscPort);
        }
        tui.addMessage("Press '?' for commands, 'q' to quit");

        try {
            // Main loop: remote input, TUI frame, state push
            while (g_running) {
                auto frameStart = std::chrono::steady_clock::now();

                remoteInput.drain([&editor](const notesketch::InputEvent& ev) {
                    editor.handleInput(ev);
                });

                if (!tui.update()) {
                    break;
                }

                if (oscServer) {
                    notesketch::EditorSnapshot snap;
                    snap.noteCount = static_cast<int>(editor.score().size());
                    snap.selectionSize = static_cast<int>(editor.selection().size());
                    snap.playing = editor.player().isPlaying();
                    snap.playhead = editor.player().playhead();
                    oscServer->pushState(snap);
                }

                auto frameEnd = std::chrono::steady_clock::now();
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    frameEnd - frameStart);
                auto sleepTime = std::chrono::milliseconds(cfg.tuiRefreshMs) - elapsed;
                if (sleepTime.count() > 0) {
                    std::this_thread::sleep_for(sleepTime);
                }
            }
        } catch (...) {
            tuiPtr = nullptr;
            tui.shutdown();
            throw;
        }

        tuiPtr = nullptr;
        tui.shutdown();
    } catch (const std::exception& e) {
        fprintf(stderr, "NoteSketch: %s\n", e.what());
        status = 1;
    }

    // Cleanup
    oscPtr = nullptr;
    if (oscServer) {
        oscServer->stop();
        if (oscServer->droppedEvents() > 0)
            fprintf(stderr, "NoteSketch: dropped %d remote input events\n",
                    oscServer->droppedEvents());
    }
    if (clockCallback) deviceManager.removeAudioCallback(clockCallback.get());

    return status;
}
