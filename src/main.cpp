/**
 * @file main.cpp
 * @brief Demo entry point: lists the genres and plays a short phrase through each one.
 *
 * Usage: tonegen_demo [config.json] [--list] [--json] [--offline]
 *
 * Without a playable ALSA device (or with --offline) the phrase is rendered in memory
 * and the block peaks are printed instead.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <iostream>
#include <span>
#include <string>
#include <thread>
#include <vector>
#include "ToneEngine.hpp"
#include "ConfigStore.hpp"
#include "GenreCatalog.hpp"
#include "Logger.hpp"
#include "AudioSettings.hpp"
#include "alsa/AlsaDriver.hpp"

using namespace tonegen;

namespace {

std::atomic<bool> g_keep_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_keep_running = false;
    }
}

struct Options {
    std::string config_path;
    bool list = false;
    bool json = false;
    bool offline = false;
};

Options parse_args(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--list") options.list = true;
        else if (arg == "--json") options.json = true;
        else if (arg == "--offline") options.offline = true;
        else options.config_path = arg;
    }
    return options;
}

// Root, third, fifth, octave: snapped to each genre's scale by the engine.
const std::vector<int> kPhrase = {60, 64, 67, 72};

void print_genres() {
    for (const auto& info : GenreCatalog::instance().list()) {
        std::cout << "  " << info.key << " - " << info.name << ": " << info.description << std::endl;
    }
}

float block_peak(const std::vector<float>& block) {
    float peak = 0.0f;
    for (float s : block) peak = std::max(peak, std::abs(s));
    return peak;
}

void render_offline(ToneEngine& engine) {
    const size_t block_size = static_cast<size_t>(engine.config().block_size);
    const int blocks_per_note = std::max(1, engine.config().sample_rate / 4 / static_cast<int>(block_size));

    for (const auto& info : engine.list_genres()) {
        engine.set_genre(info.key);
        float peak = 0.0f;
        for (int note : kPhrase) {
            engine.note_on(note, 100, "demo");
            for (int b = 0; b < blocks_per_note; ++b) {
                peak = std::max(peak, block_peak(engine.render_block(block_size)));
            }
            engine.note_off(note, "demo");
        }
        // Let the last release ring out.
        for (int b = 0; b < blocks_per_note * 4 && engine.voice_count() > 0; ++b) {
            peak = std::max(peak, block_peak(engine.render_block(block_size)));
        }
        std::cout << "  " << info.key << ": peak " << peak << std::endl;
    }
}

void play_live(ToneEngine& engine) {
    for (const auto& info : engine.list_genres()) {
        if (!g_keep_running) break;
        engine.set_genre(info.key);
        std::cout << "  Playing " << info.name << std::endl;
        for (int note : kPhrase) {
            if (!g_keep_running) break;
            engine.note_on(note, 100, "demo");
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            engine.note_off(note, "demo");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(800));
        AudioLogger::instance().flush(std::cerr);
    }
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    const Options options = parse_args(argc, argv);

    if (options.json) {
        std::cout << GenreCatalog::instance().to_json_string() << std::endl;
        return 0;
    }

    EngineConfig config;
    if (!options.config_path.empty() && !ConfigStore::load_from_file(config, options.config_path)) {
        std::cerr << "Could not load " << options.config_path << ", using defaults" << std::endl;
    }

    std::cout << "=== tonegen ===" << std::endl;
    print_genres();
    if (options.list) {
        return 0;
    }

    bool live = false;
    hal::AlsaDriver driver(config.sample_rate, config.block_size, 2, config.device);
    if (!options.offline) {
        live = driver.start();
        if (live) {
            // Pitch depends on the render rate, so render at what the device settled on
            config.sample_rate = driver.sample_rate();
            config.block_size = driver.block_size();
        } else {
            std::cerr << "Audio device unavailable, rendering offline" << std::endl;
        }
    }

    ToneEngine engine(config);
    if (live) {
        driver.set_callback([&engine](std::span<float> output) {
            engine.render_block(output);
        });
        auto& settings = AudioSettings::instance();
        std::cout << "Device: " << settings.sample_rate.load() << " Hz, " << settings.block_size.load()
                  << " frames, " << settings.num_channels.load() << " ch" << std::endl;
        play_live(engine);
        driver.stop();
    } else {
        render_offline(engine);
    }

#if TONEGEN_ENABLE_PROFILING
    const auto metrics = engine.mixer().get_metrics();
    std::cout << "Render: " << metrics.total_blocks_processed << " blocks, max "
              << metrics.max_execution_time.count() / 1000.0 << " us, "
              << metrics.overruns << " over budget" << std::endl;
#endif

    engine.close();
    AudioLogger::instance().flush(std::cerr);
    return 0;
}
