#pragma once

#include "delivery.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>

struct Config {
    struct Engine {
        std::string bundle_dir;        // empty: <data_dir>/whisper-bundle
        std::string selected_model;    // file name inside the bundle's models/
        std::string custom_model_path; // absolute model path, wins over selected_model
        std::string language = "en";
        int threads = 0;               // 0: engine default

        std::string bundle_path() const;
    } engine;

    struct Delivery {
        bool auto_paste = true;
        bool prepend_space = true;
        bool newline_on_break = false;
        double break_interval_seconds = 6.0;

        static constexpr double max_break_interval_seconds = 86400.0;

        DeliveryConfig snapshot() const {
            return {.auto_paste = auto_paste, .prepend_space = prepend_space,
                    .newline_on_break = newline_on_break};
        }
        // Out-of-range values set in code are clamped; NaN falls back to the default.
        std::chrono::milliseconds break_interval() const {
            double seconds = std::isnan(break_interval_seconds)
                ? Delivery{}.break_interval_seconds
                : std::clamp(break_interval_seconds, 0.0, max_break_interval_seconds);
            return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
        }
    } delivery;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t ring_buffer_bytes() const {
            return static_cast<size_t>(max_seconds) * sample_rate * sizeof(int16_t);
        }
    } audio;

    struct Storage {
        std::string temp_dir; // empty: $XDG_RUNTIME_DIR, else the system temp dir
        std::string temp_root() const;
    } storage;

    struct Notify {
        bool enabled = true;
    } notify;

    static Config load(const std::string& path);
    static Config load_default();
    static std::string default_path();
};
