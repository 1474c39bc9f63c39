#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::Engine::bundle_path() const {
    if (!bundle_dir.empty()) return bundle_dir;
    auto data = platform::data_dir();
    if (data.empty()) return "whisper-bundle";
    return data + "/whisper-bundle";
}

std::string Config::Storage::temp_root() const {
    if (!temp_dir.empty()) return temp_dir;
    return platform::temp_root();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("bundle_dir")) cfg.engine.bundle_dir = e["bundle_dir"].get<std::string>();
            if (e.contains("selected_model")) cfg.engine.selected_model = e["selected_model"].get<std::string>();
            if (e.contains("custom_model_path")) cfg.engine.custom_model_path = e["custom_model_path"].get<std::string>();
            if (e.contains("language")) cfg.engine.language = e["language"].get<std::string>();
            if (e.contains("threads")) cfg.engine.threads = e["threads"].get<int>();
        }

        if (j.contains("delivery")) {
            auto& d = j["delivery"];
            if (d.contains("auto_paste")) cfg.delivery.auto_paste = d["auto_paste"].get<bool>();
            if (d.contains("prepend_space")) cfg.delivery.prepend_space = d["prepend_space"].get<bool>();
            if (d.contains("newline_on_break")) cfg.delivery.newline_on_break = d["newline_on_break"].get<bool>();
            if (d.contains("break_interval_seconds")) {
                auto seconds = d["break_interval_seconds"].get<double>();
                if (std::isfinite(seconds) && seconds >= 0.0 &&
                    seconds <= Delivery::max_break_interval_seconds) {
                    cfg.delivery.break_interval_seconds = seconds;
                } else {
                    std::println(stderr, "config: break_interval_seconds {} out of range [0, {}], using {}",
                                 seconds, Delivery::max_break_interval_seconds,
                                 cfg.delivery.break_interval_seconds);
                }
            }
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<uint32_t>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("temp_dir")) cfg.storage.temp_dir = s["temp_dir"].get<std::string>();
        }

        if (j.contains("notify")) {
            auto& n = j["notify"];
            if (n.contains("enabled")) cfg.notify.enabled = n["enabled"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}

Config Config::load_default() {
    auto config_path = default_path();
    if (config_path.empty()) return Config{};

    if (fs::exists(config_path)) {
        return load(config_path);
    }
    return Config{};
}
