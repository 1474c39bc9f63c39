#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "hs_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        size_t off = 0;
        while (fd >= 0 && off < content.size()) {
            ssize_t n = ::write(fd, content.data() + off, content.size() - off);
            if (n <= 0) break;
            off += static_cast<size_t>(n);
        }
        if (fd >= 0) ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.engine.bundle_dir.empty());
        REQUIRE(cfg.engine.selected_model.empty());
        REQUIRE(cfg.engine.custom_model_path.empty());
        REQUIRE(cfg.engine.language == "en");
        REQUIRE(cfg.engine.threads == 0);
        REQUIRE(cfg.delivery.auto_paste);
        REQUIRE(cfg.delivery.prepend_space);
        REQUIRE_FALSE(cfg.delivery.newline_on_break);
        REQUIRE(cfg.delivery.break_interval() == std::chrono::milliseconds(6000));
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.max_seconds == 120);
        REQUIRE(cfg.audio.ring_buffer_bytes() == 120 * 16000 * sizeof(int16_t));
        REQUIRE(cfg.storage.temp_dir.empty());
        REQUIRE(cfg.notify.enabled);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "engine": {
                "bundle_dir": "/opt/whisper",
                "selected_model": "ggml-small.en.bin",
                "custom_model_path": "/models/custom.bin",
                "language": "de",
                "threads": 4
            },
            "delivery": {
                "auto_paste": false,
                "prepend_space": false,
                "newline_on_break": true,
                "break_interval_seconds": 2.5
            },
            "audio": { "sample_rate": 48000, "max_seconds": 60 },
            "storage": { "temp_dir": "/run/user/1000/hs" },
            "notify": { "enabled": false }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.engine.bundle_dir == "/opt/whisper");
        REQUIRE(cfg.engine.bundle_path() == "/opt/whisper");
        REQUIRE(cfg.engine.selected_model == "ggml-small.en.bin");
        REQUIRE(cfg.engine.custom_model_path == "/models/custom.bin");
        REQUIRE(cfg.engine.language == "de");
        REQUIRE(cfg.engine.threads == 4);
        REQUIRE_FALSE(cfg.delivery.auto_paste);
        REQUIRE_FALSE(cfg.delivery.prepend_space);
        REQUIRE(cfg.delivery.newline_on_break);
        REQUIRE(cfg.delivery.break_interval() == std::chrono::milliseconds(2500));
        REQUIRE(cfg.audio.sample_rate == 48000);
        REQUIRE(cfg.audio.max_seconds == 60);
        REQUIRE(cfg.storage.temp_root() == "/run/user/1000/hs");
        REQUIRE_FALSE(cfg.notify.enabled);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "delivery": { "newline_on_break": true } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.delivery.newline_on_break);
        // Other fields retain defaults
        REQUIRE(cfg.delivery.auto_paste);
        REQUIRE(cfg.delivery.prepend_space);
        REQUIRE(cfg.engine.language == "en");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("DeliverySnapshot") {
        Config cfg;
        cfg.delivery.auto_paste = false;
        cfg.delivery.newline_on_break = true;

        auto snap = cfg.delivery.snapshot();
        REQUIRE_FALSE(snap.auto_paste);
        REQUIRE(snap.prepend_space);
        REQUIRE(snap.newline_on_break);

        // Later edits do not reach an existing snapshot
        cfg.delivery.auto_paste = true;
        REQUIRE_FALSE(snap.auto_paste);
    }

    SECTION("BreakIntervalOutOfRangeKeepsDefault") {
        TmpFile negative(R"({ "delivery": { "break_interval_seconds": -3.0 } })");
        REQUIRE(Config::load(negative.path).delivery.break_interval() == std::chrono::milliseconds(6000));

        TmpFile huge(R"({ "delivery": { "break_interval_seconds": 1e300 } })");
        REQUIRE(Config::load(huge.path).delivery.break_interval() == std::chrono::milliseconds(6000));

        TmpFile zero(R"({ "delivery": { "break_interval_seconds": 0 } })");
        REQUIRE(Config::load(zero.path).delivery.break_interval() == std::chrono::milliseconds(0));
    }

    SECTION("BreakIntervalClampedWhenSetDirectly") {
        Config::Delivery d;
        d.break_interval_seconds = -3.0;
        REQUIRE(d.break_interval() == std::chrono::milliseconds(0));

        d.break_interval_seconds = 1e300;
        REQUIRE(d.break_interval() == std::chrono::hours(24));

        d.break_interval_seconds = std::nan("");
        REQUIRE(d.break_interval() == std::chrono::milliseconds(6000));
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.delivery.auto_paste);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadWrongTypeFallsBack") {
        TmpFile f(R"({ "delivery": { "auto_paste": "yes" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.delivery.auto_paste);
        REQUIRE(cfg.engine.language == "en");
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/hs_test_nonexistent_config_file.json");
        REQUIRE(cfg.delivery.prepend_space);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("DefaultBundleUnderDataDir") {
        Config cfg;
        REQUIRE(cfg.engine.bundle_path().ends_with("whisper-bundle"));
    }
}
