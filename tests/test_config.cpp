#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "test_env.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "pushscribe_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.hotkey == "ctrl");
        REQUIRE(cfg.backend.model == "small.en");
        REQUIRE(cfg.backend.language == "en");
        REQUIRE(cfg.backend.threads == 4);
        REQUIRE(cfg.cleanup.enabled);
        REQUIRE(cfg.cleanup.api_key.empty());
        REQUIRE(cfg.cleanup.url == "https://api.anthropic.com");
        REQUIRE(cfg.output.method == "auto");
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.channels == 1);
        REQUIRE(cfg.audio.max_seconds == 120);
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "hotkey": "f9",
            "backend": {
                "model": "base.en",
                "language": "de",
                "threads": 8,
                "use_gpu": false
            },
            "cleanup": {
                "enabled": false,
                "api_key": "sk-test",
                "model": "claude-haiku",
                "url": "http://127.0.0.1:1"
            },
            "output": { "method": "x11" },
            "audio": { "sample_rate": 16000, "channels": 2, "max_seconds": 60 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->hotkey == "f9");
        REQUIRE(cfg->backend.model == "base.en");
        REQUIRE(cfg->backend.language == "de");
        REQUIRE(cfg->backend.threads == 8);
        REQUIRE_FALSE(cfg->backend.use_gpu);
        REQUIRE_FALSE(cfg->cleanup.enabled);
        REQUIRE(cfg->cleanup.api_key == "sk-test");
        REQUIRE(cfg->cleanup.model == "claude-haiku");
        REQUIRE(cfg->cleanup.url == "http://127.0.0.1:1");
        REQUIRE(cfg->output.method == "x11");
        REQUIRE(cfg->audio.sample_rate == 16000);
        REQUIRE(cfg->audio.channels == 2);
        REQUIRE(cfg->audio.max_seconds == 60);
        REQUIRE(cfg->validate().has_value());
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "backend": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->backend.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg->hotkey == "ctrl");
        REQUIRE(cfg->backend.model == "small.en");
        REQUIRE(cfg->output.method == "auto");
        REQUIRE(cfg->audio.sample_rate == 16000);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().find("parse error") != std::string::npos);
    }

    SECTION("LoadWrongType") {
        TmpFile f(R"({ "audio": { "sample_rate": "fast" } })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/pushscribe_test_nonexistent_config_file.json");
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->backend.model == "small.en");
        REQUIRE(cfg->audio.sample_rate == 16000);
    }

    SECTION("LoadDefaultFromXdgConfigHome") {
        auto dir = std::filesystem::temp_directory_path() / "pushscribe_test_xdg";
        std::filesystem::create_directories(dir / "pushscribe");
        {
            std::ofstream out(dir / "pushscribe" / "config.json");
            out << R"({ "hotkey": "alt" })";
        }
        ScopedEnv xdg("XDG_CONFIG_HOME", dir.c_str());

        auto cfg = Config::load_default();
        std::filesystem::remove_all(dir);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->hotkey == "alt");
    }
}

TEST_CASE("Config environment overrides", "[config]") {

    SECTION("OverridesApplied") {
        ScopedEnv key("ANTHROPIC_API_KEY", "sk-env");
        ScopedEnv model("PUSHSCRIBE_MODEL", "medium.en");
        ScopedEnv hotkey("PUSHSCRIBE_HOTKEY", "f8");

        Config cfg;
        cfg.apply_env_overrides();
        REQUIRE(cfg.cleanup.api_key == "sk-env");
        REQUIRE(cfg.backend.model == "medium.en");
        REQUIRE(cfg.hotkey == "f8");
    }

    SECTION("EmptyValuesIgnored") {
        ScopedEnv key("ANTHROPIC_API_KEY", "");
        ScopedEnv model("PUSHSCRIBE_MODEL", nullptr);
        ScopedEnv hotkey("PUSHSCRIBE_HOTKEY", nullptr);

        Config cfg;
        cfg.cleanup.api_key = "from-file";
        cfg.apply_env_overrides();
        REQUIRE(cfg.cleanup.api_key == "from-file");
        REQUIRE(cfg.backend.model == "small.en");
        REQUIRE(cfg.hotkey == "ctrl");
    }
}

TEST_CASE("Config::validate", "[config]") {
    Config cfg;

    SECTION("UnknownHotkey") {
        cfg.hotkey = "hyper";
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("EmptyModel") {
        cfg.backend.model.clear();
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("ZeroThreads") {
        cfg.backend.threads = 0;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("UnknownOutputMethod") {
        cfg.output.method = "type";
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("ChannelRange") {
        cfg.audio.channels = 0;
        REQUIRE_FALSE(cfg.validate().has_value());
        cfg.audio.channels = 9;
        REQUIRE_FALSE(cfg.validate().has_value());
        cfg.audio.channels = 2;
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("ZeroMaxSeconds") {
        cfg.audio.max_seconds = 0;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("RequiresSixteenKilohertz") {
        cfg.audio.sample_rate = 44100;
        REQUIRE_FALSE(cfg.validate().has_value());
        cfg.audio.sample_rate = 0;
        REQUIRE_FALSE(cfg.validate().has_value());
        cfg.audio.sample_rate = 16000;
        REQUIRE(cfg.validate().has_value());
    }
}
