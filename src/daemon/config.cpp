#include "config.hpp"

#include "hotkey.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::expected<Config, std::string> Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("hotkey")) cfg.hotkey = j["hotkey"].get<std::string>();

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("model")) cfg.backend.model = b["model"].get<std::string>();
            if (b.contains("language")) cfg.backend.language = b["language"].get<std::string>();
            if (b.contains("threads")) cfg.backend.threads = b["threads"].get<int>();
            if (b.contains("use_gpu")) cfg.backend.use_gpu = b["use_gpu"].get<bool>();
        }

        if (j.contains("cleanup")) {
            auto& c = j["cleanup"];
            if (c.contains("enabled")) cfg.cleanup.enabled = c["enabled"].get<bool>();
            if (c.contains("api_key")) cfg.cleanup.api_key = c["api_key"].get<std::string>();
            if (c.contains("model")) cfg.cleanup.model = c["model"].get<std::string>();
            if (c.contains("url")) cfg.cleanup.url = c["url"].get<std::string>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("method")) cfg.output.method = o["method"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("channels")) cfg.audio.channels = a["channels"].get<uint32_t>();
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        return std::unexpected(std::string("config: parse error in ") + path + ": " + e.what());
    }

    return cfg;
}

std::expected<Config, std::string> Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env_overrides() {
    if (const char* key = std::getenv("ANTHROPIC_API_KEY"); key && *key) {
        cleanup.api_key = key;
    }
    if (const char* model = std::getenv("PUSHSCRIBE_MODEL"); model && *model) {
        backend.model = model;
    }
    if (const char* key = std::getenv("PUSHSCRIBE_HOTKEY"); key && *key) {
        hotkey = key;
    }
}

std::expected<void, std::string> Config::validate() const {
    if (auto spec = resolve_hotkey(hotkey); !spec) {
        return std::unexpected("config: " + spec.error());
    }
    if (backend.model.empty()) {
        return std::unexpected("config: backend.model must not be empty");
    }
    if (backend.threads < 1) {
        return std::unexpected("config: backend.threads must be at least 1");
    }
    if (output.method != "auto" && output.method != "wayland" &&
        output.method != "x11" && output.method != "clipboard") {
        return std::unexpected("config: unknown output method '" + output.method + "'");
    }
    if (audio.channels < 1 || audio.channels > 8) {
        return std::unexpected("config: audio.channels must be between 1 and 8");
    }
    if (audio.max_seconds == 0) {
        return std::unexpected("config: audio.max_seconds must be positive");
    }
    // whisper.cpp only accepts 16 kHz input; PipeWire resamples to whatever we ask for.
    if (audio.sample_rate != 16000) {
        return std::unexpected("config: whisper needs audio.sample_rate 16000");
    }
    return {};
}
