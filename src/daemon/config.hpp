#pragma once

#include <cstdint>
#include <expected>
#include <string>

struct Config {
    std::string hotkey = "ctrl";

    struct Backend {
        std::string model = "small.en";
        std::string language = "en";
        int threads = 4;
        bool use_gpu = true;
    } backend;

    struct Cleanup {
        bool enabled = true;
        std::string api_key;
        std::string model = "claude-sonnet-4-20250514";
        std::string url = "https://api.anthropic.com";
    } cleanup;

    struct Output {
        std::string method = "auto"; // "auto", "wayland", "x11" or "clipboard"
    } output;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t channels = 1;
        uint32_t max_seconds = 120;
    } audio;

    // Missing file yields defaults; unreadable JSON is an error.
    static std::expected<Config, std::string> load(const std::string& path);
    static std::expected<Config, std::string> load_default();

    // ANTHROPIC_API_KEY, PUSHSCRIBE_MODEL, PUSHSCRIBE_HOTKEY
    void apply_env_overrides();

    std::expected<void, std::string> validate() const;
};
