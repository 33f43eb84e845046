#include "config.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <cstdio>
#include <cstdlib>
#include <print>
#include <signal.h>
#include <string>

static void print_usage() {
    std::println("Usage: pushscribe [options]");
    std::println("Hold the hotkey to record, release to transcribe and paste.");
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("      --model NAME    Whisper model name or path (e.g. small.en)");
    std::println("      --hotkey KEY    Push-to-talk key (ctrl, alt, shift, super, f1-f12 or one character)");
    std::println("      --no-cleanup    Paste the raw transcript without LLM cleanup");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool no_cleanup = false;
    std::string config_path;
    std::string model;
    std::string hotkey;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--model") {
            if (i + 1 < argc) model = argv[++i];
        } else if (arg == "--hotkey") {
            if (i + 1 < argc) hotkey = argv[++i];
        } else if (arg == "--no-cleanup") {
            no_cleanup = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            print_usage();
            return 1;
        }
    }

    auto loaded = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!loaded) {
        std::println(stderr, "{}", loaded.error());
        return 1;
    }
    Config config = std::move(*loaded);

    config.apply_env_overrides();
    if (!model.empty()) config.backend.model = model;
    if (!hotkey.empty()) config.hotkey = hotkey;
    if (no_cleanup) config.cleanup.enabled = false;

    if (auto valid = config.validate(); !valid) {
        std::println(stderr, "{}", valid.error());
        return 1;
    }

    // Clipboard tools may exit before reading all of stdin.
    signal(SIGPIPE, SIG_IGN);

    if (verbose) {
        std::println(stderr, "[pushscribe] Starting (model: {}, hotkey: {})",
                     config.backend.model, config.hotkey);
    }

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();

    // Pending runs may be stuck in a collaborator; the signal ends the
    // process regardless, so skip the destructors that would join them.
    if (loop.abandoned_runs() > 0) {
        std::fflush(stdout);
        std::fflush(stderr);
        std::quick_exit(0);
    }
    return 0;
}
