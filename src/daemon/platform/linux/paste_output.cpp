#include "platform/linux/paste_output.hpp"
#include "platform/linux/subprocess.hpp"

#include <cstdlib>
#include <unistd.h>

ClipboardTools ClipboardTools::wayland() {
    return {
        .copy = {"wl-copy"},
        .paste = {"wtype", "-M", "ctrl", "-k", "v"},
    };
}

ClipboardTools ClipboardTools::x11() {
    return {
        .copy = {"xclip", "-selection", "clipboard"},
        .paste = {"xdotool", "key", "ctrl+v"},
    };
}

PasteOutput::PasteOutput(ClipboardTools tools)
    : tools_(std::move(tools)) {}

std::expected<Delivery, std::string> PasteOutput::deliver(const std::string& text) {
    auto copied = platform::run_command(tools_.copy, text);
    if (!copied) return std::unexpected(copied.error());
    if (*copied == platform::kCommandNotFound) {
        return std::unexpected(tools_.copy[0] + " not found, cannot reach the clipboard");
    }
    if (*copied != 0) {
        return std::unexpected(tools_.copy[0] + " exited with code " + std::to_string(*copied));
    }

    if (tools_.paste.empty()) return Delivery::ClipboardOnly;

    // Give the clipboard owner a moment before the paste request arrives.
    ::usleep(10000);

    auto pasted = platform::run_command(tools_.paste);
    if (!pasted) return std::unexpected(pasted.error());
    if (*pasted == platform::kCommandNotFound) return Delivery::ClipboardOnly;
    if (*pasted != 0) {
        return std::unexpected(tools_.paste[0] + " paste failed with code " + std::to_string(*pasted));
    }
    return Delivery::Pasted;
}

std::expected<std::unique_ptr<OutputMethod>, std::string>
make_paste_output(const std::string& method) {
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    const char* x11 = std::getenv("DISPLAY");
    bool has_wayland = wayland && *wayland;
    bool has_x11 = x11 && *x11;

    ClipboardTools tools;
    if (method == "wayland") {
        tools = ClipboardTools::wayland();
    } else if (method == "x11") {
        tools = ClipboardTools::x11();
    } else if (method == "auto" || method == "clipboard") {
        if (has_wayland) {
            tools = ClipboardTools::wayland();
        } else if (has_x11) {
            tools = ClipboardTools::x11();
        } else {
            return std::unexpected("output: neither WAYLAND_DISPLAY nor DISPLAY is set");
        }
        if (method == "clipboard") tools.paste.clear();
    } else {
        return std::unexpected("output: unknown method '" + method + "'");
    }

    return std::make_unique<PasteOutput>(std::move(tools));
}
