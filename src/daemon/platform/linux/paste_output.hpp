#pragma once

#include "output/output.hpp"

#include <memory>
#include <string>
#include <vector>

struct ClipboardTools {
    std::vector<std::string> copy;   // reads the text on stdin
    std::vector<std::string> paste;  // sends the paste keystroke; empty = clipboard only

    static ClipboardTools wayland(); // wl-copy + wtype
    static ClipboardTools x11();     // xclip + xdotool
};

// Copies text to the clipboard, then synthesizes Ctrl+V into the focused
// window. A missing paste tool downgrades to Delivery::ClipboardOnly.
class PasteOutput : public OutputMethod {
public:
    explicit PasteOutput(ClipboardTools tools);
    std::expected<Delivery, std::string> deliver(const std::string& text) override;

private:
    ClipboardTools tools_;
};

// method: "auto", "wayland", "x11" or "clipboard". "auto" and "clipboard"
// pick Wayland or X11 tools from the environment.
std::expected<std::unique_ptr<OutputMethod>, std::string>
make_paste_output(const std::string& method);
