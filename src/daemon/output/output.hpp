#pragma once

#include <expected>
#include <string>

enum class Delivery {
    Pasted,
    // Text is on the clipboard but no paste keystroke could be sent.
    ClipboardOnly,
};

class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    virtual std::expected<Delivery, std::string> deliver(const std::string& text) = 0;
};
