#pragma once

#include <expected>
#include <string>

// Post-processes a raw transcript (filler words, punctuation, self-corrections).
class TextCleaner {
public:
    virtual ~TextCleaner() = default;

    // False when the service cannot be used at all, e.g. no credentials.
    virtual bool available() const = 0;

    virtual std::expected<void, std::string> warm_up() = 0;

    virtual std::expected<std::string, std::string> cleanup(const std::string& text) = 0;
};
