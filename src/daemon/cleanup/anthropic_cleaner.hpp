#pragma once

#include "cleaner.hpp"

#include <curl/curl.h>
#include <mutex>
#include <string>
#include <string_view>

namespace anthropic {

extern const std::string_view kSystemPrompt;

std::string build_request(const std::string& model, const std::string& text);

// Extracts the first text block of a Messages API reply.
std::expected<std::string, std::string> parse_reply(long http_status, const std::string& body);

} // namespace anthropic

// Dictation cleanup through the Anthropic Messages API. The HTTP handle is
// created on first use and reused; calls are serialized on it.
class AnthropicCleaner : public TextCleaner {
public:
    AnthropicCleaner(std::string api_key, std::string model,
                     std::string url = "https://api.anthropic.com");
    ~AnthropicCleaner() override;

    AnthropicCleaner(const AnthropicCleaner&) = delete;
    AnthropicCleaner& operator=(const AnthropicCleaner&) = delete;

    bool available() const override { return !api_key_.empty(); }

    std::expected<void, std::string> warm_up() override;

    std::expected<std::string, std::string> cleanup(const std::string& text) override;

private:
    std::expected<void, std::string> ensure_client();

    std::string api_key_;
    std::string model_;
    std::string endpoint_;

    std::mutex mutex_;
    CURL* curl_ = nullptr;
    curl_slist* headers_ = nullptr;
};
