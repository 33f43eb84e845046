#include "anthropic_cleaner.hpp"
#include "../text_util.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace anthropic {

const std::string_view kSystemPrompt =
    "You are a dictation post-processor. You receive raw speech-to-text output and "
    "return a cleaned version. Rules:\n"
    "\n"
    "1. Remove filler words (um, uh, like, you know) unless they're clearly intentional.\n"
    "2. Fix grammar and punctuation.\n"
    "3. Resolve self-corrections, e.g. \"Tuesday no Wednesday\" becomes \"Wednesday\".\n"
    "4. Preserve the speaker's tone: casual stays casual, formal stays formal.\n"
    "5. Do NOT add information, change meaning, or editorialize.\n"
    "6. Return ONLY the cleaned text, with no commentary, quotes or markdown.";

std::string build_request(const std::string& model, const std::string& text) {
    json body = {
        {"model", model},
        {"max_tokens", 4096},
        {"system", std::string(kSystemPrompt)},
        {"messages", json::array({{{"role", "user"}, {"content", text}}})},
    };
    return body.dump();
}

std::expected<std::string, std::string> parse_reply(long http_status, const std::string& body) {
    try {
        // Error pages from proxies are not always JSON.
        auto j = json::parse(body, nullptr, false);
        bool is_object = !j.is_discarded() && j.is_object();

        if (http_status < 200 || http_status >= 300 ||
            (is_object && j.value("type", "") == "error")) {
            std::string msg = "HTTP " + std::to_string(http_status);
            if (is_object && j.contains("error") && j["error"].is_object()) {
                msg += ": " + j["error"].value("message", std::string("unknown error"));
            }
            return std::unexpected(msg);
        }
        if (!is_object) {
            return std::unexpected("unexpected response: " + body);
        }

        if (!j.contains("content") || !j["content"].is_array()) {
            return std::unexpected("unexpected response: " + body);
        }
        for (const auto& block : j["content"]) {
            if (block.value("type", "") == "text") {
                return text::trim(block.value("text", std::string()));
            }
        }
        return std::unexpected("response has no text block");
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

} // namespace anthropic

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

AnthropicCleaner::AnthropicCleaner(std::string api_key, std::string model, std::string url)
    : api_key_(std::move(api_key)), model_(std::move(model)),
      endpoint_(std::move(url) + "/v1/messages") {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

AnthropicCleaner::~AnthropicCleaner() {
    if (headers_) curl_slist_free_all(headers_);
    if (curl_) curl_easy_cleanup(curl_);
    curl_global_cleanup();
}

std::expected<void, std::string> AnthropicCleaner::warm_up() {
    std::lock_guard lock(mutex_);
    return ensure_client();
}

std::expected<void, std::string> AnthropicCleaner::ensure_client() {
    if (curl_) return {};
    if (api_key_.empty()) {
        return std::unexpected("no API key configured");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "content-type: application/json");
    headers = curl_slist_append(headers, "anthropic-version: 2023-06-01");
    headers = curl_slist_append(headers, ("x-api-key: " + api_key_).c_str());
    if (!headers) {
        curl_easy_cleanup(curl);
        return std::unexpected("curl_slist_append failed");
    }

    curl_ = curl;
    headers_ = headers;
    return {};
}

std::expected<std::string, std::string> AnthropicCleaner::cleanup(const std::string& text) {
    if (text::is_blank(text)) return text;

    std::lock_guard lock(mutex_);
    if (auto ready = ensure_client(); !ready) {
        return std::unexpected(ready.error());
    }

    auto body = anthropic::build_request(model_, text);
    std::string response_body;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);
    // Runs on dictation worker threads; keep the resolver off SIGALRM.
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    long http_status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_status);
    return anthropic::parse_reply(http_status, response_body);
}
