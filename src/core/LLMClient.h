#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"

/**
 * @brief OpenAI-compatible chat-completions client.
 *
 * The chat methods are virtual so tests can substitute a scripted model.
 */
class LLMClient {
public:
    explicit LLMClient(const Config::LLM& settings);
    LLMClient(const std::string& apiKey,
              const std::string& baseUrl = "https://api.openai.com/v1",
              const std::string& model = "gpt-4o-mini");
    virtual ~LLMClient() = default;

    /** Plain text completion. Returns "" when the API gives no content. */
    virtual std::string chat(const std::string& prompt, const std::string& systemRole = "");

    /**
     * @brief Completion constrained to a JSON object (response_format json_object).
     * @throws std::runtime_error when the request fails or the content is not a JSON object
     */
    virtual nlohmann::json chatJson(const std::string& prompt, const std::string& systemRole);

    /** Raw request. Returns the response body, or an empty object after exhausting retries. */
    virtual nlohmann::json complete(const nlohmann::json& messages, bool jsonMode);

    const std::string& model() const { return settings.model; }

private:
    Config::LLM settings;
    bool isSsl = true;
    std::string host;
    int port = 443;
    std::string pathPrefix;

    void parseBaseUrl(const std::string& url);
};

/** Strips a ```json fence if the model wrapped its answer in one. */
std::string stripCodeFence(const std::string& text);
