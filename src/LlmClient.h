#pragma once

#include <nlohmann/json.hpp>
#include <string>

struct LlmSettings {
    std::string baseUrl = "http://localhost:11434/v1";
    std::string apiKey;
    std::string model = "qwen2.5:72b";
    double temperature = 0.0;
    double topP = 1.0;
    double frequencyPenalty = 0.0;
    double presencePenalty = 0.0;
    int maxTokens = 0;          // 0 leaves the limit to the server
    long timeoutMs = 120000;
    int maxRetries = 2;
    long retryBackoffMs = 1000;
};

// Minimal client for an OpenAI-compatible text completion endpoint.
// Not thread-safe; every worker owns its own instance.
class LlmClient {
public:
    explicit LlmClient(const LlmSettings& settings);

    // POSTs the prompt to <baseUrl>/completions and returns the first choice.
    // Throws TranslationServiceError on transport, HTTP or payload errors.
    std::string complete(const std::string& prompt) const;

    const LlmSettings& settings() const { return config; }

protected:
    nlohmann::json buildPayload(const std::string& prompt) const;
    static std::string parseCompletion(const std::string& body);
    std::string endpoint() const;

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* output);

private:
    LlmSettings config;
};
