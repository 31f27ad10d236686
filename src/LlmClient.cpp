#include "LlmClient.h"
#include "TranslationErrors.h"

#include <curl/curl.h>
#include <memory>

namespace {

struct CurlCleanup {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistFree {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

LlmClient::LlmClient(const LlmSettings& settings) : config(settings) {}

size_t LlmClient::writeCallback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t totalSize = size * nmemb;
    output->append((char*)contents, totalSize);
    return totalSize;
}

std::string LlmClient::endpoint() const {
    std::string url = config.baseUrl;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/completions";
}

nlohmann::json LlmClient::buildPayload(const std::string& prompt) const {
    nlohmann::json payload;
    payload["model"] = config.model;
    payload["prompt"] = prompt;
    payload["temperature"] = config.temperature;
    payload["top_p"] = config.topP;
    payload["frequency_penalty"] = config.frequencyPenalty;
    payload["presence_penalty"] = config.presencePenalty;
    if (config.maxTokens > 0) {
        payload["max_tokens"] = config.maxTokens;
    }
    payload["stream"] = false;
    return payload;
}

std::string LlmClient::parseCompletion(const std::string& body) {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw TranslationServiceError(std::string("Error parsing completion response: ") + e.what());
    }

    if (response.contains("error")) {
        const auto& error = response["error"];
        const std::string message = (error.is_object() && error.contains("message") && error["message"].is_string())
            ? error["message"].get<std::string>()
            : error.dump();
        throw TranslationServiceError("Completion endpoint returned an error: " + message);
    }

    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        throw TranslationServiceError("Completion response has no choices");
    }

    const auto& choice = response["choices"][0];
    if (!choice.contains("text") || !choice["text"].is_string()) {
        throw TranslationServiceError("Completion choice has no text");
    }
    return choice["text"].get<std::string>();
}

std::string LlmClient::complete(const std::string& prompt) const {
    std::unique_ptr<CURL, CurlCleanup> curl(curl_easy_init());
    if (!curl) {
        throw TranslationServiceError("Failed to initialise curl");
    }

    curl_slist* rawHeaders = curl_slist_append(nullptr, "Content-Type: application/json");
    if (!config.apiKey.empty()) {
        rawHeaders = curl_slist_append(rawHeaders, ("Authorization: Bearer " + config.apiKey).c_str());
    }
    std::unique_ptr<curl_slist, SlistFree> headers(rawHeaders);

    const std::string url = endpoint();
    const std::string jsonData = buildPayload(prompt).dump();
    std::string responseString;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, jsonData.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(jsonData.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseString);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config.timeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TranslationServiceError(std::string("Completion request failed: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw TranslationServiceError("Completion endpoint answered HTTP " + std::to_string(status) + ": " + responseString);
    }

    return parseCompletion(responseString);
}
