#pragma once

#include "LlmClient.h"
#include "TranslationService.h"

#include <memory>
#include <string>

// Translation capability backed by a completion model. Renders the request
// with PromptBuilder and returns the raw completion.
class LlmTranslationService : public TranslationService {
public:
    explicit LlmTranslationService(const LlmSettings& settings);

    std::string translate(const TranslationRequest& request) override;
    std::unique_ptr<TranslationService> clone() const override;

private:
    LlmClient client;
};

// Language detection through the same completion endpoint
class LlmLanguageDetector : public LanguageDetector {
public:
    explicit LlmLanguageDetector(const LlmSettings& settings);

    std::string detect(const std::string& text) override;
    std::unique_ptr<LanguageDetector> clone() const override;

    // Lower-cased 2-3 letter code taken from the answer, throws
    // LanguageDetectionError when there is none
    static std::string parseLanguageCode(const std::string& answer);

private:
    LlmClient client;
};
