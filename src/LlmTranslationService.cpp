#include "LlmTranslationService.h"
#include "PromptBuilder.h"
#include "TranslationErrors.h"

#include <cctype>

LlmTranslationService::LlmTranslationService(const LlmSettings& settings) : client(settings) {}

std::string LlmTranslationService::translate(const TranslationRequest& request) {
    return client.complete(PromptBuilder::buildPrompt(request));
}

std::unique_ptr<TranslationService> LlmTranslationService::clone() const {
    return std::make_unique<LlmTranslationService>(client.settings());
}

LlmLanguageDetector::LlmLanguageDetector(const LlmSettings& settings) : client(settings) {}

std::string LlmLanguageDetector::detect(const std::string& text) {
    std::string answer;
    try {
        answer = client.complete(PromptBuilder::buildDetectionPrompt(text));
    } catch (const TranslationServiceError& e) {
        throw LanguageDetectionError(std::string("Language detection failed: ") + e.what());
    }
    return parseLanguageCode(answer);
}

std::unique_ptr<LanguageDetector> LlmLanguageDetector::clone() const {
    return std::make_unique<LlmLanguageDetector>(client.settings());
}

std::string LlmLanguageDetector::parseLanguageCode(const std::string& answer) {
    // First alphabetic word of the answer
    std::size_t start = 0;
    while (start < answer.size() && !std::isalpha(static_cast<unsigned char>(answer[start]))) {
        ++start;
    }
    std::size_t end = start;
    while (end < answer.size() && std::isalpha(static_cast<unsigned char>(answer[end]))) {
        ++end;
    }

    const std::string code = toLower(answer.substr(start, end - start));
    if (code.size() < 2 || code.size() > 3) {
        throw LanguageDetectionError("No language code in detector answer: " + trimWhitespace(answer));
    }
    return code;
}
