#pragma once

#include "TranslationConfig.h"

#include <memory>
#include <string>

struct TranslationRequest {
    std::string text;
    std::string sourceLanguage;   // empty lets the capability infer it
    std::string targetLanguage;
    Tone tone = Tone::Neutral;
    std::string domain;
    Glossary glossary;
    std::string context;          // tail of the previous translations
};

// External translation capability. Returns the raw model output; failures are
// reported with TranslationServiceError.
class TranslationService {
public:
    virtual ~TranslationService() = default;

    virtual std::string translate(const TranslationRequest& request) = 0;

    // Per-thread isolation point: every document worker gets its own clone
    virtual std::unique_ptr<TranslationService> clone() const = 0;
};

// External language detection capability. Throws LanguageDetectionError.
class LanguageDetector {
public:
    virtual ~LanguageDetector() = default;

    virtual std::string detect(const std::string& text) = 0;
    virtual std::unique_ptr<LanguageDetector> clone() const = 0;
};
