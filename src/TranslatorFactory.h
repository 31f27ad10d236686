#pragma once

#include "TranslationConfig.h"
#include "TranslationService.h"
#include "Translator.h"

#include <memory>
#include <string>

// Builds a translator for a document from its file extension. Every
// translator gets its own clones of the capability prototypes, so
// translators may run on different threads.
class TranslatorFactory {
public:
    TranslatorFactory(const TranslationService& servicePrototype, const LanguageDetector& detectorPrototype,
                      const TranslationConfig& config, const PipelineOptions& options);

    // Throws std::runtime_error for unsupported extensions
    std::unique_ptr<Translator> createTranslator(const std::string& inputPath) const;

    // "docx", "txt" or an empty string
    static std::string translatorType(const std::string& inputPath);

    // <stem>_<target language><extension>
    static std::string outputFileName(const std::string& inputPath, const std::string& targetLanguage);

    const TranslationConfig& translationConfig() const { return config; }

private:
    const TranslationService& servicePrototype;
    const LanguageDetector& detectorPrototype;
    TranslationConfig config;
    PipelineOptions options;
};
