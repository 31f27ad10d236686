#pragma once

#include "TranslationConfig.h"
#include "TranslationDriver.h"
#include "TranslationReport.h"
#include "TranslationService.h"

#include <memory>
#include <string>

class Translator {
public:
    Translator(std::unique_ptr<TranslationService> translationService, std::unique_ptr<LanguageDetector> languageDetector,
               const TranslationConfig& translationConfig, const PipelineOptions& pipelineOptions);
    virtual ~Translator() = default;

    // Translates inputPath into outputPath. Returns 0 on success and 1 on
    // failure; the cause is printed and kept in lastError().
    int run(const std::string& inputPath, const std::string& outputPath);

    // Pure virtual method to be implemented by derived classes. Throws
    // TranslatorError subclasses on fatal errors.
    virtual TranslationReport translate(const std::string& inputPath, const std::string& outputPath) = 0;

    void setCancellationFlag(const CancellationFlag* flag) { driver.setCancellationFlag(flag); }

    const TranslationReport& lastReport() const { return report; }
    const std::string& lastError() const { return error; }

protected:
    // Throws EmptyTranslationResult when the source had text to translate but
    // not a single unit came back translated
    void ensureNotEmpty(const TranslationReport& result, const std::string& inputPath) const;

    std::unique_ptr<TranslationService> service;
    std::unique_ptr<LanguageDetector> detector;
    TranslationConfig config;
    PipelineOptions options;
    TranslationDriver driver;

private:
    TranslationReport report;
    std::string error;
};
