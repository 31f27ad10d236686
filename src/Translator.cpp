#include "Translator.h"
#include "TranslationErrors.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <utility>

Translator::Translator(std::unique_ptr<TranslationService> translationService, std::unique_ptr<LanguageDetector> languageDetector,
                       const TranslationConfig& translationConfig, const PipelineOptions& pipelineOptions)
    : service(std::move(translationService)),
      detector(std::move(languageDetector)),
      config(translationConfig),
      options(pipelineOptions),
      driver(*service, *detector, options) {}

int Translator::run(const std::string& inputPath, const std::string& outputPath) {
    report = TranslationReport();
    error.clear();

    // Check if the input file exists
    std::filesystem::path inputFilePath = std::filesystem::u8path(inputPath);
    if (!std::filesystem::exists(inputFilePath)) {
        error = "Input file does not exist: " + inputFilePath.string();
        std::cerr << error << "\n";
        return 1;
    }

    // Start the timer
    auto start = std::chrono::high_resolution_clock::now();
    std::cout << "Translating " << inputPath << " to " << config.targetLanguage << "\n";

    try {
        report = translate(inputPath, outputPath);
    } catch (const TranslatorError& e) {
        error = e.what();
        std::cerr << "Failed to translate " << inputPath << ": " << error << "\n";
        return 1;
    } catch (const std::exception& e) {
        error = e.what();
        std::cerr << "Unexpected error while translating " << inputPath << ": " << error << "\n";
        return 1;
    }

    for (const auto& warning : report.warnings) {
        std::cerr << "Warning [" << toString(warning.kind) << "] unit " << warning.unitIndex << ": " << warning.message << "\n";
    }
    report.print(std::cout);

    // End timer
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    std::cout << "Time taken: " << elapsed.count() << "s" << "\n";

    return 0;
}

void Translator::ensureNotEmpty(const TranslationReport& result, const std::string& inputPath) const {
    // Failed units keep their source text, so only the translated units count
    const std::size_t attempted = result.unitsTotal - result.unitsSkipped;
    if (attempted > 0 && result.unitsTranslated == 0) {
        throw EmptyTranslationResult("Translation of " + inputPath + " produced no text: all " + std::to_string(attempted) + " unit(s) failed");
    }
}
