#include "TranslatorFactory.h"
#include "DocxTranslator.h"
#include "TextTranslator.h"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

TranslatorFactory::TranslatorFactory(const TranslationService& servicePrototype, const LanguageDetector& detectorPrototype,
                                     const TranslationConfig& config, const PipelineOptions& options)
    : servicePrototype(servicePrototype),
      detectorPrototype(detectorPrototype),
      config(config),
      options(options) {}

std::string TranslatorFactory::translatorType(const std::string& inputPath) {
    const std::string extension = toLower(std::filesystem::u8path(inputPath).extension().string());
    if (extension == ".docx") {
        return "docx";
    } else if (extension == ".txt") {
        return "txt";
    }
    return "";
}

std::unique_ptr<Translator> TranslatorFactory::createTranslator(const std::string& inputPath) const {
    const std::string type = translatorType(inputPath);
    std::cout << "Creating translator of type: " << (type.empty() ? "unknown" : type) << "\n";

    if (type == "docx") {
        return std::make_unique<DocxTranslator>(servicePrototype.clone(), detectorPrototype.clone(), config, options);
    } else if (type == "txt") {
        return std::make_unique<TextTranslator>(servicePrototype.clone(), detectorPrototype.clone(), config, options);
    } else {
        throw std::runtime_error("Unsupported file type: " + inputPath);
    }
}

std::string TranslatorFactory::outputFileName(const std::string& inputPath, const std::string& targetLanguage) {
    const std::filesystem::path path = std::filesystem::u8path(inputPath);

    std::string suffix;
    for (char ch : targetLanguage) {
        suffix += std::isspace(static_cast<unsigned char>(ch)) ? '_' : ch;
    }

    return path.stem().string() + "_" + suffix + path.extension().string();
}
