#include "TextTranslator.h"
#include "ScratchDirectory.h"
#include "TranslationContext.h"
#include "TranslationErrors.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

TranslationReport TextTranslator::translate(const std::string& inputPath, const std::string& outputPath) {
    const std::string text = readFile(inputPath);

    TranslationReport result;
    TranslationContext context(options.maxContextLength);
    const std::string translated = driver.translateText(text, config, context, result);

    ensureNotEmpty(result, inputPath);
    writeFile(outputPath, translated);
    return result;
}

std::string TextTranslator::readFile(const std::string& path) const {
    std::ifstream file(std::filesystem::u8path(path), std::ios::binary);
    if (!file.is_open()) {
        throw TranslatorError("Failed to open file: " + path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void TextTranslator::writeFile(const std::string& path, const std::string& contents) const {
    const std::filesystem::path output = std::filesystem::u8path(path);
    ScratchDirectory scratch(output.parent_path());
    const std::filesystem::path staged = scratch.file("translation.tmp");

    {
        std::ofstream file(staged, std::ios::binary);
        if (!file.is_open()) {
            throw PackagingError("Failed to open file for writing: " + staged.string());
        }
        file << contents;
        file.close();
        if (!file) {
            throw PackagingError("Failed to write file: " + staged.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(staged, output, ec);
    if (ec) {
        throw PackagingError("Failed to move translation to " + path + ": " + ec.message());
    }

    std::cout << "Text file created: " << path << "\n";
}
