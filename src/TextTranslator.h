#pragma once

#include "Translator.h"

#include <string>

// Plain-text documents: the whole file is chunked and translated with one
// rolling context.
class TextTranslator : public Translator {
public:
    using Translator::Translator;

    TranslationReport translate(const std::string& inputPath, const std::string& outputPath) override;

protected:
    std::string readFile(const std::string& path) const;
    void writeFile(const std::string& path, const std::string& contents) const;
};
