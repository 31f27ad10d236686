#pragma once

#include "Translator.h"

#include <string>

// Translates the body, header and footer parts of a .docx package in
// document order with one rolling context, keeping run formatting.
class DocxTranslator : public Translator {
public:
    using Translator::Translator;

    TranslationReport translate(const std::string& inputPath, const std::string& outputPath) override;
};
