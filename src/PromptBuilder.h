#pragma once

#include "TranslationConfig.h"
#include "TranslationService.h"

#include <string>

// Renders translation parameters into the instruction text sent to the model
// and cleans the model's answer. Pure functions, no state.
class PromptBuilder {
public:
    static std::string toneClause(Tone tone, const std::string& domain);
    static std::string domainClause(const std::string& domain);
    // One "term: definition" line per entry, empty for an empty glossary
    static std::string glossaryClause(const Glossary& glossary);

    static std::string buildPrompt(const TranslationRequest& request);
    static std::string buildDetectionPrompt(const std::string& text);

    // Strips the <translation_text> wrapper and surrounding whitespace and
    // applies the orthographic substitutions.
    static std::string cleanResponse(const std::string& raw);
    static std::string applyOrthography(const std::string& text);

    static constexpr const char* kOpenMarker = "<translation_text>";
    static constexpr const char* kCloseMarker = "</translation_text>";
};
