#pragma once

#include <cstddef>
#include <string>
#include <vector>

enum class Tone {
    Neutral,
    Formal,
    Informal,
    Technical
};

struct GlossaryEntry {
    std::string term;
    std::string definition;
};

using Glossary = std::vector<GlossaryEntry>;

struct TranslationConfig {
    std::string sourceLanguage = "auto";
    std::string targetLanguage = "German";
    Tone tone = Tone::Neutral;
    std::string domain;
    Glossary glossary;

    // True when the source language has to be detected per unit
    bool autoDetectSource() const;
};

enum class UnitMode {
    Segment,    // every merged segment is its own unit
    Paragraph   // a paragraph's segments are sent together, delimiter-joined
};

struct PipelineOptions {
    std::size_t maxChunkLength = 5000;
    std::size_t overlapWindow = 200;
    std::size_t maxContextLength = 1000;
    bool abortOnFirstFailure = false;
    UnitMode unitMode = UnitMode::Segment;
};

// Unknown values fall back to Tone::Neutral
Tone parseTone(const std::string& value);
std::string toString(Tone tone);

bool parseUnitMode(const std::string& value, UnitMode& mode);
std::string toString(UnitMode mode);

// Parses "term:definition;term:definition"
Glossary parseGlossary(const std::string& value);

std::string trimWhitespace(const std::string& input);
std::string toLower(std::string input);
