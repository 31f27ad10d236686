#include "TranslationConfig.h"

#include <algorithm>
#include <cctype>

std::string trimWhitespace(const std::string& input) {
    const auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };

    auto begin = std::find_if_not(input.begin(), input.end(), isSpace);
    auto end = std::find_if_not(input.rbegin(), input.rend(), isSpace).base();

    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string toLower(std::string input) {
    std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return input;
}

bool TranslationConfig::autoDetectSource() const {
    const std::string normalized = toLower(trimWhitespace(sourceLanguage));
    return normalized.empty() || normalized == "auto" || normalized == "automatisch erkennen";
}

Tone parseTone(const std::string& value) {
    const std::string normalized = toLower(trimWhitespace(value));

    if (normalized == "formal") {
        return Tone::Formal;
    } else if (normalized == "informal") {
        return Tone::Informal;
    } else if (normalized == "technical") {
        return Tone::Technical;
    }
    return Tone::Neutral;
}

std::string toString(Tone tone) {
    switch (tone) {
        case Tone::Formal:
            return "formal";
        case Tone::Informal:
            return "informal";
        case Tone::Technical:
            return "technical";
        case Tone::Neutral:
            break;
    }
    return "neutral";
}

bool parseUnitMode(const std::string& value, UnitMode& mode) {
    const std::string normalized = toLower(trimWhitespace(value));
    if (normalized == "segment") {
        mode = UnitMode::Segment;
        return true;
    }
    if (normalized == "paragraph") {
        mode = UnitMode::Paragraph;
        return true;
    }
    return false;
}

std::string toString(UnitMode mode) {
    return mode == UnitMode::Paragraph ? "paragraph" : "segment";
}

Glossary parseGlossary(const std::string& value) {
    Glossary glossary;

    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t end = value.find(';', start);
        if (end == std::string::npos) {
            end = value.size();
        }

        const std::string item = value.substr(start, end - start);
        const std::size_t colon = item.find(':');

        GlossaryEntry entry;
        if (colon == std::string::npos) {
            entry.term = trimWhitespace(item);
        } else {
            entry.term = trimWhitespace(item.substr(0, colon));
            entry.definition = trimWhitespace(item.substr(colon + 1));
        }

        // Skip empty items such as a trailing ';'
        if (!entry.term.empty() || !entry.definition.empty()) {
            glossary.push_back(entry);
        }

        start = end + 1;
    }

    return glossary;
}
