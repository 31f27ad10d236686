#pragma once

#include <cstddef>
#include <string>

// Tail of the most recent translation in one document pass. Never longer than
// maxLength bytes and, when a sentence boundary exists in the kept tail, never
// starting mid-sentence.
class TranslationContext {
public:
    explicit TranslationContext(std::size_t maxLength = 1000);

    void update(const std::string& translation);
    void clear();

    const std::string& str() const { return text; }

    static std::string truncate(const std::string& text, std::size_t maxLength);

private:
    std::string text;
    std::size_t limit;
};
