#include "TranslationContext.h"

#include <array>
#include <cctype>

namespace {

bool isSentenceEnd(char ch) {
    return ch == '.' || ch == '!' || ch == '?' || ch == '\n';
}

// True when the text before start ends a sentence, ignoring spaces between
bool startsSentence(const std::string& text, std::size_t start) {
    std::size_t pos = start;
    while (pos > 0 && std::isspace(static_cast<unsigned char>(text[pos - 1]))) {
        if (text[pos - 1] == '\n') {
            return true;
        }
        --pos;
    }
    return pos > 0 && isSentenceEnd(text[pos - 1]);
}

}  // namespace

TranslationContext::TranslationContext(std::size_t maxLength) : limit(maxLength) {}

void TranslationContext::update(const std::string& translation) {
    text = truncate(translation, limit);
}

void TranslationContext::clear() {
    text.clear();
}

std::string TranslationContext::truncate(const std::string& text, std::size_t maxLength) {
    if (text.size() <= maxLength) {
        return text;
    }

    // Keep the tail, starting on a UTF-8 character boundary
    std::size_t start = text.size() - maxLength;
    while (start < text.size() && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
        ++start;
    }
    std::string tail = text.substr(start);

    if (startsSentence(text, start)) {
        const std::size_t wordStart = tail.find_first_not_of(" \t\r\n");
        return wordStart == std::string::npos ? std::string() : tail.substr(wordStart);
    }

    // Drop the leading sentence fragment up to the first boundary
    static const std::array<const char*, 6> boundaries = {". ", "! ", "? ", ".\n", "!\n", "?\n"};
    std::size_t first = std::string::npos;
    for (const char* boundary : boundaries) {
        const std::size_t pos = tail.find(boundary);
        if (pos != std::string::npos && (first == std::string::npos || pos < first)) {
            first = pos;
        }
    }

    if (first != std::string::npos && first + 2 < tail.size()) {
        return tail.substr(first + 2);
    }
    return tail;
}
