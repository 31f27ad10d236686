#include "Segmenter.h"

#include <algorithm>
#include <stdexcept>

Segmenter::Segmenter(std::size_t maxLength, std::size_t overlapWindow)
    : maxLength(maxLength), overlapWindow(overlapWindow) {
    if (maxLength == 0) {
        throw std::invalid_argument("Segmenter maxLength must be greater than zero");
    }
}

std::vector<Chunk> Segmenter::split(const std::string& text) const {
    std::vector<Chunk> chunks;
    const std::size_t size = text.size();

    std::size_t offset = 0;
    while (offset < size) {
        const std::size_t end = offset + maxLength;

        // The rest of the text fits into one chunk
        if (end >= size) {
            chunks.push_back({offset, size});
            break;
        }

        const std::size_t cut = findCutPoint(text, offset, end);
        chunks.push_back({offset, cut});
        offset = cut;
    }

    return chunks;
}

std::vector<std::string> Segmenter::splitText(const std::string& text) const {
    std::vector<std::string> pieces;
    for (const Chunk& chunk : split(text)) {
        pieces.push_back(text.substr(chunk.start, chunk.length()));
    }
    return pieces;
}

// Scans the overlap window backwards from its far edge so the chunk stays as
// long as possible while still ending on a sentence.
std::size_t Segmenter::findCutPoint(const std::string& text, std::size_t offset, std::size_t end) const {
    const std::size_t windowStart = (end > offset + overlapWindow) ? end - overlapWindow : offset;
    const std::size_t windowEnd = std::min(end + overlapWindow, text.size());

    for (std::size_t i = windowEnd; i > windowStart; --i) {
        if (text[i - 1] == '.') {
            return i;
        }
    }

    // No sentence terminator: hard cut, but never inside a multi-byte character
    std::size_t cut = alignToCharBoundary(text, windowEnd);
    if (cut <= offset) {
        cut = windowEnd;
        while (cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
            ++cut;
        }
    }
    return cut;
}

std::size_t Segmenter::alignToCharBoundary(const std::string& text, std::size_t pos) {
    while (pos > 0 && pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

size_t Segmenter::getUtf8CharLength(unsigned char firstByte) {
    // First byte of a UTF-8 character determines the number of bytes
    if ((firstByte & 0b10000000) == 0) {
        return 1; // 1-byte character (0xxxxxxx)
    } else if ((firstByte & 0b11100000) == 0b11000000) {
        return 2; // 2-byte character (110xxxxx)
    } else if ((firstByte & 0b11110000) == 0b11100000) {
        return 3; // 3-byte character (1110xxxx)
    } else if ((firstByte & 0b11111000) == 0b11110000) {
        return 4; // 4-byte character (11110xxx)
    }
    // Stray continuation or invalid byte, counted on its own
    return 1;
}

std::size_t Segmenter::utf8Length(const std::string& text) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        i += getUtf8CharLength(static_cast<unsigned char>(text[i]));
        ++count;
    }
    return count;
}

std::string Segmenter::joinSegments(const std::vector<std::string>& segments) {
    std::string joined;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            joined.push_back(kSegmentDelimiter);
        }
        joined += segments[i];
    }
    return joined;
}

std::vector<std::string> Segmenter::splitSegments(const std::string& text, std::size_t expectedCount, bool& countMismatch) {
    std::vector<std::string> parts;

    std::size_t start = 0;
    while (true) {
        const std::size_t pos = text.find(kSegmentDelimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }

    countMismatch = parts.size() != expectedCount;

    // Best-effort repair: pad with empty strings or drop the surplus
    parts.resize(expectedCount);
    return parts;
}

std::string Segmenter::stripDelimiters(const std::string& text) {
    std::string result = text;
    for (char& ch : result) {
        if (ch == kSegmentDelimiter) {
            ch = ' ';
        }
    }
    return result;
}
