#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Half-open range [start, end) of byte offsets into the segmented text
struct Chunk {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t length() const { return end - start; }
};

class Segmenter {
public:
    // Separates merged segments of one paragraph inside a single unit
    static constexpr char kSegmentDelimiter = '\x1E';

    Segmenter(std::size_t maxLength, std::size_t overlapWindow);

    std::vector<Chunk> split(const std::string& text) const;
    std::vector<std::string> splitText(const std::string& text) const;

    static std::string joinSegments(const std::vector<std::string>& segments);
    static std::vector<std::string> splitSegments(const std::string& text, std::size_t expectedCount, bool& countMismatch);
    static std::string stripDelimiters(const std::string& text);

    static std::size_t utf8Length(const std::string& text);

protected:
    std::size_t findCutPoint(const std::string& text, std::size_t offset, std::size_t end) const;
    static std::size_t alignToCharBoundary(const std::string& text, std::size_t pos);
    static std::size_t getUtf8CharLength(unsigned char firstByte);

private:
    std::size_t maxLength;
    std::size_t overlapWindow;
};
