#include "TranslationDriver.h"
#include "PromptBuilder.h"
#include "TranslationErrors.h"

#include <cctype>
#include <iostream>

TranslationDriver::TranslationDriver(TranslationService& service, LanguageDetector& detector, const PipelineOptions& options)
    : service(service),
      detector(detector),
      settings(options),
      segmenter(options.maxChunkLength, options.overlapWindow) {}

void TranslationDriver::translateDocument(MarkupTree& tree, const TranslationConfig& config, TranslationContext& context, TranslationReport& report) {
    const std::vector<MergedSegment> segments = tree.mergeAdjacent();
    std::cout << "Translating " << segments.size() << " segment(s) in " << tree.name() << "\n";

    std::size_t first = 0;
    while (first < segments.size()) {
        // Segments of one paragraph are contiguous
        std::size_t last = first;
        while (last < segments.size() && segments[last].paragraphIndex == segments[first].paragraphIndex) {
            ++last;
        }

        const bool sentTogether = settings.unitMode == UnitMode::Paragraph
            && last - first > 1
            && translateParagraph(tree, segments, first, last, config, context, report);

        if (!sentTogether) {
            for (std::size_t i = first; i < last; ++i) {
                translateSegment(tree, segments[i], config, context, report);
            }
        }

        first = last;
    }
}

std::string TranslationDriver::translateText(const std::string& text, const TranslationConfig& config, TranslationContext& context, TranslationReport& report) {
    report.sourceCharacters += text.size();
    std::string result = translateChunked(text, config, context, report);
    report.outputCharacters += result.size();
    return result;
}

void TranslationDriver::translateSegment(MarkupTree& tree, const MergedSegment& segment, const TranslationConfig& config, TranslationContext& context, TranslationReport& report) {
    report.sourceCharacters += segment.text.size();

    const std::string translated = translateChunked(segment.text, config, context, report);
    report.outputCharacters += translated.size();

    // Untranslated segments keep their original markup untouched
    if (translated != segment.text) {
        tree.writeBack(segment, translated);
    }
}

bool TranslationDriver::translateParagraph(MarkupTree& tree, const std::vector<MergedSegment>& segments, std::size_t first, std::size_t last,
                                           const TranslationConfig& config, TranslationContext& context, TranslationReport& report) {
    // Whitespace-only segments stay where they are and are not sent
    std::vector<std::size_t> members;
    std::vector<std::string> texts;
    for (std::size_t i = first; i < last; ++i) {
        if (!trimWhitespace(segments[i].text).empty()) {
            members.push_back(i);
            texts.push_back(segments[i].text);
        }
    }
    if (members.size() < 2) {
        return false;
    }

    const std::string joined = Segmenter::joinSegments(texts);
    if (joined.size() > settings.maxChunkLength) {
        // Too large for one call, fall back to segment units
        return false;
    }

    std::size_t sourceSize = 0;
    for (const auto& text : texts) {
        sourceSize += text.size();
    }
    report.sourceCharacters += sourceSize;

    const std::optional<std::string> translated = translateUnit(joined, config, context, report);
    if (!translated) {
        report.outputCharacters += sourceSize;
        return true;
    }

    bool countMismatch = false;
    std::vector<std::string> parts = Segmenter::splitSegments(*translated, texts.size(), countMismatch);
    if (countMismatch) {
        const std::size_t unitIndex = report.unitsTotal - 1;
        std::cerr << "Warning: segment count mismatch in unit " << unitIndex << ", expected " << texts.size() << " parts\n";
        report.warnings.push_back({WarningKind::SegmentCountMismatch, unitIndex,
                                   "Expected " + std::to_string(texts.size()) + " segments in translated paragraph"});
    }

    for (std::size_t i = 0; i < parts.size(); ++i) {
        std::string part = trimWhitespace(parts[i]);
        if (!part.empty()) {
            part = restoreWhitespace(texts[i], part);
        }
        report.outputCharacters += part.size();

        if (part != texts[i]) {
            tree.writeBack(segments[members[i]], part);
        }
    }
    return true;
}

std::string TranslationDriver::translateChunked(const std::string& text, const TranslationConfig& config, TranslationContext& context, TranslationReport& report) {
    if (text.size() <= settings.maxChunkLength) {
        std::optional<std::string> translated = translateUnit(text, config, context, report);
        return translated ? *translated : text;
    }

    const std::vector<std::string> pieces = segmenter.splitText(text);
    std::cout << "Split unit of " << text.size() << " characters into " << pieces.size() << " chunks\n";

    std::string result;
    for (const auto& piece : pieces) {
        std::optional<std::string> translated = translateUnit(piece, config, context, report);
        result += translated ? *translated : piece;
    }
    return result;
}

std::optional<std::string> TranslationDriver::translateUnit(const std::string& text, const TranslationConfig& config, TranslationContext& context, TranslationReport& report) {
    checkCancelled();

    const std::size_t unitIndex = report.unitsTotal++;

    // Nothing worth a model call
    if (isTrivial(text)) {
        ++report.unitsSkipped;
        return text;
    }

    TranslationRequest request;
    request.text = text;
    request.sourceLanguage = resolveSourceLanguage(text, config);
    request.targetLanguage = config.targetLanguage;
    request.tone = config.tone;
    request.domain = config.domain;
    request.glossary = config.glossary;
    request.context = context.str();

    std::string raw;
    try {
        raw = service.translate(request);
    } catch (const TranslationServiceError& e) {
        return recordFailure(unitIndex, e.what(), report);
    }

    std::string translated = PromptBuilder::cleanResponse(raw);
    if (trimWhitespace(Segmenter::stripDelimiters(translated)).empty()) {
        return recordFailure(unitIndex, "empty result from translation service", report);
    }

    translated = restoreWhitespace(text, translated);

    context.update(trimWhitespace(Segmenter::stripDelimiters(translated)));
    ++report.unitsTranslated;
    return translated;
}

std::string TranslationDriver::resolveSourceLanguage(const std::string& text, const TranslationConfig& config) {
    if (!config.autoDetectSource()) {
        return config.sourceLanguage;
    }

    try {
        return detector.detect(Segmenter::stripDelimiters(text));
    } catch (const LanguageDetectionError& e) {
        // Let the translation service infer the language itself
        std::cerr << "Language detection failed: " << e.what() << "\n";
        return {};
    }
}

std::optional<std::string> TranslationDriver::recordFailure(std::size_t unitIndex, const std::string& cause, TranslationReport& report) {
    std::cerr << "Translation failed for unit " << unitIndex << ": " << cause << "\n";

    if (settings.abortOnFirstFailure) {
        throw TranslationFailed(unitIndex, cause);
    }

    report.warnings.push_back({WarningKind::TranslationUnitFailed, unitIndex, cause});
    return std::nullopt;
}

void TranslationDriver::checkCancelled() const {
    if (cancelFlag != nullptr && cancelFlag->load()) {
        throw TranslationCancelled();
    }
}

bool TranslationDriver::isTrivial(const std::string& text) {
    const std::string trimmed = trimWhitespace(text);
    return trimmed.empty() || Segmenter::utf8Length(trimmed) == 1;
}

// The service output is stripped, so edge whitespace of the source (a trailing
// carriage return, the space before the next run) is reattached here.
std::string TranslationDriver::restoreWhitespace(const std::string& source, const std::string& translation) {
    const auto isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };

    std::size_t leading = 0;
    while (leading < source.size() && isSpace(source[leading])) {
        ++leading;
    }
    std::size_t trailing = 0;
    while (trailing < source.size() - leading && isSpace(source[source.size() - 1 - trailing])) {
        ++trailing;
    }

    std::string result = translation;
    if (leading > 0 && (result.empty() || !isSpace(result.front()))) {
        result = source.substr(0, leading) + result;
    }
    if (trailing > 0 && (result.empty() || !isSpace(result.back()))) {
        result += source.substr(source.size() - trailing);
    }
    return result;
}
