#pragma once

#include "MarkupTree.h"
#include "Segmenter.h"
#include "TranslationConfig.h"
#include "TranslationContext.h"
#include "TranslationReport.h"
#include "TranslationService.h"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

using CancellationFlag = std::atomic<bool>;

// Translates the units of one document strictly in document order. Every unit
// sees the rolling context of the unit translated before it, so units are never
// reordered or run concurrently.
class TranslationDriver {
public:
    TranslationDriver(TranslationService& service, LanguageDetector& detector, const PipelineOptions& options);

    // Checked once per unit
    void setCancellationFlag(const CancellationFlag* flag) { cancelFlag = flag; }

    void translateDocument(MarkupTree& tree, const TranslationConfig& config, TranslationContext& context, TranslationReport& report);
    std::string translateText(const std::string& text, const TranslationConfig& config, TranslationContext& context, TranslationReport& report);

protected:
    std::optional<std::string> translateUnit(const std::string& text, const TranslationConfig& config, TranslationContext& context, TranslationReport& report);
    std::string translateChunked(const std::string& text, const TranslationConfig& config, TranslationContext& context, TranslationReport& report);
    void translateSegment(MarkupTree& tree, const MergedSegment& segment, const TranslationConfig& config, TranslationContext& context, TranslationReport& report);
    bool translateParagraph(MarkupTree& tree, const std::vector<MergedSegment>& segments, std::size_t first, std::size_t last,
                            const TranslationConfig& config, TranslationContext& context, TranslationReport& report);
    std::string resolveSourceLanguage(const std::string& text, const TranslationConfig& config);
    std::optional<std::string> recordFailure(std::size_t unitIndex, const std::string& cause, TranslationReport& report);
    void checkCancelled() const;

    static bool isTrivial(const std::string& text);
    static std::string restoreWhitespace(const std::string& source, const std::string& translation);

private:
    TranslationService& service;
    LanguageDetector& detector;
    PipelineOptions settings;
    Segmenter segmenter;
    const CancellationFlag* cancelFlag = nullptr;
};
