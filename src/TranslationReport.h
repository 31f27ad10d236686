#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

enum class WarningKind {
    TranslationUnitFailed,   // original text kept for the unit
    SegmentCountMismatch     // delimiter split repaired by padding or truncation
};

struct TranslationWarning {
    WarningKind kind;
    std::size_t unitIndex;
    std::string message;
};

struct TranslationReport {
    std::size_t unitsTotal = 0;
    std::size_t unitsTranslated = 0;
    std::size_t unitsSkipped = 0;
    std::size_t sourceCharacters = 0;
    std::size_t outputCharacters = 0;
    std::vector<TranslationWarning> warnings;

    std::size_t countWarnings(WarningKind kind) const {
        std::size_t count = 0;
        for (const auto& warning : warnings) {
            if (warning.kind == kind) {
                ++count;
            }
        }
        return count;
    }

    void print(std::ostream& out) const {
        out << "Units: " << unitsTotal << " total, " << unitsTranslated << " translated, "
            << unitsSkipped << " skipped, " << warnings.size() << " warning(s)\n";
        out << "Characters: " << sourceCharacters << " in, " << outputCharacters << " out\n";
    }
};

inline const char* toString(WarningKind kind) {
    return kind == WarningKind::TranslationUnitFailed ? "TranslationUnitFailed" : "SegmentCountMismatch";
}
