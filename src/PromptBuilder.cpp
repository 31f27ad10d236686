#include "PromptBuilder.h"
#include "Segmenter.h"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <utility>

namespace {

// Replaced in every result regardless of the target language
const std::pair<const char*, const char*> kOrthographicSubstitutions[] = {
    {"\xC3\x9F", "ss"},   // sharp s
};

std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return text;
    }
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

}  // namespace

std::string PromptBuilder::toneClause(Tone tone, const std::string& domain) {
    switch (tone) {
        case Tone::Formal:
            return "Use a formal and professional tone appropriate for official documents.";
        case Tone::Informal:
            return "Use an informal and conversational tone that is friendly and engaging.";
        case Tone::Technical:
            return "Use a technical tone appropriate for " + (domain.empty() ? std::string("professional") : domain) + " writing.";
        case Tone::Neutral:
            break;
    }
    return "Use a neutral tone that is objective, informative, and unbiased.";
}

std::string PromptBuilder::domainClause(const std::string& domain) {
    if (domain.empty()) {
        return "No specific domain requirements.";
    }
    return "Use terminology specific to the " + domain + " field.";
}

std::string PromptBuilder::glossaryClause(const Glossary& glossary) {
    std::string clause;
    for (const auto& entry : glossary) {
        if (!clause.empty()) {
            clause += "\n";
        }
        clause += entry.term;
        if (!entry.definition.empty()) {
            clause += ": " + entry.definition;
        }
    }
    return clause;
}

std::string PromptBuilder::buildPrompt(const TranslationRequest& request) {
    const std::string sourceLanguage = request.sourceLanguage.empty() ? "the detected source language" : request.sourceLanguage;
    const std::string glossary = glossaryClause(request.glossary);
    const bool hasDelimiters = request.text.find(Segmenter::kSegmentDelimiter) != std::string::npos;

    std::ostringstream prompt;
    prompt << "You are an expert translator.\n\n"
           << "Requirements:\n"
           << "1. Accuracy: The translation should be accurate and convey the same meaning as the original text.\n"
           << "2. Fluency: The translated text should be natural and fluent in the target language.\n"
           << "3. Style: Maintain the original style and tone of the text as much as possible.\n"
           << "4. Context: Consider the context enclosed in <context></context> of the text when translating. The context may be empty.\n"
           << "5. No Unnecessary Translations: Do not translate proper nouns like names, brands, places, addresses, URLs, email addresses, phone numbers, "
           << "or any element that would lose its meaning or functionality if translated. These should remain in their original form.\n"
           << "6. Domain-Specific Terminology: " << domainClause(request.domain) << "\n"
           << "7. Tone: " << toneClause(request.tone, request.domain) << "\n"
           << "8. Idioms and Cultural References: Adapt idiomatic expressions and culturally specific references to their equivalents in the target language.\n"
           << "9. Source Text Errors: If there are any obvious errors or typos in the source text, correct them in the translation to improve clarity.\n"
           << "10. Formatting: Preserve the original formatting of the text, including line breaks and bullet points.\n"
           << "11. Special characters: Preserve line breaks and paragraphs as in the source text. Keep carriage return characters ('\\r') if they are used in the source text.\n"
           << "12. Output Requirements: Provide only the translated text enclosed within " << kOpenMarker << kCloseMarker
           << ". Do not add explanations, notes, comments, or any additional text outside of this.\n";

    int next = 13;
    if (!glossary.empty()) {
        prompt << next++ << ". Glossary: Use the following glossary to ensure accurate translations:\n" << glossary << "\n";
    }
    if (hasDelimiters) {
        prompt << next++ << ". Segment separators: The source text contains ASCII record separator characters (0x1E) between "
               << "independently formatted spans. Keep every separator, in the same order, between the corresponding translated spans.\n";
    }

    prompt << "\n<example>\n"
           << "Translate the text enclosed in <source_text></source_text> from English to German.\n"
           << "<context>Imagine this text is part of a \"Contact Us\" section on the US website of a company that also operates in Germany.</context>\n"
           << "<source_text>Visit our website at www.example.com or call us at +1-555-123-4567.</source_text>\n"
           << kOpenMarker << "Besuchen Sie unsere Website unter www.example.com oder rufen Sie uns an unter +1-555-123-4567." << kCloseMarker << "\n"
           << "</example>\n\n"
           << "Translate the text enclosed in <source_text></source_text> from " << sourceLanguage
           << " to " << request.targetLanguage << ".\n\n"
           << "<context>" << request.context << "</context>\n"
           << "<source_text>" << request.text << "</source_text>\n"
           << kOpenMarker;

    return prompt.str();
}

std::string PromptBuilder::buildDetectionPrompt(const std::string& text) {
    // A short sample is enough to identify the language
    std::size_t sampleEnd = std::min<std::size_t>(text.size(), 500);
    while (sampleEnd < text.size() && sampleEnd > 0 && (static_cast<unsigned char>(text[sampleEnd]) & 0xC0) == 0x80) {
        --sampleEnd;
    }
    std::string sample = text.substr(0, sampleEnd);

    std::ostringstream prompt;
    prompt << "Identify the language of the text enclosed in <source_text></source_text>. "
           << "Answer with the two-letter ISO 639-1 code only, without any other text.\n\n"
           << "<source_text>" << sample << "</source_text>\n"
           << "Language code:";
    return prompt.str();
}

std::string PromptBuilder::cleanResponse(const std::string& raw) {
    std::string text = trimWhitespace(raw);

    // The prompt already opened the wrapper, but models often repeat it
    const std::size_t openLength = std::strlen(kOpenMarker);
    if (text.compare(0, openLength, kOpenMarker) == 0) {
        text.erase(0, openLength);
    }

    const std::size_t close = text.find(kCloseMarker);
    if (close != std::string::npos) {
        text.erase(close);
    }

    return applyOrthography(trimWhitespace(text));
}

std::string PromptBuilder::applyOrthography(const std::string& text) {
    std::string result = text;
    for (const auto& substitution : kOrthographicSubstitutions) {
        result = replaceAll(result, substitution.first, substitution.second);
    }
    return result;
}
