#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Base class for every fatal pipeline error
class TranslatorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The input archive cannot be opened or lacks a primary body part
class MalformedPackage : public TranslatorError {
public:
    using TranslatorError::TranslatorError;
};

// Writing the output archive failed, nothing was left at the output path
class PackagingError : public TranslatorError {
public:
    using TranslatorError::TranslatorError;
};

// The source had text but the combined translation is empty
class EmptyTranslationResult : public TranslatorError {
public:
    using TranslatorError::TranslatorError;
};

class TranslationCancelled : public TranslatorError {
public:
    TranslationCancelled() : TranslatorError("Translation cancelled") {}
};

// Raised in strict mode when a unit could not be translated
class TranslationFailed : public TranslatorError {
public:
    TranslationFailed(std::size_t unitIndex, const std::string& cause)
        : TranslatorError("Translation failed for unit " + std::to_string(unitIndex) + ": " + cause),
          failedUnit(unitIndex) {}

    std::size_t unitIndex() const { return failedUnit; }

private:
    std::size_t failedUnit;
};

// Errors reported by the external capabilities
class TranslationServiceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class LanguageDetectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
