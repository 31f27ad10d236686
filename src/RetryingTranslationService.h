#pragma once

#include "TranslationService.h"

#include <chrono>
#include <functional>
#include <memory>

// Retries a failing capability call with exponential backoff. Only
// TranslationServiceError is retried; the last one is rethrown once the
// attempts are used up.
class RetryingTranslationService : public TranslationService {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryingTranslationService(std::unique_ptr<TranslationService> inner, int maxRetries, std::chrono::milliseconds initialBackoff);

    // Tests replace the sleeper to avoid waiting
    void setSleeper(Sleeper sleeper) { sleep = std::move(sleeper); }

    std::string translate(const TranslationRequest& request) override;
    std::unique_ptr<TranslationService> clone() const override;

private:
    std::unique_ptr<TranslationService> inner;
    int maxRetries;
    std::chrono::milliseconds initialBackoff;
    Sleeper sleep;
};
