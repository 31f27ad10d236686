#include "RetryingTranslationService.h"
#include "TranslationErrors.h"

#include <iostream>
#include <thread>

RetryingTranslationService::RetryingTranslationService(std::unique_ptr<TranslationService> inner, int maxRetries, std::chrono::milliseconds initialBackoff)
    : inner(std::move(inner)),
      maxRetries(maxRetries < 0 ? 0 : maxRetries),
      initialBackoff(initialBackoff),
      sleep([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {}

std::string RetryingTranslationService::translate(const TranslationRequest& request) {
    std::chrono::milliseconds delay = initialBackoff;
    for (int attempt = 0;; ++attempt) {
        try {
            return inner->translate(request);
        } catch (const TranslationServiceError& e) {
            if (attempt >= maxRetries) {
                throw;
            }
            std::cerr << "Translation request failed (attempt " << attempt + 1 << " of " << maxRetries + 1
                      << "): " << e.what() << ". Retrying in " << delay.count() << " ms\n";
        }
        sleep(delay);
        delay *= 2;
    }
}

std::unique_ptr<TranslationService> RetryingTranslationService::clone() const {
    auto copy = std::make_unique<RetryingTranslationService>(inner->clone(), maxRetries, initialBackoff);
    copy->setSleeper(sleep);
    return copy;
}
