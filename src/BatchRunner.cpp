#include "BatchRunner.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <thread>

BatchRunner::BatchRunner(const TranslatorFactory& factory, std::size_t workers)
    : factory(factory), workers(workers == 0 ? 1 : workers) {}

std::vector<DocumentResult> BatchRunner::run(const std::vector<DocumentJob>& jobs) const {
    std::vector<DocumentResult> results(jobs.size());
    if (jobs.empty()) {
        return results;
    }

    const std::size_t workersUsed = std::min(workers, jobs.size());
    std::atomic<std::size_t> nextIndex{0};

    auto workerFn = [&]() {
        while (true) {
            const std::size_t index = nextIndex.fetch_add(1, std::memory_order_relaxed);
            if (index >= jobs.size()) {
                return;
            }
            results[index] = translateOne(jobs[index]);
        }
    };

    if (workersUsed == 1) {
        workerFn();
        return results;
    }

    std::vector<std::thread> pool;
    pool.reserve(workersUsed);
    for (std::size_t i = 0; i < workersUsed; ++i) {
        pool.emplace_back(workerFn);
    }
    for (auto& thread : pool) {
        thread.join();
    }

    return results;
}

DocumentResult BatchRunner::translateOne(const DocumentJob& job) const {
    DocumentResult result;
    result.inputPath = job.inputPath;
    result.outputPath = job.outputPath;

    if (cancelFlag != nullptr && cancelFlag->load()) {
        result.error = "Translation cancelled";
        return result;
    }

    std::unique_ptr<Translator> translator;
    try {
        translator = factory.createTranslator(job.inputPath);
    } catch (const std::exception& e) {
        result.error = e.what();
        std::cerr << "Skipping " << job.inputPath << ": " << result.error << "\n";
        return result;
    }

    translator->setCancellationFlag(cancelFlag);
    result.succeeded = translator->run(job.inputPath, job.outputPath) == 0;
    result.error = translator->lastError();
    result.report = translator->lastReport();
    return result;
}
