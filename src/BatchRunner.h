#pragma once

#include "TranslationDriver.h"
#include "TranslationReport.h"
#include "TranslatorFactory.h"

#include <cstddef>
#include <string>
#include <vector>

struct DocumentJob {
    std::string inputPath;
    std::string outputPath;
};

struct DocumentResult {
    std::string inputPath;
    std::string outputPath;
    bool succeeded = false;
    std::string error;
    TranslationReport report;
};

// Translates independent documents on a pool of worker threads. Each document
// is handled by one worker from start to finish with its own translator.
class BatchRunner {
public:
    BatchRunner(const TranslatorFactory& factory, std::size_t workers);

    void setCancellationFlag(const CancellationFlag* flag) { cancelFlag = flag; }

    // Results are returned in job order
    std::vector<DocumentResult> run(const std::vector<DocumentJob>& jobs) const;

protected:
    DocumentResult translateOne(const DocumentJob& job) const;

private:
    const TranslatorFactory& factory;
    std::size_t workers;
    const CancellationFlag* cancelFlag = nullptr;
};
