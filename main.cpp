#include "main.h"

namespace {

CancellationFlag cancelRequested{false};

void handleSignal(int) {
    cancelRequested.store(true);
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;
    if (!parse_args(argc, argv, config, error)) {
        if (error == "help") {
            print_usage(argv[0]);
            return 0;
        }
        std::cerr << error << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (config.llm.apiKey.empty()) {
        if (const char* key = std::getenv("OPENAI_API_KEY")) {
            config.llm.apiKey = key;
        }
    }

    // With --quiet only std::cerr reaches the terminal
    std::streambuf* originalBuffer = std::cout.rdbuf();
    NullBuffer nullBuffer;
    if (config.quiet) {
        std::cout.rdbuf(&nullBuffer);
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        std::cout.rdbuf(originalBuffer);
        std::cerr << "Failed to initialise curl" << "\n";
        return 1;
    }

    std::error_code ec;
    const std::filesystem::path outputDir = std::filesystem::u8path(config.outputDir);
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        curl_global_cleanup();
        std::cout.rdbuf(originalBuffer);
        std::cerr << "Failed to create output directory " << config.outputDir << ": " << ec.message() << "\n";
        return 1;
    }

    RetryingTranslationService service(std::make_unique<LlmTranslationService>(config.llm), config.llm.maxRetries,
                                       std::chrono::milliseconds(config.llm.retryBackoffMs));
    LlmLanguageDetector detector(config.llm);
    TranslatorFactory factory(service, detector, config.translation, config.pipeline);

    std::vector<DocumentJob> jobs;
    for (const auto& inputPath : config.inputPaths) {
        DocumentJob job;
        job.inputPath = inputPath;
        job.outputPath = (outputDir / TranslatorFactory::outputFileName(inputPath, config.translation.targetLanguage)).string();
        jobs.push_back(job);
    }

    BatchRunner runner(factory, config.workers);
    runner.setCancellationFlag(&cancelRequested);
    const std::vector<DocumentResult> results = runner.run(jobs);

    curl_global_cleanup();

    int failures = 0;
    for (const auto& result : results) {
        if (result.succeeded) {
            std::cout << "Translated " << result.inputPath << " -> " << result.outputPath << "\n";
        } else {
            ++failures;
            std::cerr << "Failed: " << result.inputPath << ": " << result.error << "\n";
        }
    }

    std::cout.rdbuf(originalBuffer); // Restore original std::cout buffer
    return failures == 0 ? 0 : 1;
}
