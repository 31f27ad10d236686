#include "AppConfig.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>

namespace {

bool parseIntArg(const std::string& key, const std::string& value, int& out, std::string& error) {
    try {
        std::size_t consumed = 0;
        out = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

bool parseSizeArg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    try {
        std::size_t consumed = 0;
        if (!value.empty() && value[0] == '-') {
            throw std::invalid_argument(value);
        }
        out = static_cast<std::size_t>(std::stoull(value, &consumed));
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

Glossary glossaryFromJson(const nlohmann::json& value) {
    if (value.is_string()) {
        return parseGlossary(value.get<std::string>());
    }

    Glossary glossary;
    for (const auto& item : value) {
        GlossaryEntry entry;
        if (item.is_string()) {
            entry.term = item.get<std::string>();
        } else {
            entry.term = item.at("term").get<std::string>();
            entry.definition = item.value("definition", "");
        }
        if (!entry.term.empty()) {
            glossary.push_back(entry);
        }
    }
    return glossary;
}

}  // namespace

void print_usage(const char* programName) {
    std::cout
        << "Usage:\n"
        << "  " << programName << " --input <file> [--input <file> ...] [options]\n\n"
        << "Options:\n"
        << "  --output <dir>          Output directory (default: current directory)\n"
        << "  --config <file>         JSON configuration file\n"
        << "  --source <lang>         Source language, \"auto\" to detect (default: auto)\n"
        << "  --target <lang>         Target language (default: German)\n"
        << "  --tone <tone>           neutral, formal, informal or technical\n"
        << "  --domain <domain>       Subject domain for terminology\n"
        << "  --glossary <list>       Glossary as \"term:definition;term:definition\"\n"
        << "  --max-chunk <n>         Maximum characters per request (default: 5000)\n"
        << "  --overlap <n>           Sentence search window around a cut (default: 200)\n"
        << "  --max-context <n>       Maximum characters of rolling context (default: 1000)\n"
        << "  --unit-mode <mode>      segment or paragraph (default: segment)\n"
        << "  --strict                Abort on the first failed request\n"
        << "  --workers <n>           Documents translated in parallel (default: 1)\n"
        << "  --base-url <url>        Completion endpoint base URL\n"
        << "  --model <name>          Model name\n"
        << "  --api-key <key>         API key (default: $OPENAI_API_KEY)\n"
        << "  --timeout-ms <n>        Per-request timeout in milliseconds\n"
        << "  --retries <n>           Retries per failed request\n"
        << "  --quiet                 Only print warnings and errors\n"
        << "  -h, --help              Show this help\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto requireValue = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input") {
            const std::string value = requireValue(arg);
            if (error.empty()) {
                config.inputPaths.push_back(value);
            }
        } else if (arg == "--output") {
            config.outputDir = requireValue(arg);
        } else if (arg == "--config") {
            const std::string value = requireValue(arg);
            if (error.empty() && !loadConfigFile(value, config, error)) {
                return false;
            }
        } else if (arg == "--source") {
            config.translation.sourceLanguage = requireValue(arg);
        } else if (arg == "--target") {
            config.translation.targetLanguage = requireValue(arg);
        } else if (arg == "--tone") {
            config.translation.tone = parseTone(requireValue(arg));
        } else if (arg == "--domain") {
            config.translation.domain = requireValue(arg);
        } else if (arg == "--glossary") {
            config.translation.glossary = parseGlossary(requireValue(arg));
        } else if (arg == "--max-chunk") {
            if (!parseSizeArg(arg, requireValue(arg), config.pipeline.maxChunkLength, error)) {
                return false;
            }
        } else if (arg == "--overlap") {
            if (!parseSizeArg(arg, requireValue(arg), config.pipeline.overlapWindow, error)) {
                return false;
            }
        } else if (arg == "--max-context") {
            if (!parseSizeArg(arg, requireValue(arg), config.pipeline.maxContextLength, error)) {
                return false;
            }
        } else if (arg == "--unit-mode") {
            const std::string value = requireValue(arg);
            if (error.empty() && !parseUnitMode(value, config.pipeline.unitMode)) {
                error = "Unsupported --unit-mode: " + value + " (supported: segment, paragraph)";
                return false;
            }
        } else if (arg == "--strict") {
            config.pipeline.abortOnFirstFailure = true;
        } else if (arg == "--workers") {
            if (!parseSizeArg(arg, requireValue(arg), config.workers, error)) {
                return false;
            }
        } else if (arg == "--base-url") {
            config.llm.baseUrl = requireValue(arg);
        } else if (arg == "--model") {
            config.llm.model = requireValue(arg);
        } else if (arg == "--api-key") {
            config.llm.apiKey = requireValue(arg);
        } else if (arg == "--timeout-ms") {
            int timeout = 0;
            if (!parseIntArg(arg, requireValue(arg), timeout, error)) {
                return false;
            }
            config.llm.timeoutMs = timeout;
        } else if (arg == "--retries") {
            if (!parseIntArg(arg, requireValue(arg), config.llm.maxRetries, error)) {
                return false;
            }
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.workers == 0) {
        const auto hw = std::thread::hardware_concurrency();
        config.workers = hw == 0 ? 4 : static_cast<std::size_t>(hw);
    }

    if (config.inputPaths.empty()) {
        error = "--input is required";
        return false;
    }
    if (config.pipeline.maxChunkLength == 0) {
        error = "--max-chunk must be greater than zero";
        return false;
    }
    if (config.translation.targetLanguage.empty()) {
        error = "--target must not be empty";
        return false;
    }

    return true;
}

bool loadConfigFile(const std::string& path, AppConfig& config, std::string& error) {
    std::ifstream file(std::filesystem::u8path(path));
    if (!file.is_open()) {
        error = "Failed to open config file: " + path;
        return false;
    }

    try {
        const nlohmann::json json = nlohmann::json::parse(file);

        TranslationConfig& translation = config.translation;
        translation.sourceLanguage = json.value("source_language", translation.sourceLanguage);
        translation.targetLanguage = json.value("target_language", translation.targetLanguage);
        if (json.contains("tone")) {
            translation.tone = parseTone(json["tone"].get<std::string>());
        }
        translation.domain = json.value("domain", translation.domain);
        if (json.contains("glossary")) {
            translation.glossary = glossaryFromJson(json["glossary"]);
        }

        PipelineOptions& pipeline = config.pipeline;
        pipeline.maxChunkLength = json.value("max_chunk_length", pipeline.maxChunkLength);
        pipeline.overlapWindow = json.value("overlap", pipeline.overlapWindow);
        pipeline.maxContextLength = json.value("max_context_length", pipeline.maxContextLength);
        pipeline.abortOnFirstFailure = json.value("strict", pipeline.abortOnFirstFailure);
        if (json.contains("unit_mode")) {
            const std::string mode = json["unit_mode"].get<std::string>();
            if (!parseUnitMode(mode, pipeline.unitMode)) {
                error = "Unsupported unit_mode in " + path + ": " + mode;
                return false;
            }
        }
        config.workers = json.value("workers", config.workers);

        if (json.contains("llm")) {
            const nlohmann::json& llmJson = json["llm"];
            LlmSettings& llm = config.llm;
            llm.baseUrl = llmJson.value("base_url", llm.baseUrl);
            llm.apiKey = llmJson.value("api_key", llm.apiKey);
            llm.model = llmJson.value("model", llm.model);
            llm.temperature = llmJson.value("temperature", llm.temperature);
            llm.topP = llmJson.value("top_p", llm.topP);
            llm.frequencyPenalty = llmJson.value("frequency_penalty", llm.frequencyPenalty);
            llm.presencePenalty = llmJson.value("presence_penalty", llm.presencePenalty);
            llm.maxTokens = llmJson.value("max_tokens", llm.maxTokens);
            llm.timeoutMs = llmJson.value("timeout_ms", llm.timeoutMs);
            llm.maxRetries = llmJson.value("max_retries", llm.maxRetries);
            llm.retryBackoffMs = llmJson.value("retry_backoff_ms", llm.retryBackoffMs);
        }
    } catch (const nlohmann::json::exception& e) {
        error = "Error parsing config file " + path + ": " + e.what();
        return false;
    }

    return true;
}
