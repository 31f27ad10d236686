#pragma once

#include "LlmClient.h"
#include "TranslationConfig.h"

#include <cstddef>
#include <string>
#include <vector>

struct AppConfig {
    std::vector<std::string> inputPaths;
    std::string outputDir = ".";
    TranslationConfig translation;
    PipelineOptions pipeline;
    LlmSettings llm;
    std::size_t workers = 1;
    bool quiet = false;
};

void print_usage(const char* programName);

// Later arguments override earlier ones, including values read by --config.
// Returns false with error set; error is "help" when usage was requested.
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

// Reads a JSON configuration file into config
bool loadConfigFile(const std::string& path, AppConfig& config, std::string& error);
