#pragma once

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <streambuf>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "src/AppConfig.h"
#include "src/BatchRunner.h"
#include "src/LlmTranslationService.h"
#include "src/RetryingTranslationService.h"
#include "src/TranslatorFactory.h"

// Discards everything written to it, used for --quiet
class NullBuffer : public std::streambuf {
protected:
    int overflow(int c) override { return traits_type::not_eof(c); }
};
