/**
 * @file Config.cpp
 * @brief Loading and validation of PipelineConfig
 */

#include "Config.h"
#include "FeatureExtraction.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace acoustix {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument("Invalid boolean for '" + key + "': " + value);
}

long long parseInteger(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for '" + key + "': " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid integer for '" + key + "': " + value);
    }
    return parsed;
}

double parseReal(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for '" + key + "': " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid number for '" + key + "': " + value);
    }
    return parsed;
}

size_t parsePositiveSize(const std::string& key, const std::string& value) {
    long long parsed = parseInteger(key, value);
    if (parsed <= 0) {
        throw std::invalid_argument("'" + key + "' must be positive, got " + value);
    }
    return static_cast<size_t>(parsed);
}

} // anonymous namespace

// ============================================================================
// PipelineConfig
// ============================================================================

void PipelineConfig::print() const {
    std::cout << "[Config] Pipeline configuration:\n";
    std::cout << "  - Model path:      " << modelPath << "\n";
    std::cout << "  - Cache max size:  " << cacheMaxSize << "\n";
    std::cout << "  - Sample rate:     " << targetSampleRate << " Hz\n";
    std::cout << "  - Duration:        " << targetDurationSec << " s ("
              << targetSampleCount() << " samples)\n";
    std::cout << "  - Silence gate:    " << (rejectSilence ? "on" : "off")
              << " (threshold " << silenceThreshold << ")\n";
    std::cout << "  - Threads:         " << (numThreads > 0 ? std::to_string(numThreads)
                                                            : std::string("runtime default"))
              << "\n";
}

// ============================================================================
// LOADING
// ============================================================================

void applyConfigValue(PipelineConfig& config, const std::string& key,
                      const std::string& value) {
    if (key == "model_path") {
        config.modelPath = value;
    } else if (key == "cache_max_size") {
        config.cacheMaxSize = parsePositiveSize(key, value);
    } else if (key == "sample_rate") {
        config.targetSampleRate = static_cast<uint32_t>(parsePositiveSize(key, value));
    } else if (key == "duration") {
        config.targetDurationSec = parseReal(key, value);
    } else if (key == "reject_silence") {
        config.rejectSilence = parseBool(key, value);
    } else if (key == "silence_threshold") {
        config.silenceThreshold = static_cast<float>(parseReal(key, value));
    } else if (key == "threads") {
        config.numThreads = static_cast<int>(parseInteger(key, value));
    } else if (key == "verbose") {
        config.verbose = parseBool(key, value);
    } else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
}

void loadConfigFile(const std::string& path, PipelineConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        size_t eq = content.find('=');
        if (eq == std::string::npos) {
            std::ostringstream oss;
            oss << path << ":" << lineNumber << ": expected 'key = value'";
            throw std::invalid_argument(oss.str());
        }

        std::string key = trim(content.substr(0, eq));
        std::string value = trim(content.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        applyConfigValue(config, key, value);
    }
}

void applyEnvironment(PipelineConfig& config) {
    struct EnvBinding {
        const char* variable;
        const char* key;
    };
    static const EnvBinding bindings[] = {
        {"ACOUSTIX_MODEL_PATH", "model_path"},
        {"ACOUSTIX_CACHE_MAX_SIZE", "cache_max_size"},
        {"ACOUSTIX_SAMPLE_RATE", "sample_rate"},
        {"ACOUSTIX_REJECT_SILENCE", "reject_silence"},
        {"ACOUSTIX_VERBOSE", "verbose"},
    };

    for (const auto& binding : bindings) {
        const char* value = std::getenv(binding.variable);
        if (value != nullptr && value[0] != '\0') {
            applyConfigValue(config, binding.key, value);
        }
    }
}

void validateConfig(const PipelineConfig& config) {
    if (config.cacheMaxSize == 0) {
        throw std::invalid_argument("cache_max_size must be at least 1");
    }
    if (config.targetSampleRate == 0) {
        throw std::invalid_argument("sample_rate must be positive");
    }
    if (!(config.targetDurationSec > 0.0)) {
        throw std::invalid_argument("duration must be positive");
    }
    if (config.targetSampleCount() < 1) {
        throw std::invalid_argument("duration x sample_rate must cover at least one sample");
    }

    // Biên octave cao nhất của spectral contrast phải nằm dưới Nyquist
    const double topContrastEdge =
        DEFAULT_CONTRAST_FMIN * std::pow(2.0, DEFAULT_CONTRAST_BANDS - 1);
    if (config.targetSampleRate / 2.0 <= topContrastEdge) {
        throw std::invalid_argument("sample_rate must exceed " +
                                    std::to_string(static_cast<int>(2.0 * topContrastEdge)) +
                                    " Hz for spectral contrast bands");
    }
    if (config.silenceThreshold < 0.0f) {
        throw std::invalid_argument("silence_threshold must not be negative");
    }
    if (config.numThreads < 0) {
        throw std::invalid_argument("threads must not be negative");
    }
}

} // namespace acoustix
