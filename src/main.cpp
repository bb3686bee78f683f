/**
 * @file main.cpp
 * @brief Command-line front end for the Acoustix respiratory classifier
 *
 * Đọc file âm thanh vào bộ nhớ, gọi RespiratoryPipeline và in kết quả
 * dạng JSON (mỗi file một dòng).
 *
 * Usage:
 *   ./acoustix_classify recording.wav                 # Phân loại một file
 *   ./acoustix_classify a.wav b.flac --stats          # Nhiều file + bộ đếm
 *   ./acoustix_classify --features recording.wav      # In 30 cột đặc trưng
 *   ./acoustix_classify --classes                     # Danh sách lớp
 *
 * Exit code: 0 thành công, 1 lỗi input, 2 lỗi nội bộ, 3 model không sẵn sàng.
 */

#include "AudioDecoder.hpp"
#include "Common.h"
#include "Config.h"
#include "Errors.h"
#include "Pipeline.h"
#include "ResultSerializer.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace acoustix;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USER_ERROR = 1;
constexpr int EXIT_INTERNAL_ERROR = 2;
constexpr int EXIT_MODEL_UNAVAILABLE = 3;

/**
 * @brief Tùy chọn dòng lệnh (áp dụng sau file cấu hình và biến môi trường)
 */
struct CliOptions {
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;  ///< key -> value
    std::vector<std::string> files;
    bool showHelp = false;
    bool listClasses = false;
    bool dumpFeatures = false;
    bool showStats = false;
    bool showInfo = false;
    bool pretty = false;
};

void printBanner(std::ostream& out) {
    out << "\n";
    out << "╔══════════════════════════════════════════════════════════════╗\n";
    out << "║     Acoustix - Respiratory Sound Classifier v" << ACOUSTIX_VERSION_STRING
        << "           ║\n";
    out << "║     Decode | Normalize | Descriptors | Random Forest         ║\n";
    out << "╚══════════════════════════════════════════════════════════════╝\n";
    out << "\n";
}

void printUsage(const char* programName) {
    printBanner(std::cout);
    std::cout << "Usage: " << programName << " [options] <audio file>...\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --help, -h            Show this help message\n";
    std::cout << "  --model <path>        Forest artifact (.txt or .onnx)\n";
    std::cout << "  --config <path>       Read 'key = value' configuration file\n";
    std::cout << "  --cache <n>           Prediction cache capacity (default "
              << DEFAULT_CACHE_MAX_SIZE << ")\n";
    std::cout << "  --rate <hz>           Target sample rate (default "
              << DEFAULT_TARGET_SAMPLE_RATE << ")\n";
    std::cout << "  --threads <n>         OpenMP threads for feature extraction\n";
    std::cout << "  --reject-silence      Reject recordings with no signal\n";
    std::cout << "  --verbose, -v         Log every processing stage\n";
    std::cout << "  --pretty              Indent JSON output\n";
    std::cout << "  --classes             List the condition labels\n";
    std::cout << "  --features            Print the 30 feature columns instead of classifying\n";
    std::cout << "  --stats               Print pipeline counters after processing\n";
    std::cout << "  --info                Show configuration and model summary\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  ACOUSTIX_MODEL_PATH, ACOUSTIX_CACHE_MAX_SIZE, ACOUSTIX_SAMPLE_RATE,\n";
    std::cout << "  ACOUSTIX_REJECT_SILENCE, ACOUSTIX_VERBOSE\n";
    std::cout << "\n";
    std::cout << "Exit codes: 0 ok, 1 invalid input, 2 internal error, 3 model unavailable\n";
    std::cout << "\n";
}

/**
 * @brief Phân tích tham số
 * @throws std::invalid_argument nếu option thiếu giá trị hoặc không biết
 */
CliOptions parseArguments(int argc, char* argv[]) {
    CliOptions options;

    auto requireValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Option " + flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        }
        else if (arg == "--model") {
            options.overrides.emplace_back("model_path", requireValue(i, arg));
        }
        else if (arg == "--config") {
            options.configPath = requireValue(i, arg);
        }
        else if (arg == "--cache") {
            options.overrides.emplace_back("cache_max_size", requireValue(i, arg));
        }
        else if (arg == "--rate") {
            options.overrides.emplace_back("sample_rate", requireValue(i, arg));
        }
        else if (arg == "--threads") {
            options.overrides.emplace_back("threads", requireValue(i, arg));
        }
        else if (arg == "--reject-silence") {
            options.overrides.emplace_back("reject_silence", "true");
        }
        else if (arg == "--verbose" || arg == "-v") {
            options.overrides.emplace_back("verbose", "true");
        }
        else if (arg == "--pretty") {
            options.pretty = true;
        }
        else if (arg == "--classes") {
            options.listClasses = true;
        }
        else if (arg == "--features") {
            options.dumpFeatures = true;
        }
        else if (arg == "--stats") {
            options.showStats = true;
        }
        else if (arg == "--info") {
            options.showInfo = true;
        }
        else if (arg.rfind("-", 0) == 0) {
            throw std::invalid_argument("Unknown option: " + arg);
        }
        else {
            options.files.push_back(arg);
        }
    }
    return options;
}

/**
 * @brief Ghép cấu hình: mặc định -> file -> môi trường -> dòng lệnh
 */
PipelineConfig buildConfig(const CliOptions& options) {
    PipelineConfig config;
    if (!options.configPath.empty()) {
        loadConfigFile(options.configPath, config);
    }
    applyEnvironment(config);
    for (const auto& kv : options.overrides) {
        applyConfigValue(config, kv.first, kv.second);
    }
    validateConfig(config);
    return config;
}

/**
 * @brief Đọc toàn bộ file vào bộ nhớ
 * @return false nếu không mở được
 */
bool readFileBytes(const std::string& path, ByteBuffer& bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

int exitCodeFor(const AcoustixError& error) {
    if (error.kind() == ErrorKind::MODEL_UNAVAILABLE) {
        return EXIT_MODEL_UNAVAILABLE;
    }
    return error.isClientError() ? EXIT_USER_ERROR : EXIT_INTERNAL_ERROR;
}

/**
 * @brief Xử lý một file: phân loại hoặc in đặc trưng
 * @return Exit code cho file này
 */
int processFile(RespiratoryPipeline& pipeline, const std::string& path,
                const CliOptions& options) {
    ByteBuffer bytes;
    if (!readFileBytes(path, bytes)) {
        std::cerr << "[main] Cannot read file: " << path << "\n";
        return EXIT_USER_ERROR;
    }

    const std::string hint = AudioDecoder::mediaTypeFromFilename(path);

    try {
        if (options.dumpFeatures) {
            FeatureVector features = pipeline.extractFeatures(bytes, hint);
            std::cout << featuresToJson(features, options.pretty) << "\n";
        } else {
            ClassificationResult result = pipeline.classify(bytes, hint);
            std::cout << resultToJson(result, options.pretty) << "\n";
        }
        return EXIT_OK;
    }
    catch (const AcoustixError& e) {
        std::cout << errorToJson(e) << "\n";
        return exitCodeFor(e);
    }
}

} // anonymous namespace

/**
 * @brief Main function
 */
int main(int argc, char* argv[]) {
    CliOptions options;
    PipelineConfig config;

    try {
        options = parseArguments(argc, argv);
        if (options.showHelp) {
            printUsage(argv[0]);
            return EXIT_OK;
        }
        config = buildConfig(options);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return EXIT_USER_ERROR;
    }

    if (options.listClasses) {
        std::cout << classesToJson() << "\n";
        if (options.files.empty() && !options.showInfo) {
            return EXIT_OK;
        }
    }

    if (options.files.empty() && !options.showInfo && !options.showStats) {
        printUsage(argv[0]);
        return EXIT_USER_ERROR;
    }

    try {
        RespiratoryPipeline pipeline(config);

        if (options.showInfo) {
            printBanner(std::cout);
            config.print();
            std::cout << "Model: " << pipeline.getClassifier().describe() << "\n\n";
        }

        int exitCode = EXIT_OK;
        for (const auto& path : options.files) {
            exitCode = std::max(exitCode, processFile(pipeline, path, options));
        }

        if (options.showStats) {
            std::cout << statisticsToJson(pipeline.getStatistics(), pipeline.isReady(),
                                          options.pretty) << "\n";
        }
        return exitCode;
    }
    catch (const AcoustixError& e) {
        std::cout << errorToJson(e) << "\n";
        return exitCodeFor(e);
    }
    catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << "\n";
        return EXIT_INTERNAL_ERROR;
    }
}
