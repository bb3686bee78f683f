/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests for RespiratoryPipeline
 *
 * Dùng artifact rừng nhỏ (test_helpers.h) ghi ra thư mục tạm: cây tách
 * theo spectral_centroid_mean, nên tone 1 kHz => COPD, im lặng => Healthy.
 */

#include "Config.h"
#include "Errors.h"
#include "Pipeline.h"
#include "ResultSerializer.h"
#include "test_helpers.h"

#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace acoustix;
using namespace acoustix::test;

// ============================================================================
// TEST HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Ghi artifact test ra file tạm, trả về đường dẫn
 */
std::string writeTestModel() {
    fs::path path = fs::temp_directory_path() / "acoustix_test_forest.txt";
    std::ofstream file(path);
    file << centroidForestArtifact();
    return path.string();
}

PipelineConfig testConfig(const std::string& modelPath) {
    PipelineConfig config;
    config.modelPath = modelPath;
    return config;
}

ByteBuffer toneWav(float frequency, uint32_t sampleRate, float duration) {
    return buildWav16(generateSineWave(frequency, sampleRate, duration, 0.5f), sampleRate, 1);
}

ByteBuffer silentWav(float duration) {
    return buildWav16(std::vector<float>(static_cast<size_t>(16000 * duration), 0.0f), 16000, 1);
}

bool sameResult(const ClassificationResult& a, const ClassificationResult& b) {
    return a.condition == b.condition && a.label == b.label &&
           a.confidence == b.confidence && a.probabilities == b.probabilities;
}

// ============================================================================
// PIPELINE TESTS
// ============================================================================

/**
 * Test 1: Tone 1 kHz (44.1 kHz, dài hơn 7.86 s) => COPD
 */
bool testToneEndToEnd(const std::string& modelPath) {
    std::cout << "\n[TEST] End-to-end tonal recording..." << std::endl;

    RespiratoryPipeline pipeline(testConfig(modelPath));
    bool ready = pipeline.isReady();

    ClassificationResult result = pipeline.classify(toneWav(1000.0f, 44100, 8.5f), "audio/wav");
    std::cout << "  Result: " << resultToJson(result) << std::endl;

    double sum = 0.0;
    for (float p : result.probabilities) sum += p;

    bool success = ready && result.label == "COPD" &&
                   std::fabs(result.confidence - 1.0f) < 1e-6f &&
                   std::fabs(sum - 1.0) < 1e-5;
    std::cout << "  Tone test: " << (success ? "PASS" : "FAIL") << std::endl;
    return success;
}

/**
 * Test 2: Im lặng (cổng tắt) vẫn được phân loại
 */
bool testSilentEndToEnd(const std::string& modelPath) {
    std::cout << "\n[TEST] End-to-end silent recording..." << std::endl;

    RespiratoryPipeline pipeline(testConfig(modelPath));
    ClassificationResult result = pipeline.classify(silentWav(2.0f));
    std::cout << "  Result: " << result.describe() << std::endl;

    bool success = result.label == "Healthy" &&
                   std::fabs(result.confidence - 0.875f) < 1e-6f &&
                   std::fabs(result.probabilityOf(RespiratoryCondition::ASTHMA) - 0.125f) < 1e-6f;
    std::cout << "  Silent test: " << (success ? "PASS" : "FAIL") << std::endl;
    return success;
}

/**
 * Test 3: Cổng im lặng bật => InvalidAudioError
 */
bool testSilenceGate(const std::string& modelPath) {
    std::cout << "\n[TEST] Silence gate..." << std::endl;

    PipelineConfig config = testConfig(modelPath);
    config.rejectSilence = true;
    RespiratoryPipeline pipeline(config);

    bool rejected = false;
    try {
        pipeline.classify(silentWav(2.0f));
    } catch (const InvalidAudioError& e) {
        rejected = e.status() == 422;
    }

    StatisticsSnapshot stats = pipeline.getStatistics();
    bool counted = stats.failuresOf(ErrorKind::INVALID_AUDIO) == 1 && stats.cache.size == 0;

    bool success = rejected && counted;
    std::cout << "  Silence gate test: " << (success ? "PASS" : "FAIL") << std::endl;
    return success;
}

/**
 * Test 4: Cùng payload => cùng kết quả, lần thứ hai lấy từ cache
 */
bool testDeterminismAndCache(const std::string& modelPath) {
    std::cout << "\n[TEST] Determinism and cache hit..." << std::endl;

    RespiratoryPipeline pipeline(testConfig(modelPath));
    ByteBuffer wav = toneWav(700.0f, 16000, 8.0f);

    ClassificationResult first = pipeline.classify(wav);
    ClassificationResult second = pipeline.classify(wav);

    StatisticsSnapshot stats = pipeline.getStatistics();
    bool cacheOk = stats.cache.hits == 1 && stats.cache.misses == 1 && stats.cache.size == 1;

    // Tính lại sau khi xóa cache phải cho kết quả giống hệt
    pipeline.clearCache();
    ClassificationResult recomputed = pipeline.classify(wav);

    bool sameOk = sameResult(first, second) && sameResult(first, recomputed);

    std::cout << "  Cache hit on repeat: " << (cacheOk ? "OK" : "FAIL") << std::endl;
    std::cout << "  Identical results: " << (sameOk ? "OK" : "FAIL") << std::endl;

    bool success = cacheOk && sameOk;
    std::cout << "  Determinism test: " << (success ? "PASS" : "FAIL") << std::endl;
    return success;
}

/**
 * Test 5: Payload rỗng và payload không giải mã được
 */
bool testInvalidPayloads(const std::string& modelPath) {
    std::cout << "\n[TEST] Invalid payloads..." << std::endl;

    RespiratoryPipeline pipeline(testConfig(modelPath));

    bool emptyRejected = false;
    try {
        pipeline.classify(ByteBuffer{});
    } catch (const DecodeError&) {
        emptyRejected = true;
    }

    ByteBuffer garbage(4096, 0x42);
    bool garbageRejected = false;
    try {
        pipeline.classify(garbage, "audio/wav");
    } catch (const DecodeError&) {
        garbageRejected = true;
    }

    StatisticsSnapshot stats = pipeline.getStatistics();
    bool countedOk = stats.requests == 2 && stats.succeeded == 0 &&
                     stats.failuresOf(ErrorKind::DECODE) == 2 && stats.cache.size == 0;

    bool success = emptyRejected && garbageRejected && countedOk;
    std::cout << "  Invalid payload test: " << (success ? "PASS" : "FAIL") << std::endl;
    return success;
}

/**
 * Test 6: Model thiếu => ModelUnavailableError trước cả khi giải mã
 */
bool testModelUnavailable() {
    std::cout << "\n[TEST] Model unavailable..." << std::endl;

    RespiratoryPipeline pipeline(testConfig("/nonexistent/acoustix/forest.txt"));
    bool notReady = !pipeline.isReady();

    bool emptyGivesUnavailable = false;
    try {
        pipeline.classify(ByteBuffer{});
    } catch (const ModelUnavailableError& e) {
        emptyGivesUnavailable = e.status() == 503;
    } catch (const DecodeError&) {
        emptyGivesUnavailable = false;
    }

    bool validGivesUnavailable = false;
    try {
        pipeline.classify(silentWav(1.0f));
    } catch (const ModelUnavailableError&) {
        validGivesUnavailable = true;
    }

    // Đặc trưng vẫn tính được khi không có model
    FeatureVector features = pipeline.extractFeatures(toneWav(440.0f, 16000, 2.0f));
    bool featuresOk = features.size() == 30 && features.isFinite();

    StatisticsSnapshot stats = pipeline.getStatistics();
    bool countedOk = stats.failuresOf(ErrorKind::MODEL_UNAVAILABLE) == 2;

    std::cout << "  Not ready: " << (notReady ? "OK" : "FAIL") << std::endl;
    std::cout << "  Checked before decode: " << (emptyGivesUnavailable ? "OK" : "FAIL") << std::endl;
    std::cout << "  Features without model: " << (featuresOk ? "OK" : "FAIL") << std::endl;

    bool success = notReady && emptyGivesUnavailable && validGivesUnavailable &&
                   featuresOk && countedOk;
    std::cout << "  Model unavailable test: " << (success ? "PASS" : "FAIL") << std::endl;
    return success;
}

/**
 * Test 7: Classifier dùng chung giữa hai pipeline, bộ đếm độ trễ
 */
bool testSharedClassifierAndStats(const std::string& modelPath) {
    std::cout << "\n[TEST] Shared classifier and statistics..." << std::endl;

    auto classifier = std::make_shared<const Classifier>(Classifier::load(modelPath));
    PipelineConfig config = testConfig(modelPath);
    config.cacheMaxSize = 1;

    RespiratoryPipeline first(config, classifier);
    RespiratoryPipeline second(config, classifier);

    ByteBuffer tone = toneWav(1000.0f, 16000, 8.0f);
    ByteBuffer silence = silentWav(1.0f);

    ClassificationResult a = first.classify(tone);
    ClassificationResult b = second.classify(tone);
    first.classify(silence);    // đẩy tone ra khỏi cache dung lượng 1

    StatisticsSnapshot stats = first.getStatistics();
    bool evictedOk = stats.cache.evictions == 1 && stats.cache.size == 1;
    bool latencyOk = stats.latencySamples == 2 && stats.avgLatencyMs > 0.0 &&
                     stats.p95LatencyMs >= stats.avgLatencyMs * 0.5;
    bool sharedOk = sameResult(a, b) && &first.getClassifier() == &second.getClassifier();

    std::string json = statisticsToJson(stats, first.isReady());
    std::cout << "  " << json << std::endl;
    bool jsonOk = json.find("\"requests\":2") != std::string::npos &&
                  json.find("\"status\":\"ok\"") != std::string::npos;

    bool success = evictedOk && latencyOk && sharedOk && jsonOk;
    std::cout << "  Shared classifier test: " << (success ? "PASS" : "FAIL") << std::endl;
    return success;
}

/// true nếu pipeline từ chối cấu hình bằng std::invalid_argument
bool isRejected(const PipelineConfig& config) {
    try {
        RespiratoryPipeline pipeline(config);
    } catch (const std::invalid_argument& e) {
        std::cout << "  Rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

/**
 * Test 8: Cấu hình không hợp lệ bị từ chối khi khởi tạo
 */
bool testInvalidConfig(const std::string& modelPath) {
    std::cout << "\n[TEST] Invalid configuration..." << std::endl;

    PipelineConfig zeroCache = testConfig(modelPath);
    zeroCache.cacheMaxSize = 0;

    // duration x sample_rate < 1 mẫu
    PipelineConfig tinyDuration = testConfig(modelPath);
    tinyDuration.targetDurationSec = 1e-6;

    // Nyquist 6400 Hz không vượt biên dải contrast cao nhất (6400 Hz)
    PipelineConfig lowRate = testConfig(modelPath);
    lowRate.targetSampleRate = 12800;

    PipelineConfig telephoneRate = testConfig(modelPath);
    telephoneRate.targetSampleRate = 8000;

    // 16 kHz vẫn hợp lệ
    PipelineConfig minimalRate = testConfig(modelPath);
    minimalRate.targetSampleRate = 16000;
    minimalRate.targetDurationSec = 1.0;

    bool zeroOk = isRejected(zeroCache);
    bool durationOk = isRejected(tinyDuration);
    bool rateOk = isRejected(lowRate) && isRejected(telephoneRate);
    bool validOk = !isRejected(minimalRate);

    std::cout << "  Zero cache: " << (zeroOk ? "OK" : "FAIL") << std::endl;
    std::cout << "  Sub-sample duration: " << (durationOk ? "OK" : "FAIL") << std::endl;
    std::cout << "  Sample rate too low: " << (rateOk ? "OK" : "FAIL") << std::endl;
    std::cout << "  16 kHz accepted: " << (validOk ? "OK" : "FAIL") << std::endl;

    bool success = zeroOk && durationOk && rateOk && validOk;
    std::cout << "  Invalid config test: " << (success ? "PASS" : "FAIL") << std::endl;
    return success;
}

/**
 * Test 9: 8 thread dùng chung một pipeline (cache dung lượng 2)
 *
 * Mỗi kết quả phải giống hệt kết quả tuần tự; bộ đếm cache khớp số request.
 */
bool testConcurrentClassification(const std::string& modelPath) {
    std::cout << "\n[TEST] Concurrent classification..." << std::endl;

    const size_t NUM_THREADS = 8;
    const size_t ROUNDS = 2;

    const std::vector<ByteBuffer> payloads = {
        toneWav(1000.0f, 16000, 8.0f),
        silentWav(1.0f),
        toneWav(300.0f, 22050, 3.0f)
    };

    auto classifier = std::make_shared<const Classifier>(Classifier::load(modelPath));
    PipelineConfig config = testConfig(modelPath);
    config.cacheMaxSize = 2;
    config.numThreads = 1;

    // Kết quả tham chiếu, tính tuần tự
    RespiratoryPipeline sequential(config, classifier);
    std::vector<ClassificationResult> expected;
    for (const auto& payload : payloads) {
        expected.push_back(sequential.classify(payload));
    }

    RespiratoryPipeline shared(config, classifier);
    std::vector<std::vector<std::pair<size_t, ClassificationResult>>> results(NUM_THREADS);
    std::atomic<int> errors{0};

    std::vector<std::thread> workers;
    for (size_t t = 0; t < NUM_THREADS; ++t) {
        workers.emplace_back([&, t]() {
            try {
                for (size_t round = 0; round < ROUNDS; ++round) {
                    for (size_t i = 0; i < payloads.size(); ++i) {
                        size_t index = (t + i + round) % payloads.size();
                        results[t].emplace_back(index, shared.classify(payloads[index]));
                    }
                }
            } catch (const AcoustixError& e) {
                std::cerr << "  Worker " << t << " failed: " << e.what() << std::endl;
                ++errors;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    size_t mismatches = 0;
    size_t completed = 0;
    for (const auto& perThread : results) {
        for (const auto& entry : perThread) {
            ++completed;
            if (!sameResult(entry.second, expected[entry.first])) ++mismatches;
        }
    }

    const uint64_t requests = NUM_THREADS * ROUNDS * payloads.size();
    StatisticsSnapshot stats = shared.getStatistics();

    bool resultsOk = errors == 0 && completed == requests && mismatches == 0;
    bool countersOk = stats.requests == requests && stats.succeeded == requests &&
                      stats.cache.hits + stats.cache.misses == requests;
    bool sizeOk = stats.cache.size <= 2 && stats.cache.capacity == 2;

    std::cout << "  Cache hits: " << stats.cache.hits << ", misses: " << stats.cache.misses
              << ", evictions: " << stats.cache.evictions << std::endl;
    std::cout << "  Identical to sequential: " << (resultsOk ? "OK" : "FAIL") << std::endl;
    std::cout << "  Counters consistent: " << (countersOk ? "OK" : "FAIL") << std::endl;
    std::cout << "  Size within capacity: " << (sizeOk ? "OK" : "FAIL") << std::endl;

    bool success = resultsOk && countersOk && sizeOk;
    std::cout << "  Concurrent classification test: " << (success ? "PASS" : "FAIL") << std::endl;
    return success;
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Pipeline Integration Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    const std::string modelPath = writeTestModel();
    std::cout << "Test model: " << modelPath << std::endl;

    int passed = 0;
    int total = 9;

    try {
        if (testToneEndToEnd(modelPath)) passed++;
        if (testSilentEndToEnd(modelPath)) passed++;
        if (testSilenceGate(modelPath)) passed++;
        if (testDeterminismAndCache(modelPath)) passed++;
        if (testInvalidPayloads(modelPath)) passed++;
        if (testModelUnavailable()) passed++;
        if (testSharedClassifierAndStats(modelPath)) passed++;
        if (testInvalidConfig(modelPath)) passed++;
        if (testConcurrentClassification(modelPath)) passed++;
    } catch (const AcoustixError& e) {
        std::cerr << "Unexpected " << e.name() << ": " << e.what() << std::endl;
    }

    std::error_code ec;
    fs::remove(modelPath, ec);

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
