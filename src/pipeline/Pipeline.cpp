/**
 * @file Pipeline.cpp
 * @brief Implementation of the classification pipeline
 */

#include "Pipeline.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <vector>

namespace acoustix {

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

const PipelineConfig& validated(const PipelineConfig& config) {
    validateConfig(config);
    return config;
}

} // anonymous namespace

// ============================================================================
// PipelineStatistics
// ============================================================================

PipelineStatistics::PipelineStatistics()
    : m_requests(0)
    , m_succeeded(0)
{
    for (auto& counter : m_failures) {
        counter.store(0);
    }
}

void PipelineStatistics::recordSuccess(double latencyMs) {
    ++m_succeeded;

    std::lock_guard<std::mutex> lock(m_latencyMutex);
    m_latencies.push_back(latencyMs);
    if (m_latencies.size() > LATENCY_WINDOW) {
        m_latencies.pop_front();
    }
}

void PipelineStatistics::recordFailure(ErrorKind kind) {
    ++m_failures[static_cast<size_t>(kind)];
}

StatisticsSnapshot PipelineStatistics::snapshot() const {
    StatisticsSnapshot snap;
    snap.requests = m_requests.load();
    snap.succeeded = m_succeeded.load();
    for (size_t i = 0; i < m_failures.size(); ++i) {
        snap.failures[i] = m_failures[i].load();
    }

    std::vector<double> latencies;
    {
        std::lock_guard<std::mutex> lock(m_latencyMutex);
        latencies.assign(m_latencies.begin(), m_latencies.end());
    }

    if (!latencies.empty()) {
        double sum = 0.0;
        for (double v : latencies) {
            sum += v;
        }
        snap.avgLatencyMs = sum / static_cast<double>(latencies.size());

        // Phân vị 95 theo nearest-rank
        std::sort(latencies.begin(), latencies.end());
        size_t rank = static_cast<size_t>(
            std::ceil(0.95 * static_cast<double>(latencies.size())));
        snap.p95LatencyMs = latencies[std::max<size_t>(rank, 1) - 1];
        snap.latencySamples = latencies.size();
    }
    return snap;
}

// ============================================================================
// RespiratoryPipeline
// ============================================================================

RespiratoryPipeline::RespiratoryPipeline(const PipelineConfig& config)
    : RespiratoryPipeline(config,
                          std::make_shared<const Classifier>(
                              Classifier::load(validated(config).modelPath)))
{
}

RespiratoryPipeline::RespiratoryPipeline(const PipelineConfig& config,
                                         std::shared_ptr<const Classifier> classifier)
    : m_config(validated(config))
    , m_classifier(classifier ? std::move(classifier) : std::make_shared<const Classifier>())
    , m_decoder(m_config)
    , m_extractor(SpectralConfig::fromPipeline(m_config))
    , m_cache(m_config.cacheMaxSize)
{
    if (m_config.verbose) {
        std::cerr << "[Pipeline] Classifier: " << m_classifier->describe() << "\n";
        std::cerr << "[Pipeline] Cache capacity: " << m_cache.capacity() << "\n";
    }
    if (!m_classifier->isAvailable()) {
        std::cerr << "[Pipeline] Warning: classifier unavailable ("
                  << m_classifier->getUnavailableReason()
                  << "); classification requests will be rejected\n";
    }
}

ClassificationResult RespiratoryPipeline::classify(const ByteBuffer& bytes,
                                                   const std::string& mediaTypeHint) {
    const auto start = Clock::now();
    m_stats.recordRequest();

    try {
        // Model phải sẵn sàng trước khi đụng tới payload
        m_classifier->ensureAvailable();

        if (bytes.empty()) {
            throw DecodeError("Empty audio payload");
        }

        auto stageStart = Clock::now();
        const std::string fingerprint = PredictionCache::computeFingerprint(bytes);
        logStage(ProcessingStage::FINGERPRINTING, elapsedMs(stageStart));

        ClassificationResult result = m_cache.getOrCompute(fingerprint, [&]() {
            return runUncached(bytes, mediaTypeHint);
        });

        double totalMs = elapsedMs(start);
        m_stats.recordSuccess(totalMs);
        logStage(ProcessingStage::COMPLETE, totalMs);
        return result;
    }
    catch (const AcoustixError& e) {
        m_stats.recordFailure(e.kind());
        if (!e.isClientError()) {
            std::cerr << "[Pipeline] " << e.name() << ": " << e.what() << "\n";
        } else if (m_config.verbose) {
            std::cerr << "[Pipeline] Rejected request (" << e.name() << "): "
                      << e.what() << "\n";
        }
        throw;
    }
}

ClassificationResult RespiratoryPipeline::runUncached(const ByteBuffer& bytes,
                                                      const std::string& mediaTypeHint) const {
    FeatureVector features = extractFeatures(bytes, mediaTypeHint);

    auto stageStart = Clock::now();
    ClassificationResult result = m_classifier->predict(features);
    logStage(ProcessingStage::CLASSIFYING, elapsedMs(stageStart));

    if (m_config.verbose) {
        std::cerr << "[Pipeline] Prediction: " << result.describe() << "\n";
    }
    return result;
}

FeatureVector RespiratoryPipeline::extractFeatures(const ByteBuffer& bytes,
                                                   const std::string& mediaTypeHint) const {
    auto stageStart = Clock::now();
    AudioData audio = m_decoder.decode(bytes, mediaTypeHint);
    logStage(ProcessingStage::DECODING, elapsedMs(stageStart));

    if (m_config.verbose) {
        std::cerr << "[Pipeline]   " << containerToString(audio.container) << ", "
                  << audio.sourceSampleRate << " Hz, " << audio.sourceChannels
                  << " ch -> " << audio.samples.size() << " samples @ "
                  << audio.sampleRate << " Hz\n";
    }

    stageStart = Clock::now();
    std::vector<float> signal = m_decoder.getSignalProcessor().fitToDuration(audio.samples);
    logStage(ProcessingStage::NORMALIZING, elapsedMs(stageStart));

    stageStart = Clock::now();
    DescriptorSet descriptors = m_extractor.extract(signal);
    logStage(ProcessingStage::EXTRACTING, elapsedMs(stageStart));

    stageStart = Clock::now();
    FeatureVector features = m_aggregator.aggregate(descriptors);
    logStage(ProcessingStage::AGGREGATING, elapsedMs(stageStart));

    if (!features.isFinite()) {
        throw FeatureExtractionError("Aggregated feature vector contains NaN or infinite values");
    }
    return features;
}

StatisticsSnapshot RespiratoryPipeline::getStatistics() const {
    StatisticsSnapshot snap = m_stats.snapshot();
    snap.cache = m_cache.getStatistics();
    return snap;
}

void RespiratoryPipeline::logStage(ProcessingStage stage, double elapsed) const {
    if (!m_config.verbose) {
        return;
    }
    std::cerr << "[Pipeline] " << std::left << std::setw(20) << stageToString(stage)
              << std::right << std::fixed << std::setprecision(2) << elapsed << " ms\n";
}

} // namespace acoustix
