/**
 * @file Pipeline.h
 * @brief End-to-end respiratory sound classification pipeline
 *
 * Luồng xử lý một request:
 *   1. Kiểm tra classifier sẵn sàng (trước cả khi giải mã)
 *   2. Fingerprint SHA-256 của payload, tra cache
 *   3. Khi trượt cache: decode -> cắt/đệm độ dài -> descriptors
 *      -> 30 cột thống kê -> random forest
 *   4. Lưu kết quả thành công vào cache
 *
 * Pipeline được tạo một lần lúc khởi động; classify() an toàn khi gọi
 * đồng thời (trạng thái chung duy nhất là cache và các bộ đếm).
 */

#ifndef ACOUSTIX_PIPELINE_H
#define ACOUSTIX_PIPELINE_H

#include "AudioDecoder.hpp"
#include "Classifier.h"
#include "Common.h"
#include "Config.h"
#include "Errors.h"
#include "FeatureExtraction.h"
#include "FeatureStatistics.h"
#include "PredictionCache.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace acoustix {

/// Số loại lỗi được đếm riêng
constexpr int NUM_ERROR_KINDS = 5;

/// Số request gần nhất dùng để tính độ trễ
constexpr size_t LATENCY_WINDOW = 100;

// ============================================================================
// STATISTICS
// ============================================================================

/**
 * @struct StatisticsSnapshot
 * @brief Ảnh chụp các bộ đếm của pipeline tại một thời điểm
 */
struct StatisticsSnapshot {
    uint64_t requests;                                  ///< Tổng số request
    uint64_t succeeded;                                 ///< Số request thành công
    std::array<uint64_t, NUM_ERROR_KINDS> failures;     ///< Theo ErrorKind
    CacheStatistics cache;                              ///< Bộ đếm của cache
    double avgLatencyMs;                                ///< Trung bình LATENCY_WINDOW request
    double p95LatencyMs;                                ///< Phân vị 95
    size_t latencySamples;                              ///< Số mẫu trong cửa sổ

    StatisticsSnapshot()
        : requests(0), succeeded(0), avgLatencyMs(0.0), p95LatencyMs(0.0), latencySamples(0) {
        failures.fill(0);
    }

    uint64_t failuresOf(ErrorKind kind) const { return failures[static_cast<size_t>(kind)]; }
};

/**
 * @class PipelineStatistics
 * @brief Bộ đếm thread-safe của pipeline
 */
class PipelineStatistics {
public:
    PipelineStatistics();

    void recordRequest() { ++m_requests; }
    void recordSuccess(double latencyMs);
    void recordFailure(ErrorKind kind);

    /// Ảnh chụp (chưa gồm bộ đếm cache)
    StatisticsSnapshot snapshot() const;

private:
    std::atomic<uint64_t> m_requests;
    std::atomic<uint64_t> m_succeeded;
    std::array<std::atomic<uint64_t>, NUM_ERROR_KINDS> m_failures;

    mutable std::mutex m_latencyMutex;
    std::deque<double> m_latencies;                     ///< Độ trễ gần nhất (ms)
};

// ============================================================================
// PIPELINE
// ============================================================================

/**
 * @class RespiratoryPipeline
 * @brief Ghép decoder, normalizer, extractor, aggregator, classifier và cache
 */
class RespiratoryPipeline {
public:
    /**
     * @brief Khởi tạo và nạp model từ config.modelPath
     *
     * Model lỗi không làm constructor thất bại: pipeline vẫn được tạo
     * nhưng mọi classify() ném ModelUnavailableError.
     *
     * @throws std::invalid_argument nếu cấu hình không hợp lệ
     * @throws FeatureExtractionError nếu tham số trích xuất vi phạm Nyquist
     */
    explicit RespiratoryPipeline(const PipelineConfig& config);

    /**
     * @brief Khởi tạo với classifier đã nạp sẵn (dùng chung giữa các pipeline)
     */
    RespiratoryPipeline(const PipelineConfig& config,
                        std::shared_ptr<const Classifier> classifier);

    RespiratoryPipeline(const RespiratoryPipeline&) = delete;
    RespiratoryPipeline& operator=(const RespiratoryPipeline&) = delete;

    // ========================================================================
    // MAIN METHODS
    // ========================================================================

    /**
     * @brief Phân loại một bản ghi
     *
     * @param bytes Nội dung file upload
     * @param mediaTypeHint MIME type/tên định dạng (có thể rỗng)
     * @throws ModelUnavailableError, DecodeError, InvalidAudioError,
     *         FeatureExtractionError, InferenceError
     */
    ClassificationResult classify(const ByteBuffer& bytes,
                                  const std::string& mediaTypeHint = "");

    /**
     * @brief Chỉ tính vector 30 cột (không cần model, không qua cache)
     */
    FeatureVector extractFeatures(const ByteBuffer& bytes,
                                  const std::string& mediaTypeHint = "") const;

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    bool isReady() const { return m_classifier->isAvailable(); }
    const Classifier& getClassifier() const { return *m_classifier; }
    const PipelineConfig& getConfig() const { return m_config; }
    const PredictionCache& getCache() const { return m_cache; }

    StatisticsSnapshot getStatistics() const;
    void clearCache() { m_cache.clear(); }

private:
    ClassificationResult runUncached(const ByteBuffer& bytes,
                                     const std::string& mediaTypeHint) const;

    void logStage(ProcessingStage stage, double elapsedMs) const;

    PipelineConfig m_config;
    std::shared_ptr<const Classifier> m_classifier;
    AudioDecoder m_decoder;
    FeatureExtractor m_extractor;
    FeatureAggregator m_aggregator;
    PredictionCache m_cache;
    PipelineStatistics m_stats;
};

} // namespace acoustix

#endif // ACOUSTIX_PIPELINE_H
