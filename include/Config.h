/**
 * @file Config.h
 * @brief Runtime configuration for the classification pipeline
 *
 * Cấu hình được ghép theo thứ tự ưu tiên tăng dần:
 *   1. Giá trị mặc định biên dịch sẵn
 *   2. File cấu hình dạng "key = value"
 *   3. Biến môi trường ACOUSTIX_*
 *   4. Tham số dòng lệnh (do main.cpp áp dụng)
 */

#ifndef ACOUSTIX_CONFIG_H
#define ACOUSTIX_CONFIG_H

#include <cstdint>
#include <cstddef>
#include <string>

namespace acoustix {

// ============================================================================
// DEFAULTS
// ============================================================================

/// Đường dẫn artifact model mặc định
const std::string DEFAULT_MODEL_PATH = "models/respiratory_forest.txt";

/// Dung lượng cache mặc định (số kết quả)
constexpr size_t DEFAULT_CACHE_MAX_SIZE = 128;

/// Tần số lấy mẫu sau khi giải mã (Hz)
constexpr uint32_t DEFAULT_TARGET_SAMPLE_RATE = 16000;

/// Độ dài cố định của tín hiệu (giây) - clip ngắn nhất trong tập huấn luyện
constexpr double DEFAULT_TARGET_DURATION_SEC = 7.8560090702947845;

/// Ngưỡng biên độ đỉnh dưới đó bản ghi bị coi là im lặng
constexpr float DEFAULT_SILENCE_THRESHOLD = 1e-4f;

// ============================================================================
// CONFIGURATION STRUCT
// ============================================================================

/**
 * @struct PipelineConfig
 * @brief Cấu hình cho RespiratoryPipeline
 */
struct PipelineConfig {
    std::string modelPath;          ///< Artifact classifier (.txt hoặc .onnx)
    size_t cacheMaxSize;            ///< Số kết quả tối đa trong LRU cache
    uint32_t targetSampleRate;      ///< Tần số lấy mẫu chuẩn hóa (Hz)
    double targetDurationSec;       ///< Độ dài cố định (giây)
    bool rejectSilence;             ///< Bật cổng chất lượng "im lặng"
    float silenceThreshold;         ///< Ngưỡng biên độ đỉnh cho cổng im lặng
    int numThreads;                 ///< Số luồng OpenMP (0 = mặc định runtime)
    bool verbose;                   ///< Log từng giai đoạn của mỗi request

    PipelineConfig()
        : modelPath(DEFAULT_MODEL_PATH)
        , cacheMaxSize(DEFAULT_CACHE_MAX_SIZE)
        , targetSampleRate(DEFAULT_TARGET_SAMPLE_RATE)
        , targetDurationSec(DEFAULT_TARGET_DURATION_SEC)
        , rejectSilence(false)
        , silenceThreshold(DEFAULT_SILENCE_THRESHOLD)
        , numThreads(0)
        , verbose(false) {}

    /**
     * @brief Số mẫu của tín hiệu sau chuẩn hóa độ dài
     */
    size_t targetSampleCount() const {
        return static_cast<size_t>(targetDurationSec * static_cast<double>(targetSampleRate));
    }

    /**
     * @brief In cấu hình ra console
     */
    void print() const;
};

// ============================================================================
// LOADING
// ============================================================================

/**
 * @brief Áp dụng một cặp key/value vào cấu hình
 *
 * Key hợp lệ: model_path, cache_max_size, sample_rate, duration,
 * reject_silence, silence_threshold, threads, verbose.
 *
 * @throws std::invalid_argument nếu key không biết hoặc value sai kiểu
 */
void applyConfigValue(PipelineConfig& config, const std::string& key,
                      const std::string& value);

/**
 * @brief Đọc file cấu hình "key = value" (dòng '#' là comment)
 * @throws std::runtime_error nếu không mở được file
 * @throws std::invalid_argument nếu có dòng sai cú pháp
 */
void loadConfigFile(const std::string& path, PipelineConfig& config);

/**
 * @brief Ghi đè cấu hình từ biến môi trường
 *
 * ACOUSTIX_MODEL_PATH, ACOUSTIX_CACHE_MAX_SIZE, ACOUSTIX_SAMPLE_RATE,
 * ACOUSTIX_REJECT_SILENCE, ACOUSTIX_VERBOSE
 */
void applyEnvironment(PipelineConfig& config);

/**
 * @brief Kiểm tra tính hợp lệ của cấu hình
 * @throws std::invalid_argument khi có giá trị không hợp lệ (kể cả sample_rate
 *         không đủ cao cho các dải spectral contrast)
 */
void validateConfig(const PipelineConfig& config);

} // namespace acoustix

#endif // ACOUSTIX_CONFIG_H
