/**
 * @file FeatureStatistics.h
 * @brief Aggregation of frame-level descriptors into the model input vector
 *
 * Mỗi descriptor được tóm tắt bằng mean / std / max / min trên toàn
 * ma trận (mọi band, mọi frame). Thứ tự 30 cột được đóng băng bởi
 * bảng FEATURE_COLUMNS; hai cột chroma_stft_max và mel_spectrogram_min
 * bị loại giống lúc huấn luyện.
 */

#ifndef ACOUSTIX_FEATURE_STATISTICS_H
#define ACOUSTIX_FEATURE_STATISTICS_H

#include "FeatureExtraction.h"

#include <array>
#include <string>
#include <vector>

namespace acoustix {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Số cột của vector đặc trưng
constexpr int FEATURE_DIMENSION = 30;

/// Phiên bản của bảng cột; tăng khi thứ tự/tập cột thay đổi
constexpr int FEATURE_COLUMNS_VERSION = 1;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @enum Statistic
 * @brief Phép thống kê trên một ma trận descriptor
 */
enum class Statistic : int {
    MEAN = 0,
    STD = 1,
    MAX = 2,
    MIN = 3
};

/**
 * @brief Hậu tố tên cột cho từng phép thống kê
 */
inline std::string statisticToString(Statistic statistic) {
    switch (statistic) {
        case Statistic::MEAN: return "mean";
        case Statistic::STD: return "std";
        case Statistic::MAX: return "max";
        case Statistic::MIN: return "min";
        default: return "unknown";
    }
}

/**
 * @struct FeatureColumn
 * @brief Một cột của vector đặc trưng: (descriptor, statistic)
 */
struct FeatureColumn {
    Descriptor descriptor;
    Statistic statistic;

    /// Tên cột, ví dụ "mfcc_std"
    std::string name() const {
        return descriptorToString(descriptor) + "_" + statisticToString(statistic);
    }
};

/// Bảng cột đóng băng (phiên bản FEATURE_COLUMNS_VERSION)
extern const std::array<FeatureColumn, FEATURE_DIMENSION> FEATURE_COLUMNS;

/**
 * @struct DescriptorSummary
 * @brief Bốn thống kê của một ma trận descriptor
 */
struct DescriptorSummary {
    double mean;
    double stddev;  ///< Độ lệch chuẩn tổng thể (chia cho N)
    double max;
    double min;

    DescriptorSummary() : mean(0.0), stddev(0.0), max(0.0), min(0.0) {}

    double get(Statistic statistic) const;
};

/**
 * @struct FeatureVector
 * @brief Vector 30 chiều theo thứ tự FEATURE_COLUMNS
 */
struct FeatureVector {
    std::vector<float> values;

    FeatureVector() : values(FEATURE_DIMENSION, 0.0f) {}

    size_t size() const { return values.size(); }
    float operator[](size_t i) const { return values[i]; }

    /// Tất cả giá trị đều hữu hạn
    bool isFinite() const;
};

// ============================================================================
// AGGREGATOR
// ============================================================================

/**
 * @class FeatureAggregator
 * @brief Tính vector đặc trưng từ DescriptorSet
 */
class FeatureAggregator {
public:
    /**
     * @brief Tóm tắt toàn bộ descriptor thành 30 cột
     * @throws FeatureExtractionError nếu có descriptor rỗng
     */
    FeatureVector aggregate(const DescriptorSet& descriptors) const;

    /**
     * @brief Mean / std / max / min trên toàn ma trận
     */
    static DescriptorSummary summarize(const FeatureMatrix& matrix);

    /// Tên 30 cột theo thứ tự
    static std::vector<std::string> featureNames();

    /// Vị trí của cột theo tên, -1 nếu không có
    static int columnIndex(const std::string& name);
};

} // namespace acoustix

#endif // ACOUSTIX_FEATURE_STATISTICS_H
