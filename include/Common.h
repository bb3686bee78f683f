/**
 * @file Common.h
 * @brief Common definitions and types for Acoustix respiratory classification
 *
 * Chứa các định nghĩa chung, types, và constants được sử dụng
 * xuyên suốt dự án: tập nhãn bệnh hô hấp cố định, các giai đoạn
 * pipeline và các hàm chuyển đổi sang chuỗi.
 */

#ifndef ACOUSTIX_COMMON_H
#define ACOUSTIX_COMMON_H

#include <array>
#include <cstdint>
#include <vector>
#include <string>
#include <cmath>

namespace acoustix {

// ============================================================================
// VERSION
// ============================================================================

#define ACOUSTIX_VERSION_MAJOR 1
#define ACOUSTIX_VERSION_MINOR 0
#define ACOUSTIX_VERSION_PATCH 0

/// Chuỗi phiên bản hiển thị trong CLI
constexpr const char* ACOUSTIX_VERSION_STRING = "1.0.0";

// ============================================================================
// TYPE DEFINITIONS
// ============================================================================

/// Kiểu dữ liệu cho samples
using SampleType = float;

/// Kiểu dữ liệu cho accumulator (precision cao hơn cho tính toán)
using AccumType = double;

/// Kiểu dữ liệu cho index
using IndexType = uint32_t;

/// Chuỗi byte thô của một bản ghi âm thanh (nội dung file upload)
using ByteBuffer = std::vector<uint8_t>;

// ============================================================================
// CONSTANTS
// ============================================================================

/// Pi constant
constexpr double PI = 3.14159265358979323846;

/// Epsilon để tránh chia cho 0
constexpr float EPSILON = 1e-10f;

/// Số lớp bệnh trong tập nhãn cố định
constexpr int NUM_CLASSES = 8;

// ============================================================================
// ENUMS
// ============================================================================

/**
 * @enum RespiratoryCondition
 * @brief Tập nhãn bệnh hô hấp đóng mà classifier được huấn luyện
 *
 * Thứ tự trùng với thứ tự cột xác suất của model (sắp xếp theo tên).
 */
enum class RespiratoryCondition : int {
    ASTHMA = 0,           ///< Hen suyễn
    BRONCHIECTASIS = 1,   ///< Giãn phế quản
    BRONCHIOLITIS = 2,    ///< Viêm tiểu phế quản
    COPD = 3,             ///< Bệnh phổi tắc nghẽn mạn tính
    HEALTHY = 4,          ///< Khỏe mạnh
    LRTI = 5,             ///< Nhiễm trùng đường hô hấp dưới
    PNEUMONIA = 6,        ///< Viêm phổi
    URTI = 7              ///< Nhiễm trùng đường hô hấp trên
};

/// Tất cả các nhãn theo thứ tự cột xác suất
constexpr std::array<RespiratoryCondition, NUM_CLASSES> ALL_CONDITIONS = {
    RespiratoryCondition::ASTHMA,
    RespiratoryCondition::BRONCHIECTASIS,
    RespiratoryCondition::BRONCHIOLITIS,
    RespiratoryCondition::COPD,
    RespiratoryCondition::HEALTHY,
    RespiratoryCondition::LRTI,
    RespiratoryCondition::PNEUMONIA,
    RespiratoryCondition::URTI
};

/**
 * @enum ProcessingStage
 * @brief Các giai đoạn xử lý trong pipeline
 */
enum class ProcessingStage {
    FINGERPRINTING = 0,   ///< Tính SHA-256 của payload
    DECODING = 1,         ///< Giải mã container âm thanh
    RESAMPLING = 2,       ///< Downmix + resampling
    NORMALIZING = 3,      ///< Cắt/đệm về độ dài cố định
    EXTRACTING = 4,       ///< Trích xuất descriptors
    AGGREGATING = 5,      ///< Tính thống kê 30 cột
    CLASSIFYING = 6,      ///< Chạy random forest
    COMPLETE = 7          ///< Hoàn thành
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Chuyển đổi RespiratoryCondition sang nhãn của model
 */
inline std::string conditionToString(RespiratoryCondition condition) {
    switch (condition) {
        case RespiratoryCondition::ASTHMA: return "Asthma";
        case RespiratoryCondition::BRONCHIECTASIS: return "Bronchiectasis";
        case RespiratoryCondition::BRONCHIOLITIS: return "Bronchiolitis";
        case RespiratoryCondition::COPD: return "COPD";
        case RespiratoryCondition::HEALTHY: return "Healthy";
        case RespiratoryCondition::LRTI: return "LRTI";
        case RespiratoryCondition::PNEUMONIA: return "Pneumonia";
        case RespiratoryCondition::URTI: return "URTI";
        default: return "Unknown";
    }
}

/**
 * @brief Tìm nhãn theo tên (phân biệt hoa thường, như trong model)
 * @param name Tên lớp, ví dụ "COPD"
 * @param condition Kết quả nếu tìm thấy
 * @return true nếu tên thuộc tập nhãn
 */
inline bool parseCondition(const std::string& name, RespiratoryCondition& condition) {
    for (RespiratoryCondition c : ALL_CONDITIONS) {
        if (conditionToString(c) == name) {
            condition = c;
            return true;
        }
    }
    return false;
}

/**
 * @brief Chuyển đổi ProcessingStage sang string
 */
inline std::string stageToString(ProcessingStage stage) {
    switch (stage) {
        case ProcessingStage::FINGERPRINTING: return "Fingerprinting";
        case ProcessingStage::DECODING: return "Decoding";
        case ProcessingStage::RESAMPLING: return "Resampling";
        case ProcessingStage::NORMALIZING: return "Normalizing";
        case ProcessingStage::EXTRACTING: return "Feature Extraction";
        case ProcessingStage::AGGREGATING: return "Aggregation";
        case ProcessingStage::CLASSIFYING: return "Classification";
        case ProcessingStage::COMPLETE: return "Complete";
        default: return "Unknown Stage";
    }
}

} // namespace acoustix

#endif // ACOUSTIX_COMMON_H
