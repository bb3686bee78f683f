/**
 * @file Classifier.h
 * @brief Respiratory condition classifier over the 30-column feature vector
 *
 * Model được nạp một lần lúc khởi động và dùng chung (chỉ đọc) cho mọi
 * request. Hai backend:
 *   - RandomForest: artifact văn bản "acoustix-forest"
 *   - OnnxForestModel: file .onnx xuất từ sklearn (ONNX Runtime)
 *
 * Nếu nạp/kiểm tra model thất bại, Classifier ghi lại lý do và từ chối
 * mọi dự đoán bằng ModelUnavailableError.
 */

#ifndef ACOUSTIX_CLASSIFIER_H
#define ACOUSTIX_CLASSIFIER_H

#include "Common.h"
#include "FeatureStatistics.h"

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace acoustix {

// ============================================================================
// RESULT
// ============================================================================

/**
 * @struct ClassificationResult
 * @brief Kết quả phân loại một bản ghi
 */
struct ClassificationResult {
    RespiratoryCondition condition;                 ///< Lớp dự đoán
    std::string label;                              ///< Tên lớp dự đoán
    float confidence;                               ///< Xác suất của lớp dự đoán
    std::array<float, NUM_CLASSES> probabilities;   ///< Theo thứ tự ALL_CONDITIONS

    ClassificationResult()
        : condition(RespiratoryCondition::HEALTHY)
        , confidence(0.0f) {
        probabilities.fill(0.0f);
    }

    float probabilityOf(RespiratoryCondition c) const {
        return probabilities[static_cast<size_t>(c)];
    }

    /**
     * @brief Mô tả ngắn gọn để in ra console
     */
    std::string describe() const;
};

// ============================================================================
// MODEL INTERFACE
// ============================================================================

/**
 * @class ForestModel
 * @brief Giao diện chung cho các backend ensemble đã huấn luyện
 *
 * Các cài đặt phải an toàn khi gọi predictProba() đồng thời.
 */
class ForestModel {
public:
    virtual ~ForestModel() = default;

    /**
     * @brief Xác suất theo thứ tự classNames()
     */
    virtual std::vector<double> predictProba(const std::vector<float>& features) const = 0;

    /// Tên lớp theo thứ tự cột xác suất
    virtual const std::vector<std::string>& classNames() const = 0;

    /// Tên cột đặc trưng lúc huấn luyện (rỗng nếu artifact không lưu)
    virtual const std::vector<std::string>& featureNames() const = 0;

    /// Số chiều đầu vào
    virtual size_t numFeatures() const = 0;

    virtual std::string backendName() const = 0;

    /// Mô tả model (số cây, tên input...)
    virtual std::string summary() const = 0;
};

/**
 * @brief Nạp model, chọn backend theo phần mở rộng (.onnx => ONNX Runtime)
 * @throws ModelUnavailableError nếu không nạp được
 */
std::shared_ptr<const ForestModel> loadForestModel(const std::string& path);

// ============================================================================
// CLASSIFIER
// ============================================================================

/**
 * @class Classifier
 * @brief Bọc ForestModel: kiểm tra khởi động, kiểm tra input, chuẩn hóa xác suất
 */
class Classifier {
public:
    /**
     * @brief Classifier chưa có model (mọi dự đoán => ModelUnavailableError)
     */
    Classifier();

    /**
     * @brief Dùng model đã nạp; kiểm tra tập lớp và số chiều
     *
     * Không ném lỗi: nếu kiểm tra thất bại, classifier ở trạng thái unavailable.
     */
    explicit Classifier(std::shared_ptr<const ForestModel> model);

    /**
     * @brief Nạp model từ đường dẫn; lỗi được ghi lại thay vì ném ra
     */
    static Classifier load(const std::string& modelPath);

    /**
     * @brief Dự đoán cho một vector đặc trưng
     *
     * @throws ModelUnavailableError nếu model không sẵn sàng
     * @throws InferenceError nếu sai số chiều, có NaN/Inf, hoặc model
     *         trả về phân bố không hợp lệ
     */
    ClassificationResult predict(const FeatureVector& features) const;

    /**
     * @brief Ném ModelUnavailableError nếu model không sẵn sàng
     */
    void ensureAvailable() const;

    bool isAvailable() const { return m_model != nullptr; }
    const std::string& getUnavailableReason() const { return m_unavailableReason; }

    /// Tên các lớp theo thứ tự ALL_CONDITIONS
    static std::vector<std::string> classNames();

    /// Mô tả backend đang dùng
    std::string describe() const;

private:
    void validateModel(const ForestModel& model);

    std::shared_ptr<const ForestModel> m_model;     ///< Null khi unavailable
    std::string m_unavailableReason;                ///< Lý do khi unavailable
    std::vector<int> m_modelColumnToCondition;      ///< Cột model -> index ALL_CONDITIONS
};

} // namespace acoustix

#endif // ACOUSTIX_CLASSIFIER_H
