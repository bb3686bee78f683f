/**
 * @file OnnxForest.hpp
 * @brief Random forest backend running an ONNX export through ONNX Runtime
 *
 * Dùng cho model sklearn được xuất bằng skl2onnx (zipmap=False), để
 * output xác suất là tensor float [1, C]. Tên lớp lấy từ metadata
 * "classes" (phân tách bằng dấu phẩy) nếu có, ngược lại dùng thứ tự
 * nhãn chuẩn. Tên cột lấy từ metadata "features" nếu có.
 */

#ifndef ACOUSTIX_ONNX_FOREST_HPP
#define ACOUSTIX_ONNX_FOREST_HPP

#include "Classifier.h"

#include <memory>
#include <string>
#include <vector>

namespace acoustix {

// Forward declaration cho PIMPL (ẩn ONNX Runtime)
class OnnxForestImpl;

/// Tên output xác suất được ưu tiên
constexpr const char* ONNX_PROBABILITY_OUTPUT = "probabilities";

/// Tên output xác suất mặc định của skl2onnx
constexpr const char* ONNX_SKL2ONNX_PROBABILITY_OUTPUT = "output_probability";

/**
 * @class OnnxForestModel
 * @brief ForestModel chạy trên ONNX Runtime (CPU)
 */
class OnnxForestModel : public ForestModel {
public:
    /**
     * @brief Tạo session từ file .onnx
     * @param modelPath Đường dẫn model
     * @param numThreads Số intra-op threads (0 = mặc định của runtime)
     * @throws ModelUnavailableError nếu không tạo được session
     */
    explicit OnnxForestModel(const std::string& modelPath, int numThreads = 1);
    ~OnnxForestModel() override;

    OnnxForestModel(const OnnxForestModel&) = delete;
    OnnxForestModel& operator=(const OnnxForestModel&) = delete;

    std::vector<double> predictProba(const std::vector<float>& features) const override;
    const std::vector<std::string>& classNames() const override { return m_classNames; }
    const std::vector<std::string>& featureNames() const override { return m_featureNames; }
    size_t numFeatures() const override { return m_numFeatures; }
    std::string backendName() const override { return "onnxruntime"; }
    std::string summary() const override;

private:
    std::unique_ptr<OnnxForestImpl> m_impl;
    std::string m_modelPath;
    std::vector<std::string> m_classNames;
    std::vector<std::string> m_featureNames;
    size_t m_numFeatures;
};

} // namespace acoustix

#endif // ACOUSTIX_ONNX_FOREST_HPP
