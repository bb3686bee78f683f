/**
 * @file Classifier.cpp
 * @brief Model loading, startup validation and prediction
 */

#include "Classifier.h"
#include "Errors.h"
#include "OnnxForest.hpp"
#include "RandomForest.h"

#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace acoustix {

namespace {

bool hasExtension(const std::string& path, const std::string& extension) {
    if (path.size() < extension.size()) {
        return false;
    }
    std::string tail = path.substr(path.size() - extension.size());
    for (char& c : tail) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return tail == extension;
}

} // anonymous namespace

// ============================================================================
// ClassificationResult
// ============================================================================

std::string ClassificationResult::describe() const {
    std::ostringstream oss;
    oss << label << " (" << std::fixed << std::setprecision(1)
        << confidence * 100.0f << "%)";
    return oss.str();
}

// ============================================================================
// MODEL LOADING
// ============================================================================

std::shared_ptr<const ForestModel> loadForestModel(const std::string& path) {
    std::ifstream artifact(path, std::ios::binary);
    if (!artifact.is_open()) {
        throw ModelUnavailableError("Model artifact not found: " + path);
    }
    artifact.close();

    if (hasExtension(path, ".onnx")) {
        return std::make_shared<OnnxForestModel>(path);
    }
    return RandomForest::loadFromFile(path);
}

// ============================================================================
// Classifier
// ============================================================================

Classifier::Classifier()
    : m_unavailableReason("No model loaded")
{
}

Classifier::Classifier(std::shared_ptr<const ForestModel> model) {
    if (!model) {
        m_unavailableReason = "No model loaded";
        return;
    }
    try {
        validateModel(*model);
        m_model = std::move(model);
    }
    catch (const AcoustixError& e) {
        m_unavailableReason = e.what();
        std::cerr << "[Classifier] Model rejected: " << m_unavailableReason << "\n";
    }
}

Classifier Classifier::load(const std::string& modelPath) {
    try {
        return Classifier(loadForestModel(modelPath));
    }
    catch (const AcoustixError& e) {
        std::cerr << "[Classifier] " << e.what() << "\n";
        Classifier unavailable;
        unavailable.m_unavailableReason = e.what();
        return unavailable;
    }
    catch (const std::exception& e) {
        std::cerr << "[Classifier] Unexpected error loading " << modelPath
                  << ": " << e.what() << "\n";
        Classifier unavailable;
        unavailable.m_unavailableReason = e.what();
        return unavailable;
    }
}

void Classifier::validateModel(const ForestModel& model) {
    /**
     * Kiểm tra lúc khởi động:
     *   - mọi lớp của model thuộc tập nhãn cố định, không trùng lặp
     *   - số chiều đầu vào = FEATURE_DIMENSION
     *   - tên cột (nếu model lưu) trùng khớp thứ tự FEATURE_COLUMNS
     */
    const auto& names = model.classNames();
    if (names.empty()) {
        throw ModelUnavailableError("Model declares no classes");
    }

    std::vector<int> mapping;
    std::array<bool, NUM_CLASSES> seen{};
    for (const auto& name : names) {
        RespiratoryCondition condition;
        if (!parseCondition(name, condition)) {
            throw ModelUnavailableError("Model class '" + name + "' is not a known condition");
        }
        size_t index = static_cast<size_t>(condition);
        if (seen[index]) {
            throw ModelUnavailableError("Model class '" + name + "' is listed twice");
        }
        seen[index] = true;
        mapping.push_back(static_cast<int>(index));
    }

    if (model.numFeatures() != static_cast<size_t>(FEATURE_DIMENSION)) {
        std::ostringstream oss;
        oss << "Model expects " << model.numFeatures() << " features, pipeline produces "
            << FEATURE_DIMENSION;
        throw ModelUnavailableError(oss.str());
    }

    const auto& modelFeatures = model.featureNames();
    if (!modelFeatures.empty()) {
        std::vector<std::string> expected = FeatureAggregator::featureNames();
        for (size_t i = 0; i < expected.size(); ++i) {
            if (i >= modelFeatures.size() || modelFeatures[i] != expected[i]) {
                throw ModelUnavailableError("Model feature column " + std::to_string(i) +
                                            " is '" +
                                            (i < modelFeatures.size() ? modelFeatures[i] : "") +
                                            "', expected '" + expected[i] + "'");
            }
        }
    }

    m_modelColumnToCondition = std::move(mapping);
}

void Classifier::ensureAvailable() const {
    if (!m_model) {
        throw ModelUnavailableError("Classifier unavailable: " + m_unavailableReason);
    }
}

ClassificationResult Classifier::predict(const FeatureVector& features) const {
    ensureAvailable();

    if (features.size() != static_cast<size_t>(FEATURE_DIMENSION)) {
        std::ostringstream oss;
        oss << "Feature vector has " << features.size() << " values, expected "
            << FEATURE_DIMENSION;
        throw InferenceError(oss.str());
    }
    if (!features.isFinite()) {
        throw InferenceError("Feature vector contains NaN or infinite values");
    }

    std::vector<double> raw = m_model->predictProba(features.values);
    if (raw.size() != m_modelColumnToCondition.size()) {
        std::ostringstream oss;
        oss << "Model returned " << raw.size() << " probabilities, expected "
            << m_modelColumnToCondition.size();
        throw InferenceError(oss.str());
    }

    // Ánh xạ cột model -> thứ tự ALL_CONDITIONS; lớp model không có = 0
    std::array<double, NUM_CLASSES> probs{};
    double total = 0.0;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (!std::isfinite(raw[i]) || raw[i] < 0.0) {
            throw InferenceError("Model returned an invalid probability");
        }
        probs[static_cast<size_t>(m_modelColumnToCondition[i])] = raw[i];
        total += raw[i];
    }
    if (!(total > 0.0)) {
        throw InferenceError("Model returned an all-zero probability distribution");
    }

    ClassificationResult result;
    size_t best = 0;
    for (size_t c = 0; c < probs.size(); ++c) {
        result.probabilities[c] = static_cast<float>(probs[c] / total);
        // Lấy lớp đầu tiên nếu bằng nhau
        if (probs[c] > probs[best]) {
            best = c;
        }
    }

    result.condition = ALL_CONDITIONS[best];
    result.label = conditionToString(result.condition);
    result.confidence = result.probabilities[best];
    return result;
}

std::vector<std::string> Classifier::classNames() {
    std::vector<std::string> names;
    for (RespiratoryCondition c : ALL_CONDITIONS) {
        names.push_back(conditionToString(c));
    }
    return names;
}

std::string Classifier::describe() const {
    if (!m_model) {
        return "unavailable (" + m_unavailableReason + ")";
    }
    return m_model->backendName() + ": " + m_model->summary();
}

} // namespace acoustix
