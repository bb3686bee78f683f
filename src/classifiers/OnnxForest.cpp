/**
 * @file OnnxForest.cpp
 * @brief ONNX Runtime backend for the respiratory forest
 */

#include "OnnxForest.hpp"
#include "Errors.h"

#include <iostream>
#include <sstream>

#include <onnxruntime_cxx_api.h>

namespace acoustix {

// ============================================================================
// PIMPL IMPLEMENTATION CLASS
// ============================================================================

/**
 * @class OnnxForestImpl
 * @brief Giữ các đối tượng ONNX Runtime
 */
class OnnxForestImpl {
public:
    std::unique_ptr<Ort::Env> env;
    std::unique_ptr<Ort::SessionOptions> sessionOptions;
    std::unique_ptr<Ort::Session> session;

    std::string inputName;
    std::string outputName;

    Ort::AllocatorWithDefaultOptions allocator;
};

namespace {

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t first = item.find_first_not_of(" \t");
        size_t last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
    }
    return items;
}

std::string lookupMetadata(Ort::ModelMetadata& metadata, const char* key,
                           Ort::AllocatorWithDefaultOptions& allocator) {
    auto value = metadata.LookupCustomMetadataMapAllocated(key, allocator);
    return value ? std::string(value.get()) : std::string();
}

} // anonymous namespace

// ============================================================================
// OnnxForestModel
// ============================================================================

OnnxForestModel::OnnxForestModel(const std::string& modelPath, int numThreads)
    : m_impl(std::make_unique<OnnxForestImpl>())
    , m_modelPath(modelPath)
    , m_numFeatures(FEATURE_DIMENSION)
{
    try {
        m_impl->env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "OnnxForest");

        m_impl->sessionOptions = std::make_unique<Ort::SessionOptions>();
        if (numThreads > 0) {
            m_impl->sessionOptions->SetIntraOpNumThreads(numThreads);
        }
        m_impl->sessionOptions->SetGraphOptimizationLevel(
            GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            *m_impl->env, modelPath.c_str(), *m_impl->sessionOptions);

        // ----- Input: tensor float [N, F] -----
        if (m_impl->session->GetInputCount() != 1) {
            throw ModelUnavailableError("ONNX forest must have exactly one input: " + modelPath);
        }
        m_impl->inputName =
            m_impl->session->GetInputNameAllocated(0, m_impl->allocator).get();

        auto inputInfo = m_impl->session->GetInputTypeInfo(0);
        auto inputShape = inputInfo.GetTensorTypeAndShapeInfo().GetShape();
        if (!inputShape.empty() && inputShape.back() > 0) {
            m_numFeatures = static_cast<size_t>(inputShape.back());
        }

        // ----- Output xác suất -----
        size_t numOutputs = m_impl->session->GetOutputCount();
        std::vector<std::string> outputNames;
        for (size_t i = 0; i < numOutputs; ++i) {
            outputNames.push_back(
                m_impl->session->GetOutputNameAllocated(i, m_impl->allocator).get());
        }

        for (const auto& name : outputNames) {
            if (name == ONNX_PROBABILITY_OUTPUT || name == ONNX_SKL2ONNX_PROBABILITY_OUTPUT) {
                m_impl->outputName = name;
                break;
            }
        }
        if (m_impl->outputName.empty() && numOutputs == 2) {
            m_impl->outputName = outputNames[1];
        }
        if (m_impl->outputName.empty()) {
            throw ModelUnavailableError("Cannot identify probability output of " + modelPath);
        }

        // ----- Metadata -----
        Ort::ModelMetadata metadata = m_impl->session->GetModelMetadata();
        std::string classes = lookupMetadata(metadata, "classes", m_impl->allocator);
        if (!classes.empty()) {
            m_classNames = splitList(classes);
        } else {
            for (RespiratoryCondition c : ALL_CONDITIONS) {
                m_classNames.push_back(conditionToString(c));
            }
        }
        std::string features = lookupMetadata(metadata, "features", m_impl->allocator);
        if (!features.empty()) {
            m_featureNames = splitList(features);
        }

        std::cerr << "[OnnxForest] Model loaded successfully: " << modelPath << "\n";
        std::cerr << "  Input: " << m_impl->inputName << " (" << m_numFeatures
                  << " features), Output: " << m_impl->outputName << "\n";
    }
    catch (const Ort::Exception& e) {
        throw ModelUnavailableError("ONNX Runtime cannot load " + modelPath + ": " + e.what());
    }
}

OnnxForestModel::~OnnxForestModel() = default;

std::vector<double> OnnxForestModel::predictProba(const std::vector<float>& features) const {
    try {
        std::vector<int64_t> inputShape = {1, static_cast<int64_t>(features.size())};

        auto memoryInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        auto inputTensor = Ort::Value::CreateTensor<float>(
            memoryInfo, const_cast<float*>(features.data()), features.size(),
            inputShape.data(), inputShape.size());

        const char* inputNames[] = {m_impl->inputName.c_str()};
        const char* outputNames[] = {m_impl->outputName.c_str()};

        auto outputTensors = m_impl->session->Run(
            Ort::RunOptions{nullptr},
            inputNames, &inputTensor, 1,
            outputNames, 1);

        auto& outputTensor = outputTensors[0];
        if (!outputTensor.IsTensor()) {
            throw InferenceError("ONNX probability output is not a tensor "
                                 "(export the model with zipmap disabled)");
        }
        auto outputInfo = outputTensor.GetTensorTypeAndShapeInfo();
        if (outputInfo.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
            throw InferenceError("ONNX probability output is not float");
        }

        const float* outputData = outputTensor.GetTensorData<float>();
        size_t outputSize = outputInfo.GetElementCount();
        return std::vector<double>(outputData, outputData + outputSize);
    }
    catch (const Ort::Exception& e) {
        throw InferenceError(std::string("ONNX Runtime inference failed: ") + e.what());
    }
}

std::string OnnxForestModel::summary() const {
    std::ostringstream oss;
    oss << m_modelPath << " (input " << m_impl->inputName << ", output "
        << m_impl->outputName << ", " << m_classNames.size() << " classes)";
    return oss.str();
}

} // namespace acoustix
