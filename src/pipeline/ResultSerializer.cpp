/**
 * @file ResultSerializer.cpp
 * @brief ArduinoJson based serialization for CLI output
 */

#include "ResultSerializer.h"

#include <cmath>

#include <ArduinoJson.h>

namespace acoustix {

namespace {

/// Dung lượng document (ArduinoJson v6 cấp phát một lần)
constexpr size_t JSON_RESULT_CAPACITY = 1024;
constexpr size_t JSON_FEATURES_CAPACITY = 4096;
constexpr size_t JSON_STATS_CAPACITY = 2048;
/// Phần dư cho ký tự kết thúc chuỗi và overhead của pool
constexpr size_t JSON_STRING_SLACK = 64;

std::string render(const JsonDocument& doc, bool pretty) {
    std::string output;
    if (pretty) {
        serializeJsonPretty(doc, output);
    } else {
        serializeJson(doc, output);
    }
    return output;
}

} // anonymous namespace

double roundForJson(double value) {
    const double scale = std::pow(10.0, JSON_DECIMALS);
    return std::round(value * scale) / scale;
}

std::string resultToJson(const ClassificationResult& result, bool pretty) {
    DynamicJsonDocument doc(JSON_RESULT_CAPACITY);

    doc["prediction"] = result.label;
    doc["confidence"] = roundForJson(result.confidence);

    JsonObject probs = doc.createNestedObject("all_probabilities");
    for (RespiratoryCondition c : ALL_CONDITIONS) {
        probs[conditionToString(c)] = roundForJson(result.probabilityOf(c));
    }
    return render(doc, pretty);
}

std::string errorToJson(const AcoustixError& error) {
    // Thông điệp lỗi không giới hạn độ dài: cấp đủ chỗ cho bản sao chuỗi
    const std::string name = error.name();
    const std::string detail = error.what();
    DynamicJsonDocument doc(JSON_OBJECT_SIZE(3) + name.size() + detail.size() +
                            JSON_STRING_SLACK);
    doc["error"] = name;
    doc["status"] = error.status();
    doc["detail"] = detail;
    return render(doc, false);
}

std::string featuresToJson(const FeatureVector& features, bool pretty) {
    DynamicJsonDocument doc(JSON_FEATURES_CAPACITY);

    JsonObject columns = doc.createNestedObject("features");
    for (size_t i = 0; i < FEATURE_COLUMNS.size() && i < features.size(); ++i) {
        columns[FEATURE_COLUMNS[i].name()] = features[i];
    }
    doc["columns_version"] = FEATURE_COLUMNS_VERSION;
    return render(doc, pretty);
}

std::string classesToJson() {
    DynamicJsonDocument doc(JSON_RESULT_CAPACITY);
    JsonArray classes = doc.createNestedArray("classes");
    for (RespiratoryCondition c : ALL_CONDITIONS) {
        classes.add(conditionToString(c));
    }
    return render(doc, false);
}

std::string statisticsToJson(const StatisticsSnapshot& stats, bool ready, bool pretty) {
    DynamicJsonDocument doc(JSON_STATS_CAPACITY);

    doc["status"] = ready ? "ok" : "model_unavailable";
    doc["requests"] = stats.requests;
    doc["succeeded"] = stats.succeeded;

    JsonObject cache = doc.createNestedObject("cache");
    cache["size"] = stats.cache.size;
    cache["capacity"] = stats.cache.capacity;
    cache["hits"] = stats.cache.hits;
    cache["misses"] = stats.cache.misses;
    cache["evictions"] = stats.cache.evictions;
    cache["hit_rate"] = roundForJson(stats.cache.hitRate());

    JsonObject failures = doc.createNestedObject("failures");
    for (int k = 0; k < NUM_ERROR_KINDS; ++k) {
        ErrorKind kind = static_cast<ErrorKind>(k);
        failures[errorKindToString(kind)] = stats.failuresOf(kind);
    }

    JsonObject latency = doc.createNestedObject("latency_ms");
    latency["window"] = stats.latencySamples;
    latency["avg"] = roundForJson(stats.avgLatencyMs);
    latency["p95"] = roundForJson(stats.p95LatencyMs);

    return render(doc, pretty);
}

} // namespace acoustix
