/**
 * @file ResultSerializer.h
 * @brief JSON rendering of results, errors, features and statistics (ArduinoJson)
 */

#ifndef ACOUSTIX_RESULT_SERIALIZER_H
#define ACOUSTIX_RESULT_SERIALIZER_H

#include "Classifier.h"
#include "Errors.h"
#include "FeatureStatistics.h"
#include "Pipeline.h"

#include <string>

namespace acoustix {

/// Số chữ số thập phân giữ lại trong JSON
constexpr int JSON_DECIMALS = 6;

/**
 * @brief Làm tròn tới JSON_DECIMALS chữ số thập phân
 */
double roundForJson(double value);

/**
 * @brief {"prediction", "confidence", "all_probabilities": {lớp: xác suất}}
 */
std::string resultToJson(const ClassificationResult& result, bool pretty = false);

/**
 * @brief {"error": tên lỗi, "status": mã, "detail": thông điệp}
 */
std::string errorToJson(const AcoustixError& error);

/**
 * @brief {"features": {tên cột: giá trị}} theo thứ tự FEATURE_COLUMNS
 */
std::string featuresToJson(const FeatureVector& features, bool pretty = false);

/**
 * @brief {"classes": [...]}
 */
std::string classesToJson();

/**
 * @brief Bộ đếm của pipeline: request, cache, lỗi theo loại, độ trễ
 */
std::string statisticsToJson(const StatisticsSnapshot& stats, bool ready, bool pretty = false);

} // namespace acoustix

#endif // ACOUSTIX_RESULT_SERIALIZER_H
