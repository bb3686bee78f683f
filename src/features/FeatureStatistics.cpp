/**
 * @file FeatureStatistics.cpp
 * @brief Implementation of descriptor aggregation
 */

#include "FeatureStatistics.h"
#include "Errors.h"

#include <algorithm>
#include <cmath>

namespace acoustix {

// ============================================================================
// COLUMN TABLE
// ============================================================================

const std::array<FeatureColumn, FEATURE_DIMENSION> FEATURE_COLUMNS = {{
    {Descriptor::CHROMA_STFT, Statistic::MEAN},
    {Descriptor::CHROMA_STFT, Statistic::STD},
    {Descriptor::CHROMA_STFT, Statistic::MIN},
    {Descriptor::MFCC, Statistic::MEAN},
    {Descriptor::MFCC, Statistic::STD},
    {Descriptor::MFCC, Statistic::MAX},
    {Descriptor::MFCC, Statistic::MIN},
    {Descriptor::MEL_SPECTROGRAM, Statistic::MEAN},
    {Descriptor::MEL_SPECTROGRAM, Statistic::STD},
    {Descriptor::MEL_SPECTROGRAM, Statistic::MAX},
    {Descriptor::SPECTRAL_CONTRAST, Statistic::MEAN},
    {Descriptor::SPECTRAL_CONTRAST, Statistic::STD},
    {Descriptor::SPECTRAL_CONTRAST, Statistic::MAX},
    {Descriptor::SPECTRAL_CONTRAST, Statistic::MIN},
    {Descriptor::SPECTRAL_CENTROID, Statistic::MEAN},
    {Descriptor::SPECTRAL_CENTROID, Statistic::STD},
    {Descriptor::SPECTRAL_CENTROID, Statistic::MAX},
    {Descriptor::SPECTRAL_CENTROID, Statistic::MIN},
    {Descriptor::SPECTRAL_BANDWIDTH, Statistic::MEAN},
    {Descriptor::SPECTRAL_BANDWIDTH, Statistic::STD},
    {Descriptor::SPECTRAL_BANDWIDTH, Statistic::MAX},
    {Descriptor::SPECTRAL_BANDWIDTH, Statistic::MIN},
    {Descriptor::SPECTRAL_ROLLOFF, Statistic::MEAN},
    {Descriptor::SPECTRAL_ROLLOFF, Statistic::STD},
    {Descriptor::SPECTRAL_ROLLOFF, Statistic::MAX},
    {Descriptor::SPECTRAL_ROLLOFF, Statistic::MIN},
    {Descriptor::ZERO_CROSSING_RATE, Statistic::MEAN},
    {Descriptor::ZERO_CROSSING_RATE, Statistic::STD},
    {Descriptor::ZERO_CROSSING_RATE, Statistic::MAX},
    {Descriptor::ZERO_CROSSING_RATE, Statistic::MIN},
}};

// ============================================================================
// DescriptorSummary / FeatureVector
// ============================================================================

double DescriptorSummary::get(Statistic statistic) const {
    switch (statistic) {
        case Statistic::MEAN: return mean;
        case Statistic::STD: return stddev;
        case Statistic::MAX: return max;
        case Statistic::MIN: return min;
    }
    return 0.0;
}

bool FeatureVector::isFinite() const {
    return std::all_of(values.begin(), values.end(),
                       [](float v) { return std::isfinite(v); });
}

// ============================================================================
// FeatureAggregator
// ============================================================================

DescriptorSummary FeatureAggregator::summarize(const FeatureMatrix& matrix) {
    /**
     * mean = sum(x) / N
     * std  = sqrt(sum((x - mean)^2) / N)
     */

    DescriptorSummary summary;
    if (matrix.values.empty()) {
        return summary;
    }

    const double n = static_cast<double>(matrix.values.size());
    double sum = 0.0;
    double maxVal = matrix.values.front();
    double minVal = matrix.values.front();
    for (float v : matrix.values) {
        sum += v;
        maxVal = std::max(maxVal, static_cast<double>(v));
        minVal = std::min(minVal, static_cast<double>(v));
    }
    double mean = sum / n;

    double sqSum = 0.0;
    for (float v : matrix.values) {
        double diff = v - mean;
        sqSum += diff * diff;
    }

    summary.mean = mean;
    summary.stddev = std::sqrt(sqSum / n);
    summary.max = maxVal;
    summary.min = minVal;
    return summary;
}

FeatureVector FeatureAggregator::aggregate(const DescriptorSet& descriptors) const {
    std::array<DescriptorSummary, NUM_DESCRIPTORS> summaries;
    for (int d = 0; d < NUM_DESCRIPTORS; ++d) {
        const FeatureMatrix& matrix = descriptors.get(static_cast<Descriptor>(d));
        if (matrix.empty()) {
            throw FeatureExtractionError("Descriptor " +
                                         descriptorToString(static_cast<Descriptor>(d)) +
                                         " is empty");
        }
        summaries[static_cast<size_t>(d)] = summarize(matrix);
    }

    FeatureVector vector;
    for (size_t i = 0; i < FEATURE_COLUMNS.size(); ++i) {
        const FeatureColumn& column = FEATURE_COLUMNS[i];
        const DescriptorSummary& summary =
            summaries[static_cast<size_t>(column.descriptor)];
        vector.values[i] = static_cast<float>(summary.get(column.statistic));
    }
    return vector;
}

std::vector<std::string> FeatureAggregator::featureNames() {
    std::vector<std::string> names;
    names.reserve(FEATURE_COLUMNS.size());
    for (const auto& column : FEATURE_COLUMNS) {
        names.push_back(column.name());
    }
    return names;
}

int FeatureAggregator::columnIndex(const std::string& name) {
    for (size_t i = 0; i < FEATURE_COLUMNS.size(); ++i) {
        if (FEATURE_COLUMNS[i].name() == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace acoustix
