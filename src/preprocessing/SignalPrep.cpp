/**
 * @file SignalPrep.cpp
 * @brief Implementation of signal conditioning and duration normalization
 *
 * Bao gồm:
 * - Downmix, lọc chống alias và resampling tuyến tính
 * - Chuẩn hóa độ dài cố định (cắt / đệm 0)
 */

// ============================================================================
// INCLUDES
// ============================================================================

#include "SignalPrep.hpp"
#include "Errors.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace acoustix {

// ============================================================================
// CONSTRUCTOR
// ============================================================================

SignalProcessor::SignalProcessor(const PipelineConfig& config)
    : m_targetSampleRate(config.targetSampleRate)
    , m_targetSampleCount(config.targetSampleCount())
    , m_rejectSilence(config.rejectSilence)
    , m_silenceThreshold(config.silenceThreshold)
{
}

// ============================================================================
// MAIN METHODS
// ============================================================================

std::vector<float> SignalProcessor::conditionAudio(const std::vector<float>& interleaved,
                                                   uint32_t sourceRate,
                                                   uint16_t channels) const {
    if (sourceRate == 0 || channels == 0) {
        std::ostringstream oss;
        oss << "Invalid stream parameters (rate " << sourceRate
            << " Hz, " << channels << " channels)";
        throw DecodeError(oss.str());
    }

    for (float s : interleaved) {
        if (!std::isfinite(s)) {
            throw DecodeError("Decoded stream contains non-finite samples");
        }
    }

    // ----- BƯỚC 1: Downmix -----
    std::vector<float> mono;
    if (channels > 1) {
        convertToMono(interleaved, mono, channels);
    } else {
        mono = interleaved;
    }

    // ----- BƯỚC 2: Resampling (kèm lọc chống alias) -----
    std::vector<float> resampled;
    resample(mono, sourceRate, resampled, m_targetSampleRate);

    // ----- BƯỚC 3: Kẹp biên độ -----
    clampToUnitRange(resampled);

    return resampled;
}

std::vector<float> SignalProcessor::fitToDuration(const std::vector<float>& samples) const {
    if (samples.empty()) {
        throw InvalidAudioError("Decoded audio contains no samples");
    }

    if (m_rejectSilence) {
        float peak = findMaxAbsValue(samples);
        if (peak < m_silenceThreshold) {
            std::ostringstream oss;
            oss << "Recording is silent (peak amplitude " << peak
                << " below threshold " << m_silenceThreshold << ")";
            throw InvalidAudioError(oss.str());
        }
    }

    std::vector<float> output(m_targetSampleCount, 0.0f);
    size_t copyCount = std::min(samples.size(), m_targetSampleCount);
    std::copy(samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(copyCount),
              output.begin());
    return output;
}

// ============================================================================
// RESAMPLING
// ============================================================================

void SignalProcessor::resample(const std::vector<float>& input,
                               uint32_t inputRate,
                               std::vector<float>& output,
                               uint32_t targetRate) const {
    /**
     * Resampling sử dụng Linear Interpolation
     *
     * 1. ratio = inputRate / targetRate
     * 2. Mẫu đầu ra n nằm tại pos = n * ratio trong tín hiệu gốc
     * 3. Nội suy tuyến tính giữa input[floor(pos)] và input[floor(pos)+1]
     *
     * Nội suy tuyến tính không tự chống alias, nên khi downsampling
     * tín hiệu được lọc thông thấp tại 0.9 * Nyquist mới trước.
     */

    if (input.empty()) {
        output.clear();
        return;
    }

    if (inputRate == targetRate) {
        output = input;
        return;
    }

    const std::vector<float>* source = &input;
    std::vector<float> filtered;
    if (inputRate > targetRate) {
        FilterCoefficients lowpass;
        designButterworthLowpass(ANTI_ALIAS_CUTOFF_RATIO * targetRate / 2.0,
                                 static_cast<double>(inputRate), lowpass);
        filtered = input;
        std::vector<float> pass;
        for (int i = 0; i < ANTI_ALIAS_PASSES; ++i) {
            applyZeroPhaseFilter(filtered, pass, lowpass);
            filtered.swap(pass);
        }
        source = &filtered;
    }

    double ratio = static_cast<double>(inputRate) / static_cast<double>(targetRate);
    size_t outputLength = static_cast<size_t>(
        static_cast<double>(source->size()) / ratio);
    if (outputLength == 0) {
        outputLength = 1;
    }

    output.resize(outputLength);

    for (size_t i = 0; i < outputLength; ++i) {
        double srcPos = static_cast<double>(i) * ratio;

        size_t idx0 = static_cast<size_t>(srcPos);
        if (idx0 >= source->size()) {
            idx0 = source->size() - 1;
        }
        size_t idx1 = idx0 + 1;
        double frac = srcPos - static_cast<double>(idx0);

        if (idx1 >= source->size()) {
            idx1 = source->size() - 1;
        }

        // y = y0 + (y1 - y0) * frac
        output[i] = static_cast<float>(
            (*source)[idx0] * (1.0 - frac) + (*source)[idx1] * frac
        );
    }
}

void SignalProcessor::convertToMono(const std::vector<float>& input,
                                    std::vector<float>& output,
                                    uint16_t channels) const {
    if (channels <= 1) {
        output = input;
        return;
    }

    size_t numFrames = input.size() / channels;
    output.resize(numFrames);

    for (size_t i = 0; i < numFrames; ++i) {
        double sum = 0.0;
        for (uint16_t ch = 0; ch < channels; ++ch) {
            sum += input[i * channels + ch];
        }
        output[i] = static_cast<float>(sum / channels);
    }
}

void SignalProcessor::clampToUnitRange(std::vector<float>& samples) const {
    for (auto& s : samples) {
        s = std::max(-1.0f, std::min(1.0f, s));
    }
}

// ============================================================================
// FILTERS
// ============================================================================

void SignalProcessor::designButterworthLowpass(double cutoffFreq,
                                               double sampleRate,
                                               FilterCoefficients& coeffs) const {
    /**
     * Biquad Butterworth lowpass (bậc 2) qua biến đổi bilinear:
     *
     *   K = tan(pi * fc / fs)
     *   H(z) = K^2 (1 + 2z^-1 + z^-2) / ((1 + sqrt2 K + K^2)
     *          + 2(K^2 - 1) z^-1 + (1 - sqrt2 K + K^2) z^-2)
     */

    double K = prewarp(freqToNormalizedOmega(cutoffFreq, sampleRate));
    double K2 = K * K;
    double sqrt2 = std::sqrt(2.0);

    double norm = 1.0 / (1.0 + sqrt2 * K + K2);

    coeffs.b.assign(3, 0.0);
    coeffs.a.assign(3, 0.0);

    coeffs.b[0] = K2 * norm;
    coeffs.b[1] = 2.0 * K2 * norm;
    coeffs.b[2] = K2 * norm;

    coeffs.a[0] = 1.0;
    coeffs.a[1] = 2.0 * (K2 - 1.0) * norm;
    coeffs.a[2] = (1.0 - sqrt2 * K + K2) * norm;
}

void SignalProcessor::applyIIRFilter(const std::vector<float>& input,
                                     std::vector<float>& output,
                                     const FilterCoefficients& coeffs) const {
    /**
     * Direct Form II Transposed:
     * y[n]  = b0*x[n] + w1
     * w1    = b1*x[n] - a1*y[n] + w2
     * w2    = b2*x[n] - a2*y[n]
     */

    if (input.empty() || coeffs.b.size() < 3 || coeffs.a.size() < 3) {
        output = input;
        return;
    }

    size_t n = input.size();
    output.resize(n);

    double w1 = 0.0, w2 = 0.0;

    double b0 = coeffs.b[0];
    double b1 = coeffs.b[1];
    double b2 = coeffs.b[2];
    double a1 = coeffs.a[1];
    double a2 = coeffs.a[2];

    for (size_t i = 0; i < n; ++i) {
        double x = input[i];
        double y = b0 * x + w1;

        w1 = b1 * x - a1 * y + w2;
        w2 = b2 * x - a2 * y;

        output[i] = static_cast<float>(y);
    }
}

void SignalProcessor::applyZeroPhaseFilter(const std::vector<float>& input,
                                           std::vector<float>& output,
                                           const FilterCoefficients& coeffs) const {
    // Lọc xuôi, đảo, lọc lại, đảo: pha bằng 0, biên độ |H(f)|^2
    std::vector<float> forward;
    applyIIRFilter(input, forward, coeffs);

    std::reverse(forward.begin(), forward.end());

    applyIIRFilter(forward, output, coeffs);

    std::reverse(output.begin(), output.end());
}

} // namespace acoustix
