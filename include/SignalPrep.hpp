/**
 * @file SignalPrep.hpp
 * @brief Signal conditioning and fixed-duration normalization
 *
 * Pipeline stages sau khi giải mã:
 *   1. Downmix đa kênh về mono (trung bình các kênh)
 *   2. Lọc chống alias (Butterworth zero-phase) khi giảm tần số lấy mẫu
 *   3. Resampling về tần số mục tiêu (nội suy tuyến tính)
 *   4. Kẹp biên độ về [-1.0, 1.0]
 *   5. Cắt/đệm về đúng N mẫu cố định
 *
 * Model được huấn luyện trên các đoạn có độ dài bằng nhau, nên mọi
 * bản ghi phải có cùng số mẫu trước khi trích xuất đặc trưng.
 */

#ifndef ACOUSTIX_SIGNAL_PREP_HPP
#define ACOUSTIX_SIGNAL_PREP_HPP

#include "Config.h"

#include <vector>
#include <string>
#include <cstdint>
#include <cmath>

// Define M_PI if not available (Windows/MinGW compatibility)
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace acoustix {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Tần số cắt của bộ lọc chống alias, tính theo tỷ lệ Nyquist mới
constexpr double ANTI_ALIAS_CUTOFF_RATIO = 0.9;

/// Số lần áp dụng biquad zero-phase (2 lần ~ Butterworth bậc 8 hiệu dụng)
constexpr int ANTI_ALIAS_PASSES = 2;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @enum AudioContainer
 * @brief Định dạng container đã nhận diện được
 */
enum class AudioContainer {
    UNKNOWN = 0,
    WAV = 1,        ///< RIFF/WAVE, RF64, Wave64
    FLAC = 2,
    MP3 = 3,
    MP4 = 4,        ///< ISO BMFF (m4a/mp4, thường là AAC)
    OGG = 5,        ///< Ogg (Vorbis/Opus)
    WEBM = 6,       ///< Matroska/WebM (EBML)
    AAC = 7         ///< AAC dạng ADTS thô
};

/**
 * @brief Tên container để log/hiển thị
 */
inline std::string containerToString(AudioContainer container) {
    switch (container) {
        case AudioContainer::WAV: return "wav";
        case AudioContainer::FLAC: return "flac";
        case AudioContainer::MP3: return "mp3";
        case AudioContainer::MP4: return "mp4";
        case AudioContainer::OGG: return "ogg";
        case AudioContainer::WEBM: return "webm";
        case AudioContainer::AAC: return "aac";
        default: return "unknown";
    }
}

/**
 * @struct AudioData
 * @brief Tín hiệu mono đã chuẩn hóa cùng metadata nguồn
 */
struct AudioData {
    std::vector<float> samples;     ///< Mẫu mono trong [-1.0, 1.0]
    uint32_t sampleRate;            ///< Tần số lấy mẫu hiện tại (Hz)
    uint16_t channels;              ///< Luôn = 1 sau khi giải mã
    uint32_t sourceSampleRate;      ///< Tần số lấy mẫu gốc của file
    uint16_t sourceChannels;        ///< Số kênh gốc
    AudioContainer container;       ///< Container đã giải mã

    AudioData()
        : sampleRate(0), channels(0), sourceSampleRate(0), sourceChannels(0)
        , container(AudioContainer::UNKNOWN) {}

    /// Thời lượng (giây)
    double durationSec() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

/**
 * @struct FilterCoefficients
 * @brief Hệ số bộ lọc IIR (biquad)
 *
 * Bộ lọc dạng: y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
 */
struct FilterCoefficients {
    std::vector<double> b;          ///< Hệ số tử số (feedforward)
    std::vector<double> a;          ///< Hệ số mẫu số (feedback)

    FilterCoefficients() = default;
};

// ============================================================================
// MAIN CLASS
// ============================================================================

/**
 * @class SignalProcessor
 * @brief Chuẩn hóa tín hiệu đã giải mã về dạng mà model mong đợi
 *
 * Không giữ trạng thái giữa các request: mọi phương thức đều const,
 * an toàn khi gọi đồng thời từ nhiều luồng.
 */
class SignalProcessor {
public:
    /**
     * @brief Constructor
     * @param config Cấu hình pipeline (tần số, độ dài, cổng im lặng)
     */
    explicit SignalProcessor(const PipelineConfig& config = PipelineConfig());

    // ========================================================================
    // MAIN METHODS
    // ========================================================================

    /**
     * @brief Downmix + resampling + kẹp biên độ
     *
     * @param interleaved Mẫu float xen kẽ giữa các kênh
     * @param sourceRate Tần số lấy mẫu gốc (Hz)
     * @param channels Số kênh
     * @return Tín hiệu mono tại tần số mục tiêu
     * @throws DecodeError nếu tham số nguồn không hợp lệ hoặc có mẫu NaN/Inf
     */
    std::vector<float> conditionAudio(const std::vector<float>& interleaved,
                                      uint32_t sourceRate,
                                      uint16_t channels) const;

    /**
     * @brief Cắt hoặc đệm tín hiệu về đúng targetSampleCount() mẫu
     *
     * Tín hiệu dài hơn giữ N mẫu đầu, ngắn hơn được đệm 0 ở cuối.
     *
     * @throws InvalidAudioError nếu tín hiệu rỗng, hoặc im lặng khi
     *         cổng im lặng được bật
     */
    std::vector<float> fitToDuration(const std::vector<float>& samples) const;

    // ========================================================================
    // INDIVIDUAL PROCESSING STAGES
    // ========================================================================

    /**
     * @brief Resampling bằng nội suy tuyến tính
     *
     * Khi giảm tần số, tín hiệu được lọc thông thấp trước để tránh alias.
     *
     * @param input Vector mẫu đầu vào
     * @param inputRate Tần số lấy mẫu đầu vào (Hz)
     * @param output Vector mẫu đầu ra
     * @param targetRate Tần số lấy mẫu mục tiêu (Hz)
     */
    void resample(const std::vector<float>& input,
                  uint32_t inputRate,
                  std::vector<float>& output,
                  uint32_t targetRate) const;

    /**
     * @brief Chuyển đổi tín hiệu đa kênh sang mono
     *
     * mono[i] = (ch0[i] + ch1[i] + ...) / channels
     */
    void convertToMono(const std::vector<float>& input,
                       std::vector<float>& output,
                       uint16_t channels) const;

    /**
     * @brief Kẹp mọi mẫu về [-1.0, 1.0] (tại chỗ)
     */
    void clampToUnitRange(std::vector<float>& samples) const;

    /**
     * @brief Thiết kế biquad Butterworth lowpass bằng biến đổi bilinear
     */
    void designButterworthLowpass(double cutoffFreq,
                                  double sampleRate,
                                  FilterCoefficients& coeffs) const;

    /**
     * @brief Lọc zero-phase (forward-backward)
     */
    void applyZeroPhaseFilter(const std::vector<float>& input,
                              std::vector<float>& output,
                              const FilterCoefficients& coeffs) const;

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    uint32_t getTargetSampleRate() const { return m_targetSampleRate; }
    size_t getTargetSampleCount() const { return m_targetSampleCount; }
    bool isSilenceGateEnabled() const { return m_rejectSilence; }

private:
    /**
     * @brief Lọc IIR - Direct Form II Transposed
     */
    void applyIIRFilter(const std::vector<float>& input,
                        std::vector<float>& output,
                        const FilterCoefficients& coeffs) const;

    uint32_t m_targetSampleRate;     ///< Tần số mục tiêu (Hz)
    size_t m_targetSampleCount;      ///< N = int(duration * rate)
    bool m_rejectSilence;            ///< Cổng chất lượng im lặng
    float m_silenceThreshold;        ///< Ngưỡng biên độ đỉnh
};

// ============================================================================
// INLINE UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Tính giá trị tuyệt đối tối đa trong vector
 */
inline float findMaxAbsValue(const std::vector<float>& samples) {
    float maxVal = 0.0f;
    for (const auto& s : samples) {
        float absVal = std::fabs(s);
        if (absVal > maxVal) {
            maxVal = absVal;
        }
    }
    return maxVal;
}

/**
 * @brief Chuyển đổi tần số sang tần số góc chuẩn hóa (rad/sample)
 */
inline double freqToNormalizedOmega(double freq, double sampleRate) {
    return 2.0 * M_PI * freq / sampleRate;
}

/**
 * @brief Pre-warping cho biến đổi bilinear (K = tan(omega/2))
 */
inline double prewarp(double omega) {
    return std::tan(omega / 2.0);
}

} // namespace acoustix

#endif // ACOUSTIX_SIGNAL_PREP_HPP
