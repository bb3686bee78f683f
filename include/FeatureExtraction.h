/**
 * @file FeatureExtraction.h
 * @brief Acoustic descriptor extraction for respiratory recordings
 *
 * Descriptors (cùng bộ tham số với notebook huấn luyện):
 * 1. Chroma STFT           (12 x T)
 * 2. MFCC                  (13 x T)
 * 3. Mel spectrogram       (128 x T)
 * 4. Spectral contrast     (7 x T)
 * 5. Spectral centroid     (1 x T)
 * 6. Spectral bandwidth    (1 x T)
 * 7. Spectral rolloff      (1 x T)
 * 8. Zero crossing rate    (1 x T)
 *
 * STFT: n_fft 2048, hop 512, cửa sổ Hann tuần hoàn, frame căn giữa
 * (đệm n_fft/2 số 0 mỗi bên) => T = 1 + N / hop.
 *
 * FFT dùng FFTW3 (single precision); các frame được tính song song
 * bằng OpenMP, mỗi frame độc lập nên kết quả không phụ thuộc số luồng.
 */

#ifndef ACOUSTIX_FEATURE_EXTRACTION_H
#define ACOUSTIX_FEATURE_EXTRACTION_H

#include "Config.h"

#include <vector>
#include <cstdint>
#include <cmath>
#include <memory>
#include <string>

namespace acoustix {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Kích thước FFT (samples)
constexpr int DEFAULT_N_FFT = 2048;

/// Bước nhảy giữa các frame (samples)
constexpr int DEFAULT_HOP_LENGTH = 512;

/// Số lượng Mel filters
constexpr int DEFAULT_N_MELS = 128;

/// Số lượng MFCC coefficients
constexpr int DEFAULT_N_MFCC = 13;

/// Số lớp cao độ của chroma
constexpr int DEFAULT_N_CHROMA = 12;

/// Số dải octave của spectral contrast (ma trận có n + 1 hàng)
constexpr int DEFAULT_CONTRAST_BANDS = 6;

/// Biên dưới của dải contrast đầu tiên (Hz)
constexpr float DEFAULT_CONTRAST_FMIN = 200.0f;

/// Tỷ lệ bin lấy làm đỉnh/đáy trong mỗi dải contrast
constexpr float DEFAULT_CONTRAST_QUANTILE = 0.02f;

/// Phần trăm năng lượng cho spectral rolloff
constexpr float DEFAULT_ROLL_PERCENT = 0.85f;

/// Dải động tối đa khi đổi power sang dB
constexpr float DEFAULT_TOP_DB = 80.0f;

/// Biên độ dưới ngưỡng này được coi là 0 khi đếm zero crossing
constexpr float ZCR_ZERO_THRESHOLD = 1e-10f;

/// Dải tần tìm peak khi ước lượng tuning của chroma (Hz)
constexpr float TUNING_FMIN = 150.0f;
constexpr float TUNING_FMAX = 4000.0f;

/// Ngưỡng peak tương đối (so với max của frame) khi ước lượng tuning
constexpr float TUNING_PEAK_THRESHOLD = 0.1f;

/// Độ phân giải histogram tuning (phần của một semitone)
constexpr float TUNING_RESOLUTION = 0.01f;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @enum Descriptor
 * @brief Các descriptor cấp frame
 */
enum class Descriptor : int {
    CHROMA_STFT = 0,
    MFCC = 1,
    MEL_SPECTROGRAM = 2,
    SPECTRAL_CONTRAST = 3,
    SPECTRAL_CENTROID = 4,
    SPECTRAL_BANDWIDTH = 5,
    SPECTRAL_ROLLOFF = 6,
    ZERO_CROSSING_RATE = 7
};

/// Số descriptor
constexpr int NUM_DESCRIPTORS = 8;

/**
 * @brief Tên descriptor (tiền tố của tên cột đặc trưng)
 */
inline std::string descriptorToString(Descriptor descriptor) {
    switch (descriptor) {
        case Descriptor::CHROMA_STFT: return "chroma_stft";
        case Descriptor::MFCC: return "mfcc";
        case Descriptor::MEL_SPECTROGRAM: return "mel_spectrogram";
        case Descriptor::SPECTRAL_CONTRAST: return "spectral_contrast";
        case Descriptor::SPECTRAL_CENTROID: return "spectral_centroid";
        case Descriptor::SPECTRAL_BANDWIDTH: return "spectral_bandwidth";
        case Descriptor::SPECTRAL_ROLLOFF: return "spectral_rolloff";
        case Descriptor::ZERO_CROSSING_RATE: return "zero_crossing_rate";
        default: return "unknown";
    }
}

/**
 * @struct SpectralConfig
 * @brief Tham số trích xuất (cố định khi phục vụ model)
 */
struct SpectralConfig {
    uint32_t sampleRate;            ///< Tần số lấy mẫu của tín hiệu (Hz)
    int nFft;                       ///< Kích thước FFT
    int hopLength;                  ///< Bước nhảy frame
    int nMels;                      ///< Số mel bands
    int nMfcc;                      ///< Số MFCC giữ lại
    int nChroma;                    ///< Số lớp chroma
    int contrastBands;              ///< Số dải octave contrast
    float contrastFmin;             ///< Biên dưới dải contrast đầu (Hz)
    float contrastQuantile;         ///< Quantile đỉnh/đáy
    float rollPercent;              ///< Ngưỡng rolloff
    float topDb;                    ///< Dải động power_to_db
    int numThreads;                 ///< Số luồng OpenMP (0 = mặc định)

    SpectralConfig()
        : sampleRate(DEFAULT_TARGET_SAMPLE_RATE)
        , nFft(DEFAULT_N_FFT)
        , hopLength(DEFAULT_HOP_LENGTH)
        , nMels(DEFAULT_N_MELS)
        , nMfcc(DEFAULT_N_MFCC)
        , nChroma(DEFAULT_N_CHROMA)
        , contrastBands(DEFAULT_CONTRAST_BANDS)
        , contrastFmin(DEFAULT_CONTRAST_FMIN)
        , contrastQuantile(DEFAULT_CONTRAST_QUANTILE)
        , rollPercent(DEFAULT_ROLL_PERCENT)
        , topDb(DEFAULT_TOP_DB)
        , numThreads(0) {}

    /**
     * @brief Tham số trích xuất cho một cấu hình pipeline
     */
    static SpectralConfig fromPipeline(const PipelineConfig& config) {
        SpectralConfig spectral;
        spectral.sampleRate = config.targetSampleRate;
        spectral.numThreads = config.numThreads;
        return spectral;
    }
};

/**
 * @struct FeatureMatrix
 * @brief Ma trận descriptor (hàng = band, cột = frame), lưu row-major
 */
struct FeatureMatrix {
    size_t rows;                    ///< Số band
    size_t cols;                    ///< Số frame
    std::vector<float> values;      ///< values[r * cols + c]

    FeatureMatrix() : rows(0), cols(0) {}
    FeatureMatrix(size_t numRows, size_t numCols)
        : rows(numRows), cols(numCols), values(numRows * numCols, 0.0f) {}

    float& at(size_t r, size_t c) { return values[r * cols + c]; }
    float at(size_t r, size_t c) const { return values[r * cols + c]; }
    bool empty() const { return values.empty(); }
};

/**
 * @struct Spectrogram
 * @brief Phổ STFT, lưu theo frame (frame-major) để xử lý song song
 */
struct Spectrogram {
    size_t numFrames;               ///< T
    size_t numBins;                 ///< 1 + n_fft / 2
    std::vector<float> magnitude;   ///< |X|, magnitude[t * numBins + k]
    std::vector<float> power;       ///< |X|^2

    Spectrogram() : numFrames(0), numBins(0) {}

    const float* magnitudeFrame(size_t t) const { return magnitude.data() + t * numBins; }
    const float* powerFrame(size_t t) const { return power.data() + t * numBins; }
};

/**
 * @struct DescriptorSet
 * @brief Toàn bộ descriptor của một bản ghi (cùng số frame T)
 */
struct DescriptorSet {
    FeatureMatrix chromaStft;           ///< 12 x T
    FeatureMatrix mfcc;                 ///< 13 x T
    FeatureMatrix melSpectrogram;       ///< 128 x T
    FeatureMatrix spectralContrast;     ///< 7 x T
    FeatureMatrix spectralCentroid;     ///< 1 x T
    FeatureMatrix spectralBandwidth;    ///< 1 x T
    FeatureMatrix spectralRolloff;      ///< 1 x T
    FeatureMatrix zeroCrossingRate;     ///< 1 x T
    size_t numFrames;                   ///< T
    float tuning;                       ///< Độ lệch tuning ước lượng (phần semitone)

    DescriptorSet() : numFrames(0), tuning(0.0f) {}

    /**
     * @brief Truy cập descriptor theo enum
     */
    const FeatureMatrix& get(Descriptor descriptor) const;
};

// ============================================================================
// MAIN CLASS
// ============================================================================

class FftPlan;

/**
 * @class FeatureExtractor
 * @brief Trích xuất bộ descriptor từ tín hiệu mono đã chuẩn hóa độ dài
 *
 * Bảng tra (cửa sổ Hann, mel filterbank, ma trận DCT, chỉ số dải
 * contrast) và FFTW plan được tạo một lần trong constructor; extract()
 * chỉ đọc các bảng này nên có thể gọi đồng thời.
 */
class FeatureExtractor {
public:
    /**
     * @brief Constructor
     * @throws FeatureExtractionError nếu tham số không hợp lệ (n_fft, hop,
     *         hoặc dải contrast vượt quá Nyquist)
     */
    explicit FeatureExtractor(const SpectralConfig& config = SpectralConfig());

    ~FeatureExtractor();

    FeatureExtractor(const FeatureExtractor&) = delete;
    FeatureExtractor& operator=(const FeatureExtractor&) = delete;

    // ========================================================================
    // MAIN EXTRACTION
    // ========================================================================

    /**
     * @brief Tính toàn bộ descriptor
     * @param signal Tín hiệu mono tại config.sampleRate
     * @throws FeatureExtractionError nếu tín hiệu rỗng
     */
    DescriptorSet extract(const std::vector<float>& signal) const;

    /**
     * @brief Số frame T cho tín hiệu N mẫu: 1 + N / hop
     */
    size_t frameCount(size_t numSamples) const;

    // ========================================================================
    // INDIVIDUAL DESCRIPTORS
    // ========================================================================

    /// STFT căn giữa: magnitude và power
    Spectrogram computeSpectrogram(const std::vector<float>& signal) const;

    /// Mel power spectrogram (n_mels x T)
    FeatureMatrix computeMelSpectrogram(const Spectrogram& spec) const;

    /// MFCC từ mel power spectrogram (n_mfcc x T)
    FeatureMatrix computeMfcc(const FeatureMatrix& melPower) const;

    /// Ước lượng độ lệch tuning (phần semitone, trong [-0.5, 0.5))
    float estimateTuning(const Spectrogram& spec) const;

    /// Chroma từ power spectrogram với tuning cho trước (n_chroma x T)
    FeatureMatrix computeChroma(const Spectrogram& spec, float tuning) const;

    /// Spectral contrast (contrastBands + 1 x T)
    FeatureMatrix computeSpectralContrast(const Spectrogram& spec) const;

    /// Centroid, bandwidth và rolloff (mỗi cái 1 x T)
    void computeSpectralShape(const Spectrogram& spec,
                              FeatureMatrix& centroid,
                              FeatureMatrix& bandwidth,
                              FeatureMatrix& rolloff) const;

    /// Zero crossing rate trên frame 2048 / hop 512, đệm biên (1 x T)
    FeatureMatrix computeZeroCrossingRate(const std::vector<float>& signal) const;

    // ========================================================================
    // UTILITY
    // ========================================================================

    /// Hz -> Mel (thang Slaney: tuyến tính dưới 1 kHz, log phía trên)
    static double hzToMel(double hz);

    /// Mel -> Hz (thang Slaney)
    static double melToHz(double mel);

    /**
     * @brief Đổi power sang dB tại chỗ: 10*log10(max(1e-10, x)),
     *        sau đó kẹp dưới tại (max - topDb)
     */
    static void powerToDb(FeatureMatrix& matrix, float topDb);

    /// Tần số (Hz) của bin k
    double binFrequency(size_t bin) const;

    const SpectralConfig& getConfig() const { return m_config; }
    const std::vector<std::vector<float>>& getMelFilterbank() const { return m_melFilterbank; }

private:
    // ========================================================================
    // INITIALIZATION
    // ========================================================================

    void validateConfig() const;
    void initHannWindow();
    void initMelFilterbank();
    void initDCTMatrix();
    void initContrastBands();
    void initFFT();

    /// Chroma filterbank cho một giá trị tuning (n_chroma x numBins)
    std::vector<std::vector<double>> buildChromaFilterbank(float tuning) const;

    /// Số luồng cho các vùng song song
    int parallelThreads() const;

    // ========================================================================
    // MEMBER VARIABLES
    // ========================================================================

    SpectralConfig m_config;                         ///< Tham số
    size_t m_numBins;                                ///< 1 + n_fft / 2

    std::vector<float> m_hannWindow;                 ///< Cửa sổ Hann tuần hoàn
    std::vector<std::vector<float>> m_melFilterbank; ///< n_mels x numBins
    std::vector<size_t> m_melFilterStart;            ///< Bin khác 0 đầu tiên
    std::vector<size_t> m_melFilterEnd;              ///< Bin khác 0 cuối + 1
    std::vector<std::vector<double>> m_dctMatrix;    ///< n_mfcc x n_mels (DCT-II ortho)

    std::vector<std::vector<size_t>> m_contrastBins; ///< Chỉ số bin của mỗi dải
    std::vector<size_t> m_contrastQuantileCount;     ///< Số bin lấy làm đỉnh/đáy

    std::unique_ptr<FftPlan> m_fft;                  ///< FFTW plan (PIMPL)
};

} // namespace acoustix

#endif // ACOUSTIX_FEATURE_EXTRACTION_H
