/**
 * @file FeatureExtraction.cpp
 * @brief Implementation of acoustic descriptor extraction
 *
 * Triển khai STFT (FFTW3), mel / MFCC, chroma (kèm ước lượng tuning),
 * spectral contrast, centroid / bandwidth / rolloff và zero crossing
 * rate. Vòng lặp theo frame chạy song song bằng OpenMP; mọi phép
 * cộng dồn trong một frame đều tuần tự để kết quả tất định.
 */

#include "FeatureExtraction.h"
#include "Errors.h"

#include <algorithm>
#include <cfloat>
#include <complex>
#include <limits>
#include <mutex>
#include <numeric>
#include <sstream>

#include <fftw3.h>
#include <omp.h>

namespace acoustix {

// ============================================================================
// CONSTANTS
// ============================================================================

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

/// Mức sàn khi lấy log của power
constexpr double POWER_AMIN = 1e-10;

/// Ngưỡng chuẩn hóa cột (giá trị dương nhỏ nhất của float)
constexpr double FLOAT_TINY = static_cast<double>(FLT_MIN);

/// Ngưỡng chuẩn hóa filterbank (giá trị dương nhỏ nhất của double)
constexpr double DOUBLE_TINY = std::numeric_limits<double>::min();

/// Planner của FFTW không thread-safe: tạo/hủy plan phải tuần tự
std::mutex& fftwPlannerMutex() {
    static std::mutex mutex;
    return mutex;
}

/// Median (trung bình hai phần tử giữa khi số lượng chẵn)
double median(std::vector<double> values) {
    size_t n = values.size();
    size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid),
                     values.end());
    double upper = values[mid];
    if (n % 2 == 1) {
        return upper;
    }
    double lower = *std::max_element(values.begin(),
                                     values.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lower + upper);
}

/// Phần dư dương của x / m (như np.remainder)
double positiveRemainder(double x, double m) {
    return x - m * std::floor(x / m);
}

} // anonymous namespace

// ============================================================================
// FFTW PLAN (PIMPL)
// ============================================================================

/**
 * @class FftPlan
 * @brief Giữ fftwf_plan real-to-complex cho kích thước n_fft
 *
 * Plan tạo với FFTW_UNALIGNED nên có thể thực thi với buffer bất kỳ
 * qua fftwf_execute_dft_r2c (an toàn khi gọi đồng thời).
 */
class FftPlan {
public:
    explicit FftPlan(int size) : m_plan(nullptr) {
        std::vector<float> in(static_cast<size_t>(size), 0.0f);
        std::vector<std::complex<float>> out(static_cast<size_t>(size / 2 + 1));

        std::lock_guard<std::mutex> lock(fftwPlannerMutex());
        m_plan = fftwf_plan_dft_r2c_1d(size, in.data(),
                                       reinterpret_cast<fftwf_complex*>(out.data()),
                                       FFTW_ESTIMATE | FFTW_UNALIGNED);
        if (m_plan == nullptr) {
            throw FeatureExtractionError("Failed to create FFTW plan for n_fft = " +
                                         std::to_string(size));
        }
    }

    ~FftPlan() {
        std::lock_guard<std::mutex> lock(fftwPlannerMutex());
        fftwf_destroy_plan(m_plan);
    }

    FftPlan(const FftPlan&) = delete;
    FftPlan& operator=(const FftPlan&) = delete;

    void execute(float* input, std::complex<float>* output) const {
        fftwf_execute_dft_r2c(m_plan, input, reinterpret_cast<fftwf_complex*>(output));
    }

private:
    fftwf_plan m_plan;
};

// ============================================================================
// DescriptorSet
// ============================================================================

const FeatureMatrix& DescriptorSet::get(Descriptor descriptor) const {
    switch (descriptor) {
        case Descriptor::CHROMA_STFT: return chromaStft;
        case Descriptor::MFCC: return mfcc;
        case Descriptor::MEL_SPECTROGRAM: return melSpectrogram;
        case Descriptor::SPECTRAL_CONTRAST: return spectralContrast;
        case Descriptor::SPECTRAL_CENTROID: return spectralCentroid;
        case Descriptor::SPECTRAL_BANDWIDTH: return spectralBandwidth;
        case Descriptor::SPECTRAL_ROLLOFF: return spectralRolloff;
        case Descriptor::ZERO_CROSSING_RATE: return zeroCrossingRate;
    }
    throw FeatureExtractionError("Unknown descriptor");
}

// ============================================================================
// CONSTRUCTOR & DESTRUCTOR
// ============================================================================

FeatureExtractor::FeatureExtractor(const SpectralConfig& config)
    : m_config(config)
    , m_numBins(static_cast<size_t>(config.nFft / 2 + 1))
{
    validateConfig();

    // Khởi tạo tất cả lookup tables
    initHannWindow();
    initMelFilterbank();
    initDCTMatrix();
    initContrastBands();
    initFFT();
}

FeatureExtractor::~FeatureExtractor() = default;

// ============================================================================
// INITIALIZATION METHODS
// ============================================================================

void FeatureExtractor::validateConfig() const {
    std::ostringstream oss;
    if (m_config.sampleRate == 0) {
        oss << "Sample rate must be positive";
    } else if (m_config.nFft <= 0 || m_config.nFft % 2 != 0) {
        oss << "n_fft must be a positive even number, got " << m_config.nFft;
    } else if (m_config.hopLength <= 0) {
        oss << "hop_length must be positive, got " << m_config.hopLength;
    } else if (m_config.nMels <= 0 || m_config.nMfcc <= 0 || m_config.nMfcc > m_config.nMels) {
        oss << "Invalid mel/MFCC sizes (n_mels " << m_config.nMels
            << ", n_mfcc " << m_config.nMfcc << ")";
    } else if (m_config.nChroma <= 0) {
        oss << "n_chroma must be positive";
    } else if (m_config.contrastBands <= 0 || m_config.contrastFmin <= 0.0f) {
        oss << "Invalid spectral contrast bands";
    } else {
        return;
    }
    throw FeatureExtractionError(oss.str());
}

void FeatureExtractor::initHannWindow() {
    /**
     * Hann tuần hoàn: w[n] = 0.5 - 0.5 * cos(2*pi*n / N), n = 0..N-1
     */
    const int n = m_config.nFft;
    m_hannWindow.resize(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        m_hannWindow[static_cast<size_t>(i)] =
            static_cast<float>(0.5 - 0.5 * std::cos(2.0 * M_PI * i / n));
    }
}

void FeatureExtractor::initMelFilterbank() {
    /**
     * Mel filterbank chuẩn hóa Slaney
     *
     * 1. n_mels + 2 điểm cách đều trên thang mel trong [0, sr/2]
     * 2. Bộ lọc tam giác m nối (f[m], f[m+1], f[m+2])
     * 3. Nhân hệ số 2 / (f[m+2] - f[m]) để mỗi bộ lọc có diện tích ~bằng nhau
     */

    const int nMels = m_config.nMels;
    const double fmax = m_config.sampleRate / 2.0;

    double melLow = hzToMel(0.0);
    double melHigh = hzToMel(fmax);

    std::vector<double> hzPoints(static_cast<size_t>(nMels + 2));
    for (int i = 0; i < nMels + 2; ++i) {
        double mel = melLow + (melHigh - melLow) * i / (nMels + 1);
        hzPoints[static_cast<size_t>(i)] = melToHz(mel);
    }

    m_melFilterbank.assign(static_cast<size_t>(nMels), std::vector<float>(m_numBins, 0.0f));
    m_melFilterStart.assign(static_cast<size_t>(nMels), 0);
    m_melFilterEnd.assign(static_cast<size_t>(nMels), 0);

    for (int m = 0; m < nMels; ++m) {
        size_t mi = static_cast<size_t>(m);
        double lowerDiff = hzPoints[mi + 1] - hzPoints[mi];
        double upperDiff = hzPoints[mi + 2] - hzPoints[mi + 1];
        double enorm = 2.0 / (hzPoints[mi + 2] - hzPoints[mi]);

        bool started = false;
        for (size_t k = 0; k < m_numBins; ++k) {
            double freq = binFrequency(k);
            double lower = (freq - hzPoints[mi]) / lowerDiff;
            double upper = (hzPoints[mi + 2] - freq) / upperDiff;
            double weight = std::max(0.0, std::min(lower, upper)) * enorm;

            m_melFilterbank[mi][k] = static_cast<float>(weight);
            if (weight > 0.0) {
                if (!started) {
                    m_melFilterStart[mi] = k;
                    started = true;
                }
                m_melFilterEnd[mi] = k + 1;
            }
        }
    }
}

void FeatureExtractor::initDCTMatrix() {
    /**
     * DCT-II trực chuẩn (ortho) cho MFCC
     *
     * c[k] = sqrt(2/N) * sum_{n=0}^{N-1} x[n] * cos(pi*k*(2n+1)/(2N))
     * với hệ số của k = 0 nhân thêm sqrt(1/2)
     */

    const int nMels = m_config.nMels;
    const int nMfcc = m_config.nMfcc;

    m_dctMatrix.assign(static_cast<size_t>(nMfcc), std::vector<double>(static_cast<size_t>(nMels)));

    double normFactor = std::sqrt(2.0 / nMels);

    for (int k = 0; k < nMfcc; ++k) {
        for (int n = 0; n < nMels; ++n) {
            m_dctMatrix[static_cast<size_t>(k)][static_cast<size_t>(n)] = normFactor *
                std::cos(M_PI * k * (2.0 * n + 1.0) / (2.0 * nMels));
        }
    }

    for (int n = 0; n < nMels; ++n) {
        m_dctMatrix[0][static_cast<size_t>(n)] *= std::sqrt(0.5);
    }
}

void FeatureExtractor::initContrastBands() {
    /**
     * Biên các dải octave: [0, fmin, 2 fmin, 4 fmin, ..., 2^n fmin]
     *
     * Dải k gồm các bin có tần số trong [lo, hi], cộng thêm bin ngay
     * dưới lo (k > 0); dải cuối kéo tới Nyquist. Các dải trừ dải cuối
     * bỏ bin cao nhất. Số bin lấy làm đỉnh/đáy = max(1, round(q * count)).
     */

    const int nBands = m_config.contrastBands;
    const double nyquist = m_config.sampleRate / 2.0;

    std::vector<double> octa(static_cast<size_t>(nBands + 2), 0.0);
    for (int i = 1; i < nBands + 2; ++i) {
        octa[static_cast<size_t>(i)] = m_config.contrastFmin * std::pow(2.0, i - 1);
    }

    for (int i = 0; i < nBands + 1; ++i) {
        if (octa[static_cast<size_t>(i)] >= nyquist) {
            std::ostringstream oss;
            oss << "Spectral contrast band edge " << octa[static_cast<size_t>(i)]
                << " Hz exceeds Nyquist (" << nyquist << " Hz)";
            throw FeatureExtractionError(oss.str());
        }
    }

    m_contrastBins.assign(static_cast<size_t>(nBands + 1), std::vector<size_t>());
    m_contrastQuantileCount.assign(static_cast<size_t>(nBands + 1), 1);

    for (int band = 0; band <= nBands; ++band) {
        double fLow = octa[static_cast<size_t>(band)];
        double fHigh = octa[static_cast<size_t>(band + 1)];

        std::vector<bool> mask(m_numBins, false);
        bool found = false;
        size_t firstBin = 0;
        for (size_t k = 0; k < m_numBins; ++k) {
            double freq = binFrequency(k);
            if (freq >= fLow && freq <= fHigh) {
                mask[k] = true;
                if (!found) {
                    firstBin = k;
                    found = true;
                }
            }
        }

        if (!found) {
            std::ostringstream oss;
            oss << "Spectral contrast band " << band << " [" << fLow << ", " << fHigh
                << "] Hz contains no FFT bins";
            throw FeatureExtractionError(oss.str());
        }

        if (band > 0 && firstBin > 0) {
            mask[firstBin - 1] = true;
        }
        if (band == nBands) {
            for (size_t k = firstBin + 1; k < m_numBins; ++k) {
                mask[k] = true;
            }
        }

        std::vector<size_t>& bins = m_contrastBins[static_cast<size_t>(band)];
        for (size_t k = 0; k < m_numBins; ++k) {
            if (mask[k]) {
                bins.push_back(k);
            }
        }
        size_t count = bins.size();

        if (band < nBands && bins.size() > 1) {
            bins.pop_back();
        }

        // rint: làm tròn về số chẵn gần nhất khi ở giữa
        double q = std::nearbyint(m_config.contrastQuantile * static_cast<double>(count));
        size_t quantileCount = static_cast<size_t>(std::max(1.0, q));
        m_contrastQuantileCount[static_cast<size_t>(band)] = std::min(quantileCount, bins.size());
    }
}

void FeatureExtractor::initFFT() {
    m_fft = std::make_unique<FftPlan>(m_config.nFft);
}

int FeatureExtractor::parallelThreads() const {
    return m_config.numThreads > 0 ? m_config.numThreads : omp_get_max_threads();
}

// ============================================================================
// MAIN EXTRACTION
// ============================================================================

size_t FeatureExtractor::frameCount(size_t numSamples) const {
    return 1 + numSamples / static_cast<size_t>(m_config.hopLength);
}

DescriptorSet FeatureExtractor::extract(const std::vector<float>& signal) const {
    /**
     * Quy trình:
     * 1. STFT (magnitude + power)
     * 2. Mel power -> MFCC
     * 3. Tuning -> chroma
     * 4. Contrast, centroid, bandwidth, rolloff
     * 5. ZCR trên tín hiệu thời gian
     */

    if (signal.empty()) {
        throw FeatureExtractionError("Cannot extract features from an empty signal");
    }

    DescriptorSet set;

    // ----- BƯỚC 1: STFT -----
    Spectrogram spec = computeSpectrogram(signal);
    set.numFrames = spec.numFrames;

    // ----- BƯỚC 2: Mel + MFCC -----
    set.melSpectrogram = computeMelSpectrogram(spec);
    set.mfcc = computeMfcc(set.melSpectrogram);

    // ----- BƯỚC 3: Chroma -----
    set.tuning = estimateTuning(spec);
    set.chromaStft = computeChroma(spec, set.tuning);

    // ----- BƯỚC 4: Spectral descriptors -----
    set.spectralContrast = computeSpectralContrast(spec);
    computeSpectralShape(spec, set.spectralCentroid, set.spectralBandwidth,
                         set.spectralRolloff);

    // ----- BƯỚC 5: ZCR -----
    set.zeroCrossingRate = computeZeroCrossingRate(signal);

    for (int d = 0; d < NUM_DESCRIPTORS; ++d) {
        const FeatureMatrix& m = set.get(static_cast<Descriptor>(d));
        if (m.cols != set.numFrames || m.empty()) {
            std::ostringstream oss;
            oss << "Descriptor " << descriptorToString(static_cast<Descriptor>(d))
                << " has " << m.cols << " frames, expected " << set.numFrames;
            throw FeatureExtractionError(oss.str());
        }
    }

    return set;
}

// ============================================================================
// STFT
// ============================================================================

Spectrogram FeatureExtractor::computeSpectrogram(const std::vector<float>& signal) const {
    if (signal.empty()) {
        throw FeatureExtractionError("Cannot compute STFT of an empty signal");
    }

    const size_t nFft = static_cast<size_t>(m_config.nFft);
    const size_t hop = static_cast<size_t>(m_config.hopLength);
    const size_t pad = nFft / 2;

    // Căn giữa frame: đệm n_fft/2 số 0 mỗi bên
    std::vector<float> padded(signal.size() + 2 * pad, 0.0f);
    std::copy(signal.begin(), signal.end(), padded.begin() + static_cast<std::ptrdiff_t>(pad));

    Spectrogram spec;
    spec.numFrames = frameCount(signal.size());
    spec.numBins = m_numBins;
    spec.magnitude.assign(spec.numFrames * m_numBins, 0.0f);
    spec.power.assign(spec.numFrames * m_numBins, 0.0f);

    const int numFrames = static_cast<int>(spec.numFrames);
    const size_t numBins = m_numBins;
    const float* window = m_hannWindow.data();

    #pragma omp parallel num_threads(parallelThreads())
    {
        std::vector<float> frame(nFft);
        std::vector<std::complex<float>> bins(numBins);

        #pragma omp for schedule(static)
        for (int t = 0; t < numFrames; ++t) {
            const float* src = padded.data() + static_cast<size_t>(t) * hop;
            for (size_t n = 0; n < nFft; ++n) {
                frame[n] = src[n] * window[n];
            }

            m_fft->execute(frame.data(), bins.data());

            float* mag = spec.magnitude.data() + static_cast<size_t>(t) * numBins;
            float* pwr = spec.power.data() + static_cast<size_t>(t) * numBins;
            for (size_t k = 0; k < numBins; ++k) {
                pwr[k] = std::norm(bins[k]);
                mag[k] = std::abs(bins[k]);
            }
        }
    }

    return spec;
}

// ============================================================================
// MEL / MFCC
// ============================================================================

FeatureMatrix FeatureExtractor::computeMelSpectrogram(const Spectrogram& spec) const {
    const size_t nMels = m_melFilterbank.size();
    FeatureMatrix mel(nMels, spec.numFrames);
    const int numFrames = static_cast<int>(spec.numFrames);

    #pragma omp parallel for schedule(static) num_threads(parallelThreads())
    for (int t = 0; t < numFrames; ++t) {
        const float* power = spec.powerFrame(static_cast<size_t>(t));
        for (size_t m = 0; m < nMels; ++m) {
            const std::vector<float>& filter = m_melFilterbank[m];
            double energy = 0.0;
            for (size_t k = m_melFilterStart[m]; k < m_melFilterEnd[m]; ++k) {
                energy += static_cast<double>(filter[k]) * power[k];
            }
            mel.at(m, static_cast<size_t>(t)) = static_cast<float>(energy);
        }
    }

    return mel;
}

FeatureMatrix FeatureExtractor::computeMfcc(const FeatureMatrix& melPower) const {
    /**
     * 1. Log compression: power_to_db với top_db trên toàn ma trận
     * 2. DCT-II ortho theo trục mel, giữ n_mfcc hệ số đầu
     */

    FeatureMatrix logMel = melPower;
    powerToDb(logMel, m_config.topDb);

    const size_t nMfcc = m_dctMatrix.size();
    const size_t nMels = logMel.rows;
    FeatureMatrix mfcc(nMfcc, logMel.cols);

    for (size_t t = 0; t < logMel.cols; ++t) {
        for (size_t c = 0; c < nMfcc; ++c) {
            double sum = 0.0;
            for (size_t m = 0; m < nMels; ++m) {
                sum += m_dctMatrix[c][m] * logMel.at(m, t);
            }
            mfcc.at(c, t) = static_cast<float>(sum);
        }
    }

    return mfcc;
}

// ============================================================================
// CHROMA
// ============================================================================

float FeatureExtractor::estimateTuning(const Spectrogram& spec) const {
    /**
     * Ước lượng độ lệch tuning so với A440:
     *
     * 1. Trong [150, 4000] Hz, tìm các đỉnh cục bộ của power vượt
     *    0.1 * max của frame
     * 2. Nội suy parabol để có tần số đỉnh chính xác hơn bin
     * 3. Giữ các đỉnh có độ lớn >= median
     * 4. Lấy phần lẻ semitone của từng đỉnh, histogram độ phân giải
     *    0.01, chọn bin đông nhất
     */

    const size_t K = spec.numBins;
    const double sr = static_cast<double>(m_config.sampleRate);
    const double nFft = static_cast<double>(m_config.nFft);
    const double fmin = TUNING_FMIN;
    const double fmax = std::min(static_cast<double>(TUNING_FMAX), sr / 2.0);

    std::vector<double> pitches;
    std::vector<double> magnitudes;
    std::vector<double> thresholded(K);

    for (size_t t = 0; t < spec.numFrames; ++t) {
        const float* S = spec.powerFrame(t);

        float frameMax = *std::max_element(S, S + K);
        double ref = TUNING_PEAK_THRESHOLD * static_cast<double>(frameMax);
        for (size_t k = 0; k < K; ++k) {
            thresholded[k] = (S[k] > ref) ? static_cast<double>(S[k]) : 0.0;
        }

        for (size_t k = 0; k < K; ++k) {
            double freq = binFrequency(k);
            if (!(freq >= fmin && freq < fmax)) {
                continue;
            }

            // Cực đại cục bộ với biên được đệm bằng chính nó
            double prev = (k > 0) ? thresholded[k - 1] : thresholded[k];
            double next = (k + 1 < K) ? thresholded[k + 1] : thresholded[k];
            if (!(thresholded[k] > prev && thresholded[k] >= next)) {
                continue;
            }

            double shift = 0.0;
            double gradient = 0.0;
            if (k > 0 && k + 1 < K) {
                double a = static_cast<double>(S[k + 1]) + S[k - 1] - 2.0 * S[k];
                double b = (static_cast<double>(S[k + 1]) - S[k - 1]) / 2.0;
                shift = (std::fabs(b) >= std::fabs(a)) ? 0.0 : -b / a;
                gradient = b;
            } else if (k == 0) {
                gradient = static_cast<double>(S[1]) - S[0];
            } else {
                gradient = static_cast<double>(S[k]) - S[k - 1];
            }

            double pitch = (static_cast<double>(k) + shift) * sr / nFft;
            if (pitch > 0.0) {
                pitches.push_back(pitch);
                magnitudes.push_back(static_cast<double>(S[k]) + 0.5 * gradient * shift);
            }
        }
    }

    if (pitches.empty()) {
        return 0.0f;
    }

    double magThreshold = median(magnitudes);

    const int numBins = static_cast<int>(std::ceil(1.0 / TUNING_RESOLUTION));
    const double step = 1.0 / numBins;
    std::vector<int> counts(static_cast<size_t>(numBins), 0);
    bool any = false;

    for (size_t i = 0; i < pitches.size(); ++i) {
        if (magnitudes[i] < magThreshold) {
            continue;
        }
        double octs = std::log2(pitches[i] / (440.0 / 16.0));
        double residual = positiveRemainder(DEFAULT_N_CHROMA * octs, 1.0);
        if (residual >= 0.5) {
            residual -= 1.0;
        }

        int bin = static_cast<int>((residual + 0.5) * numBins);
        bin = std::max(0, std::min(numBins - 1, bin));
        if (residual < -0.5 + bin * step && bin > 0) {
            --bin;
        } else if (bin + 1 < numBins && residual >= -0.5 + (bin + 1) * step) {
            ++bin;
        }
        counts[static_cast<size_t>(bin)]++;
        any = true;
    }

    if (!any) {
        return 0.0f;
    }

    int best = static_cast<int>(std::max_element(counts.begin(), counts.end()) - counts.begin());
    return static_cast<float>(-0.5 + best * step);
}

std::vector<std::vector<double>> FeatureExtractor::buildChromaFilterbank(float tuning) const {
    /**
     * Chroma filterbank (Ellis):
     * - Mỗi bin FFT k >= 1 ứng với cao độ p = 12 * log2(f_k / (A / 16)),
     *   A = 440 * 2^(tuning / 12); bin 0 lấy p_1 - 18
     * - Trọng số Gauss theo khoảng cách vòng tới lớp chroma, độ rộng
     *   bằng khoảng cách giữa hai bin liền kề (tối thiểu 1 semitone)
     * - Chuẩn hóa L2 theo cột, nhân trọng số octave quanh C5 (rộng 2 octave)
     * - Xoay để hàng 0 là C
     */

    const int nChroma = m_config.nChroma;
    const int nFft = m_config.nFft;
    const double sr = static_cast<double>(m_config.sampleRate);
    const double a440 = 440.0 * std::pow(2.0, static_cast<double>(tuning) / nChroma);
    const double ctroct = 5.0;
    const double octwidth = 2.0;

    std::vector<double> frqbins(static_cast<size_t>(nFft));
    for (int i = 1; i < nFft; ++i) {
        double freq = i * sr / nFft;
        frqbins[static_cast<size_t>(i)] = nChroma * std::log2(freq / (a440 / 16.0));
    }
    frqbins[0] = frqbins[1] - 1.5 * nChroma;

    std::vector<double> binwidth(static_cast<size_t>(nFft), 1.0);
    for (int i = 0; i + 1 < nFft; ++i) {
        binwidth[static_cast<size_t>(i)] =
            std::max(frqbins[static_cast<size_t>(i + 1)] - frqbins[static_cast<size_t>(i)], 1.0);
    }

    const double halfChroma = std::round(nChroma / 2.0);
    std::vector<std::vector<double>> wts(static_cast<size_t>(nChroma),
                                         std::vector<double>(static_cast<size_t>(nFft)));
    for (int c = 0; c < nChroma; ++c) {
        for (int i = 0; i < nFft; ++i) {
            double d = frqbins[static_cast<size_t>(i)] - c;
            d = positiveRemainder(d + halfChroma + 10.0 * nChroma, nChroma) - halfChroma;
            double x = 2.0 * d / binwidth[static_cast<size_t>(i)];
            wts[static_cast<size_t>(c)][static_cast<size_t>(i)] = std::exp(-0.5 * x * x);
        }
    }

    for (int i = 0; i < nFft; ++i) {
        double norm = 0.0;
        for (int c = 0; c < nChroma; ++c) {
            double w = wts[static_cast<size_t>(c)][static_cast<size_t>(i)];
            norm += w * w;
        }
        norm = std::sqrt(norm);
        double octaveWeight = std::exp(-0.5 * std::pow(
            (frqbins[static_cast<size_t>(i)] / nChroma - ctroct) / octwidth, 2.0));
        for (int c = 0; c < nChroma; ++c) {
            double& w = wts[static_cast<size_t>(c)][static_cast<size_t>(i)];
            if (norm >= DOUBLE_TINY) {
                w /= norm;
            }
            w *= octaveWeight;
        }
    }

    // Xoay -3 * (n_chroma / 12) hàng, giữ 1 + n_fft/2 cột
    const int roll = 3 * (nChroma / 12);
    std::vector<std::vector<double>> filterbank(static_cast<size_t>(nChroma),
                                                std::vector<double>(m_numBins));
    for (int c = 0; c < nChroma; ++c) {
        const std::vector<double>& src = wts[static_cast<size_t>((c + roll) % nChroma)];
        std::copy(src.begin(), src.begin() + static_cast<std::ptrdiff_t>(m_numBins),
                  filterbank[static_cast<size_t>(c)].begin());
    }

    return filterbank;
}

FeatureMatrix FeatureExtractor::computeChroma(const Spectrogram& spec, float tuning) const {
    std::vector<std::vector<double>> filterbank = buildChromaFilterbank(tuning);

    const size_t nChroma = filterbank.size();
    FeatureMatrix chroma(nChroma, spec.numFrames);
    const int numFrames = static_cast<int>(spec.numFrames);

    #pragma omp parallel for schedule(static) num_threads(parallelThreads())
    for (int t = 0; t < numFrames; ++t) {
        const float* power = spec.powerFrame(static_cast<size_t>(t));
        std::vector<double> raw(nChroma, 0.0);
        double peak = 0.0;
        for (size_t c = 0; c < nChroma; ++c) {
            double sum = 0.0;
            for (size_t k = 0; k < m_numBins; ++k) {
                sum += filterbank[c][k] * power[k];
            }
            raw[c] = sum;
            peak = std::max(peak, std::fabs(sum));
        }

        // Chuẩn hóa theo max của frame (bỏ qua frame im lặng)
        double scale = (peak >= FLOAT_TINY) ? 1.0 / peak : 1.0;
        for (size_t c = 0; c < nChroma; ++c) {
            chroma.at(c, static_cast<size_t>(t)) = static_cast<float>(raw[c] * scale);
        }
    }

    return chroma;
}

// ============================================================================
// SPECTRAL DESCRIPTORS
// ============================================================================

FeatureMatrix FeatureExtractor::computeSpectralContrast(const Spectrogram& spec) const {
    /**
     * Với mỗi dải octave: sắp xếp magnitude, đáy = trung bình q bin
     * nhỏ nhất, đỉnh = trung bình q bin lớn nhất. Contrast là hiệu
     * dB(đỉnh) - dB(đáy), mỗi ma trận dùng top_db riêng.
     */

    const size_t nRows = m_contrastBins.size();
    FeatureMatrix peak(nRows, spec.numFrames);
    FeatureMatrix valley(nRows, spec.numFrames);
    const int numFrames = static_cast<int>(spec.numFrames);

    #pragma omp parallel num_threads(parallelThreads())
    {
        std::vector<float> sorted;

        #pragma omp for schedule(static)
        for (int t = 0; t < numFrames; ++t) {
            const float* magnitude = spec.magnitudeFrame(static_cast<size_t>(t));
            for (size_t band = 0; band < nRows; ++band) {
                const std::vector<size_t>& bins = m_contrastBins[band];
                size_t q = m_contrastQuantileCount[band];

                sorted.resize(bins.size());
                for (size_t i = 0; i < bins.size(); ++i) {
                    sorted[i] = magnitude[bins[i]];
                }
                std::sort(sorted.begin(), sorted.end());

                double low = 0.0, high = 0.0;
                for (size_t i = 0; i < q; ++i) {
                    low += sorted[i];
                    high += sorted[sorted.size() - q + i];
                }
                valley.at(band, static_cast<size_t>(t)) = static_cast<float>(low / q);
                peak.at(band, static_cast<size_t>(t)) = static_cast<float>(high / q);
            }
        }
    }

    powerToDb(peak, m_config.topDb);
    powerToDb(valley, m_config.topDb);

    FeatureMatrix contrast(nRows, spec.numFrames);
    for (size_t i = 0; i < contrast.values.size(); ++i) {
        contrast.values[i] = peak.values[i] - valley.values[i];
    }
    return contrast;
}

void FeatureExtractor::computeSpectralShape(const Spectrogram& spec,
                                            FeatureMatrix& centroid,
                                            FeatureMatrix& bandwidth,
                                            FeatureMatrix& rolloff) const {
    /**
     * Trên magnitude spectrum chuẩn hóa L1 của từng frame:
     *   centroid  = sum(f * S)
     *   bandwidth = sqrt(sum(S * (f - centroid)^2))
     *   rolloff   = tần số nhỏ nhất mà năng lượng tích lũy >= 85%
     */

    centroid = FeatureMatrix(1, spec.numFrames);
    bandwidth = FeatureMatrix(1, spec.numFrames);
    rolloff = FeatureMatrix(1, spec.numFrames);

    const size_t K = spec.numBins;
    const double rollPercent = m_config.rollPercent;
    const int numFrames = static_cast<int>(spec.numFrames);

    #pragma omp parallel for schedule(static) num_threads(parallelThreads())
    for (int t = 0; t < numFrames; ++t) {
        const float* S = spec.magnitudeFrame(static_cast<size_t>(t));

        double total = 0.0;
        for (size_t k = 0; k < K; ++k) {
            total += S[k];
        }
        // Frame gần như im lặng: giữ nguyên phổ (không chia cho ~0)
        double norm = (total >= FLOAT_TINY) ? total : 1.0;

        double c = 0.0;
        for (size_t k = 0; k < K; ++k) {
            c += binFrequency(k) * (S[k] / norm);
        }

        double spread = 0.0;
        for (size_t k = 0; k < K; ++k) {
            double dev = binFrequency(k) - c;
            spread += (S[k] / norm) * dev * dev;
        }

        double threshold = rollPercent * total;
        double cumulative = 0.0;
        double rollFreq = 0.0;
        for (size_t k = 0; k < K; ++k) {
            cumulative += S[k];
            if (cumulative >= threshold) {
                rollFreq = binFrequency(k);
                break;
            }
        }

        centroid.at(0, static_cast<size_t>(t)) = static_cast<float>(c);
        bandwidth.at(0, static_cast<size_t>(t)) = static_cast<float>(std::sqrt(spread));
        rolloff.at(0, static_cast<size_t>(t)) = static_cast<float>(rollFreq);
    }
}

FeatureMatrix FeatureExtractor::computeZeroCrossingRate(const std::vector<float>& signal) const {
    /**
     * ZCR = (số lần đổi dấu trong frame) / frame_length
     *
     * - Căn giữa bằng cách lặp lại mẫu biên n_fft/2 lần mỗi bên
     * - |x| <= 1e-10 coi là 0, và 0 được tính là dương
     * - Mẫu đầu tiên của frame không được tính là crossing
     */

    if (signal.empty()) {
        throw FeatureExtractionError("Cannot compute zero crossing rate of an empty signal");
    }

    const size_t frameLength = static_cast<size_t>(m_config.nFft);
    const size_t hop = static_cast<size_t>(m_config.hopLength);
    const size_t pad = frameLength / 2;

    std::vector<uint8_t> negative(signal.size() + 2 * pad);
    auto isNegative = [](float x) -> uint8_t {
        if (std::fabs(x) <= ZCR_ZERO_THRESHOLD) {
            return 0;
        }
        return x < 0.0f ? 1 : 0;
    };
    uint8_t first = isNegative(signal.front());
    uint8_t last = isNegative(signal.back());
    for (size_t i = 0; i < pad; ++i) {
        negative[i] = first;
        negative[pad + signal.size() + i] = last;
    }
    for (size_t i = 0; i < signal.size(); ++i) {
        negative[pad + i] = isNegative(signal[i]);
    }

    size_t numFrames = frameCount(signal.size());
    FeatureMatrix zcr(1, numFrames);
    const int total = static_cast<int>(numFrames);

    #pragma omp parallel for schedule(static) num_threads(parallelThreads())
    for (int t = 0; t < total; ++t) {
        const uint8_t* frame = negative.data() + static_cast<size_t>(t) * hop;
        size_t crossings = 0;
        for (size_t n = 1; n < frameLength; ++n) {
            if (frame[n] != frame[n - 1]) {
                ++crossings;
            }
        }
        zcr.at(0, static_cast<size_t>(t)) =
            static_cast<float>(static_cast<double>(crossings) / frameLength);
    }

    return zcr;
}

// ============================================================================
// UTILITY
// ============================================================================

double FeatureExtractor::hzToMel(double hz) {
    /**
     * Slaney: tuyến tính 3 mel / 200 Hz dưới 1 kHz,
     * logarit phía trên (27 mel cho mỗi hệ số 6.4)
     */
    const double fSp = 200.0 / 3.0;
    const double minLogHz = 1000.0;
    const double minLogMel = minLogHz / fSp;
    const double logstep = std::log(6.4) / 27.0;

    if (hz >= minLogHz) {
        return minLogMel + std::log(hz / minLogHz) / logstep;
    }
    return hz / fSp;
}

double FeatureExtractor::melToHz(double mel) {
    const double fSp = 200.0 / 3.0;
    const double minLogHz = 1000.0;
    const double minLogMel = minLogHz / fSp;
    const double logstep = std::log(6.4) / 27.0;

    if (mel >= minLogMel) {
        return minLogHz * std::exp(logstep * (mel - minLogMel));
    }
    return fSp * mel;
}

void FeatureExtractor::powerToDb(FeatureMatrix& matrix, float topDb) {
    if (matrix.values.empty()) {
        return;
    }

    double maxDb = -std::numeric_limits<double>::infinity();
    std::vector<double> db(matrix.values.size());
    for (size_t i = 0; i < matrix.values.size(); ++i) {
        db[i] = 10.0 * std::log10(std::max(POWER_AMIN, static_cast<double>(matrix.values[i])));
        maxDb = std::max(maxDb, db[i]);
    }

    double floorDb = maxDb - topDb;
    for (size_t i = 0; i < matrix.values.size(); ++i) {
        matrix.values[i] = static_cast<float>(std::max(db[i], floorDb));
    }
}

double FeatureExtractor::binFrequency(size_t bin) const {
    return static_cast<double>(bin) * m_config.sampleRate / m_config.nFft;
}

} // namespace acoustix
