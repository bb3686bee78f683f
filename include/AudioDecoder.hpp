/**
 * @file AudioDecoder.hpp
 * @brief In-memory audio decoding for uploaded recordings
 *
 * Nhận diện container theo magic bytes (ưu tiên) hoặc media type /
 * phần mở rộng file (dự phòng), giải mã về float rồi chuyển qua
 * SignalProcessor để downmix, resample và kẹp biên độ.
 *
 *   - WAV (RIFF/WAVE, RF64, Wave64): dr_wav
 *   - FLAC, MP3: miniaudio
 *   - MP4/M4A, Ogg/Opus, WebM, AAC (ADTS): FFmpeg (AVIOContext trên bộ nhớ)
 *
 * Không đọc/ghi file: mọi thao tác đều trên bộ nhớ.
 */

#ifndef ACOUSTIX_AUDIO_DECODER_HPP
#define ACOUSTIX_AUDIO_DECODER_HPP

#include "Common.h"
#include "Config.h"
#include "SignalPrep.hpp"

#include <string>
#include <vector>

namespace acoustix {

/**
 * @class AudioDecoder
 * @brief Giải mã byte thô thành AudioData mono tại tần số mục tiêu
 */
class AudioDecoder {
public:
    explicit AudioDecoder(const PipelineConfig& config = PipelineConfig());

    /**
     * @brief Giải mã một bản ghi
     *
     * @param bytes Nội dung file
     * @param mediaTypeHint Content type hoặc tên file (có thể rỗng)
     * @return AudioData mono, float trong [-1, 1], tần số mục tiêu
     * @throws DecodeError nếu payload rỗng, không nhận diện được,
     *         hoặc thư viện giải mã báo lỗi
     */
    AudioData decode(const ByteBuffer& bytes, const std::string& mediaTypeHint = "") const;

    /**
     * @brief Nhận diện container: magic bytes trước, sau đó tới hint
     */
    static AudioContainer detectContainer(const ByteBuffer& bytes,
                                          const std::string& mediaTypeHint);

    /**
     * @brief Suy container từ media type ("audio/wav") hoặc tên file ("a.flac")
     */
    static AudioContainer containerFromHint(const std::string& mediaTypeHint);

    /**
     * @brief Suy media type từ phần mở rộng của tên file upload
     * @return Ví dụ "audio/wav"; "application/octet-stream" nếu không biết
     */
    static std::string mediaTypeFromFilename(const std::string& filename);

    const SignalProcessor& getSignalProcessor() const { return m_processor; }

private:
    /// Giải mã WAV bằng dr_wav (mọi bit depth PCM / IEEE float)
    void decodeWav(const ByteBuffer& bytes,
                   std::vector<float>& interleaved,
                   uint32_t& sampleRate,
                   uint16_t& channels) const;

    /// Giải mã FLAC/MP3 bằng miniaudio tại tần số và số kênh gốc
    void decodeCompressed(const ByteBuffer& bytes,
                          AudioContainer container,
                          std::vector<float>& interleaved,
                          uint32_t& sampleRate,
                          uint16_t& channels) const;

    /// Giải mã các container còn lại bằng FFmpeg, giữ tần số và số kênh gốc
    void decodeWithFfmpeg(const ByteBuffer& bytes,
                          AudioContainer container,
                          std::vector<float>& interleaved,
                          uint32_t& sampleRate,
                          uint16_t& channels) const;

    SignalProcessor m_processor;     ///< Downmix/resample/clamp
};

} // namespace acoustix

#endif // ACOUSTIX_AUDIO_DECODER_HPP
