/**
 * @file AudioDecoder.cpp
 * @brief Implementation of in-memory audio decoding
 */

// ============================================================================
// INCLUDES
// ============================================================================

#include "AudioDecoder.hpp"
#include "Errors.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <initializer_list>
#include <iostream>
#include <new>
#include <sstream>

// ----------------------------------------------------------------------------
// dr_wav - Single-header WAV library
// Định nghĩa DR_WAV_IMPLEMENTATION chỉ trong một file .cpp
// ----------------------------------------------------------------------------
#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

// ----------------------------------------------------------------------------
// miniaudio - chỉ dùng phần decoder (FLAC, MP3)
// WAV đã do dr_wav xử lý nên tắt bộ giải mã WAV tích hợp của miniaudio
// ----------------------------------------------------------------------------
#define MA_NO_WAV
#define MA_NO_DEVICE_IO
#define MA_NO_ENCODING
#define MA_NO_GENERATION
#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"

// ----------------------------------------------------------------------------
// FFmpeg - MP4/M4A, Ogg, WebM, AAC (API kênh AVChannelLayout, FFmpeg >= 5.1)
// ----------------------------------------------------------------------------
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/channel_layout.h>
#include <libswresample/swresample.h>
}

namespace acoustix {

namespace {

/// Số frame đọc mỗi lần từ ma_decoder
constexpr ma_uint64 DECODE_CHUNK_FRAMES = 4096;

/// Kích thước buffer của AVIOContext
constexpr int FFMPEG_IO_BUFFER_SIZE = 32768;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool hasPrefix(const ByteBuffer& bytes, size_t offset, const char* magic) {
    size_t len = std::strlen(magic);
    if (bytes.size() < offset + len) {
        return false;
    }
    return std::memcmp(bytes.data() + offset, magic, len) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool hasBytes(const ByteBuffer& bytes, size_t offset, std::initializer_list<uint8_t> magic) {
    if (bytes.size() < offset + magic.size()) {
        return false;
    }
    return std::equal(magic.begin(), magic.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset));
}

bool matchesAny(const std::string& hint, std::initializer_list<const char*> types,
                std::initializer_list<const char*> extensions) {
    for (const char* t : types) {
        if (hint == t) return true;
    }
    for (const char* ext : extensions) {
        if (endsWith(hint, ext)) return true;
    }
    return false;
}

// ============================================================================
// FFMPEG HELPERS
// ============================================================================

/**
 * @brief Nguồn đọc cho AVIOContext: payload nằm trong bộ nhớ
 */
struct MemoryReader {
    const uint8_t* data;
    size_t size;
    size_t position;
};

int readMemory(void* opaque, uint8_t* buffer, int bufferSize) {
    auto* reader = static_cast<MemoryReader*>(opaque);
    size_t remaining = reader->size - reader->position;
    if (remaining == 0) {
        return AVERROR_EOF;
    }
    size_t n = std::min(remaining, static_cast<size_t>(bufferSize));
    std::memcpy(buffer, reader->data + reader->position, n);
    reader->position += n;
    return static_cast<int>(n);
}

int64_t seekMemory(void* opaque, int64_t offset, int whence) {
    auto* reader = static_cast<MemoryReader*>(opaque);
    whence &= ~AVSEEK_FORCE;

    if (whence == AVSEEK_SIZE) {
        return static_cast<int64_t>(reader->size);
    }

    int64_t base = 0;
    switch (whence) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<int64_t>(reader->position); break;
        case SEEK_END: base = static_cast<int64_t>(reader->size); break;
        default: return AVERROR(EINVAL);
    }

    int64_t target = base + offset;
    if (target < 0 || target > static_cast<int64_t>(reader->size)) {
        return AVERROR(EINVAL);
    }
    reader->position = static_cast<size_t>(target);
    return target;
}

/**
 * @brief Demuxer FFmpeg cho container đã nhận diện (không để FFmpeg tự dò)
 */
const char* demuxerName(AudioContainer container) {
    switch (container) {
        case AudioContainer::MP4: return "mp4";
        case AudioContainer::OGG: return "ogg";
        case AudioContainer::WEBM: return "matroska";
        case AudioContainer::AAC: return "aac";
        default: return nullptr;
    }
}

std::string ffmpegError(int code) {
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buffer, sizeof(buffer));
    return buffer;
}

/**
 * @brief Giữ toàn bộ đối tượng FFmpeg của một lần giải mã, giải phóng khi ra khỏi scope
 */
struct FfmpegSession {
    MemoryReader reader{nullptr, 0, 0};
    AVIOContext* io = nullptr;
    AVFormatContext* format = nullptr;
    AVCodecContext* codec = nullptr;
    SwrContext* resampler = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;

    FfmpegSession() = default;
    FfmpegSession(const FfmpegSession&) = delete;
    FfmpegSession& operator=(const FfmpegSession&) = delete;

    ~FfmpegSession() {
        av_frame_free(&frame);
        av_packet_free(&packet);
        swr_free(&resampler);
        avcodec_free_context(&codec);
        // AVFMT_FLAG_CUSTOM_IO: close_input không giải phóng pb
        avformat_close_input(&format);
        if (io) {
            av_freep(&io->buffer);
            avio_context_free(&io);
        }
    }
};

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

AudioDecoder::AudioDecoder(const PipelineConfig& config)
    : m_processor(config)
{
    av_log_set_level(AV_LOG_ERROR);
}

// ============================================================================
// CONTAINER DETECTION
// ============================================================================

AudioContainer AudioDecoder::detectContainer(const ByteBuffer& bytes,
                                             const std::string& mediaTypeHint) {
    // RIFF....WAVE / RF64....WAVE
    if ((hasPrefix(bytes, 0, "RIFF") || hasPrefix(bytes, 0, "RF64")) &&
        hasPrefix(bytes, 8, "WAVE")) {
        return AudioContainer::WAV;
    }
    // Wave64: GUID "riff" + ... ; 4 byte đầu là "riff" chữ thường
    if (hasPrefix(bytes, 0, "riff") && bytes.size() >= 40) {
        return AudioContainer::WAV;
    }
    if (hasPrefix(bytes, 0, "fLaC")) {
        return AudioContainer::FLAC;
    }
    if (hasPrefix(bytes, 0, "ID3")) {
        return AudioContainer::MP3;
    }
    // ISO BMFF: box "ftyp" tại offset 4 (m4a từ ứng dụng di động)
    if (hasPrefix(bytes, 4, "ftyp")) {
        return AudioContainer::MP4;
    }
    if (hasPrefix(bytes, 0, "OggS")) {
        return AudioContainer::OGG;
    }
    // EBML header (Matroska/WebM)
    if (hasBytes(bytes, 0, {0x1A, 0x45, 0xDF, 0xA3})) {
        return AudioContainer::WEBM;
    }
    if (bytes.size() >= 2 && bytes[0] == 0xFF) {
        // ADTS: sync 12 bit, layer luôn = 00 (FF F1 / FF F9)
        if ((bytes[1] & 0xF6) == 0xF0) {
            return AudioContainer::AAC;
        }
        // MPEG audio frame sync 11 bit, layer != 00
        if ((bytes[1] & 0xE0) == 0xE0 && (bytes[1] & 0x06) != 0) {
            return AudioContainer::MP3;
        }
    }

    return containerFromHint(mediaTypeHint);
}

AudioContainer AudioDecoder::containerFromHint(const std::string& mediaTypeHint) {
    std::string hint = toLower(mediaTypeHint);
    if (hint.empty()) {
        return AudioContainer::UNKNOWN;
    }

    if (matchesAny(hint, {"audio/wav", "audio/x-wav", "audio/wave", "audio/vnd.wave"},
                   {".wav", ".wave"})) {
        return AudioContainer::WAV;
    }
    if (matchesAny(hint, {"audio/flac", "audio/x-flac"}, {".flac"})) {
        return AudioContainer::FLAC;
    }
    if (matchesAny(hint, {"audio/mpeg", "audio/mp3"}, {".mp3"})) {
        return AudioContainer::MP3;
    }
    if (matchesAny(hint, {"audio/mp4", "audio/m4a", "audio/x-m4a", "video/mp4"},
                   {".m4a", ".mp4"})) {
        return AudioContainer::MP4;
    }
    if (matchesAny(hint, {"audio/ogg", "audio/opus", "application/ogg"},
                   {".ogg", ".oga", ".opus"})) {
        return AudioContainer::OGG;
    }
    if (matchesAny(hint, {"audio/webm", "video/webm"}, {".webm"})) {
        return AudioContainer::WEBM;
    }
    if (matchesAny(hint, {"audio/aac", "audio/x-aac", "audio/aacp"}, {".aac"})) {
        return AudioContainer::AAC;
    }
    return AudioContainer::UNKNOWN;
}

std::string AudioDecoder::mediaTypeFromFilename(const std::string& filename) {
    std::string name = toLower(filename);
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos) {
        return "application/octet-stream";
    }
    std::string ext = name.substr(dot);

    if (ext == ".wav" || ext == ".wave") return "audio/wav";
    if (ext == ".flac") return "audio/flac";
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".ogg" || ext == ".oga" || ext == ".opus") return "audio/ogg";
    if (ext == ".m4a" || ext == ".mp4") return "audio/mp4";
    if (ext == ".aac") return "audio/aac";
    if (ext == ".webm") return "audio/webm";
    return "application/octet-stream";
}

// ============================================================================
// DECODING
// ============================================================================

AudioData AudioDecoder::decode(const ByteBuffer& bytes, const std::string& mediaTypeHint) const {
    if (bytes.empty()) {
        throw DecodeError("Empty audio payload");
    }

    AudioContainer container = detectContainer(bytes, mediaTypeHint);
    if (container == AudioContainer::UNKNOWN) {
        std::string hint = mediaTypeHint.empty() ? std::string("none") : mediaTypeHint;
        throw DecodeError("Unrecognized or unsupported audio format (hint: " + hint + ")");
    }

    std::vector<float> interleaved;
    uint32_t sourceRate = 0;
    uint16_t sourceChannels = 0;

    if (container == AudioContainer::WAV) {
        decodeWav(bytes, interleaved, sourceRate, sourceChannels);
    } else if (container == AudioContainer::FLAC || container == AudioContainer::MP3) {
        decodeCompressed(bytes, container, interleaved, sourceRate, sourceChannels);
    } else {
        decodeWithFfmpeg(bytes, container, interleaved, sourceRate, sourceChannels);
    }

    AudioData audio;
    audio.samples = m_processor.conditionAudio(interleaved, sourceRate, sourceChannels);
    audio.sampleRate = m_processor.getTargetSampleRate();
    audio.channels = 1;
    audio.sourceSampleRate = sourceRate;
    audio.sourceChannels = sourceChannels;
    audio.container = container;

    return audio;
}

void AudioDecoder::decodeWav(const ByteBuffer& bytes,
                             std::vector<float>& interleaved,
                             uint32_t& sampleRate,
                             uint16_t& channels) const {
    /**
     * dr_wav tự động xử lý:
     * - Các bit depth khác nhau (8, 16, 24, 32-bit), PCM và IEEE float
     * - A-law / mu-law, ADPCM
     * Output luôn là float [-1.0, 1.0]
     */

    drwav wav;
    if (!drwav_init_memory(&wav, bytes.data(), bytes.size(), nullptr)) {
        throw DecodeError("Malformed WAV stream");
    }

    sampleRate = wav.sampleRate;
    channels = wav.channels;
    drwav_uint64 totalFrames = wav.totalPCMFrameCount;

    if (sampleRate == 0 || channels == 0) {
        drwav_uninit(&wav);
        throw DecodeError("Invalid WAV header parameters");
    }

    interleaved.resize(static_cast<size_t>(totalFrames) * channels);
    drwav_uint64 framesRead = 0;
    if (totalFrames > 0) {
        framesRead = drwav_read_pcm_frames_f32(&wav, totalFrames, interleaved.data());
    }
    drwav_uninit(&wav);

    if (framesRead != totalFrames) {
        // File bị cắt cụt: giữ phần đọc được
        interleaved.resize(static_cast<size_t>(framesRead) * channels);
    }
}

void AudioDecoder::decodeCompressed(const ByteBuffer& bytes,
                                    AudioContainer container,
                                    std::vector<float>& interleaved,
                                    uint32_t& sampleRate,
                                    uint16_t& channels) const {
    // 0 kênh / 0 Hz = giữ định dạng gốc; downmix và resample do SignalProcessor
    ma_decoder_config config = ma_decoder_config_init(ma_format_f32, 0, 0);
    config.encodingFormat = (container == AudioContainer::FLAC)
                                ? ma_encoding_format_flac
                                : ma_encoding_format_mp3;

    ma_decoder decoder;
    if (ma_decoder_init_memory(bytes.data(), bytes.size(), &config, &decoder) != MA_SUCCESS) {
        throw DecodeError("Malformed " + containerToString(container) + " stream");
    }

    sampleRate = decoder.outputSampleRate;
    channels = static_cast<uint16_t>(decoder.outputChannels);

    if (sampleRate == 0 || channels == 0) {
        ma_decoder_uninit(&decoder);
        throw DecodeError("Invalid " + containerToString(container) + " stream parameters");
    }

    std::vector<float> chunk(static_cast<size_t>(DECODE_CHUNK_FRAMES) * channels);
    for (;;) {
        ma_uint64 framesRead = 0;
        ma_result result = ma_decoder_read_pcm_frames(&decoder, chunk.data(),
                                                      DECODE_CHUNK_FRAMES, &framesRead);
        interleaved.insert(interleaved.end(), chunk.begin(),
                           chunk.begin() + static_cast<std::ptrdiff_t>(framesRead * channels));
        if (result == MA_AT_END || framesRead == 0) {
            break;
        }
        if (result != MA_SUCCESS) {
            ma_decoder_uninit(&decoder);
            throw DecodeError("Failed while decoding " + containerToString(container) + " stream");
        }
    }

    ma_decoder_uninit(&decoder);

    if (interleaved.empty()) {
        throw DecodeError("No audio frames in " + containerToString(container) + " stream");
    }
}

void AudioDecoder::decodeWithFfmpeg(const ByteBuffer& bytes,
                                    AudioContainer container,
                                    std::vector<float>& interleaved,
                                    uint32_t& sampleRate,
                                    uint16_t& channels) const {
    /**
     * demux (libavformat, đọc qua AVIOContext) -> decode (libavcodec)
     * -> float interleaved (libswresample, giữ tần số và số kênh gốc).
     * Downmix/resample do SignalProcessor đảm nhận như các định dạng khác.
     */

    const std::string name = containerToString(container);
    FfmpegSession session;
    session.reader = MemoryReader{bytes.data(), bytes.size(), 0};

    auto* ioBuffer = static_cast<unsigned char*>(av_malloc(FFMPEG_IO_BUFFER_SIZE));
    if (!ioBuffer) {
        throw std::bad_alloc();
    }
    session.io = avio_alloc_context(ioBuffer, FFMPEG_IO_BUFFER_SIZE, 0, &session.reader,
                                    &readMemory, nullptr, &seekMemory);
    if (!session.io) {
        av_free(ioBuffer);
        throw std::bad_alloc();
    }

    session.format = avformat_alloc_context();
    if (!session.format) {
        throw std::bad_alloc();
    }
    session.format->pb = session.io;
    session.format->flags |= AVFMT_FLAG_CUSTOM_IO;

    const char* demuxer = demuxerName(container);
    const AVInputFormat* inputFormat = demuxer ? av_find_input_format(demuxer) : nullptr;
    if (!inputFormat) {
        throw DecodeError("No demuxer available for " + name + " streams");
    }

    // Lỗi: avformat_open_input tự giải phóng format và đặt về nullptr
    int ret = avformat_open_input(&session.format, nullptr, inputFormat, nullptr);
    if (ret < 0) {
        throw DecodeError("Malformed " + name + " stream: " + ffmpegError(ret));
    }
    ret = avformat_find_stream_info(session.format, nullptr);
    if (ret < 0) {
        throw DecodeError("Cannot read " + name + " stream info: " + ffmpegError(ret));
    }

    int streamIndex = av_find_best_stream(session.format, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (streamIndex < 0) {
        throw DecodeError("No audio stream in " + name + " container");
    }

    const AVCodecParameters* params = session.format->streams[streamIndex]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        throw DecodeError("Unsupported codec in " + name + " stream: " +
                          avcodec_get_name(params->codec_id));
    }

    session.codec = avcodec_alloc_context3(codec);
    if (!session.codec) {
        throw std::bad_alloc();
    }
    if (avcodec_parameters_to_context(session.codec, params) < 0 ||
        avcodec_open2(session.codec, codec, nullptr) < 0) {
        throw DecodeError("Cannot open " + std::string(codec->name) + " decoder");
    }

    if (session.codec->sample_rate <= 0 || session.codec->ch_layout.nb_channels <= 0) {
        throw DecodeError("Invalid " + name + " stream parameters");
    }
    sampleRate = static_cast<uint32_t>(session.codec->sample_rate);
    channels = static_cast<uint16_t>(session.codec->ch_layout.nb_channels);

    // Chỉ đổi sample format sang float interleaved
    AVChannelLayout layout;
    if (session.codec->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&layout, session.codec->ch_layout.nb_channels);
    } else {
        av_channel_layout_copy(&layout, &session.codec->ch_layout);
    }
    ret = swr_alloc_set_opts2(&session.resampler,
                              &layout, AV_SAMPLE_FMT_FLT, session.codec->sample_rate,
                              &layout, session.codec->sample_fmt, session.codec->sample_rate,
                              0, nullptr);
    av_channel_layout_uninit(&layout);
    if (ret < 0 || swr_init(session.resampler) < 0) {
        throw DecodeError("Cannot convert " + name + " samples to float");
    }

    session.packet = av_packet_alloc();
    session.frame = av_frame_alloc();
    if (!session.packet || !session.frame) {
        throw std::bad_alloc();
    }

    auto appendConverted = [&](const uint8_t** input, int inputSamples) {
        int outCount = swr_get_out_samples(session.resampler, inputSamples);
        if (outCount <= 0) {
            return;
        }
        size_t offset = interleaved.size();
        interleaved.resize(offset + static_cast<size_t>(outCount) * channels);
        auto* output = reinterpret_cast<uint8_t*>(interleaved.data() + offset);
        int converted = swr_convert(session.resampler, &output, outCount, input, inputSamples);
        if (converted < 0) {
            throw DecodeError("Sample conversion failed for " + name + " stream");
        }
        interleaved.resize(offset + static_cast<size_t>(converted) * channels);
    };

    auto drainFrames = [&]() {
        for (;;) {
            int r = avcodec_receive_frame(session.codec, session.frame);
            if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) {
                return;
            }
            if (r < 0) {
                throw DecodeError("Failed while decoding " + name + " stream: " + ffmpegError(r));
            }
            appendConverted(const_cast<const uint8_t**>(session.frame->extended_data),
                            session.frame->nb_samples);
            av_frame_unref(session.frame);
        }
    };

    // Lỗi đọc giữa chừng (file bị cắt cụt): giữ phần đã giải mã
    while (av_read_frame(session.format, session.packet) >= 0) {
        if (session.packet->stream_index != streamIndex) {
            av_packet_unref(session.packet);
            continue;
        }
        ret = avcodec_send_packet(session.codec, session.packet);
        av_packet_unref(session.packet);
        if (ret == AVERROR_INVALIDDATA) {
            continue;
        }
        if (ret < 0) {
            throw DecodeError("Failed while decoding " + name + " stream: " + ffmpegError(ret));
        }
        drainFrames();
    }

    // Flush decoder và resampler
    ret = avcodec_send_packet(session.codec, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        throw DecodeError("Failed to flush " + name + " decoder: " + ffmpegError(ret));
    }
    drainFrames();
    appendConverted(nullptr, 0);

    if (interleaved.empty()) {
        throw DecodeError("No audio frames in " + name + " stream");
    }
}

} // namespace acoustix
