/**
 * @file Errors.h
 * @brief Exception hierarchy for the classification pipeline
 *
 * Mỗi lỗi mang một ErrorKind và mã trạng thái gợi ý cho lớp HTTP
 * bên ngoài: lỗi do dữ liệu người dùng (4xx) tách biệt với lỗi nội
 * bộ (5xx).
 */

#ifndef ACOUSTIX_ERRORS_H
#define ACOUSTIX_ERRORS_H

#include <stdexcept>
#include <string>

namespace acoustix {

/**
 * @enum ErrorKind
 * @brief Phân loại lỗi của pipeline
 */
enum class ErrorKind {
    DECODE = 0,               ///< Payload không giải mã được
    INVALID_AUDIO = 1,        ///< Giải mã được nhưng không dùng được
    FEATURE_EXTRACTION = 2,   ///< Vi phạm bất biến khi trích xuất
    MODEL_UNAVAILABLE = 3,    ///< Model chưa nạp / nạp thất bại
    INFERENCE = 4             ///< Lỗi khi chạy classifier
};

/**
 * @brief Tên lỗi dùng trong JSON trả về
 */
inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DECODE: return "DecodeError";
        case ErrorKind::INVALID_AUDIO: return "InvalidAudioError";
        case ErrorKind::FEATURE_EXTRACTION: return "FeatureExtractionError";
        case ErrorKind::MODEL_UNAVAILABLE: return "ModelUnavailableError";
        case ErrorKind::INFERENCE: return "InferenceError";
        default: return "UnknownError";
    }
}

/**
 * @brief Mã trạng thái HTTP gợi ý cho từng loại lỗi
 */
inline int errorKindToStatus(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DECODE: return 400;
        case ErrorKind::INVALID_AUDIO: return 422;
        case ErrorKind::MODEL_UNAVAILABLE: return 503;
        case ErrorKind::FEATURE_EXTRACTION:
        case ErrorKind::INFERENCE:
        default: return 500;
    }
}

/**
 * @class AcoustixError
 * @brief Lớp gốc cho mọi lỗi của pipeline
 */
class AcoustixError : public std::runtime_error {
public:
    AcoustixError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }
    std::string name() const { return errorKindToString(m_kind); }
    int status() const { return errorKindToStatus(m_kind); }

    /// Lỗi do input của client (4xx)
    bool isClientError() const { return status() < 500; }

private:
    ErrorKind m_kind;
};

class DecodeError : public AcoustixError {
public:
    explicit DecodeError(const std::string& message)
        : AcoustixError(ErrorKind::DECODE, message) {}
};

class InvalidAudioError : public AcoustixError {
public:
    explicit InvalidAudioError(const std::string& message)
        : AcoustixError(ErrorKind::INVALID_AUDIO, message) {}
};

class FeatureExtractionError : public AcoustixError {
public:
    explicit FeatureExtractionError(const std::string& message)
        : AcoustixError(ErrorKind::FEATURE_EXTRACTION, message) {}
};

class ModelUnavailableError : public AcoustixError {
public:
    explicit ModelUnavailableError(const std::string& message)
        : AcoustixError(ErrorKind::MODEL_UNAVAILABLE, message) {}
};

class InferenceError : public AcoustixError {
public:
    explicit InferenceError(const std::string& message)
        : AcoustixError(ErrorKind::INFERENCE, message) {}
};

} // namespace acoustix

#endif // ACOUSTIX_ERRORS_H
