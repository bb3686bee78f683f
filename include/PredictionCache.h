/**
 * @file PredictionCache.h
 * @brief Bounded LRU cache of classification results keyed by payload fingerprint
 *
 * Khóa là SHA-256 (hex) của nội dung file upload. Cache chỉ lưu kết quả
 * thành công; lỗi không bao giờ được cache. Một mutex bảo vệ map và
 * danh sách LRU; hàm tính toán chạy ngoài lock nên hai request trượt
 * cache cùng khóa có thể cùng tính (bản ghi sau ghi đè bản ghi trước).
 */

#ifndef ACOUSTIX_PREDICTION_CACHE_H
#define ACOUSTIX_PREDICTION_CACHE_H

#include "Classifier.h"
#include "Common.h"

#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace acoustix {

/// Độ dài chuỗi hex của SHA-256
constexpr size_t FINGERPRINT_HEX_LENGTH = 64;

/**
 * @struct CacheStatistics
 * @brief Bộ đếm của cache
 */
struct CacheStatistics {
    uint64_t hits;          ///< Số lần tìm thấy
    uint64_t misses;        ///< Số lần không tìm thấy
    uint64_t evictions;     ///< Số bản ghi bị loại do đầy
    size_t size;            ///< Số bản ghi hiện tại
    size_t capacity;        ///< Dung lượng tối đa

    CacheStatistics() : hits(0), misses(0), evictions(0), size(0), capacity(0) {}

    /// Tỉ lệ hit trên tổng số lần tra cứu (0 nếu chưa tra cứu)
    double hitRate() const {
        uint64_t lookups = hits + misses;
        return lookups > 0 ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0;
    }
};

/**
 * @class PredictionCache
 * @brief LRU cache thread-safe: fingerprint -> ClassificationResult
 */
class PredictionCache {
public:
    using ComputeFunction = std::function<ClassificationResult()>;

    /**
     * @param capacity Số bản ghi tối đa (>= 1)
     * @throws std::invalid_argument nếu capacity == 0
     */
    explicit PredictionCache(size_t capacity);

    /**
     * @brief Tra cứu; nếu có thì đánh dấu là mới dùng nhất
     * @return true nếu tìm thấy (kết quả ghi vào result)
     */
    bool get(const std::string& key, ClassificationResult& result);

    /**
     * @brief Thêm/ghi đè bản ghi, loại bản ghi cũ nhất nếu đầy
     */
    void put(const std::string& key, const ClassificationResult& result);

    /**
     * @brief Trả kết quả đã cache, hoặc gọi compute() rồi lưu lại
     *
     * compute() chạy ngoài lock. Nếu compute() ném exception, không có
     * gì được lưu và exception được truyền ra ngoài.
     */
    ClassificationResult getOrCompute(const std::string& key, const ComputeFunction& compute);

    bool contains(const std::string& key) const;
    size_t size() const;
    size_t capacity() const { return m_capacity; }
    void clear();

    CacheStatistics getStatistics() const;

    /**
     * @brief SHA-256 của payload dưới dạng hex thường (64 ký tự)
     * @throws InferenceError nếu mbedtls báo lỗi (lỗi phía server, 500)
     */
    static std::string computeFingerprint(const ByteBuffer& bytes);

private:
    using Entry = std::pair<std::string, ClassificationResult>;
    using EntryList = std::list<Entry>;

    void insertLocked(const std::string& key, const ClassificationResult& result);

    const size_t m_capacity;
    EntryList m_entries;                                            ///< Đầu = mới dùng nhất
    std::unordered_map<std::string, EntryList::iterator> m_index;
    mutable std::mutex m_mutex;

    uint64_t m_hits;
    uint64_t m_misses;
    uint64_t m_evictions;
};

} // namespace acoustix

#endif // ACOUSTIX_PREDICTION_CACHE_H
