/**
 * @file PredictionCache.cpp
 * @brief LRU result cache and SHA-256 payload fingerprints
 */

#include "PredictionCache.h"
#include "Errors.h"

#include <array>
#include <stdexcept>

#include <mbedtls/sha256.h>

namespace acoustix {

PredictionCache::PredictionCache(size_t capacity)
    : m_capacity(capacity)
    , m_hits(0)
    , m_misses(0)
    , m_evictions(0)
{
    if (capacity == 0) {
        throw std::invalid_argument("Prediction cache capacity must be at least 1");
    }
}

bool PredictionCache::get(const std::string& key, ClassificationResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(key);
    if (it == m_index.end()) {
        ++m_misses;
        return false;
    }

    // Chuyển lên đầu danh sách (mới dùng nhất)
    m_entries.splice(m_entries.begin(), m_entries, it->second);
    ++m_hits;
    result = it->second->second;
    return true;
}

void PredictionCache::put(const std::string& key, const ClassificationResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    insertLocked(key, result);
}

void PredictionCache::insertLocked(const std::string& key, const ClassificationResult& result) {
    auto it = m_index.find(key);
    if (it != m_index.end()) {
        it->second->second = result;
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return;
    }

    if (m_entries.size() >= m_capacity) {
        m_index.erase(m_entries.back().first);
        m_entries.pop_back();
        ++m_evictions;
    }

    m_entries.emplace_front(key, result);
    m_index[key] = m_entries.begin();
}

ClassificationResult PredictionCache::getOrCompute(const std::string& key,
                                                   const ComputeFunction& compute) {
    ClassificationResult cached;
    if (get(key, cached)) {
        return cached;
    }

    ClassificationResult computed = compute();
    put(key, computed);
    return computed;
}

bool PredictionCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.find(key) != m_index.end();
}

size_t PredictionCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void PredictionCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_index.clear();
}

CacheStatistics PredictionCache::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStatistics stats;
    stats.hits = m_hits;
    stats.misses = m_misses;
    stats.evictions = m_evictions;
    stats.size = m_entries.size();
    stats.capacity = m_capacity;
    return stats;
}

std::string PredictionCache::computeFingerprint(const ByteBuffer& bytes) {
    std::array<unsigned char, 32> hash{};

    mbedtls_sha256_context ctx;
    mbedtls_sha256_init(&ctx);
    int ret = mbedtls_sha256_starts(&ctx, 0);  // 0 = SHA-256 (không phải SHA-224)
    if (ret == 0 && !bytes.empty()) {
        ret = mbedtls_sha256_update(&ctx, bytes.data(), bytes.size());
    }
    if (ret == 0) {
        ret = mbedtls_sha256_finish(&ctx, hash.data());
    }
    mbedtls_sha256_free(&ctx);

    if (ret != 0) {
        throw InferenceError("SHA-256 computation failed (mbedtls error " +
                                 std::to_string(ret) + ")");
    }

    static const char* HEX = "0123456789abcdef";
    std::string hex;
    hex.reserve(FINGERPRINT_HEX_LENGTH);
    for (unsigned char b : hash) {
        hex.push_back(HEX[b >> 4]);
        hex.push_back(HEX[b & 0x0F]);
    }
    return hex;
}

} // namespace acoustix
