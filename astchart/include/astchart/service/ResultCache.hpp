/**
 * @file ResultCache.hpp
 * @brief Thread-safe LRU cache of analysis results with TTL tiers
 * @author AstChart Team
 * @date 2026-02-22
 */

#ifndef ASTCHART_SERVICE_RESULT_CACHE_HPP
#define ASTCHART_SERVICE_RESULT_CACHE_HPP

#include "astchart/service/Analysis.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace astchart::service {

/**
 * @brief Lifetime class of a cached result
 *
 * NATAL results depend on birth data only, SLOW ones on slow bodies
 * (periods, returns), FAST ones on fast transits.
 */
enum class TtlTier {
    NATAL,
    SLOW,
    FAST
};

std::string ttlTierName(TtlTier tier);

struct CacheSettings {
    bool enabled = true;
    std::size_t capacity = 512;       ///< Entries before LRU eviction
    int ttl_natal_s = 86400;
    int ttl_slow_s = 21600;
    int ttl_fast_s = 900;
};

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;      ///< Removed to respect capacity
    std::uint64_t expirations = 0;    ///< Removed because the TTL elapsed
    std::size_t size = 0;
};

class ResultCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockSource = std::function<Clock::time_point()>;

    explicit ResultCache(CacheSettings settings = {}, ClockSource clock = nullptr);

    /// Cached result; refreshes recency. Expired entries are dropped.
    std::optional<AnalysisResult> get(const std::string& key);

    /// Insert or replace (last writer wins)
    void put(const std::string& key, AnalysisResult result, TtlTier tier);

    void clear();
    CacheStats stats() const;
    std::size_t size() const;
    bool enabled() const { return settings_.enabled; }
    const CacheSettings& settings() const { return settings_; }

    std::chrono::seconds ttl(TtlTier tier) const;

    /**
     * @brief Canonical key
     *
     * nlohmann::json objects keep their keys sorted, so dump() is
     * canonical for equal parameter sets.
     */
    static std::string makeKey(const std::string& fingerprint, const std::string& analysis_id,
                               const std::string& as_of, const nlohmann::json& params);

private:
    struct Entry {
        std::string key;
        AnalysisResult result;
        Clock::time_point expires;
    };

    Clock::time_point now() const { return clock_ ? clock_() : Clock::now(); }

    CacheSettings settings_;
    ClockSource clock_;

    mutable std::mutex mutex_;
    std::list<Entry> entries_;    ///< Most recent first
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    CacheStats stats_;
};

} // namespace astchart::service

#endif // ASTCHART_SERVICE_RESULT_CACHE_HPP
