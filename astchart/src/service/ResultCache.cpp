/**
 * @file ResultCache.cpp
 * @brief LRU + TTL result cache
 * @author AstChart Team
 * @date 2026-02-22
 */

#include "astchart/service/ResultCache.hpp"
#include "astchart/utils/Logger.hpp"

namespace astchart::service {

std::string ttlTierName(TtlTier tier) {
    switch (tier) {
        case TtlTier::NATAL: return "natal";
        case TtlTier::SLOW:  return "slow";
        case TtlTier::FAST:  return "fast";
    }
    return "unknown";
}

ResultCache::ResultCache(CacheSettings settings, ClockSource clock)
    : settings_(settings), clock_(std::move(clock))
{
}

std::chrono::seconds ResultCache::ttl(TtlTier tier) const {
    switch (tier) {
        case TtlTier::NATAL: return std::chrono::seconds(settings_.ttl_natal_s);
        case TtlTier::SLOW:  return std::chrono::seconds(settings_.ttl_slow_s);
        case TtlTier::FAST:  return std::chrono::seconds(settings_.ttl_fast_s);
    }
    return std::chrono::seconds(0);
}

std::optional<AnalysisResult> ResultCache::get(const std::string& key) {
    if (!settings_.enabled) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }
    if (now() >= it->second->expires) {
        entries_.erase(it->second);
        index_.erase(it);
        ++stats_.expirations;
        ++stats_.misses;
        return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    ++stats_.hits;
    return entries_.front().result;
}

void ResultCache::put(const std::string& key, AnalysisResult result, TtlTier tier) {
    if (!settings_.enabled || settings_.capacity == 0) return;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto expires = now() + ttl(tier);

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->result = std::move(result);
        it->second->expires = expires;
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    entries_.push_front(Entry{key, std::move(result), expires});
    index_[key] = entries_.begin();

    while (entries_.size() > settings_.capacity) {
        utils::Logger::debug("ResultCache", "evicting " + entries_.back().key);
        index_.erase(entries_.back().key);
        entries_.pop_back();
        ++stats_.evictions;
    }
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

CacheStats ResultCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s = stats_;
    s.size = entries_.size();
    return s;
}

std::size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string ResultCache::makeKey(const std::string& fingerprint, const std::string& analysis_id,
                                 const std::string& as_of, const nlohmann::json& params) {
    return fingerprint + "#" + analysis_id + "#" + as_of + "#" + params.dump();
}

} // namespace astchart::service
