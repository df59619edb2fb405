/**
 * @file TerrainCache.cpp
 * @brief Implementation of the terrain record store
 */

#include "TerrainCache.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace terrain3d {

TerrainCache::TerrainCache(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), logger_("TerrainCache") {
}

void TerrainCache::put(const TerrainRecord& record) {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    auto existing = records_.find(record.id);
    if (existing != records_.end()) {
        existing->second = record;
        return;
    }

    records_.emplace(record.id, record);
    insertion_order_.push_back(record.id);

    while (insertion_order_.size() > capacity_) {
        const std::string oldest = insertion_order_.front();
        insertion_order_.pop_front();
        records_.erase(oldest);
        ++evictions_;
        logger_.debug("Evicted " + oldest);
    }
}

std::optional<TerrainRecord> TerrainCache::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TerrainCache::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return records_.count(id) > 0;
}

size_t TerrainCache::size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return records_.size();
}

size_t TerrainCache::evictions() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return evictions_;
}

std::vector<std::string> TerrainCache::ids() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return std::vector<std::string>(insertion_order_.begin(), insertion_order_.end());
}

void TerrainCache::clear() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    records_.clear();
    insertion_order_.clear();
}

std::string TerrainCache::next_id() {
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    uint32_t counter = id_counter_.fetch_add(1);
    uint32_t mixed = (static_cast<uint32_t>(ticks) * 2654435761u) ^ (counter * 0x9E3779B9u);

    std::ostringstream oss;
    oss << "terrain-" << std::hex << std::setw(8) << std::setfill('0') << mixed;
    std::string id = oss.str();

    // Skip ids still held by a cached record
    std::lock_guard<std::mutex> lock(cache_mutex_);
    while (records_.count(id) > 0) {
        ++mixed;
        std::ostringstream retry;
        retry << "terrain-" << std::hex << std::setw(8) << std::setfill('0') << mixed;
        id = retry.str();
    }
    return id;
}

} // namespace terrain3d
