/**
 * @file TerrainCache.hpp
 * @brief Bounded store of generated terrains, oldest evicted first
 */

#pragma once

#include "terrain3d.hpp"
#include "Logger.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace terrain3d {

class TerrainCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit TerrainCache(size_t capacity = DEFAULT_CAPACITY);

    /**
     * @brief Insert or replace a record; evicts the oldest entries beyond capacity
     */
    void put(const TerrainRecord& record);

    std::optional<TerrainRecord> get(const std::string& id) const;

    bool contains(const std::string& id) const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t evictions() const;

    /// Ids from oldest to newest
    std::vector<std::string> ids() const;

    void clear();

    /**
     * @brief Fresh id of the form terrain-xxxxxxxx
     */
    std::string next_id();

private:
    size_t capacity_;
    std::deque<std::string> insertion_order_;
    std::unordered_map<std::string, TerrainRecord> records_;
    size_t evictions_ = 0;
    std::atomic<uint32_t> id_counter_{0};
    mutable std::mutex cache_mutex_;
    Logger logger_;
};

} // namespace terrain3d
