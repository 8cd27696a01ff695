#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

namespace road_geometry
{

using SteadyTime = std::chrono::steady_clock::time_point;
using Clock = std::function<SteadyTime()>;

inline Clock system_steady_clock()
{
    return []
    { return std::chrono::steady_clock::now(); };
}

// Rounds the coordinates to `precision` decimals and truncates the radius, so
// nearby repeated queries share one key.
inline std::string make_location_key(const std::string &prefix, double lat, double lon, double radius_m, int precision)
{
    std::ostringstream key;
    key << prefix << ":" << std::fixed << std::setprecision(precision) << lat << ":" << lon << ":"
        << static_cast<long long>(radius_m);
    return key.str();
}

// Coordinate as it appears in a location key.
inline double round_coordinate(double value, int precision)
{
    const double scale = std::pow(10.0, precision);
    return std::round(value * scale) / scale;
}

// Time-bounded cache of computed results. Expiry is checked on read; when the
// cache is full the oldest entry is evicted. Values are shared, never copied.
template <typename T>
class AnalysisCache
{
public:
    using ValuePtr = std::shared_ptr<const T>;

    explicit AnalysisCache(std::size_t max_entries = 256, Clock clock = system_steady_clock())
        : max_entries_(max_entries == 0 ? 1 : max_entries), clock_(std::move(clock)) {}

    // Returns the cached value when it is younger than `ttl`; otherwise runs
    // `compute` without holding the lock and stores its result.
    template <typename Compute>
    ValuePtr get_or_compute(const std::string &key, std::chrono::seconds ttl, Compute &&compute)
    {
        if (ValuePtr cached = get(key, ttl))
        {
            return cached;
        }

        ValuePtr value = std::make_shared<const T>(compute());
        put(key, value);
        return value;
    }

    ValuePtr get(const std::string &key, std::chrono::seconds ttl)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto it = entries_.find(key);
        if (it == entries_.end())
        {
            return nullptr;
        }
        if (clock_() - it->second.created_at >= ttl)
        {
            entries_.erase(it);
            return nullptr;
        }
        return it->second.value;
    }

    void put(const std::string &key, ValuePtr value)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (entries_.find(key) == entries_.end() && entries_.size() >= max_entries_)
        {
            evict_oldest();
        }
        entries_[key] = Entry{std::move(value), clock_()};
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    struct Entry
    {
        ValuePtr value;
        SteadyTime created_at;
    };

    void evict_oldest()
    {
        auto oldest = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it)
        {
            if (it->second.created_at < oldest->second.created_at)
            {
                oldest = it;
            }
        }
        if (oldest != entries_.end())
        {
            entries_.erase(oldest);
        }
    }

    std::size_t max_entries_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace road_geometry
