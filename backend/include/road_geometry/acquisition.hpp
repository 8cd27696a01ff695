#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

#include "analysis_cache.hpp"
#include "config.hpp"
#include "network.hpp"
#include "overpass.hpp"
#include "types.hpp"

namespace road_geometry
{

// Caches one Network per rounded (center, radius). Concurrent requests for the
// same key share a single fetch/build; different keys never wait on each other.
class NetworkAcquirer
{
public:
    NetworkAcquirer(EngineConfig config, FetchDrivableNetwork provider, Clock clock = system_steady_clock());

    // Throws EngineError(InvalidInput) for bad coordinates or radius. Provider
    // failure is absorbed by falling back to the synthesized grid.
    NetworkPtr acquire(const Point &center, double radius_m);

    std::string cache_key(const Point &center, double radius_m) const;

    std::size_t cached_networks() const;
    std::size_t builds_started() const { return builds_started_.load(); }

private:
    struct Slot
    {
        std::shared_future<NetworkPtr> network;
        SteadyTime created_at{};
        std::chrono::seconds ttl{0};
        bool ready{false};
        std::uint64_t generation{0};
    };

    bool is_live(const Slot &slot, SteadyTime now) const;
    void evict_oldest_ready();
    std::chrono::seconds ttl_for(const Network &network) const;

    EngineConfig config_;
    FetchDrivableNetwork provider_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
    std::uint64_t next_generation_{0};
    std::atomic<std::size_t> builds_started_{0};
};

// Half the equatorial circumference; no circle on the globe needs more.
constexpr double kMaxRadiusM = 20037508.0;

// Throws EngineError(InvalidInput) for invalid coordinates or a radius that is
// not finite, not positive, or above kMaxRadiusM.
void validate_request(const Point &center, double radius_m);

} // namespace road_geometry
