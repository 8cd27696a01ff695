#include "road_geometry/acquisition.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>
#include <utility>

#include "road_geometry/geometry.hpp"
#include "road_geometry/graph.hpp"

namespace road_geometry
{

void validate_request(const Point &center, double radius_m)
{
    if (!is_valid_point(center))
    {
        std::ostringstream message;
        message << "Invalid coordinates (" << center.lat << ", " << center.lon << ")";
        throw EngineError(ErrorKind::InvalidInput, message.str());
    }
    if (!std::isfinite(radius_m) || radius_m <= 0.0)
    {
        throw EngineError(ErrorKind::InvalidInput, "Radius must be a positive number of metres");
    }
    if (radius_m > kMaxRadiusM)
    {
        std::ostringstream message;
        message << "Radius " << radius_m << " m exceeds half the Earth's circumference (" << kMaxRadiusM << " m)";
        throw EngineError(ErrorKind::InvalidInput, message.str());
    }
}

NetworkAcquirer::NetworkAcquirer(EngineConfig config, FetchDrivableNetwork provider, Clock clock)
    : config_(std::move(config)), provider_(std::move(provider)), clock_(std::move(clock))
{
}

std::string NetworkAcquirer::cache_key(const Point &center, double radius_m) const
{
    return make_location_key("network", center.lat, center.lon, radius_m, config_.cache.coordinate_precision);
}

std::size_t NetworkAcquirer::cached_networks() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

bool NetworkAcquirer::is_live(const Slot &slot, SteadyTime now) const
{
    return !slot.ready || now - slot.created_at < slot.ttl;
}

std::chrono::seconds NetworkAcquirer::ttl_for(const Network &network) const
{
    if (network.source() == NetworkSource::Synthesized)
    {
        return std::chrono::seconds(config_.cache.synthesized_network_ttl_seconds);
    }
    return std::chrono::seconds(config_.cache.network_ttl_seconds);
}

void NetworkAcquirer::evict_oldest_ready()
{
    auto oldest = slots_.end();
    for (auto it = slots_.begin(); it != slots_.end(); ++it)
    {
        if (!it->second.ready)
        {
            continue;
        }
        if (oldest == slots_.end() || it->second.created_at < oldest->second.created_at)
        {
            oldest = it;
        }
    }
    if (oldest != slots_.end())
    {
        slots_.erase(oldest);
    }
}

NetworkPtr NetworkAcquirer::acquire(const Point &center, double radius_m)
{
    validate_request(center, radius_m);

    const std::string key = cache_key(center, radius_m);

    std::shared_future<NetworkPtr> pending;
    std::promise<NetworkPtr> promise;
    std::uint64_t generation = 0;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto it = slots_.find(key);
        if (it != slots_.end())
        {
            if (is_live(it->second, clock_()))
            {
                pending = it->second.network;
            }
            else
            {
                slots_.erase(it);
            }
        }

        if (!pending.valid())
        {
            if (slots_.size() >= config_.cache.max_entries)
            {
                evict_oldest_ready();
            }

            owner = true;
            generation = ++next_generation_;
            pending = promise.get_future().share();

            Slot slot;
            slot.network = pending;
            slot.generation = generation;
            slots_[key] = slot;
        }
    }

    if (!owner)
    {
        return pending.get();
    }

    builds_started_++;
    std::cout << "[acquisition] Cache miss for " << key << ", acquiring network..." << std::endl;

    try
    {
        const auto build_start = std::chrono::high_resolution_clock::now();
        NetworkPtr network = fetch_or_synthesize(provider_, center, radius_m, config_);
        const auto build_end = std::chrono::high_resolution_clock::now();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = slots_.find(key);
            if (it != slots_.end() && it->second.generation == generation)
            {
                it->second.ready = true;
                it->second.created_at = clock_();
                it->second.ttl = ttl_for(*network);
            }
        }

        std::cout << "[acquisition] " << key << " ready (" << network_source_name(network->source()) << ", "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(build_end - build_start).count()
                  << " ms)." << std::endl;

        promise.set_value(network);
        return network;
    }
    catch (...)
    {
        std::cerr << "[acquisition] Failed to acquire " << key << std::endl;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = slots_.find(key);
            if (it != slots_.end() && it->second.generation == generation)
            {
                slots_.erase(it);
            }
        }

        promise.set_exception(std::current_exception());
        throw;
    }
}

} // namespace road_geometry
