#include "road_geometry/engine.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <utility>

#include "road_geometry/bottleneck.hpp"
#include "road_geometry/capacity.hpp"
#include "road_geometry/geometry.hpp"
#include "road_geometry/network.hpp"
#include "road_geometry/routing.hpp"

namespace road_geometry
{
namespace
{

long long elapsed_ms(std::chrono::high_resolution_clock::time_point start,
                     std::chrono::high_resolution_clock::time_point end)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
}

std::string route_cache_key(const Point &origin, const Point &destination,
                            const std::vector<std::string> &avoid_segment_ids, int precision)
{
    std::ostringstream key;
    key << "routes:" << std::fixed << std::setprecision(precision) << origin.lat << ":" << origin.lon << ":"
        << destination.lat << ":" << destination.lon << ":";
    for (std::size_t i = 0; i < avoid_segment_ids.size(); i++)
    {
        key << (i ? "," : "") << avoid_segment_ids[i];
    }
    return key.str();
}

const std::unordered_map<std::string, SegmentGeometry> &segment_table()
{
    static const std::unordered_map<std::string, SegmentGeometry> segments = {
        {"SEG001", SegmentGeometry{"SEG001", {37.7749, -122.4194}, {37.7759, -122.4184}, 1200.0, 4, 65.0, "highway"}}};
    return segments;
}

} // namespace

std::string iso_timestamp_now()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&now_time, &utc);

    char timestamp[64];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return timestamp;
}

AnalysisStages default_analysis_stages()
{
    AnalysisStages stages;
    stages.capacity = [](const Network &network, const CapacityModel &model)
    { return estimate_capacity(network, model); };
    stages.bottlenecks = [](const Network &network, const BottleneckConfig &config)
    { return find_bottlenecks(network, config); };
    stages.alternative_routes = [](const Network &network)
    { return sample_alternative_routes(network); };
    return stages;
}

FetchDrivableNetwork make_default_provider(const EngineConfig &config)
{
    if (!config.provider.enabled || config.provider.endpoints.empty())
    {
        std::cout << "[engine] Map-data provider disabled, every network will be synthesized." << std::endl;
        return nullptr;
    }
    return make_overpass_provider(config.provider);
}

GeometryEngine::GeometryEngine(EngineConfig config, FetchDrivableNetwork provider, Clock clock,
                               AnalysisStages stages)
    : config_(std::move(config)),
      stages_(std::move(stages)),
      acquirer_(config_, std::move(provider), clock),
      analysis_cache_(config_.cache.max_entries, clock),
      route_cache_(config_.cache.max_entries, clock)
{
}

std::shared_ptr<const NetworkAnalysis> GeometryEngine::analyze_network_capacity(double latitude, double longitude,
                                                                                double radius_m)
{
    validate_request({latitude, longitude}, radius_m);

    std::cout << "[engine] Analyzing network capacity for " << latitude << ", " << longitude << std::endl;

    const int precision = config_.cache.coordinate_precision;
    const Point location{round_coordinate(latitude, precision), round_coordinate(longitude, precision)};
    const std::string key = make_location_key("analysis", location.lat, location.lon, radius_m, precision);
    return analysis_cache_.get_or_compute(key, std::chrono::seconds(config_.cache.analysis_ttl_seconds),
                                          [&]
                                          { return run_analysis(location, radius_m); });
}

NetworkAnalysis GeometryEngine::run_analysis(const Point &location, double radius_m)
{
    NetworkAnalysis analysis;
    analysis.location = location;
    analysis.radius_m = radius_m;

    const auto acquire_start = std::chrono::high_resolution_clock::now();
    const NetworkPtr network = acquirer_.acquire(location, radius_m);
    const auto acquire_end = std::chrono::high_resolution_clock::now();
    analysis.timing_ms["acquire_network_ms"] = elapsed_ms(acquire_start, acquire_end);

    if (network->empty())
    {
        throw EngineError(ErrorKind::EmptyNetwork, "No road network nodes found within the requested radius");
    }

    analysis.network_stats = compute_network_stats(*network);

    // Each stage runs on its own task so a failure in one leaves the others intact.
    const CapacityModel capacity_model = config_.capacity;
    const BottleneckConfig bottleneck_config = config_.bottleneck;
    const AnalysisStages stages = stages_;

    auto capacity_task = std::async(std::launch::async, [network, capacity_model, stages]
                                    {
        const auto start = std::chrono::high_resolution_clock::now();
        CapacityAnalysis result = stages.capacity(*network, capacity_model);
        return std::make_pair(std::move(result), elapsed_ms(start, std::chrono::high_resolution_clock::now())); });

    auto bottleneck_task = std::async(std::launch::async, [network, bottleneck_config, stages]
                                      {
        const auto start = std::chrono::high_resolution_clock::now();
        std::vector<BottleneckReport> result = stages.bottlenecks(*network, bottleneck_config);
        return std::make_pair(std::move(result), elapsed_ms(start, std::chrono::high_resolution_clock::now())); });

    auto samples_task = std::async(std::launch::async, [network, stages]
                                   {
        const auto start = std::chrono::high_resolution_clock::now();
        std::vector<AlternativeRouteSample> result = stages.alternative_routes(*network);
        return std::make_pair(std::move(result), elapsed_ms(start, std::chrono::high_resolution_clock::now())); });

    try
    {
        auto capacity = capacity_task.get();
        analysis.capacity_analysis = std::move(capacity.first);
        analysis.timing_ms["capacity_ms"] = capacity.second;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "[engine] Error analyzing capacity: " << ex.what() << std::endl;
        analysis.errors.push_back(std::string("capacity_analysis: ") + ex.what());
    }

    try
    {
        auto bottlenecks = bottleneck_task.get();
        analysis.bottlenecks = std::move(bottlenecks.first);
        analysis.timing_ms["bottlenecks_ms"] = bottlenecks.second;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "[engine] Error identifying bottlenecks: " << ex.what() << std::endl;
        analysis.errors.push_back(std::string("bottlenecks: ") + ex.what());
    }

    try
    {
        auto samples = samples_task.get();
        analysis.sample_alternative_routes = std::move(samples.first);
        analysis.timing_ms["alternative_routes_ms"] = samples.second;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "[engine] Error finding alternative routes: " << ex.what() << std::endl;
        analysis.errors.push_back(std::string("sample_alternative_routes: ") + ex.what());
    }

    analysis.timestamp = iso_timestamp_now();

    std::cout << "[engine] Analysis complete: " << analysis.network_stats.total_nodes << " nodes, "
              << analysis.bottlenecks.size() << " bottlenecks, " << analysis.sample_alternative_routes.size()
              << " alternative samples." << std::endl;

    return analysis;
}

std::shared_ptr<const RoutesResponse> GeometryEngine::find_optimal_routes(double origin_lat, double origin_lon,
                                                                          double dest_lat, double dest_lon,
                                                                          const std::vector<std::string> &avoid_segment_ids)
{
    if (!is_valid_point({origin_lat, origin_lon}) || !is_valid_point({dest_lat, dest_lon}))
    {
        throw EngineError(ErrorKind::InvalidInput, "Origin and destination must be valid coordinates");
    }

    // Routed and echoed at the cache precision so every caller sharing a key sees the same response.
    const int precision = config_.cache.coordinate_precision;
    const Point origin{round_coordinate(origin_lat, precision), round_coordinate(origin_lon, precision)};
    const Point destination{round_coordinate(dest_lat, precision), round_coordinate(dest_lon, precision)};

    std::cout << "[engine] Finding routes from " << origin_lat << "," << origin_lon << " to " << dest_lat << ","
              << dest_lon << std::endl;

    const std::string key =
        route_cache_key(origin, destination, avoid_segment_ids, config_.cache.coordinate_precision);
    return route_cache_.get_or_compute(key, std::chrono::seconds(config_.cache.route_ttl_seconds),
                                       [&]
                                       { return run_routing(origin, destination, avoid_segment_ids); });
}

RoutesResponse GeometryEngine::run_routing(const Point &origin, const Point &destination,
                                           const std::vector<std::string> &avoid_segment_ids)
{
    RoutesResponse response;
    response.origin = origin;
    response.destination = destination;

    const Point center = midpoint(origin, destination);
    const double distance_m = haversine(origin, destination);
    const double radius_m = std::min(
        kMaxRadiusM, std::max(config_.routing.min_network_radius_m, distance_m * config_.routing.radius_factor));

    const NetworkPtr network = acquirer_.acquire(center, radius_m);

    auto plan_task = std::async(std::launch::async, [network, origin, destination, avoid_segment_ids]
                                {
        if (avoid_segment_ids.empty())
        {
            RoutePlan plan;
            plan.primary = shortest_route(*network, origin, destination);
            return plan;
        }
        return alternate_route(*network, origin, destination, avoid_segment_ids); });

    RoutePlan plan = plan_task.get();

    if (plan.primary.success)
    {
        response.routes.push_back(std::move(plan.primary));
        if (plan.alternate)
        {
            response.routes.push_back(std::move(*plan.alternate));
        }
    }
    else
    {
        std::cerr << "[engine] No path found between origin and destination" << std::endl;
        response.no_route = true;
        response.message = plan.primary.error_message;
    }

    response.analysis_timestamp = iso_timestamp_now();
    return response;
}

std::optional<SegmentGeometry> GeometryEngine::get_segment_geometry(const std::string &segment_id) const
{
    const auto &segments = segment_table();
    const auto it = segments.find(segment_id);
    if (it == segments.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace road_geometry
