#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "acquisition.hpp"
#include "analysis_cache.hpp"
#include "config.hpp"
#include "overpass.hpp"
#include "types.hpp"

namespace road_geometry
{

struct NetworkAnalysis
{
    Point location;
    double radius_m{};
    NetworkStats network_stats;
    std::optional<CapacityAnalysis> capacity_analysis;
    std::vector<BottleneckReport> bottlenecks;
    std::vector<AlternativeRouteSample> sample_alternative_routes;
    // One line per analysis stage that failed; the other stages still report.
    std::vector<std::string> errors;
    std::map<std::string, long long> timing_ms;
    std::string timestamp;
};

struct RoutesResponse
{
    Point origin;
    Point destination;
    std::vector<RouteResult> routes;
    // Set when origin and destination snapped to disconnected nodes.
    bool no_route{false};
    std::string message;
    std::string analysis_timestamp;
};

// The per-network analysis stages run by analyze_network_capacity. Each runs
// on its own task; a stage that throws is reported in NetworkAnalysis::errors.
struct AnalysisStages
{
    std::function<CapacityAnalysis(const Network &, const CapacityModel &)> capacity;
    std::function<std::vector<BottleneckReport>(const Network &, const BottleneckConfig &)> bottlenecks;
    std::function<std::vector<AlternativeRouteSample>(const Network &)> alternative_routes;
};

AnalysisStages default_analysis_stages();

class GeometryEngine
{
public:
    GeometryEngine(EngineConfig config, FetchDrivableNetwork provider, Clock clock = system_steady_clock(),
                   AnalysisStages stages = default_analysis_stages());

    // Throws EngineError for InvalidInput and EmptyNetwork. The report echoes
    // the location rounded to the cache precision, whoever computed it.
    std::shared_ptr<const NetworkAnalysis> analyze_network_capacity(double latitude, double longitude,
                                                                    double radius_m = 2000.0);

    std::shared_ptr<const RoutesResponse> find_optimal_routes(double origin_lat, double origin_lon,
                                                              double dest_lat, double dest_lon,
                                                              const std::vector<std::string> &avoid_segment_ids = {});

    std::optional<SegmentGeometry> get_segment_geometry(const std::string &segment_id) const;

    const EngineConfig &config() const { return config_; }
    NetworkAcquirer &acquirer() { return acquirer_; }

private:
    NetworkAnalysis run_analysis(const Point &location, double radius_m);
    RoutesResponse run_routing(const Point &origin, const Point &destination,
                               const std::vector<std::string> &avoid_segment_ids);

    EngineConfig config_;
    AnalysisStages stages_;
    NetworkAcquirer acquirer_;
    AnalysisCache<NetworkAnalysis> analysis_cache_;
    AnalysisCache<RoutesResponse> route_cache_;
};

std::string iso_timestamp_now();

FetchDrivableNetwork make_default_provider(const EngineConfig &config);

} // namespace road_geometry
