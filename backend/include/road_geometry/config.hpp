#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace road_geometry
{

struct ProviderConfig
{
    bool enabled{true};
    std::vector<std::string> endpoints{
        "https://overpass-api.de/api/interpreter",
        "https://overpass.kumi.systems/api/interpreter"};
    std::string user_agent{"RoadGeometryEngine/1.0"};
    long timeout_seconds{30};
    long connect_timeout_seconds{10};
};

struct SynthesisConfig
{
    int grid_size{5};
    // 0.005 degrees between lattice rows at a 2000 m radius.
    double degrees_per_radius_metre{2.5e-6};
    double edge_length_m{500.0};
    double speed_kph{50.0};
};

struct CapacityModel
{
    double base_speed_kph{50.0};
    double base_capacity_vph{2000.0};
    double high_capacity_threshold{3000.0};
    double low_capacity_threshold{1000.0};
};

struct BottleneckConfig
{
    double percentile{90.0};
    std::size_t max_reports{10};
};

struct CacheConfig
{
    long analysis_ttl_seconds{3600};
    long route_ttl_seconds{300};
    long network_ttl_seconds{3600};
    long synthesized_network_ttl_seconds{300};
    std::size_t max_entries{256};
    int coordinate_precision{4};
};

struct RoutingConfig
{
    double min_network_radius_m{2000.0};
    double radius_factor{1.5};
    double default_speed_kph{50.0};
};

struct ServerConfig
{
    std::string host{"0.0.0.0"};
    int port{8000};
};

struct EngineConfig
{
    ProviderConfig provider;
    SynthesisConfig synthesis;
    CapacityModel capacity;
    BottleneckConfig bottleneck;
    CacheConfig cache;
    RoutingConfig routing;
    ServerConfig server;
};

EngineConfig engine_config_from_json(const nlohmann::json &document);
EngineConfig load_engine_config(const std::string &path);

} // namespace road_geometry
