#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "types.hpp"

namespace road_geometry
{

struct RawNode
{
    long id{};
    double lat{};
    double lon{};
};

struct RawEdge
{
    long source{};
    long target{};
    double length_m{};
    // Absent when the way carries neither maxspeed nor a known highway class.
    std::optional<double> speed_kph;
};

struct RawGraph
{
    std::vector<RawNode> nodes;
    std::vector<RawEdge> edges;
};

// Map-data provider capability: a drivable-road graph for a circular region,
// or nullopt when the provider cannot answer.
using FetchDrivableNetwork = std::function<std::optional<RawGraph>(const Point &center, double radius_m)>;

std::string build_overpass_query(const Point &center, double radius_m, long timeout_seconds);

// Returns "{}" when every endpoint fails.
std::string fetch_overpass_data(const std::string &query, const ProviderConfig &config);

std::optional<double> default_speed_for_highway(const std::string &highway_type);
std::optional<double> parse_maxspeed(const std::string &maxspeed);

RawGraph parse_overpass_payload(const nlohmann::json &osm_data);

FetchDrivableNetwork make_overpass_provider(ProviderConfig config);

} // namespace road_geometry
