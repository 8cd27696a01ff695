#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace road_geometry
{

enum class ErrorKind
{
    None,
    ProviderUnavailable,
    EmptyNetwork,
    NoPathFound,
    InvalidInput,
    NotFound
};

const char *error_kind_name(ErrorKind kind);

class EngineError : public std::runtime_error
{
public:
    EngineError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

struct Point
{
    double lat{};
    double lon{};
};

struct Node
{
    long id{};
    double lat{};
    double lon{};
};

// Directed road edge. Built only through Network::add_edge, which derives
// travel time and capacity from length and speed.
struct Edge
{
    long source{};
    long target{};
    double length_m{};
    double speed_kph{};
    double travel_time_s{};
    double capacity_vph{};
};

struct NetworkStats
{
    std::size_t total_nodes{0};
    std::size_t total_edges{0};
    double total_length_km{0.0};
    double average_degree{0.0};
    double density{0.0};
    bool connectivity{false};
    std::string source;
};

struct CapacityStats
{
    double mean{};
    double median{};
    double std_dev{};
    double min{};
    double max{};
};

struct ClassifiedEdge
{
    std::string edge;
    double length_m{};
    double speed_kph{};
    double estimated_capacity{};
};

struct CapacityAnalysis
{
    // Absent when the network has no edges.
    std::optional<CapacityStats> distribution;
    std::vector<ClassifiedEdge> high_capacity_roads;
    std::vector<ClassifiedEdge> low_capacity_roads;
};

enum class EntityType
{
    Node,
    Edge
};

struct BottleneckReport
{
    EntityType type{EntityType::Node};
    std::string id;
    std::vector<long> node_ids;
    double centrality_score{};
    std::string description;

    // Node reports.
    double lat{};
    double lon{};
    std::size_t degree{0};

    // Edge reports.
    double length_m{};
    double speed_kph{};
};

struct RouteResult
{
    std::string route_type;
    std::vector<long> path_nodes;
    std::vector<std::size_t> path_edges;
    double travel_time_seconds{};
    double distance_meters{};
    std::vector<Point> coordinates;
    bool success{false};
    ErrorKind error_kind{ErrorKind::None};
    std::string error_message;
};

struct RoutePlan
{
    RouteResult primary;
    std::optional<RouteResult> alternate;
    std::optional<std::size_t> removed_edge;
};

struct AlternativeRouteSample
{
    long origin_node{};
    long destination_node{};
    RouteResult primary;
    RouteResult alternative;
    double time_difference{};
};

struct SegmentGeometry
{
    std::string segment_id;
    Point start_point;
    Point end_point;
    double length_meters{};
    int lanes{};
    double speed_limit{};
    std::string road_type;
};

} // namespace road_geometry
