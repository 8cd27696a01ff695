#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace road_geometry
{

enum class NetworkSource
{
    Provider,
    Synthesized
};

const char *network_source_name(NetworkSource source);

double travel_time_seconds(double length_m, double speed_kph);
double estimate_edge_capacity(double speed_kph, const CapacityModel &model);

// Drivable road graph built for one (center, radius) request. Nodes and edges
// live in flat arrays; adjacency lists hold edge indices. Once handed out as a
// NetworkPtr the graph is never modified.
class Network
{
public:
    Network(Point center, double radius_m, NetworkSource source, CapacityModel capacity_model = {});

    // Returns false when the id is already present.
    bool add_node(long id, double lat, double lon);

    // Throws EngineError(InvalidInput) when an endpoint is missing or the
    // length or speed is not positive.
    std::size_t add_edge(long source, long target, double length_m, double speed_kph);

    const std::vector<Node> &nodes() const { return nodes_; }
    const std::vector<Edge> &edges() const { return edges_; }

    std::size_t node_count() const { return nodes_.size(); }
    std::size_t edge_count() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    bool contains(long node_id) const { return index_.count(node_id) > 0; }
    std::optional<std::size_t> index_of(long node_id) const;
    const Node &node_at(std::size_t index) const { return nodes_[index]; }
    const Node &node(long node_id) const;

    const std::vector<std::size_t> &out_edges(std::size_t node_index) const { return out_edges_[node_index]; }
    const std::vector<std::size_t> &in_edges(std::size_t node_index) const { return in_edges_[node_index]; }
    std::size_t degree(std::size_t node_index) const;

    std::size_t source_index(std::size_t edge_index) const { return edge_endpoints_[edge_index].first; }
    std::size_t target_index(std::size_t edge_index) const { return edge_endpoints_[edge_index].second; }

    // First edge source -> target, if any.
    std::optional<std::size_t> find_edge(long source, long target) const;

    const Point &center() const { return center_; }
    double radius_m() const { return radius_m_; }
    NetworkSource source() const { return source_; }

private:
    Point center_;
    double radius_m_;
    NetworkSource source_;
    CapacityModel capacity_model_;

    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<long, std::size_t> index_;
    std::vector<std::vector<std::size_t>> out_edges_;
    std::vector<std::vector<std::size_t>> in_edges_;
    std::vector<std::pair<std::size_t, std::size_t>> edge_endpoints_;
};

using NetworkPtr = std::shared_ptr<const Network>;

// Set of edge indices treated as absent by searches over a shared Network.
class EdgeMask
{
public:
    explicit EdgeMask(std::size_t edge_count) : excluded_(edge_count, false) {}

    void exclude(std::size_t edge_index);
    bool excluded(std::size_t edge_index) const;
    std::size_t excluded_count() const { return count_; }

private:
    std::vector<bool> excluded_;
    std::size_t count_{0};
};

std::string edge_label(const Edge &edge);

NetworkStats compute_network_stats(const Network &network);

} // namespace road_geometry
