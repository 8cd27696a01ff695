#include "road_geometry/serialization.hpp"

namespace road_geometry
{
namespace
{

using json = nlohmann::json;

json location_to_json(const Point &point)
{
    return {{"latitude", point.lat}, {"longitude", point.lon}};
}

json path_to_json(const std::vector<long> &path)
{
    json nodes = json::array();
    for (const long node_id : path)
    {
        nodes.push_back(std::to_string(node_id));
    }
    return nodes;
}

json classified_to_json(const std::vector<ClassifiedEdge> &edges)
{
    json out = json::array();
    for (const auto &edge : edges)
    {
        out.push_back({{"edge", edge.edge},
                       {"length_m", edge.length_m},
                       {"speed_kph", edge.speed_kph},
                       {"estimated_capacity", edge.estimated_capacity}});
    }
    return out;
}

} // namespace

json route_to_json(const RouteResult &route)
{
    json coordinates = json::array();
    for (const auto &point : route.coordinates)
    {
        // GeoJSON order.
        coordinates.push_back({point.lon, point.lat});
    }

    return {{"route_type", route.route_type},
            {"path_nodes", path_to_json(route.path_nodes)},
            {"travel_time_seconds", route.travel_time_seconds},
            {"distance_meters", route.distance_meters},
            {"coordinates", coordinates}};
}

json bottleneck_to_json(const BottleneckReport &report)
{
    json out;
    out["type"] = report.type == EntityType::Node ? "node" : "edge";
    out["id"] = report.id;
    out["node_ids"] = path_to_json(report.node_ids);
    out["centrality_score"] = report.centrality_score;
    out["description"] = report.description;

    if (report.type == EntityType::Node)
    {
        out["latitude"] = report.lat;
        out["longitude"] = report.lon;
        out["degree"] = report.degree;
    }
    else
    {
        out["length_m"] = report.length_m;
        out["speed_kph"] = report.speed_kph;
    }
    return out;
}

json capacity_to_json(const CapacityAnalysis &analysis)
{
    json out;
    out["high_capacity_roads"] = classified_to_json(analysis.high_capacity_roads);
    out["low_capacity_roads"] = classified_to_json(analysis.low_capacity_roads);

    if (analysis.distribution)
    {
        const CapacityStats &stats = *analysis.distribution;
        out["capacity_distribution"] = {{"mean", stats.mean},
                                        {"median", stats.median},
                                        {"std", stats.std_dev},
                                        {"min", stats.min},
                                        {"max", stats.max}};
    }
    else
    {
        out["capacity_distribution"] = nullptr;
    }
    return out;
}

json network_stats_to_json(const NetworkStats &stats)
{
    return {{"total_nodes", stats.total_nodes},
            {"total_edges", stats.total_edges},
            {"total_length_km", stats.total_length_km},
            {"average_degree", stats.average_degree},
            {"density", stats.density},
            {"connectivity", stats.connectivity},
            {"source", stats.source}};
}

json analysis_to_json(const NetworkAnalysis &analysis)
{
    json bottlenecks = json::array();
    for (const auto &report : analysis.bottlenecks)
    {
        bottlenecks.push_back(bottleneck_to_json(report));
    }

    json alternatives = json::array();
    for (const auto &sample : analysis.sample_alternative_routes)
    {
        alternatives.push_back({{"origin_node", std::to_string(sample.origin_node)},
                                {"destination_node", std::to_string(sample.destination_node)},
                                {"primary_route",
                                 {{"path", path_to_json(sample.primary.path_nodes)},
                                  {"travel_time", sample.primary.travel_time_seconds}}},
                                {"alternative_route",
                                 {{"path", path_to_json(sample.alternative.path_nodes)},
                                  {"travel_time", sample.alternative.travel_time_seconds}}},
                                {"time_difference", sample.time_difference}});
    }

    json out;
    out["location"] = location_to_json(analysis.location);
    out["radius_m"] = analysis.radius_m;
    out["network_stats"] = network_stats_to_json(analysis.network_stats);
    out["capacity_analysis"] =
        analysis.capacity_analysis ? capacity_to_json(*analysis.capacity_analysis) : json(nullptr);
    out["bottlenecks"] = bottlenecks;
    out["sample_alternative_routes"] = alternatives;
    out["timing"] = analysis.timing_ms;
    out["timestamp"] = analysis.timestamp;
    if (!analysis.errors.empty())
    {
        out["errors"] = analysis.errors;
    }
    return out;
}

json routes_to_json(const RoutesResponse &response)
{
    json routes = json::array();
    for (const auto &route : response.routes)
    {
        routes.push_back(route_to_json(route));
    }

    json out;
    out["origin"] = location_to_json(response.origin);
    out["destination"] = location_to_json(response.destination);
    out["routes"] = routes;
    out["analysis_timestamp"] = response.analysis_timestamp;
    if (response.no_route)
    {
        out["no_route"] = true;
        out["error_kind"] = error_kind_name(ErrorKind::NoPathFound);
        out["message"] = response.message;
    }
    return out;
}

json segment_to_json(const SegmentGeometry &segment)
{
    return {{"segment_id", segment.segment_id},
            {"start_point", location_to_json(segment.start_point)},
            {"end_point", location_to_json(segment.end_point)},
            {"length_meters", segment.length_meters},
            {"lanes", segment.lanes},
            {"speed_limit", segment.speed_limit},
            {"road_type", segment.road_type}};
}

json error_to_json(ErrorKind kind, const std::string &message)
{
    json error;
    error["status"] = "error";
    error["error_kind"] = error_kind_name(kind);
    error["message"] = message;
    return error;
}

} // namespace road_geometry
