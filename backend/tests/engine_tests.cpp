#include "test_harness.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "road_geometry/config.hpp"
#include "road_geometry/engine.hpp"
#include "road_geometry/serialization.hpp"

namespace
{

using namespace road_geometry;
using json = nlohmann::json;

// No provider: every network is the synthesized lattice.
GeometryEngine offline_engine()
{
    return GeometryEngine(EngineConfig{}, nullptr);
}

void TestAnalysisOnSynthesizedNetwork()
{
    GeometryEngine engine = offline_engine();
    const auto analysis = engine.analyze_network_capacity(37.7749, -122.4194, 2000.0);

    EXPECT_EQ(analysis->network_stats.total_nodes, static_cast<std::size_t>(25));
    EXPECT_EQ(analysis->network_stats.source, std::string("synthesized"));
    ASSERT_TRUE(analysis->capacity_analysis.has_value());
    ASSERT_TRUE(analysis->capacity_analysis->distribution.has_value());
    EXPECT_NEAR(analysis->capacity_analysis->distribution->mean, 2000.0, 1e-9);
    EXPECT_FALSE(analysis->bottlenecks.empty());
    EXPECT_TRUE(analysis->bottlenecks.size() <= 10);
    EXPECT_EQ(analysis->sample_alternative_routes.size(), static_cast<std::size_t>(2));
    EXPECT_TRUE(analysis->errors.empty());
    EXPECT_FALSE(analysis->timestamp.empty());
    EXPECT_TRUE(analysis->timing_ms.count("acquire_network_ms") == 1);

    // Same rounded key: the cached report is returned as is.
    const auto again = engine.analyze_network_capacity(37.77491, -122.41941, 2000.0);
    EXPECT_TRUE(again.get() == analysis.get());
    EXPECT_EQ(engine.acquirer().builds_started(), static_cast<std::size_t>(1));
}

void TestAnalysisRejectsInvalidInput()
{
    GeometryEngine engine = offline_engine();
    EXPECT_ENGINE_ERROR(engine.analyze_network_capacity(120.0, 0.0), ErrorKind::InvalidInput);
    EXPECT_ENGINE_ERROR(engine.analyze_network_capacity(0.0, 0.0, 0.0), ErrorKind::InvalidInput);
    EXPECT_ENGINE_ERROR(engine.find_optimal_routes(0.0, 0.0, 0.0, 200.0), ErrorKind::InvalidInput);
    EXPECT_ENGINE_ERROR(engine.analyze_network_capacity(37.7749, -122.4194, 1e20), ErrorKind::InvalidInput);
    EXPECT_EQ(engine.acquirer().builds_started(), static_cast<std::size_t>(0));
}

void TestAntipodalRouteStaysWithinRadiusBound()
{
    GeometryEngine engine = offline_engine();
    const auto response = engine.find_optimal_routes(0.0, 0.0, 0.0, 180.0);
    EXPECT_FALSE(response->no_route);
    EXPECT_EQ(response->routes.size(), static_cast<std::size_t>(1));
}

void TestFailedStageLeavesOthersIntact()
{
    AnalysisStages failing_capacity = default_analysis_stages();
    failing_capacity.capacity = [](const Network &, const CapacityModel &) -> CapacityAnalysis
    { throw std::runtime_error("capacity model diverged"); };

    GeometryEngine engine(EngineConfig{}, nullptr, system_steady_clock(), failing_capacity);
    const auto analysis = engine.analyze_network_capacity(37.7749, -122.4194, 2000.0);

    EXPECT_FALSE(analysis->capacity_analysis.has_value());
    ASSERT_TRUE(analysis->errors.size() == 1);
    EXPECT_EQ(analysis->errors[0], std::string("capacity_analysis: capacity model diverged"));
    EXPECT_FALSE(analysis->bottlenecks.empty());
    EXPECT_EQ(analysis->sample_alternative_routes.size(), static_cast<std::size_t>(2));
    EXPECT_EQ(analysis->network_stats.total_nodes, static_cast<std::size_t>(25));

    const json body = analysis_to_json(*analysis);
    EXPECT_TRUE(body["capacity_analysis"].is_null());
    EXPECT_EQ(body["errors"].size(), static_cast<std::size_t>(1));

    AnalysisStages failing_bottlenecks = default_analysis_stages();
    failing_bottlenecks.bottlenecks = [](const Network &, const BottleneckConfig &) -> std::vector<BottleneckReport>
    { throw std::runtime_error("centrality overflow"); };

    GeometryEngine other(EngineConfig{}, nullptr, system_steady_clock(), failing_bottlenecks);
    const auto partial = other.analyze_network_capacity(37.7749, -122.4194, 2000.0);

    ASSERT_TRUE(partial->capacity_analysis.has_value());
    EXPECT_NEAR(partial->capacity_analysis->distribution->mean, 2000.0, 1e-9);
    EXPECT_TRUE(partial->bottlenecks.empty());
    ASSERT_TRUE(partial->errors.size() == 1);
    EXPECT_EQ(partial->errors[0], std::string("bottlenecks: centrality overflow"));
    EXPECT_TRUE(partial->timing_ms.count("bottlenecks_ms") == 0);
    EXPECT_TRUE(partial->timing_ms.count("capacity_ms") == 1);
}

void TestCachedResponsesEchoRoundedLocation()
{
    GeometryEngine engine = offline_engine();

    const auto first = engine.analyze_network_capacity(37.77491, -122.41941, 2000.0);
    const auto second = engine.analyze_network_capacity(37.77494, -122.41944, 2000.0);
    EXPECT_TRUE(first.get() == second.get());
    EXPECT_NEAR(second->location.lat, 37.7749, 1e-12);
    EXPECT_NEAR(second->location.lon, -122.4194, 1e-12);

    const auto route = engine.find_optimal_routes(37.77491, -122.41941, 37.80441, -122.27111);
    const auto repeated = engine.find_optimal_routes(37.77494, -122.41944, 37.80444, -122.27114);
    EXPECT_TRUE(route.get() == repeated.get());
    EXPECT_NEAR(repeated->origin.lat, 37.7749, 1e-12);
    EXPECT_NEAR(repeated->origin.lon, -122.4194, 1e-12);
    EXPECT_NEAR(repeated->destination.lat, 37.8044, 1e-12);
    EXPECT_NEAR(repeated->destination.lon, -122.2711, 1e-12);
}

void TestAnalysisOfRoadlessProviderGraph()
{
    // A provider answering with nodes but no roads is still a provider answer.
    FetchDrivableNetwork provider = [](const Point &center, double) -> std::optional<RawGraph>
    {
        RawGraph raw;
        raw.nodes.push_back({1, center.lat, center.lon});
        return raw;
    };
    GeometryEngine engine(EngineConfig{}, provider);
    const auto analysis = engine.analyze_network_capacity(10.0, 10.0, 1000.0);
    EXPECT_EQ(analysis->network_stats.total_nodes, static_cast<std::size_t>(1));
    EXPECT_TRUE(analysis->bottlenecks.empty());
    EXPECT_TRUE(analysis->sample_alternative_routes.empty());
}

void TestRoutesAcrossTheBay()
{
    GeometryEngine engine = offline_engine();
    const auto response = engine.find_optimal_routes(37.7749, -122.4194, 37.8044, -122.2711);

    EXPECT_FALSE(response->no_route);
    ASSERT_TRUE(response->routes.size() == 1);
    const RouteResult &route = response->routes[0];
    EXPECT_EQ(route.route_type, std::string("fastest"));
    EXPECT_TRUE(route.distance_meters > 0.0);
    EXPECT_TRUE(route.distance_meters <= 40000.0);
    EXPECT_NEAR(route.travel_time_seconds, route.distance_meters / (50.0 / 3.6), 1e-6);
    EXPECT_EQ(route.coordinates.size(), route.path_nodes.size());

    const auto avoiding = engine.find_optimal_routes(37.7749, -122.4194, 37.8044, -122.2711, {"SEG1"});
    ASSERT_TRUE(avoiding->routes.size() == 2);
    EXPECT_EQ(avoiding->routes[1].route_type, std::string("avoiding_congestion"));
    EXPECT_TRUE(avoiding->routes[1].travel_time_seconds >= avoiding->routes[0].travel_time_seconds);

    // Both requests share one network around the midpoint.
    EXPECT_EQ(engine.acquirer().builds_started(), static_cast<std::size_t>(1));
    EXPECT_TRUE(engine.find_optimal_routes(37.7749, -122.4194, 37.8044, -122.2711).get() == response.get());
}

void TestUnreachableDestinationReportsNoRoute()
{
    // Oneway pair: the route back has no path.
    FetchDrivableNetwork provider = [](const Point &, double) -> std::optional<RawGraph>
    {
        RawGraph raw;
        raw.nodes.push_back({1, 0.0, 0.0});
        raw.nodes.push_back({2, 0.0, 0.01});
        raw.edges.push_back({1, 2, 1100.0, 50.0});
        return raw;
    };
    GeometryEngine engine(EngineConfig{}, provider);

    const auto forward = engine.find_optimal_routes(0.0, 0.0, 0.0, 0.01);
    EXPECT_FALSE(forward->no_route);
    EXPECT_EQ(forward->routes.size(), static_cast<std::size_t>(1));

    const auto backward = engine.find_optimal_routes(0.0, 0.01, 0.0, 0.0);
    EXPECT_TRUE(backward->no_route);
    EXPECT_TRUE(backward->routes.empty());
    EXPECT_FALSE(backward->message.empty());

    const json body = routes_to_json(*backward);
    EXPECT_EQ(body["error_kind"].get<std::string>(), std::string("no_path_found"));
    EXPECT_TRUE(body["routes"].empty());
}

void TestSegmentGeometryLookup()
{
    const GeometryEngine engine = offline_engine();

    const auto segment = engine.get_segment_geometry("SEG001");
    ASSERT_TRUE(segment.has_value());
    EXPECT_NEAR(segment->length_meters, 1200.0, 1e-9);
    EXPECT_EQ(segment->lanes, 4);
    EXPECT_EQ(segment->road_type, std::string("highway"));

    EXPECT_FALSE(engine.get_segment_geometry("SEG999").has_value());

    const json body = segment_to_json(*segment);
    EXPECT_NEAR(body["start_point"]["latitude"].get<double>(), 37.7749, 1e-12);
    EXPECT_NEAR(body["end_point"]["longitude"].get<double>(), -122.4184, 1e-12);
}

void TestSerializedShapes()
{
    GeometryEngine engine = offline_engine();
    const json analysis = analysis_to_json(*engine.analyze_network_capacity(37.7749, -122.4194));

    EXPECT_EQ(analysis["network_stats"]["total_nodes"].get<std::size_t>(), static_cast<std::size_t>(25));
    EXPECT_TRUE(analysis["capacity_analysis"]["capacity_distribution"].contains("std"));
    EXPECT_TRUE(analysis["bottlenecks"].is_array());
    EXPECT_EQ(analysis["bottlenecks"][0]["type"].get<std::string>(), std::string("node"));
    EXPECT_TRUE(analysis["bottlenecks"][0].contains("degree"));
    EXPECT_EQ(analysis["bottlenecks"][0]["node_ids"][0].get<std::string>(), std::string("12"));
    EXPECT_TRUE(analysis["sample_alternative_routes"][0]["primary_route"]["path"][0].is_string());
    EXPECT_FALSE(analysis.contains("errors"));

    // Coordinates come out as [lon, lat].
    RouteResult route;
    route.route_type = "fastest";
    route.path_nodes = {7};
    route.coordinates = {{37.5, -122.5}};
    const json serialized = route_to_json(route);
    EXPECT_NEAR(serialized["coordinates"][0][0].get<double>(), -122.5, 1e-12);
    EXPECT_NEAR(serialized["coordinates"][0][1].get<double>(), 37.5, 1e-12);
    EXPECT_EQ(serialized["path_nodes"][0].get<std::string>(), std::string("7"));

    const json error = error_to_json(ErrorKind::InvalidInput, "bad");
    EXPECT_EQ(error["status"].get<std::string>(), std::string("error"));
    EXPECT_EQ(error["error_kind"].get<std::string>(), std::string("invalid_input"));
    EXPECT_EQ(error_to_json(ErrorKind::NotFound, "Segment geometry not found")["error_kind"].get<std::string>(),
              std::string("not_found"));

    CapacityAnalysis empty;
    EXPECT_TRUE(capacity_to_json(empty)["capacity_distribution"].is_null());
}

void TestConfigOverrides()
{
    const json document = json::parse(R"({
        "provider": {"enabled": false},
        "synthesis": {"grid_size": 3},
        "bottleneck": {"max_reports": 2},
        "cache": {"route_ttl_seconds": 60},
        "server": {"port": 9090}
    })");

    const EngineConfig config = engine_config_from_json(document);
    EXPECT_FALSE(config.provider.enabled);
    EXPECT_EQ(config.synthesis.grid_size, 3);
    EXPECT_EQ(config.bottleneck.max_reports, static_cast<std::size_t>(2));
    EXPECT_EQ(config.cache.route_ttl_seconds, 60L);
    EXPECT_EQ(config.server.port, 9090);
    // Untouched keys keep their defaults.
    EXPECT_NEAR(config.capacity.base_capacity_vph, 2000.0, 1e-12);
    EXPECT_EQ(config.cache.analysis_ttl_seconds, 3600L);

    EXPECT_TRUE(make_default_provider(config) == nullptr);

    GeometryEngine engine(config, nullptr);
    const auto analysis = engine.analyze_network_capacity(0.0, 0.0, 2000.0);
    EXPECT_EQ(analysis->network_stats.total_nodes, static_cast<std::size_t>(9));
    EXPECT_TRUE(analysis->bottlenecks.size() <= 2);
}

void TestConfigRejectsBadValues()
{
    EXPECT_ENGINE_ERROR(engine_config_from_json(json::array()), ErrorKind::InvalidInput);
    EXPECT_ENGINE_ERROR(engine_config_from_json(json::parse(R"({"synthesis": {"grid_size": 0}})")),
                        ErrorKind::InvalidInput);
    EXPECT_ENGINE_ERROR(engine_config_from_json(json::parse(R"({"server": {"port": "eighty"}})")),
                        ErrorKind::InvalidInput);
    EXPECT_ENGINE_ERROR(engine_config_from_json(json::parse(R"({"bottleneck": {"percentile": 150}})")),
                        ErrorKind::InvalidInput);
    EXPECT_ENGINE_ERROR(load_engine_config("/nonexistent/road_geometry.json"), ErrorKind::InvalidInput);
}

} // namespace

int main()
{
    TestAnalysisOnSynthesizedNetwork();
    TestAnalysisRejectsInvalidInput();
    TestAntipodalRouteStaysWithinRadiusBound();
    TestFailedStageLeavesOthersIntact();
    TestCachedResponsesEchoRoundedLocation();
    TestAnalysisOfRoadlessProviderGraph();
    TestRoutesAcrossTheBay();
    TestUnreachableDestinationReportsNoRoute();
    TestSegmentGeometryLookup();
    TestSerializedShapes();
    TestConfigOverrides();
    TestConfigRejectsBadValues();

    return report_results("engine_tests");
}
