#include <curl/curl.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "road_geometry/config.hpp"
#include "road_geometry/engine.hpp"
#include "road_geometry/serialization.hpp"
#include "road_geometry/types.hpp"

namespace road_geometry
{
namespace
{

using json = nlohmann::json;

int status_for(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::InvalidInput:
        return 400;
    case ErrorKind::EmptyNetwork:
    case ErrorKind::NoPathFound:
        return 422;
    case ErrorKind::ProviderUnavailable:
        return 503;
    case ErrorKind::NotFound:
        return 404;
    case ErrorKind::None:
        break;
    }
    return 500;
}

void send_error(httplib::Response &res, int status, ErrorKind kind, const std::string &message)
{
    res.status = status;
    res.set_content(error_to_json(kind, message).dump(), "application/json");
}

// Runs `handler`, mapping engine and request errors to JSON error bodies.
template <typename Handler>
void guarded(const char *endpoint, httplib::Response &res, Handler &&handler)
{
    try
    {
        handler();
    }
    catch (const EngineError &ex)
    {
        std::cerr << "[server] " << endpoint << ": " << ex.what() << std::endl;
        send_error(res, status_for(ex.kind()), ex.kind(), ex.what());
    }
    catch (const json::exception &ex)
    {
        std::cerr << "[server] " << endpoint << ": bad request body: " << ex.what() << std::endl;
        send_error(res, 400, ErrorKind::InvalidInput, std::string("Invalid request: ") + ex.what());
    }
    catch (const std::exception &ex)
    {
        std::cerr << "[server] " << endpoint << ": " << ex.what() << std::endl;
        send_error(res, 500, ErrorKind::None, ex.what());
    }
}

double query_double(const httplib::Request &req, const char *name, double fallback)
{
    if (!req.has_param(name))
    {
        return fallback;
    }

    try
    {
        return std::stod(req.get_param_value(name));
    }
    catch (const std::exception &)
    {
        throw EngineError(ErrorKind::InvalidInput, std::string("Query parameter ") + name + " is not a number");
    }
}

void register_routes(httplib::Server &server, GeometryEngine &engine)
{
    server.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res)
                                   {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (req.method == "OPTIONS")
        {
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled; });

    server.Get("/health", [](const httplib::Request &, httplib::Response &res)
               {
        json response;
        response["status"] = "healthy";
        response["service"] = "geometry_analyzer";
        response["timestamp"] = iso_timestamp_now();
        res.set_content(response.dump(), "application/json"); });

    server.Post("/analyze-network", [&engine](const httplib::Request &req, httplib::Response &res)
                { guarded("/analyze-network", res, [&]
                          {
        const auto body = json::parse(req.body);
        const double latitude = body.at("latitude").get<double>();
        const double longitude = body.at("longitude").get<double>();
        const double radius_m = body.value("radius_m", 2000.0);

        const auto analysis = engine.analyze_network_capacity(latitude, longitude, radius_m);
        res.set_content(analysis_to_json(*analysis).dump(), "application/json"); }); });

    server.Post("/find-routes", [&engine](const httplib::Request &req, httplib::Response &res)
                { guarded("/find-routes", res, [&]
                          {
        const auto body = json::parse(req.body);
        const double origin_lat = body.at("origin_latitude").get<double>();
        const double origin_lon = body.at("origin_longitude").get<double>();
        const double dest_lat = body.at("destination_latitude").get<double>();
        const double dest_lon = body.at("destination_longitude").get<double>();

        std::vector<std::string> avoid_segments;
        if (body.contains("avoid_segments") && body["avoid_segments"].is_array())
        {
            avoid_segments = body["avoid_segments"].get<std::vector<std::string>>();
        }

        const auto routes = engine.find_optimal_routes(origin_lat, origin_lon, dest_lat, dest_lon, avoid_segments);
        res.set_content(routes_to_json(*routes).dump(), "application/json"); }); });

    server.Get(R"(/segment/([^/]+)/geometry)", [&engine](const httplib::Request &req, httplib::Response &res)
               { guarded("/segment/geometry", res, [&]
                         {
        const std::string segment_id = req.matches[1];
        const auto geometry = engine.get_segment_geometry(segment_id);
        if (!geometry)
        {
            send_error(res, status_for(ErrorKind::NotFound), ErrorKind::NotFound, "Segment geometry not found");
            return;
        }
        res.set_content(segment_to_json(*geometry).dump(), "application/json"); }); });

    server.Get("/network/bottlenecks", [&engine](const httplib::Request &req, httplib::Response &res)
               { guarded("/network/bottlenecks", res, [&]
                         {
        if (!req.has_param("latitude") || !req.has_param("longitude"))
        {
            throw EngineError(ErrorKind::InvalidInput, "latitude and longitude are required");
        }
        const double latitude = query_double(req, "latitude", 0.0);
        const double longitude = query_double(req, "longitude", 0.0);
        const double radius_m = query_double(req, "radius_m", 2000.0);

        const auto analysis = engine.analyze_network_capacity(latitude, longitude, radius_m);

        json bottlenecks = json::array();
        for (const auto &report : analysis->bottlenecks)
        {
            bottlenecks.push_back(bottleneck_to_json(report));
        }

        json response;
        response["location"] = {{"latitude", latitude}, {"longitude", longitude}};
        response["bottlenecks"] = bottlenecks;
        response["timestamp"] = iso_timestamp_now();
        res.set_content(response.dump(), "application/json"); }); });
}

} // namespace
} // namespace road_geometry

int main(int argc, char **argv)
{
    using namespace road_geometry;

    EngineConfig config;
    if (argc > 1)
    {
        try
        {
            config = load_engine_config(argv[1]);
        }
        catch (const EngineError &ex)
        {
            std::cerr << "[server] " << ex.what() << std::endl;
            return 1;
        }
    }

    // Must run before any thread issues a request.
    curl_global_init(CURL_GLOBAL_DEFAULT);

    GeometryEngine engine(config, make_default_provider(config));

    httplib::Server server;
    register_routes(server, engine);

    std::cout << "[server] Geometry analyzer starting on http://" << config.server.host << ":" << config.server.port
              << std::endl;
    if (!server.listen(config.server.host, config.server.port))
    {
        std::cerr << "[server] Failed to listen on " << config.server.host << ":" << config.server.port << std::endl;
        curl_global_cleanup();
        return 1;
    }

    curl_global_cleanup();
    return 0;
}
