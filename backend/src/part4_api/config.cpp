#include "road_geometry/config.hpp"

#include <fstream>
#include <iostream>
#include <string>

#include "road_geometry/types.hpp"

namespace road_geometry
{
namespace
{

using json = nlohmann::json;

template <typename T>
void read_key(const json &section, const char *section_name, const char *key, T &target)
{
    if (!section.contains(key))
    {
        return;
    }

    try
    {
        target = section.at(key).get<T>();
    }
    catch (const json::exception &ex)
    {
        throw EngineError(ErrorKind::InvalidInput,
                          std::string("Invalid config value ") + section_name + "." + key + ": " + ex.what());
    }
}

const json &section_or_empty(const json &document, const char *name)
{
    static const json empty = json::object();
    if (document.contains(name) && document[name].is_object())
    {
        return document[name];
    }
    return empty;
}

} // namespace

EngineConfig engine_config_from_json(const json &document)
{
    if (!document.is_object())
    {
        throw EngineError(ErrorKind::InvalidInput, "Config document must be a JSON object");
    }

    EngineConfig config;

    const json &provider = section_or_empty(document, "provider");
    read_key(provider, "provider", "enabled", config.provider.enabled);
    read_key(provider, "provider", "endpoints", config.provider.endpoints);
    read_key(provider, "provider", "user_agent", config.provider.user_agent);
    read_key(provider, "provider", "timeout_seconds", config.provider.timeout_seconds);
    read_key(provider, "provider", "connect_timeout_seconds", config.provider.connect_timeout_seconds);

    const json &synthesis = section_or_empty(document, "synthesis");
    read_key(synthesis, "synthesis", "grid_size", config.synthesis.grid_size);
    read_key(synthesis, "synthesis", "degrees_per_radius_metre", config.synthesis.degrees_per_radius_metre);
    read_key(synthesis, "synthesis", "edge_length_m", config.synthesis.edge_length_m);
    read_key(synthesis, "synthesis", "speed_kph", config.synthesis.speed_kph);

    const json &capacity = section_or_empty(document, "capacity");
    read_key(capacity, "capacity", "base_speed_kph", config.capacity.base_speed_kph);
    read_key(capacity, "capacity", "base_capacity_vph", config.capacity.base_capacity_vph);
    read_key(capacity, "capacity", "high_capacity_threshold", config.capacity.high_capacity_threshold);
    read_key(capacity, "capacity", "low_capacity_threshold", config.capacity.low_capacity_threshold);

    const json &bottleneck = section_or_empty(document, "bottleneck");
    read_key(bottleneck, "bottleneck", "percentile", config.bottleneck.percentile);
    read_key(bottleneck, "bottleneck", "max_reports", config.bottleneck.max_reports);

    const json &cache = section_or_empty(document, "cache");
    read_key(cache, "cache", "analysis_ttl_seconds", config.cache.analysis_ttl_seconds);
    read_key(cache, "cache", "route_ttl_seconds", config.cache.route_ttl_seconds);
    read_key(cache, "cache", "network_ttl_seconds", config.cache.network_ttl_seconds);
    read_key(cache, "cache", "synthesized_network_ttl_seconds", config.cache.synthesized_network_ttl_seconds);
    read_key(cache, "cache", "max_entries", config.cache.max_entries);
    read_key(cache, "cache", "coordinate_precision", config.cache.coordinate_precision);

    const json &routing = section_or_empty(document, "routing");
    read_key(routing, "routing", "min_network_radius_m", config.routing.min_network_radius_m);
    read_key(routing, "routing", "radius_factor", config.routing.radius_factor);
    read_key(routing, "routing", "default_speed_kph", config.routing.default_speed_kph);

    const json &server = section_or_empty(document, "server");
    read_key(server, "server", "host", config.server.host);
    read_key(server, "server", "port", config.server.port);

    if (config.synthesis.grid_size < 1)
    {
        throw EngineError(ErrorKind::InvalidInput, "synthesis.grid_size must be at least 1");
    }
    if (config.capacity.base_speed_kph <= 0.0)
    {
        throw EngineError(ErrorKind::InvalidInput, "capacity.base_speed_kph must be positive");
    }
    if (config.bottleneck.percentile < 0.0 || config.bottleneck.percentile > 100.0)
    {
        throw EngineError(ErrorKind::InvalidInput, "bottleneck.percentile must be within [0, 100]");
    }

    return config;
}

EngineConfig load_engine_config(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw EngineError(ErrorKind::InvalidInput, "Unable to open config file " + path);
    }

    json document;
    try
    {
        in >> document;
    }
    catch (const json::parse_error &ex)
    {
        throw EngineError(ErrorKind::InvalidInput, "Config file " + path + " is not valid JSON: " + ex.what());
    }

    std::cout << "[config] Loaded configuration from " << path << std::endl;
    return engine_config_from_json(document);
}

} // namespace road_geometry
