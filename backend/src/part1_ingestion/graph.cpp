#include "road_geometry/graph.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace road_geometry
{

NetworkPtr build_network_from_raw(const RawGraph &raw, const Point &center, double radius_m, const EngineConfig &config)
{
    std::cout << "[acquisition] Building network from provider data..." << std::endl;

    auto network = std::make_shared<Network>(center, radius_m, NetworkSource::Provider, config.capacity);

    for (const auto &node : raw.nodes)
    {
        network->add_node(node.id, node.lat, node.lon);
    }

    int defaulted_speeds = 0;
    for (const auto &edge : raw.edges)
    {
        double speed_kph = config.routing.default_speed_kph;
        if (edge.speed_kph && *edge.speed_kph > 0.0)
        {
            speed_kph = *edge.speed_kph;
        }
        else
        {
            defaulted_speeds++;
        }

        network->add_edge(edge.source, edge.target, edge.length_m, speed_kph);
    }

    std::cout << "[acquisition] Network built with " << network->node_count() << " nodes and "
              << network->edge_count() << " directed edges (" << defaulted_speeds
              << " edges using the default speed)." << std::endl;

    return network;
}

NetworkPtr synthesize_grid_network(const Point &center, double radius_m, const SynthesisConfig &synthesis,
                                   const CapacityModel &capacity)
{
    const int grid_size = synthesis.grid_size;
    const double spacing = synthesis.degrees_per_radius_metre * radius_m;

    std::cout << "[acquisition] Generating simulated " << grid_size << "x" << grid_size
              << " fallback grid around " << center.lat << ", " << center.lon << std::endl;

    auto network = std::make_shared<Network>(center, radius_m, NetworkSource::Synthesized, capacity);

    for (int i = 0; i < grid_size; i++)
    {
        for (int j = 0; j < grid_size; j++)
        {
            const long node_id = static_cast<long>(i) * grid_size + j;
            const double lat = center.lat + (i - grid_size / 2) * spacing;
            const double lon = center.lon + (j - grid_size / 2) * spacing;
            network->add_node(node_id, lat, lon);
        }
    }

    for (int i = 0; i < grid_size; i++)
    {
        for (int j = 0; j < grid_size; j++)
        {
            const long current = static_cast<long>(i) * grid_size + j;

            if (j < grid_size - 1)
            {
                const long right = current + 1;
                network->add_edge(current, right, synthesis.edge_length_m, synthesis.speed_kph);
                network->add_edge(right, current, synthesis.edge_length_m, synthesis.speed_kph);
            }

            if (i < grid_size - 1)
            {
                const long below = current + grid_size;
                network->add_edge(current, below, synthesis.edge_length_m, synthesis.speed_kph);
                network->add_edge(below, current, synthesis.edge_length_m, synthesis.speed_kph);
            }
        }
    }

    std::cout << "[acquisition] Simulated graph generated with " << network->node_count() << " nodes and "
              << network->edge_count() << " directed edges." << std::endl;

    return network;
}

NetworkPtr fetch_or_synthesize(const FetchDrivableNetwork &provider, const Point &center, double radius_m,
                               const EngineConfig &config)
{
    if (provider)
    {
        std::optional<RawGraph> raw;
        try
        {
            raw = provider(center, radius_m);
        }
        catch (const std::exception &ex)
        {
            std::cerr << "[acquisition] Map-data provider failed: " << ex.what() << std::endl;
        }
        catch (...)
        {
            std::cerr << "[acquisition] Map-data provider failed with a non-standard exception ("
                      << error_kind_name(ErrorKind::ProviderUnavailable) << ")" << std::endl;
        }

        if (raw && !raw->nodes.empty())
        {
            try
            {
                return build_network_from_raw(*raw, center, radius_m, config);
            }
            catch (const EngineError &ex)
            {
                std::cerr << "[acquisition] Provider graph rejected: " << ex.what() << std::endl;
            }
        }
        else
        {
            std::cerr << "[acquisition] Map-data provider unavailable ("
                      << error_kind_name(ErrorKind::ProviderUnavailable) << "), falling back to synthesis." << std::endl;
        }
    }

    return synthesize_grid_network(center, radius_m, config.synthesis, config.capacity);
}

} // namespace road_geometry
