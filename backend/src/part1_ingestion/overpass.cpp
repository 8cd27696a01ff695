#include "road_geometry/overpass.hpp"

#include <curl/curl.h>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "road_geometry/geometry.hpp"

namespace road_geometry
{
namespace
{

using json = nlohmann::json;

constexpr double kKphPerMph = 1.609344;

const char *kDrivableHighways =
    "motorway|motorway_link|trunk|trunk_link|primary|primary_link|secondary|secondary_link|"
    "tertiary|tertiary_link|unclassified|residential|living_street|service";

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp)
{
    static_cast<std::string *>(userp)->append(static_cast<char *>(contents), size * nmemb);
    return size * nmemb;
}

enum class Direction
{
    Both,
    Forward,
    Reverse
};

Direction parse_oneway(const json &tags)
{
    if (!tags.contains("oneway") || !tags["oneway"].is_string())
    {
        return Direction::Both;
    }

    const std::string value = tags["oneway"].get<std::string>();
    if (value == "yes" || value == "true" || value == "1")
    {
        return Direction::Forward;
    }
    if (value == "-1")
    {
        return Direction::Reverse;
    }
    return Direction::Both;
}

} // namespace

std::string build_overpass_query(const Point &center, double radius_m, long timeout_seconds)
{
    std::ostringstream query;
    query << std::fixed << std::setprecision(6);
    query << "[out:json][timeout:" << timeout_seconds << "];";
    query << "way(around:" << std::setprecision(0) << radius_m << std::setprecision(6) << ","
          << center.lat << "," << center.lon << ")";
    query << "[highway~\"^(" << kDrivableHighways << ")$\"];";
    query << "out body;>;out skel qt;";
    return query.str();
}

std::string fetch_overpass_data(const std::string &query, const ProviderConfig &config)
{
    std::cout << "[overpass] Query: " << query << std::endl;

    CURL *curl = curl_easy_init();
    if (!curl)
    {
        std::cerr << "[overpass] Failed to initialize CURL" << std::endl;
        return "{}";
    }

    std::string response_data;
    bool success = false;

    for (const auto &base_url : config.endpoints)
    {
        response_data.clear();

        char *encoded_query = curl_easy_escape(curl, query.c_str(), static_cast<int>(query.length()));
        if (!encoded_query)
        {
            std::cerr << "[overpass] Failed to encode query" << std::endl;
            break;
        }
        const std::string url = base_url + "?data=" + std::string(encoded_query);
        curl_free(encoded_query);

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, config.timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.connect_timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        const CURLcode res = curl_easy_perform(curl);

        if (res == CURLE_OK)
        {
            long http_code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

            if (http_code == 200)
            {
                success = true;
                std::cout << "[overpass] Fetched " << response_data.size() << " bytes from " << base_url << std::endl;
                break;
            }
            std::cerr << "[overpass] HTTP " << http_code << " from " << base_url << ", trying next server..." << std::endl;
        }
        else
        {
            std::cerr << "[overpass] Connection to " << base_url << " failed: " << curl_easy_strerror(res)
                      << ", trying next server..." << std::endl;
        }
    }

    curl_easy_cleanup(curl);

    if (!success)
    {
        std::cerr << "[overpass] All Overpass servers failed" << std::endl;
        return "{}";
    }

    return response_data;
}

std::optional<double> default_speed_for_highway(const std::string &highway_type)
{
    static const std::unordered_map<std::string, double> speeds = {
        {"motorway", 100.0},
        {"motorway_link", 60.0},
        {"trunk", 90.0},
        {"trunk_link", 50.0},
        {"primary", 80.0},
        {"primary_link", 50.0},
        {"secondary", 60.0},
        {"secondary_link", 40.0},
        {"tertiary", 50.0},
        {"tertiary_link", 40.0},
        {"unclassified", 40.0},
        {"residential", 30.0},
        {"living_street", 20.0},
        {"service", 20.0}};

    const auto it = speeds.find(highway_type);
    if (it == speeds.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> parse_maxspeed(const std::string &maxspeed)
{
    // Values like "50", "50 km/h", "30 mph"; symbolic values ("walk", "RU:urban") are ignored.
    std::istringstream in(maxspeed);
    double value = 0.0;
    if (!(in >> value) || value <= 0.0)
    {
        return std::nullopt;
    }

    std::string unit;
    in >> unit;
    if (unit == "mph")
    {
        return value * kKphPerMph;
    }
    return value;
}

RawGraph parse_overpass_payload(const json &osm_data)
{
    RawGraph raw;

    if (!osm_data.is_object() || !osm_data.contains("elements") || !osm_data["elements"].is_array())
    {
        std::cerr << "[overpass] No valid elements in OSM data." << std::endl;
        return raw;
    }

    std::unordered_map<long, std::size_t> node_lookup;

    for (const auto &element : osm_data["elements"])
    {
        if (element.value("type", "") != "node" || !element.contains("lat") || !element.contains("lon"))
        {
            continue;
        }

        const long id = element["id"].get<long>();
        if (node_lookup.count(id))
        {
            continue;
        }
        node_lookup[id] = raw.nodes.size();
        raw.nodes.push_back({id, element["lat"].get<double>(), element["lon"].get<double>()});
    }

    int oneway_count = 0;
    int skipped_segments = 0;

    for (const auto &element : osm_data["elements"])
    {
        if (element.value("type", "") != "way" || !element.contains("nodes"))
        {
            continue;
        }

        std::string highway_type;
        std::optional<double> speed_kph;
        Direction direction = Direction::Both;

        if (element.contains("tags"))
        {
            const auto &tags = element["tags"];

            if (tags.contains("highway") && tags["highway"].is_string())
            {
                highway_type = tags["highway"].get<std::string>();
                speed_kph = default_speed_for_highway(highway_type);
            }

            if (tags.contains("maxspeed") && tags["maxspeed"].is_string())
            {
                const auto tagged = parse_maxspeed(tags["maxspeed"].get<std::string>());
                if (tagged)
                {
                    speed_kph = tagged;
                }
            }

            direction = parse_oneway(tags);
        }

        if (direction != Direction::Both)
        {
            oneway_count++;
        }

        const auto &way_node_ids = element["nodes"];

        for (std::size_t i = 0; i + 1 < way_node_ids.size(); i++)
        {
            const long node1_id = way_node_ids[i].get<long>();
            const long node2_id = way_node_ids[i + 1].get<long>();

            const auto first = node_lookup.find(node1_id);
            const auto second = node_lookup.find(node2_id);
            if (first == node_lookup.end() || second == node_lookup.end())
            {
                skipped_segments++;
                continue;
            }

            const RawNode &a = raw.nodes[first->second];
            const RawNode &b = raw.nodes[second->second];
            const double dist_meters = haversine(a.lat, a.lon, b.lat, b.lon);
            if (dist_meters <= 0.0)
            {
                skipped_segments++;
                continue;
            }

            if (direction != Direction::Reverse)
            {
                raw.edges.push_back({node1_id, node2_id, dist_meters, speed_kph});
            }
            if (direction != Direction::Forward)
            {
                raw.edges.push_back({node2_id, node1_id, dist_meters, speed_kph});
            }
        }
    }

    std::cout << "[overpass] Parsed " << raw.nodes.size() << " nodes and " << raw.edges.size()
              << " directed edges (" << oneway_count << " one-way ways, " << skipped_segments
              << " segments skipped)." << std::endl;

    return raw;
}

FetchDrivableNetwork make_overpass_provider(ProviderConfig config)
{
    return [config](const Point &center, double radius_m) -> std::optional<RawGraph>
    {
        const std::string query = build_overpass_query(center, radius_m, config.timeout_seconds);
        const std::string payload = fetch_overpass_data(query, config);

        RawGraph raw;
        try
        {
            raw = parse_overpass_payload(json::parse(payload));
        }
        catch (const json::exception &ex)
        {
            std::cerr << "[overpass] Unusable response: " << ex.what() << std::endl;
            return std::nullopt;
        }

        if (raw.nodes.empty())
        {
            return std::nullopt;
        }
        return raw;
    };
}

} // namespace road_geometry
