#include "road_geometry/bottleneck.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <limits>
#include <queue>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace road_geometry
{
namespace
{

constexpr double kInf = std::numeric_limits<double>::infinity();

struct Pred
{
    std::size_t node{};
    std::size_t edge{};
};

struct Item
{
    double distance{};
    std::size_t node{};
};

// Path lengths and centralities are sums of doubles; equal values reached
// through different nodes can differ in the last bits.
bool nearly_equal(double a, double b)
{
    return std::fabs(a - b) <= 1e-9 * std::max(1.0, std::max(std::fabs(a), std::fabs(b)));
}

// Symmetric nodes or edges can land a few ulps either side of the threshold.
bool exceeds(double score, double threshold)
{
    return score > threshold && !nearly_equal(score, threshold);
}

std::string describe(const char *what, double score)
{
    std::ostringstream out;
    out << what << " (centrality: " << std::fixed << std::setprecision(3) << score << ")";
    return out.str();
}

} // namespace

CentralityResult compute_betweenness(const Network &network)
{
    CentralityResult out;

    const std::size_t n = network.node_count();
    const std::size_t m = network.edge_count();
    out.node_betweenness.assign(n, 0.0);
    out.edge_betweenness.assign(m, 0.0);

    if (n == 0 || m == 0)
    {
        return out;
    }

    std::vector<double> dist(n, kInf);
    std::vector<double> sigma(n, 0.0);
    std::vector<double> delta(n, 0.0);
    std::vector<bool> settled(n, false);
    std::vector<std::vector<Pred>> preds(n);
    std::vector<std::size_t> order;
    order.reserve(n);

    const auto cmp = [](const Item &a, const Item &b)
    {
        if (a.distance != b.distance)
        {
            return a.distance > b.distance;
        }
        return a.node > b.node;
    };

    for (std::size_t s = 0; s < n; s++)
    {
        std::fill(dist.begin(), dist.end(), kInf);
        std::fill(sigma.begin(), sigma.end(), 0.0);
        std::fill(delta.begin(), delta.end(), 0.0);
        std::fill(settled.begin(), settled.end(), false);
        for (auto &p : preds)
        {
            p.clear();
        }
        order.clear();

        std::priority_queue<Item, std::vector<Item>, decltype(cmp)> pq(cmp);
        dist[s] = 0.0;
        sigma[s] = 1.0;
        pq.push({0.0, s});

        while (!pq.empty())
        {
            const Item current = pq.top();
            pq.pop();
            const std::size_t v = current.node;
            if (settled[v])
            {
                continue;
            }
            settled[v] = true;
            order.push_back(v);

            for (const std::size_t edge_index : network.out_edges(v))
            {
                const std::size_t w = network.target_index(edge_index);
                if (settled[w])
                {
                    continue;
                }

                const double candidate = dist[v] + network.edges()[edge_index].travel_time_s;
                if (dist[w] == kInf || (candidate < dist[w] && !nearly_equal(candidate, dist[w])))
                {
                    dist[w] = candidate;
                    sigma[w] = sigma[v];
                    preds[w].clear();
                    preds[w].push_back({v, edge_index});
                    pq.push({candidate, w});
                }
                else if (nearly_equal(candidate, dist[w]))
                {
                    sigma[w] += sigma[v];
                    preds[w].push_back({v, edge_index});
                }
            }
        }

        // Accumulate dependencies in reverse settle order.
        for (auto it = order.rbegin(); it != order.rend(); ++it)
        {
            const std::size_t w = *it;
            const double sigma_w = sigma[w];
            if (sigma_w <= 0.0)
            {
                continue;
            }

            for (const Pred &p : preds[w])
            {
                const double c = (sigma[p.node] / sigma_w) * (1.0 + delta[w]);
                delta[p.node] += c;
                out.edge_betweenness[p.edge] += c;
            }

            if (w != s)
            {
                out.node_betweenness[w] += delta[w];
            }
        }
    }

    double node_scale = 0.0;
    if (n > 2)
    {
        node_scale = 1.0 / (static_cast<double>(n - 1) * static_cast<double>(n - 2));
    }
    double edge_scale = 0.0;
    if (n > 1)
    {
        edge_scale = 1.0 / (static_cast<double>(n) * static_cast<double>(n - 1));
    }

    for (double &value : out.node_betweenness)
    {
        value *= node_scale;
    }
    for (double &value : out.edge_betweenness)
    {
        value *= edge_scale;
    }

    return out;
}

double percentile(std::vector<double> values, double pct)
{
    if (values.empty())
    {
        return 0.0;
    }

    std::sort(values.begin(), values.end());

    const double rank = (pct / 100.0) * static_cast<double>(values.size() - 1);
    const std::size_t lower = static_cast<std::size_t>(std::floor(rank));
    const std::size_t upper = std::min(lower + 1, values.size() - 1);
    const double fraction = rank - static_cast<double>(lower);

    return values[lower] + (values[upper] - values[lower]) * fraction;
}

std::vector<BottleneckReport> find_bottlenecks(const Network &network, const BottleneckConfig &config)
{
    std::vector<BottleneckReport> bottlenecks;
    if (network.empty())
    {
        return bottlenecks;
    }

    const CentralityResult centrality = compute_betweenness(network);

    const double node_threshold = percentile(centrality.node_betweenness, config.percentile);
    for (std::size_t i = 0; i < network.node_count(); i++)
    {
        const double score = centrality.node_betweenness[i];
        if (!exceeds(score, node_threshold))
        {
            continue;
        }

        const Node &node = network.node_at(i);
        BottleneckReport report;
        report.type = EntityType::Node;
        report.id = std::to_string(node.id);
        report.node_ids = {node.id};
        report.centrality_score = score;
        report.lat = node.lat;
        report.lon = node.lon;
        report.degree = network.degree(i);
        report.description = describe("High-traffic intersection", score);
        bottlenecks.push_back(std::move(report));
    }

    if (!centrality.edge_betweenness.empty())
    {
        const double edge_threshold = percentile(centrality.edge_betweenness, config.percentile);
        for (std::size_t i = 0; i < network.edge_count(); i++)
        {
            const double score = centrality.edge_betweenness[i];
            if (!exceeds(score, edge_threshold))
            {
                continue;
            }

            const Edge &edge = network.edges()[i];
            BottleneckReport report;
            report.type = EntityType::Edge;
            report.id = edge_label(edge);
            report.node_ids = {edge.source, edge.target};
            report.centrality_score = score;
            report.length_m = edge.length_m;
            report.speed_kph = edge.speed_kph;
            report.description = describe("Critical road segment", score);
            bottlenecks.push_back(std::move(report));
        }
    }

    std::stable_sort(bottlenecks.begin(), bottlenecks.end(),
                     [](const BottleneckReport &a, const BottleneckReport &b)
                     { return a.centrality_score > b.centrality_score; });

    if (bottlenecks.size() > config.max_reports)
    {
        bottlenecks.resize(config.max_reports);
    }

    std::cout << "[bottleneck] " << bottlenecks.size() << " bottlenecks above the " << config.percentile
              << "th percentile." << std::endl;

    return bottlenecks;
}

} // namespace road_geometry
