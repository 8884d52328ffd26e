#include <queue>
#include <unordered_set>
#include <algorithm>
#include <functional>

#include "graph_algo.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "my_assert.hpp"
#include "utils.hpp"


using namespace graph;
using namespace gman;
using namespace std;

using V = Graph::V;
using Weight = Graph::Weight;

#define hset unordered_set


EulerStatus GraphAlgo::is_eulerian(const Graph& g)
{
    uint nof_odd = count_if(g.adj_by_v.begin(), g.adj_by_v.end(),
                            [](const auto& v_adj) { return v_adj.second.size() % 2 != 0; });
    L_DEBUG("is_eulerian: {} vertices of odd degree", nof_odd);
    return {nof_odd == 0, nof_odd == 2};
}

ShortestDistances GraphAlgo::dijkstra(const Graph& g, const V& start)
{
    if (not g.has_vertex(start))
        throw InvalidVertex(start);

    ShortestDistances result;
    for (const auto& v : g.vertices())
        result.dist[v] = INF;
    result.dist[start] = 0;

    using DistV = pair<Weight, V>;
    priority_queue<DistV, vector<DistV>, greater<>> queue;
    queue.push({0, start});
    hset<V> settled;

    while (!queue.empty())
    {
        auto [cur_dist, cur] = queue.top();
        queue.pop();

        // the heap may hold outdated entries of already settled vertices
        if (!settled.insert(cur).second)
            continue;

        for (const auto& n : g.adj_by_v.at(cur))
        {
            auto w = g.edge_weight(cur, n);
            if (w < 0)
                throw invalid_argument("negative weight " + number_to_str(w) + " on " + cur + " -> " + n);
            auto candidate = cur_dist + w;
            if (candidate < result.dist.at(n))
            {
                result.dist[n] = candidate;
                result.pred[n] = cur;
                queue.push({candidate, n});
            }
        }
    }

    L_DEBUG("dijkstra from {}: settled {} of {} vertices", start, settled.size(), g.order());
    return result;
}

optional<Path> GraphAlgo::shortest_path(const Graph& g, const V& start, const V& end)
{
    if (not g.has_vertex(end))
        throw InvalidVertex(end);

    auto sd = dijkstra(g, start);
    auto cost = sd.dist.at(end);
    if (cost == INF)
        return {};

    // walk back from `end`, the source has no predecessor
    vector<V> vertices {end};
    for (auto it = sd.pred.find(end); it != sd.pred.end(); it = sd.pred.find(it->second))
    {
        vertices.push_back(it->second);
        MASSERT(vertices.size() <= g.order(), "predecessors form a cycle at " << it->second);
    }
    reverse(vertices.begin(), vertices.end());
    MASSERT(vertices.front() == start, "the path must begin at " << start << ", not at " << vertices.front());

    return Path{cost, vertices};
}
