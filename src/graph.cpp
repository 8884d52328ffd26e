#include "graph.hpp"
#include "logger.hpp"

#include <algorithm>


using namespace graph;
using namespace gman;
using namespace std;

using V = Graph::V;


void Graph::add_vertex(const V& vertex)
{
    auto [it, inserted] = adj_by_v.insert({vertex, {}});
    if (inserted)
    {
        vertices_ordered.push_back(vertex);
        L_DEBUG("added vertex {}", vertex);
    }
}

void Graph::add_edge(const V& src, const V& dst, Weight weight)
{
    add_vertex(src);
    add_vertex(dst);

    adj_by_v.at(src).push_back(dst);
    weight_by_edge[{src, dst}] = weight;

    if (not directed)
    {
        adj_by_v.at(dst).push_back(src);
        weight_by_edge[{dst, src}] = weight;
    }

    L_DEBUG("added edge {} {} {} (weight {})", src, directed? "->": "--", dst, weight);
}

uint Graph::size() const
{
    uint nof_entries = 0;
    for (const auto& [v, adj] : adj_by_v)
        nof_entries += adj.size();
    return directed? nof_entries: nof_entries/2;
}

const vector<V>& Graph::adjacent_vertices(const V& vertex) const
{
    static const vector<V> empty;
    auto it = adj_by_v.find(vertex);
    if (it == adj_by_v.end())
        return empty;
    return it->second;
}

variant<uint, InOutDegree> Graph::degree(const V& vertex) const
{
    uint out = adjacent_vertices(vertex).size();
    if (not directed)
        return out;

    uint in = 0;
    for (const auto& [v, adj] : adj_by_v)
        if (contains(adj, vertex))
            ++in;
    return InOutDegree{in, out};
}

bool Graph::are_adjacent(const V& v1, const V& v2) const
{
    return contains(adjacent_vertices(v1), v2);
}

optional<Graph::Weight> Graph::find_weight(const V& src, const V& dst) const
{
    auto it = weight_by_edge.find({src, dst});
    if (it == weight_by_edge.end())
        return {};
    return it->second;
}

Graph::Weight Graph::edge_weight(const V& src, const V& dst) const
{
    return find_weight(src, dst).value_or(1);
}


namespace graph
{
std::ostream& operator<<(ostream& out, const Graph& g)
{
    for (const auto& v : g.vertices())
    {
        auto neighbor_to_str = [&g, &v](const V& n)
        {
            stringstream ss;
            ss << n << " (Weight: ";
            if (auto w = g.find_weight(v, n))
                ss << number_to_str(*w);
            else
                ss << "N/A";
            ss << ")";
            return ss.str();
        };
        out << v << ": " << join(", ", g.adjacent_vertices(v), neighbor_to_str) << endl;
    }
    return out;
}
}
