#pragma once

#include <unordered_map>
#include <vector>
#include <optional>
#include <limits>

#include "graph.hpp"


namespace graph
{

struct EulerStatus
{
    bool eulerian;       // every vertex has even degree
    bool semi_eulerian;  // exactly two vertices have odd degree
};

struct ShortestDistances
{
    /** Every vertex of the graph; unreachable ones have INF. */
    std::unordered_map<Graph::V, Graph::Weight> dist;

    /** Only reachable vertices other than the source have a predecessor. */
    std::unordered_map<Graph::V, Graph::V> pred;
};

struct Path
{
    Graph::Weight cost;
    std::vector<Graph::V> vertices;  // from the start to the end, both included
};

struct GraphAlgo
{
    using V = Graph::V;
    using Weight = Graph::Weight;

    static constexpr Weight INF = std::numeric_limits<Weight>::infinity();

    /**
     Counts the vertices with odd degree (the length of the adjacency list, so multi-edges count):
     none means Eulerian, exactly two means semi-Eulerian.
     Note: directedness and connectivity are not taken into account.
    */
    static EulerStatus is_eulerian(const Graph& g);

    /**
     Dijkstra with a binary heap, O((V+E) log V).
     Missing weights default to 1 (see Graph::edge_weight), negative weights are not supported.
     Throws gman::InvalidVertex if `start` is not in `g`,
     and std::invalid_argument when it meets a reachable edge of negative weight.
    */
    static ShortestDistances dijkstra(const Graph& g, const V& start);

    /**
     @return: the cheapest path from `start` to `end`, or nothing if `end` is unreachable.
     For start == end the path is [start] with cost 0.
     Throws gman::InvalidVertex if `start` or `end` is not in `g` (and see dijkstra).
    */
    static std::optional<Path> shortest_path(const Graph& g, const V& start, const V& end);
};

}
