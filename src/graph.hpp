/**
 * Weighted graph (directed or undirected) keyed by string labels.
 * Multi-edges are kept in the adjacency lists, but a (src, dst) pair has one weight (last write wins).
 */
#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <variant>
#include <tuple>
#include <iostream>

#include "utils.hpp"


namespace graph
{

struct InOutDegree
{
    uint in;
    uint out;

    bool operator==(const InOutDegree& rhs) const { return in == rhs.in && out == rhs.out; }
    bool operator!=(const InOutDegree& rhs) const { return !(rhs == *this); }
};

class Graph
{
public:
    typedef std::string V;
    typedef double Weight;

    /** Undirected graph holds both directions of every edge, directed graph only the inserted one. */
    explicit Graph(bool directed=false) : directed(directed) { }

    Graph(bool directed, const std::initializer_list<std::tuple<V,V,Weight>>& edges) : directed(directed)
    {
        for (const auto& [src, dst, w] : edges)
            add_edge(src, dst, w);
    }

    /** Add a vertex (no-op if the vertex is already present). */
    void add_vertex(const V& vertex);

    /**
     * Add a connection from src to dst (and from dst to src if undirected).
     * Automatically creates missing vertices.
     * The weight is not validated.
     */
    void add_edge(const V& src, const V& dst, Weight weight=1);

    bool is_directed() const { return directed; }

    /**
     * Note: existing edges are left as they are,
     * so toggling a non-empty undirected graph to directed keeps both directions of its edges
     * and toggling a directed one to undirected does not add the reverse ones.
     */
    void set_directed(bool value) { directed = value; }

    bool has_vertex(const V& vertex) const { return adj_by_v.find(vertex) != adj_by_v.end(); }

    /** In the order of their first mention. */
    const std::vector<V>& vertices() const { return vertices_ordered; }

    /** Number of vertices. */
    uint order() const { return vertices_ordered.size(); }

    /** Number of edges (for undirected graphs, every edge is counted once). */
    uint size() const;

    /** Empty for unknown vertices. */
    const std::vector<V>& adjacent_vertices(const V& vertex) const;

    /**
     * Undirected: the length of the adjacency list (0 for unknown vertices).
     * Directed: {in, out}, where `in` is the number of vertices whose adjacency list mentions `vertex`.
     * Complexity of the directed case: O(V+E) (there is no reverse index).
     */
    std::variant<uint, InOutDegree> degree(const V& vertex) const;

    /** Checks the direction v1 -> v2 only. */
    bool are_adjacent(const V& v1, const V& v2) const;

    /** The recorded weight of src -> dst, if any. */
    std::optional<Weight> find_weight(const V& src, const V& dst) const;

    /**
     * The weight of src -> dst, or 1 when none is recorded.
     * Algorithms use this fallback and never fail on a missing weight.
     */
    Weight edge_weight(const V& src, const V& dst) const;

    /** Note: compares verbatim, including the order of adjacency lists. */
    bool operator==(const Graph& rhs) const
    {
        return directed == rhs.directed &&
               vertices_ordered == rhs.vertices_ordered &&
               adj_by_v == rhs.adj_by_v &&
               weight_by_edge == rhs.weight_by_edge;
    }
    bool operator!=(const Graph& rhs) const { return !(rhs == *this); }

    friend std::ostream& operator<<(std::ostream&, const Graph&);

    friend struct GraphAlgo;

private:
    bool directed;
    std::vector<V> vertices_ordered;
    std::unordered_map<V, std::vector<V>> adj_by_v;
    std::unordered_map<std::pair<V,V>, Weight, gman::pair_hash<V,V>> weight_by_edge;
};

}
