#pragma clang diagnostic push
#pragma ide diagnostic ignored "cert-err58-cpp"

#include <vector>
#include <string>
#include <stdexcept>

#include "gtest/gtest.h"

#include "graph.hpp"
#include "graph_algo.hpp"
#include "errors.hpp"

using namespace std;
using namespace graph;
using namespace gman;

using GA = GraphAlgo;
using Vvec = vector<Graph::V>;


TEST(EulerTest, TriangleIsEulerian)
{
    Graph g(false, {{"A","B",1}, {"B","C",1}, {"C","A",1}});
    auto status = GA::is_eulerian(g);
    ASSERT_TRUE(status.eulerian);
    ASSERT_FALSE(status.semi_eulerian);
}

TEST(EulerTest, PathIsSemiEulerian)
{
    Graph g(false, {{"A","B",1}, {"B","C",1}});  // degrees 1,2,1
    auto status = GA::is_eulerian(g);
    ASSERT_FALSE(status.eulerian);
    ASSERT_TRUE(status.semi_eulerian);
}

TEST(EulerTest, StarIsNeither)
{
    Graph g(false, {{"C","X",1}, {"C","Y",1}, {"C","Z",1}});  // 4 odd vertices
    auto status = GA::is_eulerian(g);
    ASSERT_FALSE(status.eulerian);
    ASSERT_FALSE(status.semi_eulerian);
}

TEST(EulerTest, EmptyAndIsolatedVerticesAreEulerian)
{
    Graph g;
    ASSERT_TRUE(GA::is_eulerian(g).eulerian);
    g.add_vertex("A");
    g.add_vertex("B");
    ASSERT_TRUE(GA::is_eulerian(g).eulerian);
}

TEST(EulerTest, ConnectivityIsIgnored)
{
    // two disjoint triangles
    Graph g(false, {{"A","B",1}, {"B","C",1}, {"C","A",1},
                    {"X","Y",1}, {"Y","Z",1}, {"Z","X",1}});
    ASSERT_TRUE(GA::is_eulerian(g).eulerian);
}

TEST(EulerTest, MultiEdgesCount)
{
    Graph g;
    g.add_edge("A", "B");
    g.add_edge("A", "B");  // A and B get degree 2
    ASSERT_TRUE(GA::is_eulerian(g).eulerian);
}

TEST(EulerTest, DirectedUsesOutDegreeOnly)
{
    Graph g(true, {{"A","B",1}, {"B","C",1}});  // out-degrees 1,1,0
    auto status = GA::is_eulerian(g);
    ASSERT_FALSE(status.eulerian);
    ASSERT_TRUE(status.semi_eulerian);
}


TEST(DijkstraTest, Distances)
{
    Graph g(false, {{"A","B",1}, {"B","C",2}, {"A","C",5}});
    g.add_vertex("D");

    auto sd = GA::dijkstra(g, "A");
    ASSERT_EQ(sd.dist.size(), 4u);
    ASSERT_EQ(sd.dist.at("A"), 0);
    ASSERT_EQ(sd.dist.at("B"), 1);
    ASSERT_EQ(sd.dist.at("C"), 3);
    ASSERT_EQ(sd.dist.at("D"), GA::INF);

    ASSERT_EQ(sd.pred.count("A"), 0u);
    ASSERT_EQ(sd.pred.count("D"), 0u);
    ASSERT_EQ(sd.pred.at("C"), "B");
    ASSERT_EQ(sd.pred.at("B"), "A");
}

TEST(DijkstraTest, UnknownStart)
{
    Graph g(false, {{"A","B",1}});
    ASSERT_THROW(GA::dijkstra(g, "Z"), InvalidVertex);
}

TEST(DijkstraTest, NegativeWeight)
{
    Graph g;
    g.add_edge("A", "B", -1);
    g.add_edge("C", "D", 1);
    ASSERT_THROW(GA::dijkstra(g, "A"), invalid_argument);
    ASSERT_THROW(GA::shortest_path(g, "A", "B"), invalid_argument);

    // unreachable negative edges do not matter
    ASSERT_EQ(GA::dijkstra(g, "C").dist.at("D"), 1);
}

TEST(DijkstraTest, UsesLastWeightOfRepeatedEdge)
{
    Graph g(true);
    g.add_edge("A", "B", 10);
    g.add_edge("A", "B", 2);
    ASSERT_EQ(GA::dijkstra(g, "A").dist.at("B"), 2);
}


TEST(ShortestPathTest, Triangle)
{
    Graph g(false, {{"A","B",1}, {"B","C",2}, {"A","C",5}});
    auto path = GA::shortest_path(g, "A", "C");
    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->cost, 3);
    ASSERT_EQ(path->vertices, Vvec({"A","B","C"}));

    // undirected, so the way back is the same
    auto back = GA::shortest_path(g, "C", "A");
    ASSERT_TRUE(back.has_value());
    ASSERT_EQ(back->cost, 3);
    ASSERT_EQ(back->vertices, Vvec({"C","B","A"}));
}

TEST(ShortestPathTest, StartEqualsEnd)
{
    Graph g(false, {{"A","B",1}});
    auto path = GA::shortest_path(g, "A", "A");
    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->cost, 0);
    ASSERT_EQ(path->vertices, Vvec({"A"}));

    Graph lonely;
    lonely.add_vertex("X");
    auto path2 = GA::shortest_path(lonely, "X", "X");
    ASSERT_TRUE(path2.has_value());
    ASSERT_EQ(path2->vertices, Vvec({"X"}));
}

TEST(ShortestPathTest, DisconnectedComponents)
{
    Graph g(false, {{"A","B",1}, {"C","D",1}});
    ASSERT_FALSE(GA::shortest_path(g, "A", "D").has_value());
}

TEST(ShortestPathTest, DirectedRespectsDirection)
{
    Graph g(true, {{"A","B",1}, {"B","C",1}});
    ASSERT_TRUE(GA::shortest_path(g, "A", "C").has_value());
    ASSERT_FALSE(GA::shortest_path(g, "C", "A").has_value());
}

TEST(ShortestPathTest, PrefersCheaperLongerPath)
{
    // A-E directly costs 10, A-B-C-D-E costs 4
    Graph g(false, {{"A","E",10}, {"A","B",1}, {"B","C",1}, {"C","D",1}, {"D","E",1}, {"B","E",7}});
    auto path = GA::shortest_path(g, "A", "E");
    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->cost, 4);
    ASSERT_EQ(path->vertices, Vvec({"A","B","C","D","E"}));
}

TEST(ShortestPathTest, UnknownVertices)
{
    Graph g(false, {{"A","B",1}});
    ASSERT_THROW(GA::shortest_path(g, "Z", "A"), InvalidVertex);
    ASSERT_THROW(GA::shortest_path(g, "A", "Z"), InvalidVertex);
}


#pragma clang diagnostic pop
