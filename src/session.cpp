#include "session.hpp"
#include "graph_algo.hpp"
#include "edge_list_reader.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"


using namespace std;
using namespace gman;
using namespace graph;


namespace
{

void expect_nof_args(const string& cmd, const vector<string>& args, size_t min, size_t max)
{
    if (args.size() < min || args.size() > max)
        throw invalid_argument("wrong number of arguments for '" + cmd + "' (see 'help')");
}

string to_list_str(const vector<Graph::V>& vertices)
{
    return "[" + join(", ", vertices) + "]";
}

}


bool Session::execute(const string& line)
{
    auto tokens = split_by_space(line);
    if (tokens.empty() || tokens[0][0] == '#')
        return true;

    auto cmd = lower(tokens[0]);
    if (cmd == "quit" || cmd == "exit")
        return false;

    vector<string> args(tokens.begin() + 1, tokens.end());
    try
    {
        dispatch(cmd, args);
    }
    catch (ParseError& e)
    {
        out << "error: " << e.what() << endl;
    }
    catch (InvalidVertex& e)
    {
        out << "error: " << e.what() << endl;
    }
    catch (invalid_argument& e)
    {
        out << "error: " << e.what() << endl;
    }
    return true;
}

void Session::run(istream& in)
{
    for (string l; getline(in, l);)
        if (!execute(l))
            return;
}

void Session::dispatch(const string& cmd, const vector<string>& args)
{
    L_DEBUG("command: {} {}", cmd, join(" ", args));

    if (cmd == "vertex")
    {
        expect_nof_args(cmd, args, 1, 1);
        g.add_vertex(args[0]);
    }
    else if (cmd == "edge")
        cmd_edge(args);
    else if (cmd == "load")
    {
        expect_nof_args(cmd, args, 1, 1);
        auto nof_edges = load_from_file(g, args[0]);
        out << "Loaded " << nof_edges << " edges from " << args[0] << "." << endl;
    }
    else if (cmd == "directed")
        cmd_directed(args);
    else if (cmd == "show")
    {
        expect_nof_args(cmd, args, 0, 0);
        out << g;
    }
    else if (cmd == "order" || cmd == "size" || cmd == "info")
    {
        expect_nof_args(cmd, args, 0, 0);
        if (cmd != "size")
            out << "Order (Vertices): " << g.order() << endl;
        if (cmd != "order")
            out << "Size (Edges): " << g.size() << endl;
    }
    else if (cmd == "adj")
    {
        expect_nof_args(cmd, args, 1, 1);
        out << "Adjacent vertices of " << args[0] << ": " << to_list_str(g.adjacent_vertices(args[0])) << endl;
    }
    else if (cmd == "degree")
    {
        expect_nof_args(cmd, args, 1, 1);
        cmd_degree(args[0]);
    }
    else if (cmd == "adjacent")
    {
        expect_nof_args(cmd, args, 2, 2);
        out << args[0] << " and " << args[1] << " are "
            << (g.are_adjacent(args[0], args[1])? "adjacent": "not adjacent") << "." << endl;
    }
    else if (cmd == "euler")
    {
        expect_nof_args(cmd, args, 0, 0);
        cmd_euler();
    }
    else if (cmd == "path")
    {
        expect_nof_args(cmd, args, 2, 2);
        cmd_path(args[0], args[1]);
    }
    else if (cmd == "help")
        print_help();
    else
        throw invalid_argument("unknown command '" + cmd + "' (see 'help')");
}

void Session::cmd_edge(const vector<string>& args)
{
    expect_nof_args("edge", args, 2, 3);

    long weight = 1;
    if (args.size() == 3 && !parse_long(args[2], weight))
        throw invalid_argument("the weight is not an integer: '" + args[2] + "'");
    if (weight < 1)
        throw invalid_argument("the weight must be at least 1: '" + args[2] + "'");

    g.add_edge(args[0], args[1], weight);
}

void Session::cmd_directed(const vector<string>& args)
{
    expect_nof_args("directed", args, 1, 1);

    auto value = lower(args[0]);
    if (value != "on" && value != "off")
        throw invalid_argument("expected 'directed on' or 'directed off'");

    bool directed = value == "on";
    if (directed != g.is_directed() && g.size() > 0)
        L_WARN("switching to {} keeps the {} existing edges as they are",
               directed? "directed": "undirected", g.size());
    g.set_directed(directed);
    L_INF("the graph is now {}", directed? "directed": "undirected");
}

void Session::cmd_degree(const string& v)
{
    auto degree = g.degree(v);
    if (auto in_out = get_if<InOutDegree>(&degree))
        out << "Degree of " << v << " - In: " << in_out->in << ", Out: " << in_out->out << endl;
    else
        out << "Degree of " << v << ": " << get<uint>(degree) << endl;
}

void Session::cmd_euler()
{
    auto status = GraphAlgo::is_eulerian(g);
    out << "Graph is ";
    if (status.eulerian)
        out << "Eulerian.";
    else if (status.semi_eulerian)
        out << "Semi-Eulerian.";
    else
        out << "neither Eulerian nor Semi-Eulerian.";
    out << endl;
}

void Session::cmd_path(const string& start, const string& end)
{
    auto path = GraphAlgo::shortest_path(g, start, end);
    if (!path)
    {
        out << "No path exists between the vertices." << endl;
        return;
    }
    out << "Shortest path from " << start << " to " << end << " is " << to_list_str(path->vertices)
        << " with cost " << number_to_str(path->cost) << "." << endl;
}

void Session::print_help()
{
    out << "Commands:"                                                          << endl
        << "  vertex V             add vertex V"                                << endl
        << "  edge S T [W]         add edge S-T (S->T if directed), W >= 1, defaults to 1" << endl
        << "  load FILE            add the edges of FILE ('source target weight' per line)" << endl
        << "  directed on|off      switch the directedness (existing edges are kept as is)" << endl
        << "  show                 print the adjacency lists with weights"      << endl
        << "  order | size | info  print the number of vertices and/or edges"   << endl
        << "  adj V                print the vertices adjacent to V"            << endl
        << "  degree V             print the degree of V (in/out if directed)"  << endl
        << "  adjacent A B         check whether B is adjacent to A"            << endl
        << "  euler                check whether the graph is (semi-)Eulerian"  << endl
        << "  path S T             print the shortest path from S to T"         << endl
        << "  help                 print this help"                             << endl
        << "  quit | exit          end the session"                             << endl;
}
