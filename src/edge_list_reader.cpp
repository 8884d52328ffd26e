#include "edge_list_reader.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <fstream>


using namespace std;
using namespace gman;
using namespace graph;


uint gman::load_from_file(Graph& g, const string& file_name)
{
    ifstream f(file_name);
    if (!f.is_open())
        throw ParseError("cannot open the file: " + file_name);

    auto nof_edges = load_from_stream(g, f, file_name);
    L_INF("loaded {} edges from {} (order: {}, size: {})", nof_edges, file_name, g.order(), g.size());
    return nof_edges;
}

uint gman::load_from_stream(Graph& g, istream& in, const string& source_name)
{
    uint line_nr = 0;
    uint nof_edges = 0;
    for (string l; getline(in, l);)
    {
        ++line_nr;
        auto tokens = split_by_space(l);  // tokens are: source, target, weight
        if (tokens.size() != 3)
            throw ParseError(source_name, line_nr,
                             "expected 'source target weight' but got " + to_string(tokens.size()) + " fields");

        long weight;
        if (!parse_long(tokens[2], weight))
            throw ParseError(source_name, line_nr, "the weight is not an integer: '" + tokens[2] + "'");

        g.add_edge(tokens[0], tokens[1], weight);
        ++nof_edges;
    }

    if (in.bad())
        throw ParseError(source_name, line_nr, "read error");

    return nof_edges;
}
