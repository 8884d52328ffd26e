#pragma once

#include <string>
#include <vector>
#include <istream>
#include <ostream>

#include "graph.hpp"


namespace gman
{

/**
 * A command shell that owns one graph and runs the textual commands on it
 * (see `help` for the list), writing the answers to `out`.
 * Errors of a command (bad arguments, unknown vertices, malformed files) are reported to `out`
 * and do not stop the session.
 */
class Session
{
public:
    explicit Session(std::ostream& out, bool directed=false) : g(directed), out(out) { }

    /** @return: false if the command asks to end the session */
    bool execute(const std::string& line);

    /** Execute the lines of `in` until its end or until `quit`. */
    void run(std::istream& in);

    graph::Graph& graph() { return g; }
    const graph::Graph& graph() const { return g; }

private:
    graph::Graph g;
    std::ostream& out;

    void dispatch(const std::string& cmd, const std::vector<std::string>& args);

    void cmd_edge(const std::vector<std::string>& args);
    void cmd_directed(const std::vector<std::string>& args);
    void cmd_degree(const std::string& v);
    void cmd_euler();
    void cmd_path(const std::string& start, const std::string& end);
    void print_help();
};

} // namespace gman
