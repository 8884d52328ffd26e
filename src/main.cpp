#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <args.hxx>

#include "session.hpp"
#include "edge_list_reader.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"


using namespace std;
using namespace gman;


int main(int argc, const char *argv[])
{
    args::ArgumentParser parser("Graph manager: build a weighted graph and query it "
                                "(order/size, degrees, adjacency, Eulerian check, shortest paths)",
                                "Without -c, the commands are read from stdin (type 'help' for the list).");
    parser.helpParams.width = 100;
    parser.helpParams.helpindent = 26;

    args::Positional<string> edges_arg
        (parser, "edges",
         "File with edges to load first, one 'source target weight' per line");

    args::Flag directed_flag
            (parser,
             "directed",
             "start with a directed graph (default: undirected)",
             {'d', "directed"});

    args::ValueFlagList<string> command_list_arg
            (parser,
             "cmd",
             "execute the command and exit (instead of reading stdin). "
             "Can be given several times (e.g. -c 'euler' -c 'path A C'), "
             "the commands run in that order.",
             {'c', "command"});

    args::Flag silence_flag
            (parser,
             "s",
             "silent mode (no logging)",
             {'s', "silent"});

    args::Flag verbose_flag
            (parser,
             "v",
             "verbose mode (default: warnings only)",
             {'v', "verbose"});

    args::HelpFlag help
        (parser,
         "help",
         "Display this help menu",
         {'h', "help"});

    try
    {
        parser.ParseCLI(argc, argv);
    }
    catch (args::Help&)
    {
        cout << parser;
        return 0;
    }
    catch (args::ParseError& e)
    {
        cerr << e.what() << endl;
        cerr << parser;
        return 1;
    }
    catch (args::ValidationError& e)
    {
        cerr << e.what() << endl;
        cerr << parser;
        return 1;
    }

    // setup logging
    console()->set_level(spdlog::level::warn);
    if (silence_flag)
        console()->set_level(spdlog::level::off);
    if (verbose_flag)
        console()->set_level(spdlog::level::debug);

    // parse args
    vector<string> commands(command_list_arg.Get());
    bool directed(directed_flag.Get());

    L_INF("edges: {}, directed: {}, commands: [{}]",
          edges_arg? edges_arg.Get(): "none", directed, join(", ", commands));

    Session session(cout, directed);

    if (edges_arg)
    {
        try
        {
            load_from_file(session.graph(), edges_arg.Get());
        }
        catch (ParseError& e)
        {
            cerr << e.what() << endl;
            return 1;
        }
    }

    if (commands.empty())
    {
        session.run(cin);
        return 0;
    }

    for (const auto& c : commands)
        if (!session.execute(c))
            break;

    return 0;
}
