#pragma once

#include <string>
#include <istream>

#include "graph.hpp"


namespace gman
{

/**
 * Read edges in the format
 *   source target weight
 * (one edge per line, whitespace-separated, the weight is an integer) and add them to `g`.
 * Throws ParseError on the first malformed line or if the file cannot be opened.
 * Note: edges from the lines before the malformed one stay in `g`.
 * @return: the number of edges read
 */
uint load_from_file(graph::Graph& g, const std::string& file_name);

/** Same as load_from_file, `source_name` is used in error messages only. */
uint load_from_stream(graph::Graph& g, std::istream& in, const std::string& source_name="<stream>");

} //namespace gman
