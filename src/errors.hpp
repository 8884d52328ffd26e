#pragma once

#include <stdexcept>
#include <string>


namespace gman
{

/** Malformed edge-list input (or an input that cannot be read). */
class ParseError : public std::runtime_error
{
public:
    ParseError(const std::string& source, uint line_nr, const std::string& what_is_wrong)
        : std::runtime_error(source + ":" + std::to_string(line_nr) + ": " + what_is_wrong),
          line_nr(line_nr) { }

    explicit ParseError(const std::string& message) : std::runtime_error(message), line_nr(0) { }

    /** 0 when the error is not tied to a line */
    const uint line_nr;
};

/** The operation needs a vertex that the graph does not have. */
class InvalidVertex : public std::out_of_range
{
public:
    explicit InvalidVertex(const std::string& vertex_)
        : std::out_of_range("unknown vertex: " + vertex_), vertex(vertex_) { }

    const std::string vertex;
};

} // namespace gman
