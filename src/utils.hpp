#pragma once

#include <cstdlib>
#include <string>
#include <sstream>
#include <vector>
#include <algorithm>
#include <cctype>
#include <functional>
#include <stdexcept>
#include <limits>
#include <iomanip>


namespace gman
{


inline
std::vector<std::string> split_by_space(const std::string& s)
{
    std::istringstream iss(s);
    std::string token;
    std::vector<std::string> tokens;
    while (iss >> token)
        tokens.push_back(token);
    return tokens;
}

template<typename TC>
inline
std::string join(const std::string& sep, const TC& elements)
{
    std::stringstream ss;
    uint i = 1;
    for (const auto& e: elements)
    {
        ss << e;
        if (i != elements.size())
            ss << sep;
        i++;
    }
    return ss.str();
}

template<typename TC, typename ToStr>
inline
std::string join(const std::string& sep, const TC& elements, ToStr convert_to_str)
{
    std::stringstream ss;
    uint i = 1;
    for (const auto& e: elements)
    {
        ss << convert_to_str(e);
        if (i != elements.size())
            ss << sep;
        i++;
    }
    return ss.str();
}


inline
std::string lower(const std::string& what)
{
    // https://stackoverflow.com/a/313990/801203
    std::string result = what;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

/** All significant digits (no `1e+06` for a million). */
template<typename T>
inline
std::string number_to_str(const T& number)
{
    std::stringstream ss;
    ss << std::setprecision(std::numeric_limits<T>::max_digits10) << number;
    return ss.str();
}

template<typename T>
inline
bool contains(const std::vector<T>& elements, const T& elem)
{
    return std::find(elements.begin(), elements.end(), elem) != elements.end();
}

/**
 * Parse the whole `token` as a (possibly signed) decimal integer.
 * @return: false if `token` is empty, has trailing characters, or is out of range.
 */
inline
bool parse_long(const std::string& token, long& result)
{
    if (token.empty())
        return false;
    try
    {
        size_t pos = 0;
        result = std::stol(token, &pos);
        return pos == token.size();
    }
    catch (std::invalid_argument&)
    {
        return false;
    }
    catch (std::out_of_range&)
    {
        return false;
    }
}

inline
std::string create_tmp_folder()
{
    std::string path_tmp_str = "/tmp/XXXXXX";
    char* folder = mkdtemp((char*)path_tmp_str.c_str());  // (char*) is a hack but path_tmp_str lives long enough, so OK
    if (folder == nullptr)
        throw std::runtime_error("failure to create tmp folder");
    return folder;
}


template<typename T, typename U, typename H1=std::hash<T>, typename H2=std::hash<U>>
struct pair_hash
{
    size_t operator()(const std::pair<T, U>& x) const
    {
        size_t hash_value = 17;
        hash_value = 31*hash_value + H1()(x.first);
        hash_value = 31*hash_value + H2()(x.second);
        return hash_value;
    }
};


}  // namespace gman
