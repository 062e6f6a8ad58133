#ifndef __EXCEPTION_HPP__
#define __EXCEPTION_HPP__

#include "pch.hpp"

/////////////////////////////////////////////////////////
// String helpers shared by the parsers

// view of s without leading and trailing white space
inline std::string_view trimmed(std::string_view s)
{
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

inline std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

/////////////////////////////////////////////////////////
// Emulating sprintf: sprint("frame ", n, " of ", sFile)
template<typename... Args>
std::string sprint(const Args&... args)
{
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

// every exception carries the location it was raised at
#define THROW(ex, ...) throw ex(sprint(__VA_ARGS__, " [", __FILE__, ":", __LINE__, "]"))
#define THROW_WITH_NESTED(ex, ...) std::throw_with_nested(ex(sprint(__VA_ARGS__, " [", __FILE__, ":", __LINE__, "]")))

/////////////////////////////////////////////////////////
// Raised when a file name does not map to any known trajectory format.
// This is the only error the loading code propagates; problems inside the
// trajectory content degrade to missing frames instead.
class UnsupportedFormat : public std::runtime_error
{
public:
    explicit UnsupportedFormat(const std::string& sWhat)
        : std::runtime_error(sWhat)
    {}
};

// Prints e and the chain of exceptions nested into it, one level of indentation per link.
void print_nested_exception(std::ostream& os, const std::exception& e, int level = 0);
void print_nested_exception(std::ostream& os, const std::exception_ptr& e);

// The messages of e and its nested exceptions on one line, outermost first.
std::string describe_exception(const std::exception& e);

#endif
