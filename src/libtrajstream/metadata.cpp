#include "pch.hpp"
#include "metadata.hpp"
#include "exception.hpp"

using namespace std;

std::optional<double> parseNumber(std::string_view sv)
{
    sv = trimmed(sv);
    if(sv.empty())
        return nullopt;

    // strtod needs a terminated string
    const string s(sv);
    char* pEnd = nullptr;
    errno = 0;
    const double d = strtod(s.c_str(), &pEnd);
    if(pEnd != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(d))
        return nullopt;
    return d;
}

MetadataValue parseMetadataValue(const std::string& sValue)
{
    if(auto d = parseNumber(sValue))
        return *d;
    return sValue;
}

std::string formatMetadataValue(const MetadataValue& value)
{
    if(const double* pd = std::get_if<double>(&value))
    {
        ostringstream oss;
        oss.precision(numeric_limits<double>::max_digits10);
        oss << *pd;
        return oss.str();
    }
    return std::get<string>(value);
}

std::optional<double> asNumber(const MetadataValue& value)
{
    if(const double* pd = std::get_if<double>(&value))
        return *pd;
    return nullopt;
}

std::optional<double> asNumber(const MetadataMap& m, const std::string& sKey)
{
    auto pItem = m.find(sKey);
    if(pItem == m.end())
        return nullopt;
    return asNumber(pItem->second);
}

std::map<std::string, double> numericEntries(const MetadataMap& m)
{
    map<string, double> numbers;
    for(const auto& [key, value] : m)
    {
        if(auto d = asNumber(value))
            numbers.emplace(key, *d);
    }
    return numbers;
}

void parse_comment_line(const std::string& comment, KVPairs& kv)
{
    static thread_local regex pattern(R"(([^=\s]+)\s*=\s*(\".*?\"|\S+))");

    smatch match;
    auto begin = comment.cbegin();

    while(regex_search(begin, comment.cend(), match, pattern))
    {
        string key = match[1];                
        string val = match[2];

        // strip quotes
        if(val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.length() - 2);

        kv.insert(make_pair(key, val));

        begin = match.suffix().first;
    }
}
