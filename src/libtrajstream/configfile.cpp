#include "pch.hpp"
#include "configfile.hpp" 
#include "exception.hpp"

using namespace std;

const regex ConfigFile::commentPattern(R"(\s*[;#].*)");
const regex ConfigFile::sectionPattern(R"(\s*\[(.+?)\]\s*)");
const regex ConfigFile::blankLinePattern(R"(^\s*$)");
const regex ConfigFile::kvPattern(R"(\s*([^=:#;]+?)\s*[=:]\s*([^#;]*?)\s*([#;].*)?)");

template<>
bool ConfigFile::convert<bool>(const std::string& sValue)
{
    const string s = to_lower(sValue);
    if(s == "true" || s == "yes" || s == "on" || s == "1")
        return true;
    if(s == "false" || s == "no" || s == "off" || s == "0")
        return false;
    THROW(invalid_argument, "\"", sValue, "\" is not a boolean");
}

template<>
std::string ConfigFile::convert<std::string>(const std::string& sValue)
{
    return sValue;
}

void ConfigFile::open(const string& sFilename)
{
    ifstream ifs(sFilename);
    if(!ifs.is_open())
        THROW(runtime_error, "Unable to open configuration file \"", sFilename, "\"");

    try
    {
        read(ifs);
    }
    catch(const runtime_error&)
    {
        THROW_WITH_NESTED(runtime_error, "Error in configuration file \"", sFilename, "\"");
    }
}

void ConfigFile::read(std::istream& is)
{
    string sRawLine;
    size_t nLine = 0;
    auto pCurrentSection = m_data.end();

    while(getline(is, sRawLine))
    {
        ++nLine;
        const string line(trimmed(sRawLine));

        // Skip comment lines and blank lines
        if(regex_match(line, commentPattern) || regex_match(line, blankLinePattern))
            continue;

        smatch sectionMatch;
        if(regex_match(line, sectionMatch, sectionPattern))
        {
            pCurrentSection = m_data.insert(make_pair(sectionMatch[1], KVMap()));
            continue;
        }

        smatch kvMatch;
        if(!regex_match(line, kvMatch, kvPattern))
            THROW(runtime_error, "line ", nLine, ": cannot parse \"", line, "\"");
        if(pCurrentSection == m_data.end())
            THROW(runtime_error, "line ", nLine, ": key \"", kvMatch[1].str(), "\" outside of any section");

        pCurrentSection->second[kvMatch[1]] = kvMatch[2];
    }
}

bool ConfigFile::isSectionPresent(const std::string& section) const
{
    return m_data.find(section) != m_data.end();
}

bool ConfigFile::isKeyPresent(SectionPtr pSection, const std::string& key) const 
{
    return pSection->second.find(key) != pSection->second.end();
}

std::string ConfigFile::get(SectionPtr pSection, const std::string& key) const
{
    auto keyIt = pSection->second.find(key);
    if(keyIt == pSection->second.end())
        THROW(runtime_error, "Key \"", key, "\" not present in section [", pSection->first, "]");

    return keyIt->second;
}

ConfigFile::SectionPtr ConfigFile::getSection(const std::string& sSectionName) const
{
    auto range = getSections(sSectionName);

    if(range.first == range.second)
        THROW(runtime_error, "Section \"", sSectionName, "\" not found in ConfigFile, but requested");

    if(next(range.first) != range.second)
        THROW(runtime_error, "Section \"", sSectionName, "\" occurs more than once in ConfigFile");

    return range.first;
}

ConfigFile::SectionRange ConfigFile::getSections(const std::string& sSectionName) const 
{
    if(sSectionName.empty())
        return make_pair(m_data.begin(), m_data.end());
    return m_data.equal_range(sSectionName);
}

std::vector<std::string> ConfigFile::keys(SectionPtr pSection) const 
{
    vector<string> aKeys; 
    aKeys.reserve(pSection->second.size());

    for(const auto& [key, value] : pSection->second)
        aKeys.push_back(key);

    return aKeys;
}

void ConfigFile::write(ostream& os) const 
{
    for(const auto& [sSection, kv] : m_data)
    {
        os << "[" << sSection << "]\n";
        for(const auto& [key, value] : kv)
            os << key << " = " << value << "\n";
    }
}
