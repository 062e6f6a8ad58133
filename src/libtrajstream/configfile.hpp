#ifndef __CONFIGFILE_HPP__
#define __CONFIGFILE_HPP__

#include "exception.hpp"

// ini style configuration:
//   [section]
//   key = value     ; comment
class ConfigFile 
{
public:
    typedef std::map<std::string, std::string> KVMap;
    typedef std::unordered_multimap<std::string, KVMap> DataMap;
    typedef DataMap::const_iterator SectionPtr;
    typedef std::pair<SectionPtr, SectionPtr> SectionRange;

    void open(const std::string& sFilename);
    void read(std::istream& is);

    // loop over sections
    // if no search string is given, all sections are returned
    SectionRange getSections(const std::string& sSectionName = "") const;

    // returns the section with the given name; 
    // throws exception if section is occurring multiple times or not present
    SectionPtr getSection(const std::string& sSectionName) const;

    bool isSectionPresent(const std::string& section) const;
    bool isKeyPresent(SectionPtr pSection, const std::string& key) const;

    std::string get(SectionPtr pSection, const std::string& key) const;

    // returns all keys present in a given section
    std::vector<std::string> keys(SectionPtr pSection) const;

    template<typename T>
    T as(SectionPtr pSection, const std::string& key) const
    {
        const std::string sValue = get(pSection, key);
        try
        {
            return convert<T>(sValue);
        }
        catch(const std::invalid_argument&)
        {
            THROW_WITH_NESTED(std::runtime_error, "Invalid value for \"", key, "\" in section [", pSection->first, "]");
        }
    }

    // defaultValue is returned if the section or the key is not present; 
    // a value that cannot be converted is still an error
    template<typename T>
    T as(const std::string& sSectionName, const std::string& key, const T& defaultValue) const
    {
        if(!isSectionPresent(sSectionName))
            return defaultValue;

        auto pSection = getSection(sSectionName);
        if(!isKeyPresent(pSection, key))
            return defaultValue;
        return as<T>(pSection, key);
    }

    // writes all content to stream, mainly for debug purposes
    void write(std::ostream& os) const;

private:
    template<typename T>
    static T convert(const std::string& sValue)
    {
        T convertedValue;
        std::istringstream iss(sValue);
        if(!(iss >> convertedValue) || !iss.eof())
            THROW(std::invalid_argument, "Conversion to type \"", typeid(T).name(), "\" failed for value \"", sValue, "\"");
        return convertedValue;
    }

    static const std::regex commentPattern;
    static const std::regex blankLinePattern;
    static const std::regex sectionPattern;
    static const std::regex kvPattern;

    DataMap m_data;
};

// true/false, yes/no, on/off or 1/0
template<>
bool ConfigFile::convert<bool>(const std::string& sValue);

template<>
std::string ConfigFile::convert<std::string>(const std::string& sValue);

typedef std::shared_ptr<ConfigFile> ConfigFilePtr; 

#endif
