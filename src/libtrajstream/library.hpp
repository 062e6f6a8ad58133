#ifndef __LIBRARY_HPP__
#define __LIBRARY_HPP__

#include "exception.hpp"

namespace library 
{
    // Per-element table with case insensitive keys ("fe" finds "Fe").
    template<class TValue>
    class Dataset
    {
    public:
        explicit Dataset(const std::map<std::string, TValue>& m)
            : m_map(m.begin(), m.end())
        {}

        inline std::optional<TValue> find(const std::string& sElement) const
        {
            auto pItem = m_map.find(sElement);
            if(pItem == m_map.end())
                return std::nullopt;
            return pItem->second;
        }

        inline const TValue& get(const std::string& sElement) const
        {
            auto pItem = m_map.find(sElement);
            if(pItem == m_map.end())
                THROW(std::runtime_error, "No value for element \"", sElement, "\"");
            return pItem->second;
        }

        // adds or replaces the value of an element
        inline void overwrite(const std::string& sElement, const TValue& value)
        {
            m_map.insert_or_assign(sElement, value);
        }

    private:
        struct NoCaseLess
        {
            bool operator()(const std::string& s1, const std::string& s2) const 
            {
                return std::lexicographical_compare(s1.begin(), s1.end(), s2.begin(), s2.end(), 
                    [](unsigned char c1, unsigned char c2) { return std::tolower(c1) < std::tolower(c2); });
            }
        };

        std::map<std::string, TValue, NoCaseLess> m_map;
    };

    // gives molar mass in g/mol
    extern Dataset<double> Masses;

    // translates an element number to respective symbol string
    extern const std::map<size_t, std::string> ElementNo2Symbol;

    // exact (case sensitive) check against the periodic table
    bool isElementSymbol(const std::string& sSymbol);

    // symbol for an atomic number, "X" for anything unknown
    std::string symbolForNumber(long nNumber);
}


#endif
