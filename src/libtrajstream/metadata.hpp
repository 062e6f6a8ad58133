#ifndef __METADATA_HPP__
#define __METADATA_HPP__

#include "pch.hpp"

// A metadata value is either a number or a string; nothing else is stored.
typedef std::variant<double, std::string> MetadataValue;
typedef std::map<std::string, MetadataValue> MetadataMap;

// raw key=value pairs as they appear on a comment line
typedef std::map<std::string, std::string> KVPairs;

// Coercion rule used for every textual value: a value becomes a number if the
// complete (trimmed) text parses as a finite floating point number, otherwise
// it stays a string.
MetadataValue parseMetadataValue(const std::string& sValue);

// inverse of parseMetadataValue, numbers are written with full precision
std::string formatMetadataValue(const MetadataValue& value);

// returns the value if it is a number
std::optional<double> asNumber(const MetadataValue& value);
std::optional<double> asNumber(const MetadataMap& m, const std::string& sKey);

// only the numeric entries, used for plotting
std::map<std::string, double> numericEntries(const MetadataMap& m);

// Splits a comment line into key=value pairs. Values may be quoted ("a b c"), 
// the quotes are removed. Tokens that are not key=value pairs are ignored; 
// the first occurrence of a key wins.
void parse_comment_line(const std::string& comment, KVPairs& kv);

// parses a strict floating point number (complete string, finite)
std::optional<double> parseNumber(std::string_view s);

#endif
