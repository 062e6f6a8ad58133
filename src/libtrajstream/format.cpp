#include "pch.hpp"
#include "format.hpp"

using namespace std;

namespace
{
    const vector<string> COMPRESSION_SUFFIXES = {".xz", ".zst", ".zstd"};

    bool endsWith(const string& s, const string& sSuffix)
    {
        return s.size() >= sSuffix.size() && s.compare(s.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0;
    }
}

std::string stripCompressionSuffix(const std::string& sFilename)
{
    string sName = sFilename;
    bool bStripped = true;
    while(bStripped)
    {
        bStripped = false;
        const string sLower = to_lower(sName);
        for(const auto& sSuffix : COMPRESSION_SUFFIXES)
        {
            if(endsWith(sLower, sSuffix))
            {
                sName.resize(sName.size() - sSuffix.size());
                bStripped = true;
                break;
            }
        }
    }
    return sName;
}

TrajectoryFormat detectFormat(const std::string& sFilename)
{
    const string sName = to_lower(stripCompressionSuffix(sFilename));

    if(endsWith(sName, ".xyz") || endsWith(sName, ".extxyz"))
        return TrajectoryFormat::Xyz;
    if(endsWith(sName, ".traj"))
        return TrajectoryFormat::AseBinary;
    if(endsWith(sName, ".h5") || endsWith(sName, ".hdf5"))
        return TrajectoryFormat::Hdf5;

    THROW(UnsupportedFormat, "Unsupported format for frame loading: \"", sFilename, "\"");
}

std::string formatKey(TrajectoryFormat format)
{
    switch(format)
    {
    case TrajectoryFormat::Xyz:
        return "xyz";
    case TrajectoryFormat::AseBinary:
        return "traj";
    case TrajectoryFormat::Hdf5:
        return "h5";
    }
    THROW(logic_error, "formatKey: unknown format value ", static_cast<int>(format));
}

std::string sourceFormatName(TrajectoryFormat format)
{
    switch(format)
    {
    case TrajectoryFormat::Xyz:
        return "xyz_trajectory";
    case TrajectoryFormat::AseBinary:
        return "ase_trajectory";
    case TrajectoryFormat::Hdf5:
        return "hdf5_trajectory";
    }
    THROW(logic_error, "sourceFormatName: unknown format value ", static_cast<int>(format));
}
