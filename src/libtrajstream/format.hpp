#ifndef __FORMAT_HPP__
#define __FORMAT_HPP__

#include "exception.hpp"

enum class TrajectoryFormat
{
    Xyz,        // multi-frame (extended) XYZ text
    AseBinary,  // ASE .traj binary container
    Hdf5        // structured HDF5 file, read through the HDF5 library
};

// Maps a file name to its trajectory format. Compression suffixes the input
// layer can decode (.xz, .zst, .zstd) are ignored.
// Throws UnsupportedFormat for anything else.
TrajectoryFormat detectFormat(const std::string& sFilename);

// key under which the decoder of a format is registered
std::string formatKey(TrajectoryFormat format);

// value of the "source_format" metadata entry
std::string sourceFormatName(TrajectoryFormat format);

// file name without the compression suffixes understood by readTrajectoryFile
std::string stripCompressionSuffix(const std::string& sFilename);

#endif
