#ifndef __INPUT_HPP__
#define __INPUT_HPP__

#include "exception.hpp"

enum class Compression
{
    None,
    Xz,
    Zstd
};

// compression of a file, judged by its last suffix (.xz, .zst, .zstd)
Compression compressionOf(const std::string& sFilename);

// Reads the complete content of is, decompressing it on the way.
// Throws runtime_error if the codec is not available or the data is damaged.
std::string readStream(std::istream& is, Compression compression);

// Loads a trajectory file into memory; compressed files are decompressed.
// The result is the raw input expected by FrameLoader and parseTrajectory.
std::string readTrajectoryFile(const std::string& sFilename);

#endif
