#include "pch.hpp"
#include "input.hpp"
#include "input/lzma_streambuf.hpp"
#include "input/zstd_streambuf.hpp"

using namespace std;

namespace
{
    string readAll(std::streambuf* pBuf)
    {
        // errors of the decompressing buffers propagate from here
        return string(istreambuf_iterator<char>(pBuf), istreambuf_iterator<char>());
    }
}

Compression compressionOf(const std::string& sFilename)
{
    const string sName = to_lower(sFilename);
    const auto nDot = sName.find_last_of('.');
    if(nDot == string::npos)
        return Compression::None;

    const string sExt = sName.substr(nDot + 1);
    if(sExt == "xz")
        return Compression::Xz;
    if(sExt == "zst" || sExt == "zstd")
        return Compression::Zstd;
    return Compression::None;
}

std::string readStream(std::istream& is, Compression compression)
{
    switch(compression)
    {
    case Compression::Xz:
    {
#if HAVE_LZMA
        LZMAStreamBuf buf(&is);
        return readAll(&buf);
#else
        THROW(runtime_error, "trajstream was built without xz support");
#endif
    }

    case Compression::Zstd:
    {
#if HAVE_ZSTD
        ZStdStreamBuf buf(&is);
        return readAll(&buf);
#else
        THROW(runtime_error, "trajstream was built without zstd support");
#endif
    }

    case Compression::None:
        break;
    }

    return readAll(is.rdbuf());
}

std::string readTrajectoryFile(const std::string& sFilename)
{
    ifstream ifs(sFilename, ios::in | ios::binary);
    if(!ifs.is_open())
        THROW(runtime_error, "Specified input file \"", sFilename, "\" could not be opened!");

    try
    {
        return readStream(ifs, compressionOf(sFilename));
    }
    catch(const runtime_error&)
    {
        THROW_WITH_NESTED(runtime_error, "Reading \"", sFilename, "\" failed");
    }
}
