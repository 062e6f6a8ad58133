#include "pch.hpp"
#include "frame_decoder.hpp"

using namespace std;

FrameDecoder::FrameDecoder()
{}

FrameDecoder::~FrameDecoder()
{}

void FrameDecoder::open(std::string_view raw)
{
    m_raw = raw;
}

ScanCursor FrameDecoder::begin() const
{
    return ScanCursor{};
}

double FrameDecoder::progressOf(const ScanCursor& cursor) const
{
    if(m_raw.empty())
        return 100;
    return 100.0 * static_cast<double>(std::min(cursor.nOffset, m_raw.size())) / static_cast<double>(m_raw.size());
}

size_t FrameDecoder::progressInterval() const
{
    return 1000;
}
