#ifndef __FRAME_DECODER_HPP__
#define __FRAME_DECODER_HPP__

#include "factory.hpp"
#include "frame.hpp"

// why a single frame could not be decoded
enum class DecodeError
{
    Corrupt,    // header or payload does not parse
    Truncated   // the input ends inside the frame
};

template<class T>
using DecodeResult = std::variant<T, DecodeError>;

// Position of a forward scan. Text formats advance by byte offset, 
// container formats by record number in their offsets table.
struct ScanCursor
{
    size_t nOffset = 0;
    size_t nRecord = 0;
};

// Outcome of one scan step. Every Frame and Corrupt step occupies one frame number.
struct ScanStep
{
    enum class Kind 
    { 
        Frame,      // a structurally complete frame starts at nOffset
        Corrupt,    // one lost frame, the scan resynchronizes at next
        EndOfInput 
    };

    Kind kind = Kind::EndOfInput;
    size_t nOffset = 0;
    size_t nSize = 0;
    ScanCursor next;
};

// Format specific decoder. An instance is bound to one raw buffer via open() and 
// lives for a single loader call only; it never outlives or modifies the buffer.
class FrameDecoder
{
public:
    FrameDecoder();
    virtual ~FrameDecoder() = 0;

    // bind to the raw input; invalid input must not throw, it simply yields no frames
    virtual void open(std::string_view raw);

    // cursor of the first frame
    virtual ScanCursor begin() const;

    // locates the next frame at or after cursor, without decoding it
    virtual ScanStep scanNextFrame(const ScanCursor& cursor) const = 0;

    // cursor pointing at an indexed frame, so a scan can resume from there
    virtual ScanCursor seek(const FrameIndex& entry) const = 0;

    // decodes exactly one frame starting at nOffset
    virtual DecodeResult<FramePtr> decodeFrameAt(size_t nOffset, size_t nFrameNumber) const = 0;

    // decodes only the scalar properties of the frame at nOffset
    virtual DecodeResult<TrajectoryMetadata> decodeMetadataAt(size_t nOffset, size_t nFrameNumber) const = 0;

    // scan position as a percentage, used for progress notifications
    virtual double progressOf(const ScanCursor& cursor) const;

    // how many scan steps pass between two progress notifications
    virtual size_t progressInterval() const;

    inline std::string_view raw() const { return m_raw; }

protected:
    std::string_view m_raw;
};

typedef std::shared_ptr<FrameDecoder> FrameDecoderPtr;

namespace registry
{
    typedef Factory<FrameDecoder> FrameDecoderFactory;
}

#endif
