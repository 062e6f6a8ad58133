#ifndef __FRAME_LOADER_HPP__
#define __FRAME_LOADER_HPP__

#include "format.hpp"
#include "frame_decoder.hpp"
#include "progress.hpp"

struct PlotMetadataOptions
{
    // every nSampleRate-th frame, 0 is treated as 1
    size_t nSampleRate = 1;
    // if given, only these properties are kept
    std::optional<std::vector<std::string>> aProperties;
};

// Reads frames out of a raw trajectory held by the caller. A loader is a plain
// value (format + file name): it keeps no frame data and no decoder state, 
// every call decodes from raw again. 
// Frames are numbered by their position in the input. A corrupted record keeps 
// its number (loadFrame returns nullptr for it) but is not counted as a frame.
class FrameLoader
{
public:
    FrameLoader(TrajectoryFormat format, std::string sFilename);

    inline TrajectoryFormat format() const { return m_format; }
    inline const std::string& filename() const { return m_sFilename; }

    // number of valid frames
    size_t getTotalFrames(std::string_view raw) const;

    // One forward pass over raw. An entry is recorded for every valid frame whose
    // number is a multiple of nSampleRate. If pnTotalFrames is given, it receives
    // the number of valid frames found during the pass.
    FrameIndexList buildFrameIndex(std::string_view raw, size_t nSampleRate = 1, 
            const ProgressCallback& onProgress = nullptr, size_t* pnTotalFrames = nullptr) const;

    // Decodes frame nFrameNumber, seeking from the nearest entry of pIndex if given.
    // Returns nullptr if the frame does not exist or is corrupted.
    FramePtr loadFrame(std::string_view raw, size_t nFrameNumber, const FrameIndexList* pIndex = nullptr) const;

    // decodes the first nMaxFrames valid frames in a single pass (all by default)
    std::vector<FramePtr> loadFrames(std::string_view raw, size_t nMaxFrames = std::numeric_limits<size_t>::max(),
            const ProgressCallback& onProgress = nullptr) const;

    // scalar properties of the sampled frames, without decoding atoms
    std::vector<TrajectoryMetadata> extractPlotMetadata(std::string_view raw, const PlotMetadataOptions& options = PlotMetadataOptions(),
            const ProgressCallback& onProgress = nullptr) const;

private:
    FrameDecoderPtr createDecoder(std::string_view raw) const;

    TrajectoryFormat m_format;
    std::string m_sFilename;
};

// throws UnsupportedFormat if the file name does not belong to a known format
FrameLoader createFrameLoader(const std::string& sFilename);

#endif
