#ifndef __STREAMING_HPP__
#define __STREAMING_HPP__

#include "frame_loader.hpp"

// inputs larger than this are always parsed in streaming mode
constexpr size_t LARGE_FILE_THRESHOLD = 400 * 1024 * 1024;

struct StreamingOptions
{
    // force streaming mode regardless of the input size
    bool bUseIndexing = false;
    bool bExtractPlotMetadata = true;
    size_t nIndexSampleRate = 1;
    // frames decoded up front in streaming mode
    size_t nInitialFrames = 10;
};

// true if raw of the given size is parsed in streaming (indexed) mode
bool useStreamingMode(size_t nSize, const StreamingOptions& options);

// Parses a complete trajectory. 
// Direct mode decodes every valid frame. Streaming mode builds a frame index, 
// decodes only the first nInitialFrames frames and leaves the rest to 
// FrameLoader::loadFrame. In both modes frames[i] is valid for i < frames.size()
// and totalFrames() is the number of valid frames.
// Throws UnsupportedFormat for an unknown file name; broken content never throws.
TrajectoryData parseTrajectory(std::string_view raw, const std::string& sFilename, 
        const ProgressCallback& onProgress = nullptr, const StreamingOptions& options = StreamingOptions());

// Same as parseTrajectory, running on its own thread. raw must stay alive until the future is ready.
std::future<TrajectoryData> parseTrajectoryAsync(std::string_view raw, std::string sFilename, 
        ProgressCallback onProgress = nullptr, StreamingOptions options = StreamingOptions());

#endif
