#include "pch.hpp"
#include "streaming.hpp"

using namespace std;

namespace
{
    void addSummary(TrajectoryData& data, const FrameLoader& loader)
    {
        data.m_metadata["source_format"] = sourceFormatName(loader.format());
        data.m_metadata["filename"] = loader.filename();
        data.m_metadata["frame_count"] = static_cast<double>(data.m_aFrames.size());
        if(!data.m_aFrames.empty())
            data.m_metadata["total_atoms"] = static_cast<double>(data.m_aFrames.front()->m_structure.m_aSites.size());
    }

    TrajectoryData parseStreaming(std::string_view raw, const FrameLoader& loader, const ProgressReporter& progress, const StreamingOptions& options)
    {
        TrajectoryData data;

        size_t nTotalFrames = 0;
        progress.report(10, 100, "Building frame index");
        data.m_aIndexedFrames = loader.buildFrameIndex(raw, options.nIndexSampleRate, 
                progress.scaled(10, 50, "Building index: ").callback(), &nTotalFrames);
        data.m_nTotalFrames = nTotalFrames;

        progress.report(50, 100, "Loading initial frames");
        data.m_aFrames = loader.loadFrames(raw, std::min(options.nInitialFrames, nTotalFrames));

        if(options.bExtractPlotMetadata)
        {
            progress.report(70, 100, "Extracting plot metadata");
            data.m_aPlotMetadata = loader.extractPlotMetadata(raw, PlotMetadataOptions(), 
                    progress.scaled(70, 90, "Extracting: ").callback());
        }

        data.m_bIsIndexed = true;
        addSummary(data, loader);
        progress.report(100, 100, sprint("Ready: ", nTotalFrames, " frames indexed"));
        return data;
    }

    TrajectoryData parseDirect(std::string_view raw, const FrameLoader& loader, const ProgressReporter& progress)
    {
        TrajectoryData data;

        progress.report(10, 100, "Parsing trajectory");
        data.m_aFrames = loader.loadFrames(raw, numeric_limits<size_t>::max(), progress.scaled(10, 100, "Parsing: ").callback());
        data.m_nTotalFrames = data.m_aFrames.size();

        addSummary(data, loader);
        progress.report(100, 100, "Complete");
        return data;
    }
}

bool useStreamingMode(size_t nSize, const StreamingOptions& options)
{
    return options.bUseIndexing || nSize > LARGE_FILE_THRESHOLD;
}

TrajectoryData parseTrajectory(std::string_view raw, const std::string& sFilename, 
        const ProgressCallback& onProgress, const StreamingOptions& options)
{
    const FrameLoader loader = createFrameLoader(sFilename);

    const ProgressReporter progress(onProgress);
    progress.report(0, 100, "Detecting format");

    if(raw.size() > LARGE_FILE_THRESHOLD)
        progress.report(5, 100, sprint("Large file detected (", raw.size() >> 20, " MB)"));

    if(useStreamingMode(raw.size(), options))
        return parseStreaming(raw, loader, progress, options);
    return parseDirect(raw, loader, progress);
}

std::future<TrajectoryData> parseTrajectoryAsync(std::string_view raw, std::string sFilename, 
        ProgressCallback onProgress, StreamingOptions options)
{
    // an unsupported file name is reported to the caller right away
    createFrameLoader(sFilename);

    return std::async(std::launch::async, [raw, sFilename = std::move(sFilename), onProgress = std::move(onProgress), options]() {
        return parseTrajectory(raw, sFilename, onProgress, options);
    });
}
