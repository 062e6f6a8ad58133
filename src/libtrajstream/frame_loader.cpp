#include "pch.hpp"
#include "frame_loader.hpp"

using namespace std;

namespace
{
    // Calls visit(nFrameNumber, step) for every Frame and Corrupt step from cursor on 
    // until the input ends or visit returns false.
    template<class Visitor>
    void scan(const FrameDecoder& decoder, ScanCursor cursor, size_t nFrameNumber, 
            const ProgressReporter& progress, const string& sStage, Visitor visit)
    {
        const size_t nInterval = std::max<size_t>(decoder.progressInterval(), 1);
        size_t nSteps = 0;
        for(;;)
        {
            const ScanStep step = decoder.scanNextFrame(cursor);
            if(step.kind == ScanStep::Kind::EndOfInput)
                break;

            if(!visit(nFrameNumber, step))
                return;

            ++nFrameNumber;
            cursor = step.next;

            if(++nSteps % nInterval == 0)
                progress.report(decoder.progressOf(cursor), 100, sprint(sStage, ": ", nFrameNumber));
        }
        progress.report(100, 100, sprint(sStage, ": done"));
    }

    FramePtr frameOrNull(DecodeResult<FramePtr>&& result)
    {
        if(auto ppFrame = std::get_if<FramePtr>(&result))
            return std::move(*ppFrame);
        return nullptr;
    }
}

FrameLoader::FrameLoader(TrajectoryFormat format, std::string sFilename)
    : m_format(format), m_sFilename(std::move(sFilename))
{}

FrameDecoderPtr FrameLoader::createDecoder(std::string_view raw) const
{
    FrameDecoderPtr pDecoder = registry::FrameDecoderFactory::Get().Create(formatKey(m_format));
    pDecoder->open(raw);
    return pDecoder;
}

size_t FrameLoader::getTotalFrames(std::string_view raw) const
{
    auto pDecoder = createDecoder(raw);

    size_t nFrames = 0;
    scan(*pDecoder, pDecoder->begin(), 0, ProgressReporter(), "Counting", [&](size_t, const ScanStep& step) {
        if(step.kind == ScanStep::Kind::Frame)
            ++nFrames;
        return true;
    });
    return nFrames;
}

FrameIndexList FrameLoader::buildFrameIndex(std::string_view raw, size_t nSampleRate, 
        const ProgressCallback& onProgress, size_t* pnTotalFrames) const
{
    if(nSampleRate == 0)
        nSampleRate = 1;

    auto pDecoder = createDecoder(raw);

    FrameIndexList aIndex;
    size_t nFrames = 0;
    scan(*pDecoder, pDecoder->begin(), 0, ProgressReporter(onProgress), "Indexing", [&](size_t nFrameNumber, const ScanStep& step) {
        if(step.kind != ScanStep::Kind::Frame)
            return true;

        ++nFrames;
        if(nFrameNumber % nSampleRate == 0)
        {
            FrameIndex entry;
            entry.m_nFrameNumber = nFrameNumber;
            entry.m_nByteOffset = step.nOffset;
            entry.m_nEstimatedSize = step.nSize;
            aIndex.push_back(entry);
        }
        return true;
    });

    if(pnTotalFrames)
        *pnTotalFrames = nFrames;
    return aIndex;
}

FramePtr FrameLoader::loadFrame(std::string_view raw, size_t nFrameNumber, const FrameIndexList* pIndex) const
{
    auto pDecoder = createDecoder(raw);

    ScanCursor cursor = pDecoder->begin();
    size_t nStart = 0;

    if(pIndex && !pIndex->empty())
    {
        // nearest entry at or below the requested frame
        auto pEntry = std::upper_bound(pIndex->begin(), pIndex->end(), nFrameNumber, 
            [](size_t n, const FrameIndex& entry) { return n < entry.m_nFrameNumber; });
        if(pEntry != pIndex->begin())
        {
            --pEntry;
            if(pEntry->m_nFrameNumber == nFrameNumber)
                return frameOrNull(pDecoder->decodeFrameAt(pEntry->m_nByteOffset, nFrameNumber));

            cursor = pDecoder->seek(*pEntry);
            nStart = pEntry->m_nFrameNumber;
        }
    }

    FramePtr pFrame;
    scan(*pDecoder, cursor, nStart, ProgressReporter(), "Seeking", [&](size_t nCurrent, const ScanStep& step) {
        if(nCurrent < nFrameNumber)
            return true;

        if(step.kind == ScanStep::Kind::Frame)
            pFrame = frameOrNull(pDecoder->decodeFrameAt(step.nOffset, nFrameNumber));
        return false;
    });
    return pFrame;
}

std::vector<FramePtr> FrameLoader::loadFrames(std::string_view raw, size_t nMaxFrames, const ProgressCallback& onProgress) const
{
    vector<FramePtr> aFrames;
    if(nMaxFrames == 0)
        return aFrames;

    auto pDecoder = createDecoder(raw);
    scan(*pDecoder, pDecoder->begin(), 0, ProgressReporter(onProgress), "Parsing", [&](size_t nFrameNumber, const ScanStep& step) {
        if(step.kind == ScanStep::Kind::Frame)
        {
            if(auto pFrame = frameOrNull(pDecoder->decodeFrameAt(step.nOffset, nFrameNumber)))
                aFrames.push_back(std::move(pFrame));
        }
        return aFrames.size() < nMaxFrames;
    });
    return aFrames;
}

std::vector<TrajectoryMetadata> FrameLoader::extractPlotMetadata(std::string_view raw, const PlotMetadataOptions& options, 
        const ProgressCallback& onProgress) const
{
    const size_t nSampleRate = std::max<size_t>(options.nSampleRate, 1);
    auto pDecoder = createDecoder(raw);

    vector<TrajectoryMetadata> aMetadata;
    scan(*pDecoder, pDecoder->begin(), 0, ProgressReporter(onProgress), "Extracting", [&](size_t nFrameNumber, const ScanStep& step) {
        if(step.kind != ScanStep::Kind::Frame || nFrameNumber % nSampleRate != 0)
            return true;

        auto result = pDecoder->decodeMetadataAt(step.nOffset, nFrameNumber);
        auto pMetadata = std::get_if<TrajectoryMetadata>(&result);
        if(!pMetadata)
            return true;

        if(options.aProperties)
        {
            const auto& aKeep = *options.aProperties;
            for(auto p = pMetadata->m_mProperties.begin(); p != pMetadata->m_mProperties.end(); )
            {
                if(std::find(aKeep.begin(), aKeep.end(), p->first) == aKeep.end())
                    p = pMetadata->m_mProperties.erase(p);
                else
                    ++p;
            }
        }

        aMetadata.push_back(std::move(*pMetadata));
        return true;
    });
    return aMetadata;
}

FrameLoader createFrameLoader(const std::string& sFilename)
{
    return FrameLoader(detectFormat(sFilename), sFilename);
}
