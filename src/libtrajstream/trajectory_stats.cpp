#include "pch.hpp"
#include "trajectory_stats.hpp"
#include "exception.hpp"

using namespace std;

std::vector<std::string> validateTrajectory(const TrajectoryData& data)
{
    if(data.m_aFrames.empty())
        return {"Trajectory must have at least one frame"};

    vector<string> aErrors;
    for(size_t i = 0; i < data.m_aFrames.size(); ++i)
    {
        if(!data.m_aFrames[i])
            aErrors.push_back(sprint("Frame ", i, " is missing"));
        else if(data.m_aFrames[i]->m_structure.m_aSites.empty())
            aErrors.push_back(sprint("Frame ", i, " has no sites"));
    }

    if(data.m_nTotalFrames)
    {
        const size_t nTotal = *data.m_nTotalFrames;
        if(nTotal == 0)
            aErrors.push_back("total_frames must be a positive number, got 0");
        else if(data.m_aFrames.size() > nTotal)
            aErrors.push_back(sprint("total_frames (", nTotal, ") is smaller than the number of loaded frames (", data.m_aFrames.size(), ")"));

        if(data.m_aIndexedFrames && data.m_aIndexedFrames->size() > nTotal)
            aErrors.push_back(sprint("total_frames (", nTotal, ") inconsistent with indexed_frames length (", data.m_aIndexedFrames->size(), ")"));
    }

    if(data.isIndexed() && (!data.m_aIndexedFrames || data.m_aIndexedFrames->empty()))
        aErrors.push_back("is_indexed is true but indexed_frames is missing or empty");

    if(data.m_aIndexedFrames)
    {
        const auto& aIndex = *data.m_aIndexedFrames;
        for(size_t i = 1; i < aIndex.size(); ++i)
        {
            if(aIndex[i].m_nFrameNumber <= aIndex[i - 1].m_nFrameNumber)
                aErrors.push_back(sprint("indexed_frames[", i, "] frame_number (", aIndex[i].m_nFrameNumber, ") is not increasing"));
            if(aIndex[i].m_nByteOffset <= aIndex[i - 1].m_nByteOffset)
                aErrors.push_back(sprint("indexed_frames[", i, "] byte_offset (", aIndex[i].m_nByteOffset, ") is not increasing"));
        }
    }

    return aErrors;
}

TrajectoryStats getTrajectoryStats(const TrajectoryData& data)
{
    TrajectoryStats stats;
    stats.m_nFrameCount = data.totalFrames();
    stats.m_bIsIndexed = data.isIndexed();

    vector<const TrajectoryFrame*> apFrames;
    for(const auto& pFrame : data.m_aFrames)
    {
        if(pFrame)
            apFrames.push_back(pFrame.get());
    }

    if(!apFrames.empty())
    {
        const TrajectoryFrame& first = *apFrames.front();
        const TrajectoryFrame& last = *apFrames.back();

        for(auto pFrame : apFrames)
            stats.m_aSteps.push_back(pFrame->m_nStep);
        stats.m_stepRange = make_pair(first.m_nStep, last.m_nStep);

        // the atom count is checked on at most 100 evenly spaced frames
        const size_t nMaxSample = 100;
        const size_t nInterval = std::max<size_t>(apFrames.size() / nMaxSample, 1);
        const size_t nFirstCount = first.m_structure.m_aSites.size();
        bool bConstant = last.m_structure.m_aSites.size() == nFirstCount;
        for(size_t i = 0; i < apFrames.size() && bConstant; i += nInterval)
            bConstant = apFrames[i]->m_structure.m_aSites.size() == nFirstCount;

        stats.m_bConstantAtomCount = bConstant;
        if(bConstant)
            stats.m_nTotalAtoms = nFirstCount;
        else
        {
            size_t nMin = numeric_limits<size_t>::max(), nMax = 0;
            for(auto pFrame : apFrames)
            {
                nMin = std::min(nMin, pFrame->m_structure.m_aSites.size());
                nMax = std::max(nMax, pFrame->m_structure.m_aSites.size());
            }
            stats.m_atomCountRange = make_pair(nMin, nMax);
        }
    }

    if(data.m_aIndexedFrames)
        stats.m_nIndexedFrameCount = data.m_aIndexedFrames->size();
    if(data.m_aPlotMetadata)
        stats.m_nPlotMetadataCount = data.m_aPlotMetadata->size();

    return stats;
}

void TrajectoryStats::write(std::ostream& os) const
{
    os << "frames:          " << m_nFrameCount << "\n";
    os << "indexed:         " << (m_bIsIndexed ? "yes" : "no") << "\n";
    if(m_stepRange)
        os << "steps:           " << m_stepRange->first << " - " << m_stepRange->second << "\n";
    if(m_nTotalAtoms)
        os << "atoms:           " << *m_nTotalAtoms << "\n";
    if(m_atomCountRange)
        os << "atoms:           " << m_atomCountRange->first << " - " << m_atomCountRange->second << " (varying)\n";
    if(m_nIndexedFrameCount)
        os << "index entries:   " << *m_nIndexedFrameCount << "\n";
    if(m_nPlotMetadataCount)
        os << "plot metadata:   " << *m_nPlotMetadataCount << "\n";
}
