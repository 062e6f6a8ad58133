#ifndef __TRAJECTORY_STATS_HPP__
#define __TRAJECTORY_STATS_HPP__

#include "frame.hpp"

// Consistency check of a parse result; returns one message per problem found,
// an empty list means the trajectory is usable.
std::vector<std::string> validateTrajectory(const TrajectoryData& data);

struct TrajectoryStats
{
    // total_frames if known, otherwise the number of loaded frames
    size_t m_nFrameCount = 0;
    bool m_bIsIndexed = false;

    // the remaining values describe the loaded frames only
    std::vector<size_t> m_aSteps;
    std::optional<std::pair<size_t, size_t>> m_stepRange;
    std::optional<bool> m_bConstantAtomCount;
    std::optional<size_t> m_nTotalAtoms;
    std::optional<std::pair<size_t, size_t>> m_atomCountRange;

    std::optional<size_t> m_nIndexedFrameCount;
    std::optional<size_t> m_nPlotMetadataCount;

    void write(std::ostream& os) const;
};

TrajectoryStats getTrajectoryStats(const TrajectoryData& data);

#endif
