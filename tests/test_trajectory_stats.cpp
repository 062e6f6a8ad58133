#include <gtest/gtest.h>

#include "trajectory_stats.hpp"

using namespace std;

namespace
{
    FramePtr frame(size_t nStep, size_t nAtoms)
    {
        vector<Vector3d> aPositions(nAtoms, Vector3d::Zero());
        vector<string> aElements(nAtoms, "Si");
        return createTrajectoryFrame(aPositions, aElements, nullptr, nStep, MetadataMap());
    }

    FrameIndex entry(size_t nFrameNumber, size_t nOffset)
    {
        FrameIndex index;
        index.m_nFrameNumber = nFrameNumber;
        index.m_nByteOffset = nOffset;
        index.m_nEstimatedSize = 10;
        return index;
    }

    TrajectoryData indexedTrajectory()
    {
        TrajectoryData data;
        data.m_aFrames = {frame(0, 8), frame(1, 8)};
        data.m_nTotalFrames = 5;
        data.m_aIndexedFrames = FrameIndexList{entry(0, 0), entry(2, 20), entry(4, 40)};
        data.m_bIsIndexed = true;
        data.m_aPlotMetadata = vector<TrajectoryMetadata>(5);
        return data;
    }

    bool mentions(const vector<string>& aErrors, const string& sText)
    {
        return std::any_of(aErrors.begin(), aErrors.end(), [&sText](const string& s) { return s.find(sText) != string::npos; });
    }
}

TEST(ValidateTrajectory, AcceptsDirectAndIndexedResults)
{
    TrajectoryData direct;
    direct.m_aFrames = {frame(0, 3), frame(1, 3), frame(2, 3)};
    direct.m_nTotalFrames = 3;
    EXPECT_TRUE(validateTrajectory(direct).empty());

    EXPECT_TRUE(validateTrajectory(indexedTrajectory()).empty());
}

TEST(ValidateTrajectory, NeedsFrames)
{
    const auto aErrors = validateTrajectory(TrajectoryData());
    ASSERT_EQ(aErrors.size(), 1u);
    EXPECT_TRUE(mentions(aErrors, "at least one frame"));
}

TEST(ValidateTrajectory, BrokenFrames)
{
    TrajectoryData data;
    data.m_aFrames = {frame(0, 3), nullptr, frame(2, 0)};

    const auto aErrors = validateTrajectory(data);
    EXPECT_EQ(aErrors.size(), 2u);
    EXPECT_TRUE(mentions(aErrors, "Frame 1 is missing"));
    EXPECT_TRUE(mentions(aErrors, "Frame 2 has no sites"));
}

TEST(ValidateTrajectory, InconsistentCounts)
{
    TrajectoryData data = indexedTrajectory();
    data.m_nTotalFrames = 2;
    EXPECT_TRUE(mentions(validateTrajectory(data), "indexed_frames length"));

    data.m_nTotalFrames = 1;
    EXPECT_TRUE(mentions(validateTrajectory(data), "number of loaded frames"));

    data.m_nTotalFrames = 0;
    EXPECT_TRUE(mentions(validateTrajectory(data), "positive"));
}

TEST(ValidateTrajectory, IndexedWithoutIndex)
{
    TrajectoryData data = indexedTrajectory();
    data.m_aIndexedFrames.reset();
    EXPECT_TRUE(mentions(validateTrajectory(data), "is_indexed"));
}

TEST(ValidateTrajectory, IndexMustIncrease)
{
    TrajectoryData data = indexedTrajectory();
    data.m_aIndexedFrames = FrameIndexList{entry(0, 0), entry(2, 20), entry(2, 10)};

    const auto aErrors = validateTrajectory(data);
    EXPECT_TRUE(mentions(aErrors, "frame_number"));
    EXPECT_TRUE(mentions(aErrors, "byte_offset"));
}

TEST(TrajectoryStats, IndexedTrajectory)
{
    const TrajectoryStats stats = getTrajectoryStats(indexedTrajectory());

    EXPECT_EQ(stats.m_nFrameCount, 5u);
    EXPECT_TRUE(stats.m_bIsIndexed);
    EXPECT_EQ(stats.m_aSteps, (vector<size_t>{0, 1}));
    EXPECT_EQ(stats.m_stepRange, make_pair(size_t(0), size_t(1)));
    EXPECT_EQ(stats.m_bConstantAtomCount, optional<bool>(true));
    EXPECT_EQ(stats.m_nTotalAtoms, optional<size_t>(8));
    EXPECT_FALSE(stats.m_atomCountRange);
    EXPECT_EQ(stats.m_nIndexedFrameCount, optional<size_t>(3));
    EXPECT_EQ(stats.m_nPlotMetadataCount, optional<size_t>(5));

    ostringstream oss;
    stats.write(oss);
    EXPECT_NE(oss.str().find("indexed:         yes"), string::npos);
    EXPECT_NE(oss.str().find("atoms:           8"), string::npos);
}

TEST(TrajectoryStats, VaryingAtomCount)
{
    TrajectoryData data;
    data.m_aFrames = {frame(0, 4), frame(1, 6), frame(2, 4)};

    const TrajectoryStats stats = getTrajectoryStats(data);
    EXPECT_EQ(stats.m_nFrameCount, 3u);
    EXPECT_FALSE(stats.m_bIsIndexed);
    EXPECT_EQ(stats.m_bConstantAtomCount, optional<bool>(false));
    EXPECT_FALSE(stats.m_nTotalAtoms);
    EXPECT_EQ(stats.m_atomCountRange, make_pair(size_t(4), size_t(6)));
}

TEST(TrajectoryStats, Empty)
{
    const TrajectoryStats stats = getTrajectoryStats(TrajectoryData());
    EXPECT_EQ(stats.m_nFrameCount, 0u);
    EXPECT_TRUE(stats.m_aSteps.empty());
    EXPECT_FALSE(stats.m_stepRange);
    EXPECT_FALSE(stats.m_bConstantAtomCount);
}
