#include "synthetic.hpp"

#include "frame_loader.hpp"

using namespace std;

class Hdf5Decoder : public ::testing::Test
{
protected:
    const FrameLoader loader = createFrameLoader("torch_sim.h5");
};

TEST_F(Hdf5Decoder, DiscoversNestedDatasets)
{
    const string raw = synthetic::hdf5Trajectory(4, 3);
    EXPECT_EQ(loader.getTotalFrames(raw), 4u);

    auto pFrame = loader.loadFrame(raw, 2);
    ASSERT_TRUE(pFrame);
    EXPECT_EQ(pFrame->m_nStep, 2u);

    const auto& aSites = pFrame->m_structure.m_aSites;
    ASSERT_EQ(aSites.size(), 3u);
    EXPECT_EQ(aSites[0].element(), "O");
    EXPECT_EQ(aSites[1].element(), "H");
    EXPECT_DOUBLE_EQ(aSites[1].m_vXyz.x(), 2.0);
    EXPECT_DOUBLE_EQ(aSites[1].m_vXyz.y(), 1.0);
    EXPECT_DOUBLE_EQ(aSites[1].m_vXyz.z(), 0.5);

    ASSERT_TRUE(pFrame->m_structure.m_pLattice);
    EXPECT_DOUBLE_EQ(pFrame->m_structure.m_pLattice->a(), 12.0);
    EXPECT_EQ(asNumber(pFrame->m_metadata, "energy"), -12.0);
    EXPECT_NEAR(*asNumber(pFrame->m_metadata, "volume"), 1728.0, 1e-9);
}

TEST_F(Hdf5Decoder, IndexIsContiguousAndIncreasing)
{
    const string raw = synthetic::hdf5Trajectory(5, 2);
    size_t nTotal = 0;
    const auto aIndex = loader.buildFrameIndex(raw, 2, nullptr, &nTotal);

    EXPECT_EQ(nTotal, 5u);
    ASSERT_EQ(aIndex.size(), 3u);
    for(size_t i = 0; i < aIndex.size(); ++i)
    {
        EXPECT_EQ(aIndex[i].m_nFrameNumber, 2 * i);
        EXPECT_EQ(aIndex[i].m_nEstimatedSize, 2 * 3 * sizeof(double));
        if(i > 0)
            EXPECT_GT(aIndex[i].m_nByteOffset, aIndex[i - 1].m_nByteOffset);
    }

    for(size_t n = 0; n < 5; ++n)
    {
        auto pFrame = loader.loadFrame(raw, n, &aIndex);
        ASSERT_TRUE(pFrame);
        EXPECT_EQ(pFrame->m_nStep, n);
        EXPECT_DOUBLE_EQ(pFrame->m_structure.m_aSites[0].m_vXyz.x(), static_cast<double>(n));
    }
    EXPECT_FALSE(loader.loadFrame(raw, 5, &aIndex));
}

TEST_F(Hdf5Decoder, WithoutCellThereIsNoLattice)
{
    const string raw = synthetic::hdf5Trajectory(2, 2, false);
    auto pFrame = loader.loadFrame(raw, 1);
    ASSERT_TRUE(pFrame);
    EXPECT_FALSE(pFrame->m_structure.m_pLattice);
    EXPECT_EQ(pFrame->m_metadata.count("volume"), 0u);
    EXPECT_EQ(asNumber(pFrame->m_metadata, "energy"), -11.0);
}

TEST_F(Hdf5Decoder, PlotMetadata)
{
    const string raw = synthetic::hdf5Trajectory(3, 2);
    const auto aMetadata = loader.extractPlotMetadata(raw);
    ASSERT_EQ(aMetadata.size(), 3u);
    EXPECT_EQ(aMetadata[1].m_mProperties.at("energy"), -11.0);
    EXPECT_NEAR(aMetadata[1].m_mProperties.at("volume"), 1331.0, 1e-9);
}

TEST_F(Hdf5Decoder, NotAnHdf5File)
{
    EXPECT_EQ(loader.getTotalFrames(""), 0u);
    EXPECT_EQ(loader.getTotalFrames("definitely not hdf5"), 0u);
    EXPECT_FALSE(loader.loadFrame("definitely not hdf5", 0));

    // a valid signature followed by garbage must not throw either
    const string damaged = string("\x89HDF\r\n\x1a\n", 8) + string(100, '\0');
    EXPECT_EQ(loader.getTotalFrames(damaged), 0u);
}
