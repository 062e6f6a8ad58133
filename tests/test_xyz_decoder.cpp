#include "synthetic.hpp"

#include "frame_decoder.hpp"
#include "frame_loader.hpp"

using namespace std;

namespace
{
    FrameDecoderPtr openXyz(string_view raw)
    {
        auto pDecoder = registry::FrameDecoderFactory::Get().Create("xyz");
        pDecoder->open(raw);
        return pDecoder;
    }

    vector<ScanStep::Kind> scanKinds(const FrameDecoder& decoder)
    {
        vector<ScanStep::Kind> aKinds;
        ScanCursor cursor = decoder.begin();
        for(;;)
        {
            const ScanStep step = decoder.scanNextFrame(cursor);
            if(step.kind == ScanStep::Kind::EndOfInput)
                break;
            aKinds.push_back(step.kind);
            cursor = step.next;
        }
        return aKinds;
    }

    FramePtr decodeFirst(string_view raw)
    {
        auto pDecoder = openXyz(raw);
        auto result = pDecoder->decodeFrameAt(0, 0);
        auto ppFrame = get_if<FramePtr>(&result);
        return ppFrame ? *ppFrame : nullptr;
    }
}

TEST(XyzDecoder, DecodesPlainFrame)
{
    const string raw = synthetic::xyzFrame(2);
    auto pFrame = decodeFirst(raw);
    ASSERT_TRUE(pFrame);

    const auto& aSites = pFrame->m_structure.m_aSites;
    ASSERT_EQ(aSites.size(), 3u);
    EXPECT_EQ(aSites[0].element(), "O");
    EXPECT_EQ(aSites[1].element(), "H");
    EXPECT_EQ(aSites[0].m_sLabel, "O1");
    EXPECT_EQ(aSites[2].m_sLabel, "H3");
    EXPECT_DOUBLE_EQ(aSites[1].m_vXyz.x(), 2.25);
    EXPECT_DOUBLE_EQ(aSites[1].m_vXyz.y(), 1.5);
    EXPECT_DOUBLE_EQ(aSites[1].m_vXyz.z(), 3.75);
    EXPECT_FALSE(pFrame->m_structure.m_pLattice);

    EXPECT_EQ(asNumber(pFrame->m_metadata, "energy"), -2.5);
    EXPECT_EQ(asNumber(pFrame->m_metadata, "temperature"), 300.0);
    EXPECT_EQ(get<string>(pFrame->m_metadata.at("label")), "frame2");
}

TEST(XyzDecoder, ReadsExtendedXyzComment)
{
    const string raw = 
        "2\n"
        "Lattice=\"10 0 0 0 10 0 0 0 5\" Properties=species:S:1:pos:R:3:forces:R:3 pbc=\"T T F\" energy=-3.25 config_type=\"bulk water\"\n"
        "O 1.0 2.0 2.5 0.1 0.2 0.3\n"
        "H 5.0 5.0 1.0 -0.1 -0.2 -0.3\n";

    auto pFrame = decodeFirst(raw);
    ASSERT_TRUE(pFrame);

    const auto& structure = pFrame->m_structure;
    ASSERT_TRUE(structure.m_pLattice);
    EXPECT_DOUBLE_EQ(structure.m_pLattice->volume(), 500.0);
    EXPECT_TRUE(structure.m_pLattice->pbc()[0]);
    EXPECT_TRUE(structure.m_pLattice->pbc()[1]);
    EXPECT_FALSE(structure.m_pLattice->pbc()[2]);

    EXPECT_EQ(asNumber(pFrame->m_metadata, "volume"), 500.0);
    EXPECT_EQ(asNumber(pFrame->m_metadata, "energy"), -3.25);
    EXPECT_EQ(get<string>(pFrame->m_metadata.at("config_type")), "bulk water");
    EXPECT_EQ(pFrame->m_metadata.count("Lattice"), 0u);
    EXPECT_EQ(pFrame->m_metadata.count("Properties"), 0u);

    ASSERT_EQ(structure.m_aSites.size(), 2u);
    const auto& o = structure.m_aSites[0];
    EXPECT_NEAR(o.m_vAbc.x(), 0.1, 1e-12);
    EXPECT_NEAR(o.m_vAbc.z(), 0.5, 1e-12);
    ASSERT_EQ(o.m_mProperties.count("forces"), 1u);
    EXPECT_DOUBLE_EQ(o.m_mProperties.at("forces")[2], 0.3);
    EXPECT_DOUBLE_EQ(structure.m_aSites[1].m_mProperties.at("forces")[0], -0.1);
}

TEST(XyzDecoder, CorruptCountLineIsOneLostFrame)
{
    const string raw = synthetic::corruptXyzTrajectory(3, 1);
    auto pDecoder = openXyz(raw);

    const vector<ScanStep::Kind> aExpected = {ScanStep::Kind::Frame, ScanStep::Kind::Corrupt, ScanStep::Kind::Frame};
    EXPECT_EQ(scanKinds(*pDecoder), aExpected);
}

TEST(XyzDecoder, NegativeCountIsCorrupt)
{
    const string raw = "-2\ncomment\nH 0 0 0\nH 1 0 0\n" + synthetic::xyzFrame(0);
    auto pDecoder = openXyz(raw);

    const vector<ScanStep::Kind> aExpected = {ScanStep::Kind::Corrupt, ScanStep::Kind::Frame};
    EXPECT_EQ(scanKinds(*pDecoder), aExpected);
    EXPECT_TRUE(holds_alternative<DecodeError>(pDecoder->decodeFrameAt(0, 0)));
}

TEST(XyzDecoder, CountLargerThanInputIsCorrupt)
{
    for(const string sCount : {"18446744073709551615", "18446744073709551614", "1000000"})
    {
        const string raw = sCount + "\ncomment energy=1\n";
        auto pDecoder = openXyz(raw);

        const vector<ScanStep::Kind> aExpected = {ScanStep::Kind::Corrupt};
        EXPECT_EQ(scanKinds(*pDecoder), aExpected) << sCount;
        EXPECT_TRUE(holds_alternative<DecodeError>(pDecoder->decodeFrameAt(0, 0))) << sCount;
        EXPECT_TRUE(holds_alternative<DecodeError>(pDecoder->decodeMetadataAt(0, 0))) << sCount;
    }
}

TEST(XyzDecoder, HugeCountDoesNotHideFollowingFrames)
{
    const string raw = "18446744073709551615\ncomment\n" + synthetic::xyzTrajectory(2);
    const FrameLoader loader = createFrameLoader("md.xyz");

    EXPECT_EQ(loader.getTotalFrames(raw), 2u);
    EXPECT_FALSE(loader.loadFrame(raw, 0));
    EXPECT_TRUE(loader.loadFrame(raw, 1));
    EXPECT_TRUE(loader.loadFrame(raw, 2));
    EXPECT_EQ(loader.loadFrames(raw).size(), 2u);
}

TEST(XyzDecoder, TruncatedLastFrameIsCorrupt)
{
    string raw = synthetic::xyzTrajectory(2);
    raw += "5\ncomment\nH 0 0 0\n";
    auto pDecoder = openXyz(raw);

    const vector<ScanStep::Kind> aExpected = {ScanStep::Kind::Frame, ScanStep::Kind::Frame, ScanStep::Kind::Corrupt};
    EXPECT_EQ(scanKinds(*pDecoder), aExpected);

    const size_t nTruncated = synthetic::xyzTrajectory(2).size();
    auto result = pDecoder->decodeFrameAt(nTruncated, 2);
    ASSERT_TRUE(holds_alternative<DecodeError>(result));
    EXPECT_EQ(get<DecodeError>(result), DecodeError::Truncated);
}

TEST(XyzDecoder, ToleratesBlankLinesAndCrLf)
{
    const string raw = "\r\n2\r\nenergy=1.5\r\nH 0 0 0\r\nH 0 0 0.74\r\n\r\n\n2\r\nenergy=2.5\r\nH 0 0 0\r\nH 0 0 0.75";
    auto pDecoder = openXyz(raw);

    const vector<ScanStep::Kind> aExpected = {ScanStep::Kind::Frame, ScanStep::Kind::Frame};
    EXPECT_EQ(scanKinds(*pDecoder), aExpected);

    const ScanStep second = pDecoder->scanNextFrame(pDecoder->scanNextFrame(pDecoder->begin()).next);
    auto result = pDecoder->decodeFrameAt(second.nOffset, 1);
    ASSERT_TRUE(holds_alternative<FramePtr>(result));
    const FramePtr pFrame = get<FramePtr>(result);
    EXPECT_EQ(asNumber(pFrame->m_metadata, "energy"), 2.5);
    EXPECT_DOUBLE_EQ(pFrame->m_structure.m_aSites[1].m_vXyz.z(), 0.75);
}

TEST(XyzDecoder, SkipsUnreadableAtomLines)
{
    const string raw = 
        "4\n"
        "energy=1\n"
        "O 0 0 0\n"
        "Qq 1 1 1\n"
        "H 1 nan 0\n"
        "H 0 1\n";

    auto pFrame = decodeFirst(raw);
    ASSERT_TRUE(pFrame);
    ASSERT_EQ(pFrame->m_structure.m_aSites.size(), 1u);
    EXPECT_EQ(pFrame->m_structure.m_aSites[0].element(), "O");
}

TEST(XyzDecoder, AcceptsAtomicNumbersAsSpecies)
{
    auto pFrame = decodeFirst("2\n\n8 0 0 0\n1 0 0 1\n");
    ASSERT_TRUE(pFrame);
    ASSERT_EQ(pFrame->m_structure.m_aSites.size(), 2u);
    EXPECT_EQ(pFrame->m_structure.m_aSites[0].element(), "O");
    EXPECT_EQ(pFrame->m_structure.m_aSites[1].element(), "H");
}

TEST(XyzDecoder, ZeroAtomFrameIsValid)
{
    const string raw = "0\nenergy=4\n" + synthetic::xyzFrame(1);
    auto pDecoder = openXyz(raw);

    const vector<ScanStep::Kind> aExpected = {ScanStep::Kind::Frame, ScanStep::Kind::Frame};
    EXPECT_EQ(scanKinds(*pDecoder), aExpected);

    auto result = pDecoder->decodeFrameAt(0, 0);
    ASSERT_TRUE(holds_alternative<FramePtr>(result));
    EXPECT_TRUE(get<FramePtr>(result)->m_structure.m_aSites.empty());
}

TEST(XyzDecoder, MetadataOnlyDecode)
{
    const string raw = synthetic::xyzFrame(7);
    auto pDecoder = openXyz(raw);

    auto result = pDecoder->decodeMetadataAt(0, 7);
    ASSERT_TRUE(holds_alternative<TrajectoryMetadata>(result));
    const auto& metadata = get<TrajectoryMetadata>(result);
    EXPECT_EQ(metadata.m_nFrameNumber, 7u);
    EXPECT_EQ(metadata.m_nStep, 7u);

    const map<string, double> expected = {{"energy", -7.5}, {"temperature", 300}};
    EXPECT_EQ(metadata.m_mProperties, expected);
}

TEST(XyzDecoder, MalformedPropertiesFallBackToDefaultColumns)
{
    auto pFrame = decodeFirst("1\nProperties=species:S\nC 1 2 3\n");
    ASSERT_TRUE(pFrame);
    ASSERT_EQ(pFrame->m_structure.m_aSites.size(), 1u);
    EXPECT_EQ(pFrame->m_structure.m_aSites[0].element(), "C");
    EXPECT_DOUBLE_EQ(pFrame->m_structure.m_aSites[0].m_vXyz.z(), 3.0);
}

TEST(XyzDecoder, EmptyInputHasNoFrames)
{
    auto pDecoder = openXyz("");
    EXPECT_TRUE(scanKinds(*pDecoder).empty());
    EXPECT_TRUE(holds_alternative<DecodeError>(pDecoder->decodeFrameAt(0, 0)));
}
