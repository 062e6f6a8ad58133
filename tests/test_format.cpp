#include <gtest/gtest.h>

#include "format.hpp"
#include "frame_decoder.hpp"

using namespace std;

TEST(Format, DetectsByExtension)
{
    EXPECT_EQ(detectFormat("md.xyz"), TrajectoryFormat::Xyz);
    EXPECT_EQ(detectFormat("md.extxyz"), TrajectoryFormat::Xyz);
    EXPECT_EQ(detectFormat("relax.traj"), TrajectoryFormat::AseBinary);
    EXPECT_EQ(detectFormat("torch_sim.h5"), TrajectoryFormat::Hdf5);
    EXPECT_EQ(detectFormat("torch_sim.hdf5"), TrajectoryFormat::Hdf5);
}

TEST(Format, IgnoresCaseAndDirectories)
{
    EXPECT_EQ(detectFormat("/data/runs.v2/MD.XYZ"), TrajectoryFormat::Xyz);
    EXPECT_EQ(detectFormat("Relax.Traj"), TrajectoryFormat::AseBinary);
}

TEST(Format, IgnoresCompressionSuffixes)
{
    EXPECT_EQ(detectFormat("md.xyz.xz"), TrajectoryFormat::Xyz);
    EXPECT_EQ(detectFormat("md.extxyz.ZST"), TrajectoryFormat::Xyz);
    EXPECT_EQ(detectFormat("md.traj.zstd"), TrajectoryFormat::AseBinary);

    EXPECT_EQ(stripCompressionSuffix("md.xyz.xz"), "md.xyz");
    EXPECT_EQ(stripCompressionSuffix("md.xyz"), "md.xyz");
    EXPECT_EQ(stripCompressionSuffix("md.XYZ.Xz"), "md.XYZ");
}

TEST(Format, RejectsEverythingElse)
{
    for(const string sName : {"structure.cif", "POSCAR", "md.xyz.gz", "md.xz", "traj", ".h5.txt", ""})
        EXPECT_THROW(detectFormat(sName), UnsupportedFormat) << sName;
}

TEST(Format, UnsupportedFormatIsARuntimeError)
{
    try
    {
        detectFormat("model.pdb");
        FAIL() << "no exception thrown";
    }
    catch(const runtime_error& e)
    {
        EXPECT_NE(string(e.what()).find("model.pdb"), string::npos);
    }
}

TEST(Format, Names)
{
    EXPECT_EQ(formatKey(TrajectoryFormat::Xyz), "xyz");
    EXPECT_EQ(formatKey(TrajectoryFormat::AseBinary), "traj");
    EXPECT_EQ(formatKey(TrajectoryFormat::Hdf5), "h5");
    EXPECT_EQ(sourceFormatName(TrajectoryFormat::Xyz), "xyz_trajectory");
    EXPECT_EQ(sourceFormatName(TrajectoryFormat::AseBinary), "ase_trajectory");
    EXPECT_EQ(sourceFormatName(TrajectoryFormat::Hdf5), "hdf5_trajectory");
}

TEST(Format, EveryFormatHasADecoder)
{
    const auto& factory = registry::FrameDecoderFactory::Get();
    EXPECT_EQ(factory.Keys(), (vector<string>{"h5", "traj", "xyz"}));

    for(auto format : {TrajectoryFormat::Xyz, TrajectoryFormat::AseBinary, TrajectoryFormat::Hdf5})
        EXPECT_TRUE(factory.Create(formatKey(format)));

    EXPECT_THROW(factory.Create("pdb"), UnsupportedFormat);
}

TEST(Format, NestedErrorsAreDescribedOnOneLine)
{
    try
    {
        try
        {
            detectFormat("model.pdb");
        }
        catch(const UnsupportedFormat&)
        {
            std::throw_with_nested(runtime_error("while opening the trajectory"));
        }
        FAIL() << "no exception thrown";
    }
    catch(const runtime_error& e)
    {
        const string sDescription = describe_exception(e);
        EXPECT_EQ(sDescription.rfind("while opening the trajectory: ", 0), 0u) << sDescription;
        EXPECT_NE(sDescription.find("model.pdb"), string::npos) << sDescription;
    }
}
