#ifndef __FRAME_HPP__
#define __FRAME_HPP__

#include "lattice.hpp"
#include "metadata.hpp"

struct Species
{
    std::string m_sElement;
    double m_dOccupancy = 1.0;
    int m_nOxidationState = 0;
};

struct Site
{
    std::vector<Species> m_aSpecies;
    // fractional coordinates, zero if the structure has no lattice
    Vector3d m_vAbc = Vector3d::Zero();
    // cartesian coordinates
    Vector3d m_vXyz = Vector3d::Zero();
    std::string m_sLabel;
    // per-site numeric properties such as "forces"
    std::map<std::string, Eigen::VectorXd> m_mProperties;

    inline const std::string& element() const { return m_aSpecies.front().m_sElement; }
};

struct Structure
{
    std::vector<Site> m_aSites;
    // nullptr for non-periodic structures
    LatticePtr m_pLattice;
};

// One decoded timestep. Frames are created by the decoders and never modified afterwards.
class TrajectoryFrame
{
public:
    Structure m_structure;
    size_t m_nStep = 0;
    MetadataMap m_metadata;
};

typedef std::shared_ptr<const TrajectoryFrame> FramePtr;

// Position of one frame inside the raw input; carries no frame content.
struct FrameIndex
{
    size_t m_nFrameNumber = 0;
    size_t m_nByteOffset = 0;
    size_t m_nEstimatedSize = 0;
};

typedef std::vector<FrameIndex> FrameIndexList;

// scalar per-frame properties, never atomic coordinates
struct TrajectoryMetadata
{
    size_t m_nFrameNumber = 0;
    size_t m_nStep = 0;
    std::map<std::string, double> m_mProperties;
};

// Result of parsing a whole trajectory; owned by the caller.
struct TrajectoryData
{
    std::vector<FramePtr> m_aFrames;
    std::optional<size_t> m_nTotalFrames;
    std::optional<FrameIndexList> m_aIndexedFrames;
    std::optional<bool> m_bIsIndexed;
    std::optional<std::vector<TrajectoryMetadata>> m_aPlotMetadata;
    // source_format, frame_count, ...
    MetadataMap m_metadata;

    inline bool isIndexed() const { return m_bIsIndexed.value_or(false); }
    // authoritative number of frames in either parse mode
    inline size_t totalFrames() const { return m_nTotalFrames.value_or(m_aFrames.size()); }
};

// Builds a frame from positions and element symbols. Sites are labelled
// <element><index+1>, fractional coordinates are computed if a lattice is given.
// aProperties (optional) holds per-site properties keyed by name, each with one entry per site.
FramePtr createTrajectoryFrame(
        const std::vector<Vector3d>& aPositions,
        const std::vector<std::string>& aElements,
        LatticePtr pLattice,
        size_t nStep,
        MetadataMap metadata,
        const std::map<std::string, std::vector<Eigen::VectorXd>>& aProperties = {});

#endif
