#include "pch.hpp"
#include "frame.hpp"
#include "exception.hpp"

using namespace std;

FramePtr createTrajectoryFrame(
        const std::vector<Vector3d>& aPositions,
        const std::vector<std::string>& aElements,
        LatticePtr pLattice,
        size_t nStep,
        MetadataMap metadata,
        const std::map<std::string, std::vector<Eigen::VectorXd>>& aProperties)
{
    if(aPositions.size() != aElements.size())
        THROW(invalid_argument, "createTrajectoryFrame: ", aPositions.size(), " positions but ", aElements.size(), " elements");

    auto pFrame = make_shared<TrajectoryFrame>();
    pFrame->m_nStep = nStep;
    pFrame->m_metadata = std::move(metadata);
    pFrame->m_structure.m_pLattice = pLattice;

    auto& aSites = pFrame->m_structure.m_aSites;
    aSites.resize(aPositions.size());
    for(size_t iSite = 0; iSite < aPositions.size(); ++iSite)
    {
        Site& site = aSites[iSite];
        site.m_aSpecies.push_back(Species{aElements[iSite]});
        site.m_vXyz = aPositions[iSite];
        if(pLattice)
            site.m_vAbc = pLattice->abs2frac(site.m_vXyz);
        site.m_sLabel = aElements[iSite] + to_string(iSite + 1);

        for(const auto& [sName, aValues] : aProperties)
        {
            if(iSite < aValues.size() && aValues[iSite].size() > 0)
                site.m_mProperties.emplace(sName, aValues[iSite]);
        }
    }

    return pFrame;
}
