#include "pch.hpp"
#include "extract.hpp"
#include "library.hpp"

using namespace std;

namespace
{
    // 1 g/mol per A^3 in g/cm^3
    constexpr double AMU_PER_A3_TO_G_PER_CM3 = 1.66053906660;

    void copyNumbers(const MetadataMap& metadata, const vector<string>& aKeys, ExtractedData& data)
    {
        for(const auto& sKey : aKeys)
        {
            if(auto d = asNumber(metadata, sKey))
                data[sKey] = *d;
        }
    }

    optional<double> latticeValue(const Lattice& lattice, const string& sName)
    {
        if(sName == "a") return lattice.a();
        if(sName == "b") return lattice.b();
        if(sName == "c") return lattice.c();
        if(sName == "alpha") return lattice.alpha();
        if(sName == "beta") return lattice.beta();
        if(sName == "gamma") return lattice.gamma();
        if(sName == "volume") return lattice.volume();
        return nullopt;
    }

    // true if the property differs between the loaded frames
    bool propertyVaries(const TrajectoryData& trajectory, const string& sName, double dTolerance = 1e-10)
    {
        vector<double> aValues;
        for(const auto& pFrame : trajectory.m_aFrames)
        {
            if(!pFrame)
                continue;

            optional<double> value;
            if(pFrame->m_structure.m_pLattice)
                value = latticeValue(*pFrame->m_structure.m_pLattice, sName);
            if(!value)
                value = asNumber(pFrame->m_metadata, sName);
            if(value)
                aValues.push_back(*value);
        }

        for(double d : aValues)
        {
            if(std::abs(d - aValues.front()) > dTolerance)
                return true;
        }
        return false;
    }
}

double density(const Structure& structure)
{
    if(!structure.m_pLattice)
        THROW(runtime_error, "density: structure has no lattice");

    double dMass = 0;
    for(const auto& site : structure.m_aSites)
    {
        for(const auto& species : site.m_aSpecies)
        {
            const auto dElementMass = library::Masses.find(species.m_sElement);
            if(!dElementMass)
                THROW(runtime_error, "density: no mass known for element \"", species.m_sElement, "\" of site ", site.m_sLabel);
            dMass += species.m_dOccupancy * *dElementMass;
        }
    }
    return dMass * AMU_PER_A3_TO_G_PER_CM3 / structure.m_pLattice->volume();
}

ExtractedData energyDataExtractor(const TrajectoryFrame& frame, const TrajectoryData& /*trajectory*/)
{
    ExtractedData data;
    data["Step"] = static_cast<double>(frame.m_nStep);
    copyNumbers(frame.m_metadata, {"energy", "energy_per_atom", "potential_energy", "kinetic_energy", "total_energy"}, data);
    return data;
}

ExtractedData forceStressDataExtractor(const TrajectoryFrame& frame, const TrajectoryData& /*trajectory*/)
{
    ExtractedData data;
    data["Step"] = static_cast<double>(frame.m_nStep);

    // per-site forces are preferred over precomputed values
    vector<double> aMagnitudes;
    for(const auto& site : frame.m_structure.m_aSites)
    {
        auto pForce = site.m_mProperties.find("forces");
        if(pForce != site.m_mProperties.end())
            aMagnitudes.push_back(pForce->second.norm());
    }

    if(!aMagnitudes.empty())
    {
        double dSum = 0;
        for(double f : aMagnitudes)
            dSum += f * f;
        data["force_max"] = *std::max_element(aMagnitudes.begin(), aMagnitudes.end());
        data["force_norm"] = std::sqrt(dSum / static_cast<double>(aMagnitudes.size()));
    }
    else
    {
        copyNumbers(frame.m_metadata, {"force_max"}, data);
        if(auto d = asNumber(frame.m_metadata, "force_norm"))
            data["force_norm"] = *d;
        else if(auto d = asNumber(frame.m_metadata, "force_rms"))
            data["force_norm"] = *d;
    }

    copyNumbers(frame.m_metadata, {"stress_max", "stress_frobenius", "stress_trace", "pressure"}, data);
    return data;
}

ExtractedData structuralDataExtractor(const TrajectoryFrame& frame, const TrajectoryData& /*trajectory*/)
{
    ExtractedData data;
    data["Step"] = static_cast<double>(frame.m_nStep);

    const LatticePtr& pLattice = frame.m_structure.m_pLattice;
    if(pLattice)
    {
        data["volume"] = pLattice->volume();
        data["a"] = pLattice->a();
        data["b"] = pLattice->b();
        data["c"] = pLattice->c();
        data["alpha"] = pLattice->alpha();
        data["beta"] = pLattice->beta();
        data["gamma"] = pLattice->gamma();
    }
    else if(auto d = asNumber(frame.m_metadata, "volume"))
        data["volume"] = *d;

    copyNumbers(frame.m_metadata, {"temperature"}, data);

    if(auto d = asNumber(frame.m_metadata, "density"))
        data["density"] = *d;
    else if(pLattice)
    {
        try
        {
            data["density"] = density(frame.m_structure);
        }
        catch(const runtime_error& e)
        {
            cerr << "WARNING: no density for step " << frame.m_nStep << ": " << e.what() << "\n";
        }
    }

    return data;
}

ExtractedData combinedDataExtractor(const TrajectoryFrame& frame, const TrajectoryData& trajectory)
{
    ExtractedData data = energyDataExtractor(frame, trajectory);
    const DataExtractor aExtractors[] = {forceStressDataExtractor, structuralDataExtractor};
    for(const auto& extractor : aExtractors)
    {
        for(const auto& [sKey, dValue] : extractor(frame, trajectory))
            data[sKey] = dValue;
    }

    for(const string sParam : {"a", "b", "c", "alpha", "beta", "gamma"})
    {
        if(!propertyVaries(trajectory, sParam))
            data["_constant_" + sParam] = 1;
    }
    return data;
}
