#ifndef __EXTRACT_HPP__
#define __EXTRACT_HPP__

#include "frame.hpp"

// Named scalar values of one frame as they are plotted; always contains "Step".
typedef std::map<std::string, double> ExtractedData;
typedef std::function<ExtractedData(const TrajectoryFrame&, const TrajectoryData&)> DataExtractor;

// energy, energy_per_atom, potential_energy, kinetic_energy, total_energy
ExtractedData energyDataExtractor(const TrajectoryFrame& frame, const TrajectoryData& trajectory);

// force_max and force_norm (rms of the per-site force magnitudes), stress and pressure values
ExtractedData forceStressDataExtractor(const TrajectoryFrame& frame, const TrajectoryData& trajectory);

// lattice parameters, volume, density and temperature
ExtractedData structuralDataExtractor(const TrajectoryFrame& frame, const TrajectoryData& trajectory);

// all of the above; lattice parameters that are equal in all loaded frames 
// are flagged with an additional "_constant_<name>" entry
ExtractedData combinedDataExtractor(const TrajectoryFrame& frame, const TrajectoryData& trajectory);

// Density in g/cm^3, based on library::Masses.
// Throws runtime_error if the structure has no lattice or contains an element without known mass.
double density(const Structure& structure);

#endif
