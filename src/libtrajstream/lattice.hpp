#ifndef __LATTICE_HPP__
#define __LATTICE_HPP__ 

#include "pch.hpp"

using Eigen::Vector3d;
using Eigen::Matrix3d;

class Lattice 
{
public:		
    typedef std::array<bool, 3> Pbc;

    // rows of mMatrix are the three lattice vectors a, b and c
    explicit Lattice(const Matrix3d& mMatrix, const Pbc& pbc = Pbc{true, true, true});

    // transforms absolute cartesian coordinates into fractional cell coordinates
    // NOTE: WITHOUT applying periodic boundary conditions, which is trivial by just taking the decimal part of the number
    Vector3d abs2frac(const Vector3d& v) const;
    // transforms fractional cell coordinates into absolute cartesian coordinates
    Vector3d frac2abs(const Vector3d& v) const;

    // wraps a vector into the cell, honouring the periodic directions only
    Vector3d wrap(const Vector3d& v) const;

    inline const Matrix3d& matrix() const { return m_mMatrix; }
    inline const Pbc& pbc() const { return m_pbc; }

    // lengths of the lattice vectors
    inline double a() const { return m_mMatrix.row(0).norm(); }
    inline double b() const { return m_mMatrix.row(1).norm(); }
    inline double c() const { return m_mMatrix.row(2).norm(); }

    // angles in degrees: alpha between b and c, beta between a and c, gamma between a and b
    double alpha() const;
    double beta() const;
    double gamma() const;

    // cell volume, always positive
    double volume() const;

    // true if the three vectors do not span a volume
    static bool isDegenerate(const Matrix3d& mMatrix);

private:
    Matrix3d m_mMatrix;
    Pbc m_pbc;
    // true, if the three vectors form a diagonal matrix, i.e. a cubic or orthorhombic box whose vectors are aligned along the x,y,z cartesian coordinates
    bool m_bDiagonalMatrix;
    // Matrices used for the rotation between the cartesian coordinates and the FRACTIONAL cell coordinates
    Matrix3d m_mCartesian2Cell, m_mCell2Cartesian;
};

typedef std::shared_ptr<const Lattice> LatticePtr;

#endif
