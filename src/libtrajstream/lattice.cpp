#include "pch.hpp"
#include "lattice.hpp"

using namespace std;

namespace
{
    const double VOLUME_EPSILON = 1e-12;

    inline double angleBetween(const Vector3d& u, const Vector3d& v)
    {
        const double dNorm = u.norm() * v.norm();
        if(dNorm == 0)
            return 0;
        const double dCos = std::clamp(u.dot(v) / dNorm, -1.0, 1.0);
        return std::acos(dCos) * 180.0 / EIGEN_PI;
    }
}

Lattice::Lattice(const Matrix3d& mMatrix, const Pbc& pbc)
    : m_mMatrix(mMatrix)
    , m_pbc(pbc)
    , m_bDiagonalMatrix(false)
{
    // test if the vectors form a diagonal matrix, i.e. a cubic or orthorhombic box
    // This is a test _exactly_ for zero which should only happen, if the vectors are manually set to zero.
    const Matrix3d& m = m_mMatrix;
    const bool bDegenerate = isDegenerate(m_mMatrix);
    if(!bDegenerate && m(0,1) == 0 && m(0,2) == 0 && m(1,0) == 0 && m(1,2) == 0 && m(2,0) == 0 && m(2,1) == 0)
        m_bDiagonalMatrix = true;

    // the columns of the transformation are the lattice vectors
    m_mCell2Cartesian = m_mMatrix.transpose();
    m_mCartesian2Cell = bDegenerate ? Matrix3d::Zero() : Matrix3d(m_mCell2Cartesian.inverse());
}

Vector3d Lattice::abs2frac(const Vector3d& v) const 
{
    if(m_bDiagonalMatrix)
        return Vector3d(v.x() / m_mMatrix(0,0), v.y() / m_mMatrix(1,1), v.z() / m_mMatrix(2,2));
    else 
        return m_mCartesian2Cell * v;
}

Vector3d Lattice::frac2abs(const Vector3d& v) const 
{
    if(m_bDiagonalMatrix)
        return Vector3d(v.x() * m_mMatrix(0,0), v.y() * m_mMatrix(1,1), v.z() * m_mMatrix(2,2));
    else 
        return m_mCell2Cartesian * v;
}

Vector3d Lattice::wrap(const Vector3d& v) const
{
    Vector3d vFrac = abs2frac(v);
    for(size_t k = 0; k < 3; ++k)
    {
        if(m_pbc[k])
            vFrac[k] -= std::floor(vFrac[k]);
    }
    return frac2abs(vFrac);
}

double Lattice::alpha() const
{
    return angleBetween(m_mMatrix.row(1).transpose(), m_mMatrix.row(2).transpose());
}

double Lattice::beta() const
{
    return angleBetween(m_mMatrix.row(0).transpose(), m_mMatrix.row(2).transpose());
}

double Lattice::gamma() const
{
    return angleBetween(m_mMatrix.row(0).transpose(), m_mMatrix.row(1).transpose());
}

double Lattice::volume() const 
{
    return std::abs(m_mMatrix.determinant());
}

bool Lattice::isDegenerate(const Matrix3d& mMatrix)
{
    return !mMatrix.allFinite() || std::abs(mMatrix.determinant()) < VOLUME_EPSILON;
}
