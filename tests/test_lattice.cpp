#include <gtest/gtest.h>

#include "lattice.hpp"

using namespace std;

TEST(Lattice, OrthorhombicBox)
{
    const Lattice lattice(Eigen::Vector3d(2, 3, 4).asDiagonal().toDenseMatrix());

    EXPECT_DOUBLE_EQ(lattice.a(), 2);
    EXPECT_DOUBLE_EQ(lattice.b(), 3);
    EXPECT_DOUBLE_EQ(lattice.c(), 4);
    EXPECT_DOUBLE_EQ(lattice.alpha(), 90);
    EXPECT_DOUBLE_EQ(lattice.beta(), 90);
    EXPECT_DOUBLE_EQ(lattice.gamma(), 90);
    EXPECT_DOUBLE_EQ(lattice.volume(), 24);

    const Vector3d vFrac = lattice.abs2frac(Vector3d(1, 1.5, -2));
    EXPECT_TRUE(vFrac.isApprox(Vector3d(0.5, 0.5, -0.5)));
    EXPECT_TRUE(lattice.frac2abs(vFrac).isApprox(Vector3d(1, 1.5, -2)));
}

TEST(Lattice, HexagonalCell)
{
    Matrix3d m;
    m << 3, 0, 0,
         -1.5, 3 * std::sqrt(3.0) / 2, 0,
         0, 0, 5;
    const Lattice lattice(m);

    EXPECT_NEAR(lattice.a(), 3, 1e-12);
    EXPECT_NEAR(lattice.b(), 3, 1e-12);
    EXPECT_NEAR(lattice.c(), 5, 1e-12);
    EXPECT_NEAR(lattice.alpha(), 90, 1e-9);
    EXPECT_NEAR(lattice.beta(), 90, 1e-9);
    EXPECT_NEAR(lattice.gamma(), 120, 1e-9);
    EXPECT_NEAR(lattice.volume(), 3 * 3 * std::sqrt(3.0) / 2 * 5, 1e-9);

    // rows are the lattice vectors
    EXPECT_TRUE(lattice.frac2abs(Vector3d(0, 1, 0)).isApprox(Vector3d(-1.5, 3 * std::sqrt(3.0) / 2, 0)));
    const Vector3d v(0.3, 1.1, 2.7);
    EXPECT_TRUE(lattice.frac2abs(lattice.abs2frac(v)).isApprox(v));
}

TEST(Lattice, WrapHonoursPeriodicDirections)
{
    const Lattice lattice(Matrix3d::Identity() * 10, Lattice::Pbc{true, true, false});

    const Vector3d v = lattice.wrap(Vector3d(12, -3, 15));
    EXPECT_NEAR(v.x(), 2, 1e-12);
    EXPECT_NEAR(v.y(), 7, 1e-12);
    EXPECT_NEAR(v.z(), 15, 1e-12);
}

TEST(Lattice, VolumeIsPositiveForLeftHandedCells)
{
    Matrix3d m = Matrix3d::Identity() * 2;
    m.row(2) *= -1;
    EXPECT_DOUBLE_EQ(Lattice(m).volume(), 8);
}

TEST(Lattice, Degenerate)
{
    EXPECT_TRUE(Lattice::isDegenerate(Matrix3d::Zero()));

    Matrix3d m = Matrix3d::Identity();
    m.row(2) = m.row(0) + m.row(1);
    EXPECT_TRUE(Lattice::isDegenerate(m));
    EXPECT_FALSE(Lattice::isDegenerate(Matrix3d::Identity()));
}
