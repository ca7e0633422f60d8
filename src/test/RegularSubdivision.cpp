// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"

#include "omegafan/Errors.hpp"
#include "omegafan/RegularSubdivision.hpp"
#include <gtest/gtest.h>

using namespace ofan;

namespace {
  PointConfiguration unitSquare() {
    PointConfiguration points;
    points.push_back(QQVector{0, 0});
    points.push_back(QQVector{1, 0});
    points.push_back(QQVector{0, 1});
    points.push_back(QQVector{1, 1});
    return points;
  }
}

TEST(RegularSubdivision, segment) {
  PointConfiguration points;
  points.push_back(QQVector{0});
  points.push_back(QQVector{1});
  points.push_back(QQVector{2});

  EXPECT_EQ((std::vector<IndexSet>{IndexSet{0, 1, 2}}),
    regularSubdivision(points, IntVector{0, 0, 0}));

  // A lifted middle point is in no cell.
  EXPECT_EQ((std::vector<IndexSet>{IndexSet{0, 2}}),
    regularSubdivision(points, IntVector{0, 1, 0}));

  EXPECT_EQ((std::vector<IndexSet>{IndexSet{0, 1}, IndexSet{1, 2}}),
    regularSubdivision(points, IntVector{0, -1, 0}));

  EXPECT_EQ((std::vector<IndexSet>{IndexSet{0, 1}, IndexSet{1, 2}}),
    regularSubdivision(points, IntVector{5, 3, 9}));
}

TEST(RegularSubdivision, square) {
  const auto points = unitSquare();
  EXPECT_EQ((std::vector<IndexSet>{IndexSet{0, 1, 2, 3}}),
    regularSubdivision(points, IntVector{0, 0, 0, 0}));
  EXPECT_EQ((std::vector<IndexSet>{IndexSet{0, 1, 2}, IndexSet{1, 2, 3}}),
    regularSubdivision(points, IntVector{1, 0, 0, 0}));
  EXPECT_EQ((std::vector<IndexSet>{IndexSet{0, 1, 3}, IndexSet{0, 2, 3}}),
    regularSubdivision(points, IntVector{0, 1, 0, 0}));
  EXPECT_EQ((std::vector<IndexSet>{IndexSet{0, 1, 3}, IndexSet{0, 2, 3}}),
    regularSubdivision(points, IntVector{-1, 0, 0, -1}));
}

TEST(RegularSubdivision, lowerDimensionalPoints) {
  // Points on a line in the plane.
  PointConfiguration points;
  points.push_back(QQVector{0, 0});
  points.push_back(QQVector{1, 1});
  points.push_back(QQVector{2, 2});
  EXPECT_EQ((std::vector<IndexSet>{IndexSet{0, 1}, IndexSet{1, 2}}),
    regularSubdivision(points, IntVector{1, 0, 1}));
}

TEST(RegularSubdivision, errors) {
  EXPECT_THROW(
    regularSubdivision(unitSquare(), IntVector{0, 0, 0}),
    InconsistentDimensionError
  );
  EXPECT_THROW(
    regularSubdivision(PointConfiguration(), IntVector()),
    PolyhedralEngineFailure
  );

  PointConfiguration mixed = unitSquare();
  mixed.push_back(QQVector{1});
  EXPECT_THROW(pointDimension(mixed), InconsistentDimensionError);
  EXPECT_EQ(2u, pointDimension(unitSquare()));
}
