// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_REGULAR_SUBDIVISION_GUARD
#define OMEGAFAN_REGULAR_SUBDIVISION_GUARD

#include "QQMatrix.hpp"
#include "Subsets.hpp"
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

/// A list of points of a common dimension. Point i belongs to variable i
/// of a polynomial ring.
typedef std::vector<QQVector> PointConfiguration;

/// Returns the maximal cells of the regular subdivision of points induced
/// by lifting point i to height weight[i] and taking the lower envelope.
/// Each cell is the sorted list of all points that lie on one lower facet
/// of the lifted configuration. Points above every lower facet are in no
/// cell. The cells are sorted lexicographically.
///
/// The zero weight gives the single cell of all points. weight must have
/// one entry per point.
std::vector<IndexSet> regularSubdivision(
  const PointConfiguration& points,
  const IntVector& weight
);

/// Returns the dimension of the points. All points must have it.
size_t pointDimension(const PointConfiguration& points);

OMEGAFAN_NAMESPACE_END
#endif
