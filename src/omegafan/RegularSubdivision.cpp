// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "RegularSubdivision.hpp"

#include "Errors.hpp"
#include "LogDomain.hpp"
#include <algorithm>
#include <sstream>

OMEGAFAN_DEFINE_LOG_DOMAIN(
  Subdivision,
  "Counts the regular subdivisions computed and shows their cells."
);

OMEGAFAN_NAMESPACE_BEGIN

size_t pointDimension(const PointConfiguration& points) {
  if (points.empty())
    throw PolyhedralEngineFailure("The point configuration is empty.");
  const auto dim = points.front().size();
  for (auto it = points.begin(); it != points.end(); ++it)
    if (it->size() != dim)
      throw InconsistentDimensionError
        ("The points of a configuration have different dimensions.");
  return dim;
}

std::vector<IndexSet> regularSubdivision(
  const PointConfiguration& points,
  const IntVector& weight
) {
  const auto dim = pointDimension(points);
  const auto pointCount = points.size();
  if (weight.size() != pointCount) {
    std::ostringstream out;
    out << "A weight of length " << weight.size()
      << " was given for a configuration of " << pointCount << " points.";
    throw InconsistentDimensionError(out.str());
  }
  OMEGAFAN_LOG_INCREMENT(Subdivision);

  // Homogenize by a leading 1 so that affine dependencies among the points
  // become linear dependencies.
  std::vector<QQVector> homogeneous;
  homogeneous.reserve(pointCount);
  for (auto it = points.begin(); it != points.end(); ++it) {
    QQVector point;
    point.reserve(dim + 1);
    point.push_back(1);
    point.insert(point.end(), it->begin(), it->end());
    homogeneous.push_back(std::move(point));
  }
  const auto rank = QQMatrix(homogeneous, dim + 1).rank();

  // Each affinely independent set of rank points spans a hyperplane in the
  // lifted space. It supports a lower facet if no lifted point lies below
  // it, and then the cell is the set of points on the hyperplane.
  std::vector<IndexSet> cells;
  std::vector<size_t> pivots;
  forEachSubset(pointCount, rank, [&](const IndexSet& subset) {
    QQMatrix system(rank, dim + 2);
    for (size_t i = 0; i < rank; ++i) {
      const auto& point = homogeneous[subset[i]];
      for (size_t c = 0; c <= dim; ++c)
        system(i, c) = point[c];
      system(i, dim + 1) = weight[subset[i]];
    }
    if (system.reduce(&pivots) != rank || pivots.back() == dim + 1)
      return true; // the points are dependent

    // A linear functional on homogenized points that agrees with the
    // weight on the subset.
    QQVector height(dim + 1);
    for (size_t r = 0; r < rank; ++r)
      height[pivots[r]] = system(r, dim + 1);

    IndexSet cell;
    for (size_t p = 0; p < pointCount; ++p) {
      const auto onHyperplane = dot(height, homogeneous[p]);
      const int sign = cmp(mpq_class(weight[p]), onHyperplane);
      if (sign < 0)
        return true; // not a lower facet
      if (sign == 0)
        cell.push_back(p);
    }
    cells.push_back(std::move(cell));
    return true;
  });

  std::sort(cells.begin(), cells.end());
  cells.erase(std::unique(cells.begin(), cells.end()), cells.end());

  OMEGAFAN_IF_STREAM_LOG(Subdivision) {
    auto out = log.stream();
    out << "Regular subdivision with " << cells.size() << " cells:";
    for (auto cell = cells.begin(); cell != cells.end(); ++cell) {
      out << " {";
      for (auto it = cell->begin(); it != cell->end(); ++it)
        out << (it == cell->begin() ? "" : " ") << *it;
      out << '}';
    }
    out << '\n';
  };
  return cells;
}

OMEGAFAN_NAMESPACE_END
