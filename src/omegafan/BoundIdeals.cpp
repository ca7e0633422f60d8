// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "BoundIdeals.hpp"

#include "Errors.hpp"
#include "Lineality.hpp"
#include "LogDomain.hpp"
#include "RingMap.hpp"
#include <algorithm>
#include <sstream>

OMEGAFAN_DEFINE_LOG_DOMAIN(
  BoundIdeals,
  "Counts the stratum and cylinder ideals built for the lower and upper "
  "bound ideals."
);

OMEGAFAN_NAMESPACE_BEGIN

namespace {
  void checkPointCount(const Ideal& ideal, const PointConfiguration& points) {
    if (points.size() != ideal.varCount()) {
      std::ostringstream out;
      out << "The point configuration has " << points.size()
        << " points but the ring has " << ideal.varCount() << " variables.";
      throw InconsistentDimensionError(out.str());
    }
  }

  void checkVariables(const Ideal& ideal, const IndexSet& vars) {
    if (!std::is_sorted(vars.begin(), vars.end()) ||
      std::adjacent_find(vars.begin(), vars.end()) != vars.end())
      throw InconsistentDimensionError
        ("A set of variables must be sorted and without repetitions.");
    if (!vars.empty() && vars.back() >= ideal.varCount())
      throw InconsistentDimensionError("Variable index out of range.");
  }

  std::vector<IndexSet> maximalCells(
    const Ideal& ideal,
    const IntVector& weight,
    const PointConfiguration& points
  ) {
    checkPointCount(ideal, points);
    return regularSubdivision(points, weight);
  }
}

Ideal stratum(
  const Ideal& ideal,
  const IndexSet& vars,
  const SymbolicEngine& engine
) {
  checkVariables(ideal, vars);
  OMEGAFAN_LOG_INCREMENT(BoundIdeals);
  const auto other = complement(vars, ideal.varCount());
  if (other.empty())
    return ideal;
  const auto vanishing = Ideal::variables(ideal.ringPtr(), other);
  return engine.eliminate(ideal + vanishing, other);
}

std::vector<Ideal> idealsOfMaxCells(
  const Ideal& ideal,
  const IntVector& weight,
  const PointConfiguration& points,
  const SymbolicEngine& engine
) {
  const auto cells = maximalCells(ideal, weight, points);
  std::vector<Ideal> ideals;
  ideals.reserve(cells.size());
  for (auto it = cells.begin(); it != cells.end(); ++it)
    ideals.push_back(stratum(ideal, *it, engine));
  return ideals;
}

Ideal idealW(
  const Ideal& ideal,
  const IntVector& weight,
  const PointConfiguration& points,
  const SymbolicEngine& engine
) {
  const auto strata = idealsOfMaxCells(ideal, weight, points, engine);
  Ideal sum = Ideal::zero(ideal.ringPtr());
  for (auto it = strata.begin(); it != strata.end(); ++it)
    sum = sum + *it;
  return sum;
}

Ideal idealW(
  const Ideal& ideal,
  const IntVector& weight,
  const SymbolicEngine& engine
) {
  return idealW(ideal, weight, pointConfiguration(ideal, engine), engine);
}

Ideal cylinderIdeal(
  const Ideal& ideal,
  const IndexSet& cell,
  const SymbolicEngine& engine
) {
  checkVariables(ideal, cell);
  OMEGAFAN_LOG_INCREMENT(BoundIdeals);
  const auto inclusion = RingMap::subringInclusion(ideal.ringPtr(), cell);
  const Ideal contraction = inclusion.preimage(ideal, engine);
  return inclusion.image(contraction) +
    Ideal::variables(ideal.ringPtr(), inclusion.complement());
}

Ideal idealUpW(
  const Ideal& ideal,
  const IntVector& weight,
  const PointConfiguration& points,
  const SymbolicEngine& engine
) {
  const auto cells = maximalCells(ideal, weight, points);
  Ideal intersection = Ideal::unit(ideal.ringPtr());
  for (auto it = cells.begin(); it != cells.end(); ++it)
    intersection =
      engine.intersect(intersection, cylinderIdeal(ideal, *it, engine));
  return intersection;
}

Ideal idealUpW(
  const Ideal& ideal,
  const IntVector& weight,
  const SymbolicEngine& engine
) {
  return idealUpW(ideal, weight, pointConfiguration(ideal, engine), engine);
}

OMEGAFAN_NAMESPACE_END
