// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_BOUND_IDEALS_GUARD
#define OMEGAFAN_BOUND_IDEALS_GUARD

#include "Ideal.hpp"
#include "RegularSubdivision.hpp"
#include "SymbolicEngine.hpp"
#include "Subsets.hpp"
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

/// Returns the ideal of the intersection of the variety of ideal with the
/// coordinate subspace where the variables outside vars vanish. This is
/// ideal plus the variables outside vars, with those variables then
/// eliminated. The result is an ideal of the ring of ideal whose
/// generators only involve the variables in vars.
Ideal stratum(
  const Ideal& ideal,
  const IndexSet& vars,
  const SymbolicEngine& engine
);

/// Returns stratum(ideal, C) for each maximal cell C of the regular
/// subdivision of points at weight, in the order of the cells.
std::vector<Ideal> idealsOfMaxCells(
  const Ideal& ideal,
  const IntVector& weight,
  const PointConfiguration& points,
  const SymbolicEngine& engine
);

/// The lower bound ideal at weight: the sum of idealsOfMaxCells.
Ideal idealW(
  const Ideal& ideal,
  const IntVector& weight,
  const PointConfiguration& points,
  const SymbolicEngine& engine
);

/// As above with the point configuration of ideal.
Ideal idealW(
  const Ideal& ideal,
  const IntVector& weight,
  const SymbolicEngine& engine
);

/// Returns the ideal of polynomials vanishing on the cylinder over cell:
/// the contraction of ideal to the subring of the variables in cell,
/// mapped back into the ring and extended by the variables outside cell.
Ideal cylinderIdeal(
  const Ideal& ideal,
  const IndexSet& cell,
  const SymbolicEngine& engine
);

/// The upper bound ideal at weight: the intersection of the cylinder
/// ideals over the maximal cells of the regular subdivision of points at
/// weight, starting from the unit ideal.
Ideal idealUpW(
  const Ideal& ideal,
  const IntVector& weight,
  const PointConfiguration& points,
  const SymbolicEngine& engine
);

/// As above with the point configuration of ideal.
Ideal idealUpW(
  const Ideal& ideal,
  const IntVector& weight,
  const SymbolicEngine& engine
);

OMEGAFAN_NAMESPACE_END
#endif
