// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "SecondaryFanInput.hpp"

#include "Errors.hpp"
#include "Lineality.hpp"

OMEGAFAN_NAMESPACE_BEGIN

SecondaryFanInput::SecondaryFanInput(
  const Kind kind,
  std::shared_ptr<const PolyhedralFan> fan
):
  mKind(kind),
  mFan(std::move(fan))
{}

SecondaryFanInput SecondaryFanInput::expanded(PolyhedralFan fan) {
  return SecondaryFanInput
    (ExpandedFan, std::make_shared<const PolyhedralFan>(std::move(fan)));
}

SecondaryFanInput SecondaryFanInput::symmetryReducedPairs(
  std::vector<IntVector> rays,
  IncidenceMatrix cones
) {
  if (rays.empty())
    throw PolyhedralEngineFailure("A secondary fan needs at least one ray.");
  const auto ambientDim = rays.front().size();
  auto fan = std::make_shared<const PolyhedralFan>(ambientDim,
    std::move(rays), std::move(cones), std::vector<IntVector>());
  return SecondaryFanInput(SymmetryReducedPairs, std::move(fan));
}

PolyhedralFan SecondaryFanInput::normalized(
  const Ideal& ideal,
  const SymbolicEngine& engine
) const {
  if (mFan->ambientDimension() != ideal.varCount())
    throw InconsistentDimensionError
      ("The rays of the secondary fan need one entry per variable.");
  if (mKind == ExpandedFan)
    return *mFan;

  const auto vRep = linealitySpaceVRep(ideal, engine);
  std::vector<IntVector> lineality;
  for (size_t row = 0; row < vRep.rowCount(); ++row)
    lineality.push_back(primitive(vRep.row(row)));
  return PolyhedralFan(mFan->ambientDimension(), mFan->rays(),
    mFan->cones(), std::move(lineality));
}

OMEGAFAN_NAMESPACE_END
