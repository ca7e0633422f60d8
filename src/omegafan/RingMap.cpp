// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "RingMap.hpp"

#include "Errors.hpp"
#include <algorithm>

OMEGAFAN_NAMESPACE_BEGIN

RingMap::RingMap(
  std::shared_ptr<const PolyRing> source,
  std::shared_ptr<const PolyRing> target,
  std::vector<VarIndex> vars
):
  mSource(std::move(source)),
  mTarget(std::move(target)),
  mVars(std::move(vars))
{
  OMEGAFAN_ASSERT(mSource->varCount() == mVars.size());
}

RingMap RingMap::subringInclusion(
  std::shared_ptr<const PolyRing> target,
  std::vector<VarIndex> vars
) {
  for (size_t i = 0; i < vars.size(); ++i) {
    if (vars[i] >= target->varCount())
      throw InconsistentDimensionError("Subring variable out of range.");
    if (i > 0 && vars[i - 1] >= vars[i])
      throw InconsistentDimensionError
        ("Subring variables must be sorted and distinct.");
  }
  auto source = target->subring(vars);
  return RingMap(std::move(source), std::move(target), std::move(vars));
}

std::vector<RingMap::VarIndex> RingMap::complement() const {
  std::vector<VarIndex> other;
  for (VarIndex var = 0; var < target().varCount(); ++var)
    if (!std::binary_search(mVars.begin(), mVars.end(), var))
      other.push_back(var);
  return other;
}

Poly RingMap::image(const Poly& poly) const {
  OMEGAFAN_ASSERT(poly.ring().sameVariables(source()));
  return poly.mapped(target(), mVars);
}

Ideal RingMap::image(const Ideal& ideal) const {
  if (!ideal.ring().sameVariables(source()))
    throw InconsistentDimensionError("The ideal is not in the source ring.");
  return Ideal(mTarget, ideal.generators().mapped(target(), mVars));
}

Ideal RingMap::preimage(
  const Ideal& ideal,
  const SymbolicEngine& engine
) const {
  if (!ideal.ring().sameVariables(target()))
    throw InconsistentDimensionError("The ideal is not in the target ring.");
  const Ideal eliminated = engine.eliminate(ideal, complement());

  std::vector<VarIndex> images(target().varCount(), static_cast<VarIndex>(-1));
  for (VarIndex k = 0; k < mVars.size(); ++k)
    images[mVars[k]] = k;
  return Ideal(mSource, eliminated.generators().mapped(source(), images));
}

OMEGAFAN_NAMESPACE_END
