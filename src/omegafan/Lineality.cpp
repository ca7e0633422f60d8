// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Lineality.hpp"

#include "Errors.hpp"

OMEGAFAN_NAMESPACE_BEGIN

QQMatrix linealitySpaceHRep(
  const Ideal& ideal,
  const SymbolicEngine& engine
) {
  if (ideal.isZero())
    throw DegenerateIdealError("The zero ideal has no point configuration.");
  const Ideal gb = engine.reducedBasis(ideal);
  if (gb.generatorCount() == 0)
    throw DegenerateIdealError("The zero ideal has no point configuration.");
  if (gb.hasUnitGenerator())
    throw DegenerateIdealError("The unit ideal has no point configuration.");

  const auto varCount = ideal.varCount();
  const auto& monoid = gb.ring().monoid();
  QQMatrix differences(0, varCount);
  for (size_t i = 0; i < gb.generatorCount(); ++i) {
    const auto& poly = gb.generator(i);
    for (size_t a = 0; a < poly.termCount(); ++a) {
      for (size_t b = a + 1; b < poly.termCount(); ++b) {
        QQVector row(varCount);
        for (PolyRing::VarIndex var = 0; var < varCount; ++var) {
          row[var] = static_cast<long>(monoid.exponent(poly.mono(a), var) -
            monoid.exponent(poly.mono(b), var));
        }
        differences.appendRow(std::move(row));
      }
    }
  }
  return differences.nonzeroRows();
}

QQMatrix linealitySpaceVRep(
  const Ideal& ideal,
  const SymbolicEngine& engine
) {
  return linealitySpaceHRep(ideal, engine).kernel().reducedRowEchelonForm();
}

PointConfiguration pointConfiguration(
  const Ideal& ideal,
  const SymbolicEngine& engine
) {
  const auto vRep = linealitySpaceVRep(ideal, engine);
  PointConfiguration points;
  points.reserve(vRep.colCount());
  for (size_t col = 0; col < vRep.colCount(); ++col)
    points.push_back(vRep.column(col));
  return points;
}

OMEGAFAN_NAMESPACE_END
