// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Monoid.hpp"

OMEGAFAN_NAMESPACE_BEGIN

void Monoid::setExponents(const Exponent* exps, MonoPtr mono) const {
  for (size_t grading = 0; grading < gradingCount(); ++grading) {
    Exponent degree = 0;
    for (VarIndex var = 0; var < varCount(); ++var)
      degree += mOrder.weight(grading, var) * exps[var];
    mono[grading] = degree;
  }
  std::copy_n(exps, varCount(), mono + mGradingCount);
}

void Monoid::setExponent(
  const VarIndex var,
  const Exponent e,
  MonoPtr mono
) const {
  OMEGAFAN_ASSERT(var < varCount());
  const auto delta = e - mono[mGradingCount + var];
  for (size_t grading = 0; grading < gradingCount(); ++grading)
    mono[grading] += mOrder.weight(grading, var) * delta;
  mono[mGradingCount + var] = e;
}

void Monoid::lcm(ConstMonoPtr a, ConstMonoPtr b, MonoPtr lcmOut) const {
  const auto ea = exponents(a);
  const auto eb = exponents(b);
  std::vector<Exponent> exps(varCount());
  for (VarIndex var = 0; var < varCount(); ++var)
    exps[var] = std::max(ea[var], eb[var]);
  setExponents(exps.data(), lcmOut);
}

Monoid::CompareResult Monoid::compare(ConstMonoPtr a, ConstMonoPtr b) const {
  for (size_t grading = 0; grading < gradingCount(); ++grading) {
    if (a[grading] < b[grading])
      return LessThan;
    if (a[grading] > b[grading])
      return GreaterThan;
  }

  if (mOrder.baseOrder() == TermOrder::LexBaseOrder) {
    for (VarIndex var = 0; var < varCount(); ++var) {
      const auto ea = exponent(a, var);
      const auto eb = exponent(b, var);
      if (ea != eb)
        return ea > eb ? GreaterThan : LessThan;
    }
  } else {
    for (VarIndex var = varCount(); var > 0; --var) {
      const auto ea = exponent(a, var - 1);
      const auto eb = exponent(b, var - 1);
      if (ea != eb)
        return ea < eb ? GreaterThan : LessThan;
    }
  }
  return EqualTo;
}

void Monoid::print(
  std::ostream& out,
  ConstMonoPtr mono,
  const std::vector<std::string>& varNames
) const {
  OMEGAFAN_ASSERT(varNames.size() == varCount());
  bool printedSomething = false;
  for (VarIndex var = 0; var < varCount(); ++var) {
    const auto e = exponent(mono, var);
    if (e == 0)
      continue;
    if (printedSomething)
      out << '*';
    out << varNames[var];
    if (e != 1)
      out << '^' << e;
    printedSomething = true;
  }
  if (!printedSomething)
    out << '1';
}

OMEGAFAN_NAMESPACE_END
