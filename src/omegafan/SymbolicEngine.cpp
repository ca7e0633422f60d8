// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "SymbolicEngine.hpp"

#include "ClassicGBAlg.hpp"
#include "Errors.hpp"
#include "Reducer.hpp"
#include <algorithm>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

class SymbolicEngine::DeadlineCallback : public ClassicGBAlg::Callback {
public:
  DeadlineCallback(const tbb::tick_count start, const double seconds):
    mStart(start), mSeconds(seconds) {}

  virtual bool call() {
    return (tbb::tick_count::now() - mStart).seconds() < mSeconds;
  }

private:
  const tbb::tick_count mStart;
  const double mSeconds;
};

namespace {
  typedef PolyRing::VarIndex VarIndex;

  const VarIndex NoImage = static_cast<VarIndex>(-1);

  std::vector<VarIndex> identityImages(const VarIndex varCount) {
    std::vector<VarIndex> images(varCount);
    for (VarIndex var = 0; var < varCount; ++var)
      images[var] = var;
    return images;
  }

  void checkSameVariables(const PolyRing& a, const PolyRing& b) {
    if (!a.sameVariables(b)) {
      throw InconsistentDimensionError
        ("The ideals are in rings with different variables.");
    }
  }

  // Returns factor * x_var * poly.
  Poly timesVariable(
    const Poly& poly,
    const VarIndex var,
    const Poly::Coefficient& factor
  ) {
    const auto& monoid = poly.monoid();
    auto varMono = monoid.alloc();
    monoid.setExponent(var, 1, Monoid::ptr(varMono));
    auto prod = monoid.alloc();

    Poly result(poly.ring());
    result.reserve(poly.termCount());
    for (size_t i = 0; i < poly.termCount(); ++i) {
      monoid.multiply(poly.mono(i), Monoid::ptr(varMono), Monoid::ptr(prod));
      result.append(factor * poly.coef(i), Monoid::ptr(prod));
    }
    return result;
  }

  // Returns true if poly reduces to zero modulo the reduced Groebner basis
  // gb.
  bool reducesToZero(const Ideal& gb, const Poly& poly) {
    const auto& ring = gb.ring();
    PolyBasis basis(ring);
    for (size_t i = 0; i < gb.generatorCount(); ++i)
      basis.insert(make_unique<Poly>(gb.generator(i)));
    Reducer reducer(ring);
    if (&poly.ring() == &ring)
      return reducer.classicReduce(poly, basis)->isZero();
    checkSameVariables(poly.ring(), ring);
    const auto mapped = poly.mapped(ring, identityImages(ring.varCount()));
    return reducer.classicReduce(mapped, basis)->isZero();
  }
}

SymbolicEngine::SymbolicEngine():
  mStart(tbb::tick_count::now())
{}

SymbolicEngine::SymbolicEngine(const GroebnerBasisLimits& limits):
  mLimits(limits),
  mStart(tbb::tick_count::now())
{}

Basis SymbolicEngine::groebnerBasis(const Basis& generators) const {
  ClassicGBAlgParams params;
  params.breakAfter = mLimits.maxBasisSize;
  DeadlineCallback deadline(mStart, mLimits.seconds);
  if (mLimits.seconds > 0) {
    if (!deadline.call())
      throw ComputationTimeout("The time limit was reached.");
    params.callback = &deadline;
  }
  return computeGBClassicAlg(generators, params);
}

Ideal SymbolicEngine::reducedBasis(const Ideal& ideal) const {
  auto ring = ideal.ringPtr();
  const TermOrder grevlex(ring->varCount());
  if (ring->order() != grevlex)
    ring = ring->withOrder(grevlex);
  const Ideal inGrevlex = ideal.inRing(ring);
  return Ideal(ring, groebnerBasis(inGrevlex.generators()));
}

bool SymbolicEngine::equal(const Ideal& a, const Ideal& b) const {
  checkSameVariables(a.ring(), b.ring());
  return reducedBasis(a).generators() == reducedBasis(b).generators();
}

bool SymbolicEngine::isUnit(const Ideal& ideal) const {
  const Ideal gb = reducedBasis(ideal);
  return gb.generatorCount() == 1 && gb.hasUnitGenerator();
}

bool SymbolicEngine::contains(const Ideal& ideal, const Poly& poly) const {
  return reducesToZero(reducedBasis(ideal), poly);
}

bool SymbolicEngine::isSubset(const Ideal& a, const Ideal& b) const {
  checkSameVariables(a.ring(), b.ring());
  const Ideal gb = reducedBasis(b);
  for (size_t i = 0; i < a.generatorCount(); ++i)
    if (!reducesToZero(gb, a.generator(i)))
      return false;
  return true;
}

Ideal SymbolicEngine::intersect(const Ideal& a, const Ideal& b) const {
  checkSameVariables(a.ring(), b.ring());
  if (a.hasUnitGenerator())
    return b.inRing(a.ringPtr());
  if (b.hasUnitGenerator())
    return a;
  if (a.isZero() || b.isZero())
    return Ideal::zero(a.ringPtr());

  const auto& ring = a.ring();
  const auto varCount = ring.varCount();
  std::string name = "t";
  while (ring.varIndex(name) != NoImage)
    name += '_';
  const auto t = varCount;
  const auto extended = ring.withExtraVariable(name)->withOrder
    (TermOrder::elimination(varCount + 1, std::vector<VarIndex>(1, t)));

  const auto images = identityImages(varCount);
  Basis gens(*extended);
  for (size_t i = 0; i < a.generatorCount(); ++i) {
    const auto f = a.generator(i).mapped(*extended, images);
    gens.insert(timesVariable(f, t, 1));
  }
  for (size_t i = 0; i < b.generatorCount(); ++i) {
    Poly g = b.generator(i).mapped(*extended, images);
    const Poly tg = timesVariable(g, t, -1);
    for (size_t term = 0; term < tg.termCount(); ++term)
      g.append(tg.coef(term), tg.mono(term));
    gens.insert(g.polyWithTermsDescending());
  }
  const Basis gb = groebnerBasis(gens);

  auto back = identityImages(varCount + 1);
  back[t] = NoImage;
  Basis intersection(ring);
  for (size_t i = 0; i < gb.size(); ++i)
    if (gb.getPoly(i).isFreeOf(t))
      intersection.insert(gb.getPoly(i).mapped(ring, back));
  return Ideal(a.ringPtr(), std::move(intersection));
}

Ideal SymbolicEngine::eliminate(
  const Ideal& ideal,
  const std::vector<VarIndex>& vars
) const {
  const auto varCount = ideal.varCount();
  for (auto it = vars.begin(); it != vars.end(); ++it)
    if (*it >= varCount)
      throw InconsistentDimensionError("Cannot eliminate unknown variable.");
  if (vars.empty())
    return ideal;

  const auto elimRing =
    ideal.ring().withOrder(TermOrder::elimination(varCount, vars));
  const Basis gb = groebnerBasis(ideal.inRing(elimRing).generators());

  const auto images = identityImages(varCount);
  Basis eliminated(ideal.ring());
  for (size_t i = 0; i < gb.size(); ++i) {
    const auto& poly = gb.getPoly(i);
    const bool keep = std::all_of(vars.begin(), vars.end(),
      [&](VarIndex var) {return poly.isFreeOf(var);});
    if (keep)
      eliminated.insert(poly.mapped(ideal.ring(), images));
  }
  return Ideal(ideal.ringPtr(), std::move(eliminated));
}

Ideal SymbolicEngine::initial(
  const Ideal& ideal,
  const TropicalValuation valuation,
  const WeightVector& weight
) const {
  const auto varCount = ideal.varCount();
  if (weight.size() != varCount) {
    std::ostringstream out;
    out << "A weight of length " << weight.size()
      << " was given for an ideal in " << varCount << " variables.";
    throw InconsistentDimensionError(out.str());
  }

  const Ideal gb = reducedBasis(ideal);
  for (size_t i = 0; i < gb.generatorCount(); ++i) {
    if (!gb.generator(i).isHomogeneous()) {
      throw SymbolicEngineFailure
        ("Initial ideals are only supported for homogeneous ideals.");
    }
  }
  if (varCount == 0)
    return gb.inRing(ideal.ringPtr());

  // For a homogeneous ideal, adding a multiple of (1, ..., 1) to the weight
  // does not change the initial ideal. That turns the weight into a
  // non-negative grading whose largest degree picks out the initial terms.
  const long bound = 1L << 30;
  TermOrder::Gradings grading(varCount);
  for (VarIndex var = 0; var < varCount; ++var) {
    if (abs(weight[var]) > bound)
      throw SymbolicEngineFailure("Weight entry too large: " +
        weight[var].get_str() + '.');
    grading[var] = weight[var].get_si();
  }
  if (valuation == MinValuation) {
    const auto max = *std::max_element(grading.begin(), grading.end());
    for (auto it = grading.begin(); it != grading.end(); ++it)
      *it = max - *it;
  } else {
    const auto min = *std::min_element(grading.begin(), grading.end());
    for (auto it = grading.begin(); it != grading.end(); ++it)
      *it -= min;
  }

  const auto weightRing =
    ideal.ring().withOrder(TermOrder::weighted(grading));
  const Basis weightGB = groebnerBasis(gb.inRing(weightRing).generators());

  const auto images = identityImages(varCount);
  const auto& monoid = weightRing->monoid();
  Basis initialForms(ideal.ring());
  for (size_t i = 0; i < weightGB.size(); ++i) {
    const auto& poly = weightGB.getPoly(i);
    if (poly.isZero())
      continue;
    const auto top = monoid.degree(poly.leadMono(), 0);
    Poly form(*weightRing);
    for (size_t term = 0; term < poly.termCount(); ++term) {
      if (monoid.degree(poly.mono(term), 0) != top)
        break;
      form.append(poly.coef(term), poly.mono(term));
    }
    initialForms.insert(form.mapped(ideal.ring(), images));
  }
  return Ideal(ideal.ringPtr(), std::move(initialForms));
}

OMEGAFAN_NAMESPACE_END
