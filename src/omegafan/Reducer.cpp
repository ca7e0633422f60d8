// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Reducer.hpp"

#include <iostream>
#include <algorithm>

OMEGAFAN_NAMESPACE_BEGIN

Reducer::Reducer(const PolyRing& ring):
  mRing(ring),
  mQueue(MonoGreater(ring.monoid()))
{}

void Reducer::reset() {
  mQueue.clear();
  mArena.freeAllAllocs();
}

void Reducer::insert(
  const Coefficient& multiplier,
  Poly::ConstMonoPtr mono,
  const Poly& f,
  const size_t skip
) {
  const auto& monoid = mRing.monoid();
  auto product = monoid.alloc();
  for (size_t i = skip; i < f.termCount(); ++i) {
    monoid.multiply(mono, f.mono(i), Monoid::ptr(product));
    const auto it = mQueue.find(product);
    if (it == mQueue.end())
      mQueue.insert(std::make_pair(product, Coefficient(multiplier * f.coef(i))));
    else {
      it->second += multiplier * f.coef(i);
      if (it->second == 0)
        mQueue.erase(it);
    }
  }
}

std::unique_ptr<Poly> Reducer::classicReduce(
  const Poly& poly,
  const PolyBasis& basis
) {
  OMEGAFAN_ASSERT(&poly.ring() == &mRing);
  auto identity = mRing.monoid().alloc(mArena);
  mRing.monoid().setIdentity(identity);
  insert(1, identity, poly, 0);
  return classicReduce(make_unique<Poly>(mRing), basis);
}

std::unique_ptr<Poly> Reducer::classicTailReduce(
  const Poly& poly,
  const PolyBasis& basis
) {
  OMEGAFAN_ASSERT(&poly.ring() == &mRing);
  OMEGAFAN_ASSERT(!poly.isZero());
  auto identity = mRing.monoid().alloc(mArena);
  mRing.monoid().setIdentity(identity);
  insert(1, identity, poly, 1);

  auto result = make_unique<Poly>(mRing);
  result->append(poly.leadCoef(), poly.leadMono());
  return classicReduce(std::move(result), basis);
}

std::unique_ptr<Poly> Reducer::classicReduceSPoly(
  const Poly& a,
  const Poly& b,
  const PolyBasis& basis
) {
  OMEGAFAN_ASSERT(a.isMonic());
  OMEGAFAN_ASSERT(b.isMonic());
  const auto& monoid = mRing.monoid();

  const auto lcm = monoid.alloc(mArena);
  monoid.lcm(a.leadMono(), b.leadMono(), lcm);

  // insert tail of multiple of a
  const auto multiple1 = monoid.alloc(mArena);
  monoid.divide(a.leadMono(), lcm, multiple1);
  insert(1, multiple1, a, 1);

  // insert tail of multiple of b
  const auto multiple2 = monoid.alloc(mArena);
  monoid.divide(b.leadMono(), lcm, multiple2);
  insert(-1, multiple2, b, 1);

  return classicReduce(make_unique<Poly>(mRing), basis);
}

std::unique_ptr<Poly> Reducer::classicReduce(
  std::unique_ptr<Poly> result,
  const PolyBasis& basis
) {
  OMEGAFAN_ASSERT(&result->ring() == &mRing);
  const auto& monoid = mRing.monoid();
  ++mClassicStats.reductions;

  if (tracingLevel > 100)
    std::cerr << "Classic reduction begun." << std::endl;

  unsigned long long steps = 0; // number of steps in this reduction
  const auto multiplier = monoid.alloc(mArena);
  while (!mQueue.empty()) {
    const auto lead = mQueue.begin();
    const auto leadMono = Monoid::ptr(lead->first);
    const size_t reducer = basis.divisor(leadMono);
    if (reducer == static_cast<size_t>(-1)) { // no reducer found
      OMEGAFAN_ASSERT(
        result->isZero() || monoid.lessThan(leadMono, result->backMono())
      );
      result->append(lead->second, leadMono);
      mQueue.erase(lead);
    } else { // reduce by reducer
      ++steps;
      const Poly& by = basis.poly(reducer);
      monoid.divide(by.leadMono(), leadMono, multiplier);
      const Coefficient coef = -lead->second / by.leadCoef();
      mQueue.erase(lead);
      insert(coef, multiplier, by, 1);
    }
  }
  if (!result->isZero())
    result->makeMonic();
  else
    ++mClassicStats.zeroReductions;

  mClassicStats.steps += steps;
  mClassicStats.maxSteps = std::max(mClassicStats.maxSteps, steps);
  reset();
  return result;
}

OMEGAFAN_NAMESPACE_END
