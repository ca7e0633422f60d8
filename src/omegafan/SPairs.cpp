// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "SPairs.hpp"

#include <algorithm>

OMEGAFAN_NAMESPACE_BEGIN

SPairs::SPairs(const PolyBasis& basis):
  mBasis(basis),
  mSequence(0)
{}

bool SPairs::PairGreater::operator()(const Pair& x, const Pair& y) const {
  const auto cmp = mMonoid->compare(Monoid::ptr(x.lcm), Monoid::ptr(y.lcm));
  if (cmp != Monoid::EqualTo)
    return cmp == Monoid::GreaterThan;
  return x.sequence > y.sequence;
}

std::pair<size_t, size_t> SPairs::pop() {
  const PairGreater greater(mBasis.monoid());
  while (!mQueue.empty()) {
    std::pop_heap(mQueue.begin(), mQueue.end(), greater);
    const Pair p = std::move(mQueue.back());
    mQueue.pop_back();
    if (mBasis.retired(p.a) || mBasis.retired(p.b))
      continue;
    return std::make_pair(p.a, p.b);
  }
  const auto invalid = static_cast<size_t>(-1);
  return std::make_pair(invalid, invalid);
}

void SPairs::addPairsAssumeAutoReduce(
  size_t index,
  std::vector<size_t>& toRetireAndReduce
) {
  OMEGAFAN_ASSERT(index < mBasis.size());
  OMEGAFAN_ASSERT(!mBasis.retired(index));
  const auto& monoid = mBasis.monoid();
  const PairGreater greater(monoid);
  const auto lead = mBasis.leadMono(index);

  for (size_t other = 0; other < index; ++other) {
    if (mBasis.retired(other))
      continue;
    const auto otherLead = mBasis.leadMono(other);
    if (monoid.divides(lead, otherLead)) {
      toRetireAndReduce.push_back(other);
      continue;
    }
    ++mStats.sPairsConsidered;
    if (monoid.relativelyPrime(lead, otherLead)) {
      ++mStats.relativelyPrimeHits;
      continue;
    }
    Pair p;
    p.a = index;
    p.b = other;
    p.sequence = mSequence++;
    p.lcm = monoid.alloc();
    monoid.lcm(lead, otherLead, Monoid::ptr(p.lcm));
    mQueue.push_back(std::move(p));
    std::push_heap(mQueue.begin(), mQueue.end(), greater);
  }
}

OMEGAFAN_NAMESPACE_END
