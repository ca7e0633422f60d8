// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "PolyBasis.hpp"

OMEGAFAN_NAMESPACE_BEGIN

void PolyBasis::insert(std::unique_ptr<Poly> poly) {
  OMEGAFAN_ASSERT(poly.get() != 0);
  OMEGAFAN_ASSERT(!poly->isZero());
  OMEGAFAN_ASSERT(&poly->ring() == &ring());
  mEntries.push_back(Entry());
  mEntries.back().poly = std::move(poly);
  ++mActiveSize;
}

size_t PolyBasis::divisor(Poly::ConstMonoPtr mono) const {
  // Prefer the divisor with the fewest terms.
  size_t best = static_cast<size_t>(-1);
  for (size_t i = 0; i < size(); ++i) {
    if (retired(i) || !monoid().divides(leadMono(i), mono))
      continue;
    if (best == static_cast<size_t>(-1) ||
      poly(i).termCount() < poly(best).termCount())
      best = i;
  }
  return best;
}

size_t PolyBasis::termCount() const {
  size_t sum = 0;
  for (size_t i = 0; i < size(); ++i)
    if (!retired(i))
      sum += poly(i).termCount();
  return sum;
}

Basis PolyBasis::toBasis() {
  Basis basis(ring());
  basis.reserve(activeSize());
  for (size_t i = 0; i < size(); ++i)
    if (!retired(i))
      basis.insert(retire(i));
  return basis;
}

OMEGAFAN_NAMESPACE_END
