// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Basis.hpp"

#include <algorithm>

OMEGAFAN_NAMESPACE_BEGIN

void Basis::insert(std::unique_ptr<Poly>&& p) {
  OMEGAFAN_ASSERT(p.get() != 0);
  OMEGAFAN_ASSERT(&p->ring() == &ring());
  OMEGAFAN_ASSERT(p->termsAreInDescendingOrder());
  mGenerators.push_back(std::move(p));
}

Basis Basis::clone() const {
  Basis copy(ring());
  copy.reserve(size());
  for (auto it = mGenerators.begin(); it != mGenerators.end(); ++it)
    copy.insert(make_unique<Poly>(**it));
  return copy;
}

Basis Basis::mapped(
  const PolyRing& target,
  const std::vector<PolyRing::VarIndex>& images
) const {
  Basis image(target);
  image.reserve(size());
  for (auto it = mGenerators.begin(); it != mGenerators.end(); ++it)
    image.insert((*it)->mapped(target, images));
  return image;
}

void Basis::display(std::ostream& out) const {
  for (size_t i = 0; i < size(); ++i) {
    if (i != 0)
      out << ",\n";
    getPoly(i).display(out);
  }
}

void Basis::sort() {
  const auto& monoid = ring().monoid();
  const auto cmp = [&](
    const std::unique_ptr<Poly>& a,
    const std::unique_ptr<Poly>& b
  ) {
    if (a->isZero() || b->isZero())
      return a->isZero() && !b->isZero();
    return monoid.lessThan(a->leadMono(), b->leadMono());
  };
  std::stable_sort(mGenerators.begin(), mGenerators.end(), cmp);
}

bool Basis::operator==(const Basis& basis) const {
  if (size() != basis.size())
    return false;
  for (size_t i = 0; i < size(); ++i)
    if (getPoly(i) != basis.getPoly(i))
      return false;
  return true;
}

OMEGAFAN_NAMESPACE_END
