// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Ideal.hpp"

#include "Errors.hpp"

OMEGAFAN_NAMESPACE_BEGIN

namespace {
  std::vector<Ideal::VarIndex> identityImages(Ideal::VarIndex varCount) {
    std::vector<Ideal::VarIndex> images(varCount);
    for (Ideal::VarIndex var = 0; var < varCount; ++var)
      images[var] = var;
    return images;
  }
}

Ideal::Ideal(std::shared_ptr<const PolyRing> ring, Basis generators):
  mRing(std::move(ring))
{
  OMEGAFAN_ASSERT(mRing.get() != 0);
  if (&generators.ring() == mRing.get())
    mGenerators = std::make_shared<const Basis>(std::move(generators));
  else {
    if (!generators.ring().sameVariables(*mRing))
      throw InconsistentDimensionError
        ("Generators of an ideal must be polynomials of its ring.");
    mGenerators = std::make_shared<const Basis>
      (generators.mapped(*mRing, identityImages(mRing->varCount())));
  }
}

Ideal Ideal::zero(std::shared_ptr<const PolyRing> ring) {
  Basis basis(*ring);
  return Ideal(std::move(ring), std::move(basis));
}

Ideal Ideal::unit(std::shared_ptr<const PolyRing> ring) {
  Basis basis(*ring);
  Poly one(*ring);
  auto mono = ring->monoid().alloc();
  one.append(1, Monoid::ptr(mono));
  basis.insert(std::move(one));
  return Ideal(std::move(ring), std::move(basis));
}

Ideal Ideal::variables(
  std::shared_ptr<const PolyRing> ring,
  const std::vector<VarIndex>& vars
) {
  Basis basis(*ring);
  const auto& monoid = ring->monoid();
  for (auto it = vars.begin(); it != vars.end(); ++it) {
    if (*it >= ring->varCount())
      throw InconsistentDimensionError("Variable index out of range.");
    auto mono = monoid.alloc();
    monoid.setExponent(*it, 1, Monoid::ptr(mono));
    Poly var(*ring);
    var.append(1, Monoid::ptr(mono));
    basis.insert(std::move(var));
  }
  return Ideal(std::move(ring), std::move(basis));
}

bool Ideal::isZero() const {
  for (size_t i = 0; i < generatorCount(); ++i)
    if (!generator(i).isZero())
      return false;
  return true;
}

bool Ideal::hasUnitGenerator() const {
  for (size_t i = 0; i < generatorCount(); ++i) {
    const auto& gen = generator(i);
    if (gen.termCount() == 1 && ring().monoid().isIdentity(gen.leadMono()))
      return true;
  }
  return false;
}

Ideal Ideal::operator+(const Ideal& ideal) const {
  if (!ring().sameVariables(ideal.ring()))
    throw InconsistentDimensionError
      ("Cannot add ideals of rings with different variables.");
  Basis sum(ring());
  sum.reserve(generatorCount() + ideal.generatorCount());
  for (size_t i = 0; i < generatorCount(); ++i)
    sum.insert(Poly(generator(i)));
  if (&ideal.ring() == &ring()) {
    for (size_t i = 0; i < ideal.generatorCount(); ++i)
      sum.insert(Poly(ideal.generator(i)));
  } else {
    const auto images = identityImages(varCount());
    for (size_t i = 0; i < ideal.generatorCount(); ++i)
      sum.insert(ideal.generator(i).mapped(ring(), images));
  }
  return Ideal(mRing, std::move(sum));
}

Ideal Ideal::inRing(std::shared_ptr<const PolyRing> ring) const {
  if (ring.get() == mRing.get())
    return *this;
  return Ideal(std::move(ring), generators().clone());
}

void Ideal::display(std::ostream& out) const {
  ring().write(out);
  out << " {";
  for (size_t i = 0; i < generatorCount(); ++i) {
    out << (i == 0 ? "" : ", ");
    generator(i).display(out);
  }
  out << '}';
}

OMEGAFAN_NAMESPACE_END
