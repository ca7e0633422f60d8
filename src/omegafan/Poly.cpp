// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Poly.hpp"

#include "Errors.hpp"
#include <algorithm>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

void Poly::append(const Coefficient& coef, ConstMonoPtr mono) {
  OMEGAFAN_ASSERT(coef != 0);
  mCoefs.push_back(coef);
  mMonos.insert(mMonos.end(), mono, mono + monoid().entryCount());
}

void Poly::appendExponents(const Coefficient& coef, const Exponent* exps) {
  auto mono = monoid().alloc();
  monoid().setExponents(exps, Monoid::ptr(mono));
  append(coef, Monoid::ptr(mono));
}

Poly Poly::polyWithTermsDescending() const {
  const auto& m = monoid();
  std::vector<size_t> order(termCount());
  for (size_t i = 0; i < termCount(); ++i)
    order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return m.lessThan(mono(b), mono(a));
  });

  Poly sorted(ring());
  sorted.reserve(termCount());
  for (size_t i = 0; i < order.size(); ) {
    Coefficient sum = coef(order[i]);
    size_t j = i + 1;
    for (; j < order.size() && m.equal(mono(order[i]), mono(order[j])); ++j)
      sum += coef(order[j]);
    if (sum != 0)
      sorted.append(sum, mono(order[i]));
    i = j;
  }
  return sorted;
}

void Poly::makeMonic() {
  OMEGAFAN_ASSERT(!isZero());
  if (isMonic())
    return;
  const Coefficient multiplier = 1 / leadCoef();
  for (auto it = mCoefs.begin(); it != mCoefs.end(); ++it)
    *it *= multiplier;
}

bool Poly::operator==(const Poly& poly) const {
  OMEGAFAN_ASSERT(ring().sameVariables(poly.ring()));
  if (termCount() != poly.termCount())
    return false;
  for (size_t i = 0; i < termCount(); ++i) {
    if (coef(i) != poly.coef(i))
      return false;
    const auto a = monoid().exponents(mono(i));
    const auto b = poly.monoid().exponents(poly.mono(i));
    if (!std::equal(a, a + ring().varCount(), b))
      return false;
  }
  return true;
}

bool Poly::termsAreInDescendingOrder() const {
  for (size_t i = 1; i < termCount(); ++i)
    if (!monoid().lessThan(mono(i), mono(i - 1)))
      return false;
  return true;
}

bool Poly::isHomogeneous() const {
  if (isZero())
    return true;
  const auto degree = monoid().totalDegree(leadMono());
  for (size_t i = 1; i < termCount(); ++i)
    if (monoid().totalDegree(mono(i)) != degree)
      return false;
  return true;
}

bool Poly::isFreeOf(const VarIndex var) const {
  for (size_t i = 0; i < termCount(); ++i)
    if (exponent(i, var) != 0)
      return false;
  return true;
}

Poly Poly::mapped(
  const PolyRing& target,
  const std::vector<VarIndex>& images
) const {
  OMEGAFAN_ASSERT(images.size() == ring().varCount());
  const auto noImage = static_cast<VarIndex>(-1);
  Poly image(target);
  image.reserve(termCount());
  std::vector<Exponent> exps(target.varCount());
  for (size_t i = 0; i < termCount(); ++i) {
    std::fill(exps.begin(), exps.end(), static_cast<Exponent>(0));
    for (VarIndex var = 0; var < ring().varCount(); ++var) {
      const auto e = exponent(i, var);
      if (e == 0)
        continue;
      if (images[var] == noImage) {
        throw OmegaFanError
          ("Variable " + ring().varName(var) + " has no image under the map.");
      }
      OMEGAFAN_ASSERT(images[var] < target.varCount());
      exps[images[var]] += e;
    }
    image.appendExponents(coef(i), exps.data());
  }
  return image.polyWithTermsDescending();
}

void Poly::display(std::ostream& out) const {
  display(out, ring().varNames());
}

void Poly::display(
  std::ostream& out,
  const std::vector<std::string>& names
) const {
  if (isZero()) {
    out << '0';
    return;
  }
  for (size_t i = 0; i < termCount(); ++i) {
    Coefficient c = coef(i);
    if (c < 0) {
      out << (i == 0 ? "-" : " - ");
      c = -c;
    } else if (i != 0)
      out << " + ";

    const bool isOne = monoid().isIdentity(mono(i));
    if (isOne)
      out << c;
    else {
      if (c != 1)
        out << c << '*';
      monoid().print(out, mono(i), names);
    }
  }
}

std::string Poly::toString() const {
  std::ostringstream out;
  display(out);
  return out.str();
}

OMEGAFAN_NAMESPACE_END
