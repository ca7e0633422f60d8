// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Plucker.hpp"

#include "Errors.hpp"
#include "Subsets.hpp"
#include <algorithm>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

std::string pluckerName(const size_t i, const size_t j, const size_t n) {
  OMEGAFAN_ASSERT(i < j);
  std::ostringstream name;
  name << 'p' << i << (n < 10 ? "" : "_") << j;
  return name.str();
}

Ideal plucker2Ideal(const size_t n) {
  if (n < 2)
    throw InconsistentDimensionError("G(2,n) needs n to be at least 2.");

  IndexSet indices;
  for (size_t i = 1; i <= n; ++i)
    indices.push_back(i);
  const auto pairs = subsetsLex(indices, 2);
  std::vector<std::string> names;
  for (auto it = pairs.begin(); it != pairs.end(); ++it)
    names.push_back(pluckerName((*it)[0], (*it)[1], n));
  auto ring = std::make_shared<const PolyRing>(std::move(names));

  // The variable of the pair a < b.
  const auto var = [&](size_t a, size_t b) {
    IndexSet pair;
    pair.push_back(a);
    pair.push_back(b);
    return static_cast<size_t>
      (std::lower_bound(pairs.begin(), pairs.end(), pair) - pairs.begin());
  };

  Basis relations(*ring);
  const auto quadruples = subsetsLex(indices, 4);
  std::vector<Monoid::Exponent> exponents(ring->varCount());
  for (auto it = quadruples.begin(); it != quadruples.end(); ++it) {
    const auto i = (*it)[0], j = (*it)[1], k = (*it)[2], l = (*it)[3];
    Poly relation(*ring);
    const auto addTerm = [&](int coef, size_t a, size_t b) {
      std::fill(exponents.begin(), exponents.end(), 0);
      ++exponents[a];
      ++exponents[b];
      relation.appendExponents(coef, exponents.data());
    };
    addTerm(1, var(i, j), var(k, l));
    addTerm(-1, var(i, k), var(j, l));
    addTerm(1, var(i, l), var(j, k));
    relations.insert(relation.polyWithTermsDescending());
  }
  return Ideal(std::move(ring), std::move(relations));
}

OMEGAFAN_NAMESPACE_END
