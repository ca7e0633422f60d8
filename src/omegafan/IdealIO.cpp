// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "IdealIO.hpp"

#include <algorithm>
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

namespace {
  mpq_class readCoefficient(Scanner& in) {
    const mpz_class numerator = in.readInteger();
    if (!in.match('/'))
      return mpq_class(numerator);
    const mpz_class denominator = in.readInteger();
    if (denominator == 0)
      in.reportError("Division by zero in coefficient.");
    mpq_class coef(numerator, denominator);
    coef.canonicalize();
    return coef;
  }

  // Reads a product of coefficients and powers of variables.
  void readTerm(
    Scanner& in,
    const PolyRing& ring,
    mpq_class& coef,
    std::vector<Monoid::Exponent>& exponents
  ) {
    coef = 1;
    std::fill(exponents.begin(), exponents.end(), 0);
    do {
      if (in.peekDigit()) {
        coef *= readCoefficient(in);
        continue;
      }
      const auto name = in.readIdentifier();
      const auto var = ring.varIndex(name);
      if (var == static_cast<PolyRing::VarIndex>(-1))
        in.reportError("Unknown variable " + name + '.');
      Monoid::Exponent e = 1;
      if (in.match('^')) {
        const auto power = in.readInteger();
        if (!power.fits_slong_p())
          in.reportError("Exponent too large.");
        e = power.get_si();
      }
      exponents[var] += e;
    } while (in.match('*'));
  }
}

std::shared_ptr<const PolyRing> readRing(Scanner& in) {
  in.expect('Q');
  in.expect('[');
  std::vector<std::string> names;
  if (!in.match(']')) {
    do {
      names.push_back(in.readIdentifier());
    } while (in.match(','));
    in.expect(']');
  }
  for (size_t i = 0; i < names.size(); ++i)
    for (size_t j = 0; j < i; ++j)
      if (names[i] == names[j])
        in.reportError("Variable " + names[i] + " is declared twice.");
  return std::make_shared<const PolyRing>(std::move(names));
}

Poly readPoly(Scanner& in, const PolyRing& ring) {
  Poly poly(ring);
  std::vector<Monoid::Exponent> exponents(ring.varCount());
  mpq_class coef;
  bool first = true;
  while (true) {
    bool negative = false;
    if (in.match('-'))
      negative = true;
    else if (!in.match('+') && !first)
      break;
    first = false;

    readTerm(in, ring, coef, exponents);
    if (negative)
      coef = -coef;
    if (coef != 0)
      poly.appendExponents(coef, exponents.data());
  }
  return poly.polyWithTermsDescending();
}

Ideal readIdeal(Scanner& in) {
  auto ring = readRing(in);
  Basis basis(*ring);
  in.expect('{');
  if (!in.match('}')) {
    do {
      basis.insert(readPoly(in, *ring));
    } while (in.match(','));
    in.expect('}');
  }
  return Ideal(std::move(ring), std::move(basis));
}

Ideal parseIdeal(const std::string& text) {
  Scanner in(text);
  auto ideal = readIdeal(in);
  in.expectEOF();
  return ideal;
}

void writeIdeal(std::ostream& out, const Ideal& ideal) {
  ideal.ring().write(out);
  out << "\n{\n";
  for (size_t i = 0; i < ideal.generatorCount(); ++i) {
    out << "  ";
    ideal.generator(i).display(out);
    out << (i + 1 == ideal.generatorCount() ? "\n" : ",\n");
  }
  out << "}\n";
}

OMEGAFAN_NAMESPACE_END
