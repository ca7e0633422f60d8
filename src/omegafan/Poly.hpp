// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_POLY_GUARD
#define OMEGAFAN_POLY_GUARD

#include "PolyRing.hpp"
#include <vector>
#include <ostream>
#include <string>

OMEGAFAN_NAMESPACE_BEGIN

/// A polynomial with rational coefficients. The coefficients and
/// monomials of the terms are kept in two flat arrays.
class Poly {
public:
  typedef PolyRing::Coefficient Coefficient;
  typedef PolyRing::VarIndex VarIndex;
  typedef Monoid::Exponent Exponent;
  typedef Monoid::MonoPtr MonoPtr;
  typedef Monoid::ConstMonoPtr ConstMonoPtr;

  explicit Poly(const PolyRing& ring): mRing(ring) {}

  Poly(const Poly& poly):
    mRing(poly.ring()), mCoefs(poly.mCoefs), mMonos(poly.mMonos)
  {}

  Poly(Poly&& poly):
    mRing(poly.ring()),
    mCoefs(std::move(poly.mCoefs)),
    mMonos(std::move(poly.mMonos))
  {}

  const PolyRing& ring() const {return mRing;}
  const Monoid& monoid() const {return ring().monoid();}
  bool isZero() const {return mCoefs.empty();}
  size_t termCount() const {return mCoefs.size();}

  /// Returns a polynomial whose terms have been permuted to be in
  /// descending order. Terms with equal monomials are combined and terms
  /// with zero coefficient are dropped.
  ///
  ///   p = p.polyWithTermsDescending()
  Poly polyWithTermsDescending() const;

  /// Appends the given term as the last term in the polynomial.
  void append(const Coefficient& coef, ConstMonoPtr mono);

  /// Appends a term given by its varCount() exponents.
  void appendExponents(const Coefficient& coef, const Exponent* exps);

  /// Hint that space for the give number of terms is going to be needed.
  /// This serves the same purpose as std::vector<>::reserve.
  void reserve(size_t spaceForThisManyTerms) {
    mCoefs.reserve(spaceForThisManyTerms);
    mMonos.reserve(spaceForThisManyTerms * monoid().entryCount());
  }

  /// Makes the polynomial monic by multiplying by the multiplicative inverse
  /// of leadCoef(). Calling this method is an error if isZero().
  void makeMonic();

  void setToZero() {
    mCoefs.clear();
    mMonos.clear();
  }

  Poly& operator=(const Poly& poly) {return *this = Poly(poly);}
  Poly& operator=(Poly&& poly) {
    OMEGAFAN_ASSERT(&ring() == &poly.ring());
    mCoefs = std::move(poly.mCoefs);
    mMonos = std::move(poly.mMonos);
    return *this;
  }

  /// Two polynomials are equal if they have the same terms in the same
  /// order. The rings must have the same variables.
  bool operator==(const Poly& poly) const;
  bool operator!=(const Poly& poly) const {return !(*this == poly);}

  // *** Accessing the terms of the polynomial.

  /// Returns the coefficient of the given term.
  const Coefficient& coef(size_t index) const {
    OMEGAFAN_ASSERT(index < termCount());
    return mCoefs[index];
  }

  /// Returns the coefficient of the leading term.
  const Coefficient& leadCoef() const {
    OMEGAFAN_ASSERT(!isZero());
    return mCoefs.front();
  }

  /// Returns true if the polynomial is monic. It is an error to ask if the
  /// zero polynomial is monic.
  bool isMonic() const {
    OMEGAFAN_ASSERT(!isZero());
    return leadCoef() == 1;
  }

  /// Returns the monomial of the given term.
  ConstMonoPtr mono(size_t index) const {
    OMEGAFAN_ASSERT(index < termCount());
    return &mMonos[index * monoid().entryCount()];
  }

  /// Returns the monomial of the leading term.
  ConstMonoPtr leadMono() const {
    OMEGAFAN_ASSERT(!isZero());
    return &mMonos.front();
  }

  /// Returns the monomial of the last term.
  ConstMonoPtr backMono() const {
    OMEGAFAN_ASSERT(!isZero());
    return mono(termCount() - 1);
  }

  Exponent exponent(size_t index, VarIndex var) const {
    return monoid().exponent(mono(index), var);
  }

  /// Returns true if the terms are in descending order. The terms are in
  /// descending order when mono(0) > mono(1) > ... > backMono.
  bool termsAreInDescendingOrder() const;

  /// Returns true if all terms have the same total degree.
  bool isHomogeneous() const;

  /// Returns true if no term involves the given variable.
  bool isFreeOf(VarIndex var) const;

  /// Returns the image of this polynomial in target under the map
  /// sending variable var to variable images[var] of target. A variable
  /// whose image is static_cast<VarIndex>(-1) must not occur in the
  /// polynomial. The terms of the result are sorted for target's order.
  Poly mapped(const PolyRing& target, const std::vector<VarIndex>& images)
    const;

  /// Prints the polynomial like 2*x1*x2^2 - 1/3*x3 + 1 using the variable
  /// names of the ring.
  void display(std::ostream& out) const;

  /// As display(out) but with other names for the variables.
  void display(std::ostream& out, const std::vector<std::string>& names)
    const;

  std::string toString() const;

private:
  const PolyRing& mRing;
  std::vector<Coefficient> mCoefs;
  std::vector<Exponent> mMonos;
};

inline std::ostream& operator<<(std::ostream& out, const Poly& p) {
  p.display(out);
  return out;
}

OMEGAFAN_NAMESPACE_END
#endif
