// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_REDUCER_GUARD
#define OMEGAFAN_REDUCER_GUARD

#include "Poly.hpp"
#include "PolyBasis.hpp"
#include <memtailor.h>
#include <map>
#include <memory>

OMEGAFAN_NAMESPACE_BEGIN

/// Reduces polynomials by the elements of a PolyBasis. The pending terms
/// of a reduction are kept in an ordered map from monomial to coefficient
/// with the greatest monomial first. Temporary monomials are allocated
/// from an arena that is cleared after each reduction.
class Reducer {
public:
  explicit Reducer(const PolyRing& ring);

  /// Returns the reduced form of poly modulo basis, made monic unless it
  /// is zero. Both the lead term and the tail are reduced.
  std::unique_ptr<Poly> classicReduce(const Poly& poly, const PolyBasis& basis);

  /// Reduces the tail of poly and leaves the lead term as it is.
  std::unique_ptr<Poly> classicTailReduce
    (const Poly& poly, const PolyBasis& basis);

  /// Returns the reduced form of the S-polynomial of a and b, both of which
  /// must be monic.
  std::unique_ptr<Poly> classicReduceSPoly
    (const Poly& a, const Poly& b, const PolyBasis& basis);

  struct Stats {
    Stats():
      reductions(0),
      steps(0),
      maxSteps(0),
      zeroReductions(0) {}

    unsigned long long reductions;
    unsigned long long steps;
    unsigned long long maxSteps;
    unsigned long long zeroReductions;
  };
  const Stats& classicStats() const {return mClassicStats;}

private:
  typedef Poly::Coefficient Coefficient;

  class MonoGreater {
  public:
    explicit MonoGreater(const Monoid& monoid): mMonoid(&monoid) {}
    bool operator()(const Monoid::Mono& a, const Monoid::Mono& b) const {
      return mMonoid->compare(Monoid::ptr(a), Monoid::ptr(b)) ==
        Monoid::GreaterThan;
    }
  private:
    const Monoid* mMonoid;
  };
  typedef std::map<Monoid::Mono, Coefficient, MonoGreater> Queue;

  // Adds multiplier * mono * f to the pending terms, skipping the first
  // skip terms of f.
  void insert(
    const Coefficient& multiplier,
    Poly::ConstMonoPtr mono,
    const Poly& f,
    size_t skip
  );

  // Reduces the pending terms and appends the result to partialResult.
  std::unique_ptr<Poly> classicReduce
    (std::unique_ptr<Poly> partialResult, const PolyBasis& basis);

  void reset();

  const PolyRing& mRing;
  Queue mQueue;
  memt::Arena mArena;
  Stats mClassicStats;
};

OMEGAFAN_NAMESPACE_END
#endif
