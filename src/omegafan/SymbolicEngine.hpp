// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_SYMBOLIC_ENGINE_GUARD
#define OMEGAFAN_SYMBOLIC_ENGINE_GUARD

#include "Ideal.hpp"
#include <gmpxx.h>
#include <tbb/tick_count.h>
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

/// An integer weight vector with one entry per variable or point.
typedef std::vector<mpz_class> WeightVector;

/// Which terms of a polynomial are initial with respect to a weight.
enum TropicalValuation {
  /// The initial form consists of the terms of least weight.
  MinValuation,

  /// The initial form consists of the terms of greatest weight.
  MaxValuation
};

/// Bounds on the Groebner basis computations of a SymbolicEngine. A value
/// of zero means no limit.
struct GroebnerBasisLimits {
  GroebnerBasisLimits(): maxBasisSize(0), seconds(0) {}

  /// Give up when a basis has more than this many elements.
  unsigned int maxBasisSize;

  /// Give up when this much time has passed since the engine was
  /// constructed.
  double seconds;
};

/// Ideal operations that need Groebner bases. Every computation obeys the
/// limits given at construction: exceeding the basis size raises
/// SymbolicEngineFailure and passing the deadline raises
/// ComputationTimeout.
///
/// An engine has no mutable state, so one object can be used from several
/// threads. The deadline is measured from construction, so use a fresh
/// engine for each unit of work that should have its own time limit.
class SymbolicEngine {
public:
  typedef PolyRing::VarIndex VarIndex;

  SymbolicEngine();
  explicit SymbolicEngine(const GroebnerBasisLimits& limits);

  const GroebnerBasisLimits& limits() const {return mLimits;}

  /// Returns the reduced Groebner basis of the ideal generated by
  /// generators with respect to the order of generators.ring().
  Basis groebnerBasis(const Basis& generators) const;

  /// Returns the ideal generated by its reduced Groebner basis for graded
  /// reverse lexicographic order. Two ideals are equal if and only if
  /// these bases are equal.
  Ideal reducedBasis(const Ideal& ideal) const;

  bool equal(const Ideal& a, const Ideal& b) const;

  bool isUnit(const Ideal& ideal) const;

  /// Returns true if poly lies in ideal. poly must be a polynomial of a
  /// ring with the same variables.
  bool contains(const Ideal& ideal, const Poly& poly) const;

  /// Returns true if every generator of a lies in b.
  bool isSubset(const Ideal& a, const Ideal& b) const;

  Ideal sum(const Ideal& a, const Ideal& b) const {return a + b;}

  /// Returns the intersection of a and b computed as the elimination of t
  /// from t*a + (1-t)*b.
  Ideal intersect(const Ideal& a, const Ideal& b) const;

  /// Returns the intersection of ideal with the subring of the variables
  /// not in vars, as an ideal of the ring of ideal.
  Ideal eliminate(const Ideal& ideal, const std::vector<VarIndex>& vars)
    const;

  /// Returns the initial ideal of ideal with respect to weight under the
  /// given convention. The ideal must be homogeneous for the standard
  /// grading and weight must have one entry per variable.
  Ideal initial(
    const Ideal& ideal,
    TropicalValuation valuation,
    const WeightVector& weight
  ) const;

private:
  class DeadlineCallback;

  const GroebnerBasisLimits mLimits;
  const tbb::tick_count mStart;
};

OMEGAFAN_NAMESPACE_END
#endif
