// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_CLASSIC_GB_ALG_GUARD
#define OMEGAFAN_CLASSIC_GB_ALG_GUARD

#include "Reducer.hpp"
#include "SPairs.hpp"
#include "PolyBasis.hpp"
#include "Basis.hpp"
#include <mathic.h>
#include <memory>
#include <ostream>
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

/// Calculates a classic Grobner basis using Buchberger's algorithm.
///
/// Basis elements are auto top reduced: an element whose lead monomial
/// becomes divisible by the lead monomial of a new element is retired,
/// reduced and inserted again. S-pairs are reduced in order of ascending
/// lcm and pairs with relatively prime lead monomials are skipped.
class ClassicGBAlg {
public:
  class Callback {
  public:
    virtual ~Callback() {}

    /// Stop the computation if call return false.
    virtual bool call() = 0;
  };

  explicit ClassicGBAlg(const Basis& basis);

  // Replaces the current basis with a Grobner basis of the same ideal.
  // The computation ends early if the callback asks for it or if the basis
  // grows beyond the break-after limit, see stopped().
  void computeGrobnerBasis();

  // Returns true if the last computation ended before all S-pairs were
  // handled.
  bool stopped() const {return mStoppedByCallback || mStoppedByLimit;}
  bool stoppedByCallback() const {return mStoppedByCallback;}
  bool stoppedByLimit() const {return mStoppedByLimit;}

  // Returns the unique reduced Grobner basis: monic, interreduced and
  // sorted by ascending lead monomial. Only call this after a computation
  // that was not stopped. The basis of this object is empty afterwards.
  Basis reducedBasis();

  // How many S-pairs were not eliminated before reduction of the
  // corresponding S-polynomial.
  unsigned long long sPolyReductionCount() const {return mSPolyReductionCount;}

  // Returns the current basis.
  const PolyBasis& basis() const {return mBasis;}

  // Shows statistics on what the algorithm has done.
  void printStats(std::ostream& out) const;

  /// A value of zero means no limit.
  void setBreakAfter(unsigned int elements) {
    mBreakAfter = elements;
  }

  void setUseAutoTailReduction(bool value) {
    mUseAutoTailReduction = value;
  }

  /// callback is called before every S-pair reduction and then it has the
  /// option of stopping the computation. callback can be null, in
  /// which case no call is made and the computation continues.
  void setCallback(Callback* callback) {mCallback = callback;}

private:
  // Perform a step of the algorithm.
  void step();

  void autoTailReduce();

  void insertReducedPoly(std::unique_ptr<Poly> poly);

  Callback* mCallback;
  unsigned int mBreakAfter;
  bool mUseAutoTailReduction;
  bool mStoppedByCallback;
  bool mStoppedByLimit;

  const PolyRing& mRing;
  Reducer mReducer;
  PolyBasis mBasis;
  SPairs mSPairs;
  mathic::Timer mTimer;
  unsigned long long mSPolyReductionCount;
};

struct ClassicGBAlgParams {
  ClassicGBAlgParams():
    breakAfter(0),
    useAutoTailReduction(false),
    callback(0) {}

  unsigned int breakAfter;
  bool useAutoTailReduction;
  ClassicGBAlg::Callback* callback;
};

/// Returns the reduced Grobner basis of the ideal generated by basis with
/// respect to the monomial order of basis.ring(). Throws ComputationTimeout
/// if params.callback stopped the computation and BasisSizeLimitExceeded
/// if the basis grew beyond params.breakAfter elements.
Basis computeGBClassicAlg(const Basis& basis, const ClassicGBAlgParams& params);

OMEGAFAN_NAMESPACE_END
#endif
