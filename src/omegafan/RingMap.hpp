// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_RING_MAP_GUARD
#define OMEGAFAN_RING_MAP_GUARD

#include "Ideal.hpp"
#include "SymbolicEngine.hpp"
#include <memory>
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

/// The inclusion of a subring into a ring. The subring has one variable
/// for each of a sorted list of variables of the target, and its k'th
/// variable is sent to the k'th variable of that list.
class RingMap {
public:
  typedef PolyRing::VarIndex VarIndex;

  /// vars must be sorted, without repetitions and in range for target.
  static RingMap subringInclusion(
    std::shared_ptr<const PolyRing> target,
    std::vector<VarIndex> vars
  );

  const PolyRing& source() const {return *mSource;}
  const std::shared_ptr<const PolyRing>& sourcePtr() const {return mSource;}
  const PolyRing& target() const {return *mTarget;}
  const std::shared_ptr<const PolyRing>& targetPtr() const {return mTarget;}

  /// The variables of the target hit by the map.
  const std::vector<VarIndex>& variables() const {return mVars;}

  /// The variables of the target not hit by the map.
  std::vector<VarIndex> complement() const;

  Poly image(const Poly& poly) const;

  /// The ideal generated by the images of the generators of ideal.
  Ideal image(const Ideal& ideal) const;

  /// The contraction of an ideal of the target: all polynomials of the
  /// source whose image lies in ideal.
  Ideal preimage(const Ideal& ideal, const SymbolicEngine& engine) const;

private:
  RingMap(
    std::shared_ptr<const PolyRing> source,
    std::shared_ptr<const PolyRing> target,
    std::vector<VarIndex> vars
  );

  std::shared_ptr<const PolyRing> mSource;
  std::shared_ptr<const PolyRing> mTarget;
  std::vector<VarIndex> mVars;
};

OMEGAFAN_NAMESPACE_END
#endif
