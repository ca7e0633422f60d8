// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_SECONDARY_FAN_INPUT_GUARD
#define OMEGAFAN_SECONDARY_FAN_INPUT_GUARD

#include "PolyhedralFan.hpp"
#include "Ideal.hpp"
#include "SymbolicEngine.hpp"
#include <memory>

OMEGAFAN_NAMESPACE_BEGIN

/// The secondary fan to be filtered. It is either a complete fan object or
/// only rays and cones, as happens when the fan has been computed up to
/// symmetry and it would be too expensive to expand it.
class SecondaryFanInput {
public:
  enum Kind {
    ExpandedFan,
    SymmetryReducedPairs
  };

  static SecondaryFanInput expanded(PolyhedralFan fan);

  static SecondaryFanInput symmetryReducedPairs(
    std::vector<IntVector> rays,
    IncidenceMatrix cones
  );

  Kind kind() const {return mKind;}

  /// Returns the input as a fan. For rays and cones the lineality space is
  /// the lineality space of the point configuration of ideal, scaled to
  /// integer vectors.
  PolyhedralFan normalized(const Ideal& ideal, const SymbolicEngine& engine)
    const;

private:
  SecondaryFanInput(Kind kind, std::shared_ptr<const PolyhedralFan> fan);

  Kind mKind;
  std::shared_ptr<const PolyhedralFan> mFan; // no lineality for pairs
};

OMEGAFAN_NAMESPACE_END
#endif
