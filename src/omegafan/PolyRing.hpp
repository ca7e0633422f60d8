// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_POLY_RING_GUARD
#define OMEGAFAN_POLY_RING_GUARD

#include "Monoid.hpp"
#include <gmpxx.h>
#include <memory>
#include <string>
#include <vector>
#include <ostream>

OMEGAFAN_NAMESPACE_BEGIN

/// A polynomial ring over the rational numbers with named variables in a
/// fixed order together with a monomial order.
///
/// The variable order is the bijection between variables and the points
/// of a point configuration, so it never changes. Changing the monomial
/// order gives a new ring with the same variables, see withOrder().
class PolyRing {
public:
  typedef Monoid::VarIndex VarIndex;
  typedef Monoid::Exponent Exponent;
  typedef mpq_class Coefficient;

  PolyRing(std::vector<std::string> varNames, const TermOrder& order);

  /// A ring with graded reverse lexicographic order.
  explicit PolyRing(std::vector<std::string> varNames);

  /// A ring with variables x1, ..., xn and graded reverse lexicographic
  /// order.
  static std::shared_ptr<const PolyRing> standard(VarIndex varCount);

  VarIndex varCount() const {return mVarNames.size();}
  const std::vector<std::string>& varNames() const {return mVarNames;}
  const std::string& varName(VarIndex var) const {
    OMEGAFAN_ASSERT(var < varCount());
    return mVarNames[var];
  }

  /// Returns the index of the variable with the given name or
  /// static_cast<VarIndex>(-1) if there is no such variable.
  VarIndex varIndex(const std::string& name) const;

  const Monoid& monoid() const {return mMonoid;}
  const TermOrder& order() const {return mMonoid.order();}

  /// Returns true if the two rings have the same variables in the same
  /// order. The monomial orders may differ.
  bool sameVariables(const PolyRing& ring) const {
    return mVarNames == ring.mVarNames;
  }

  /// Returns a ring with the same variables and the given order.
  std::shared_ptr<const PolyRing> withOrder(const TermOrder& order) const;

  /// Returns a ring with an additional last variable of the given name
  /// and graded reverse lexicographic order.
  std::shared_ptr<const PolyRing> withExtraVariable(
    const std::string& name
  ) const;

  /// Returns a ring on the variables with the given sorted indices and
  /// graded reverse lexicographic order.
  std::shared_ptr<const PolyRing> subring(
    const std::vector<VarIndex>& vars
  ) const;

  /// Writes the ring as Q[x1,x2,...].
  void write(std::ostream& out) const;

private:
  std::vector<std::string> mVarNames;
  Monoid mMonoid;
};

OMEGAFAN_NAMESPACE_END
#endif
