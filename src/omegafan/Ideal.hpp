// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_IDEAL_GUARD
#define OMEGAFAN_IDEAL_GUARD

#include "Basis.hpp"
#include "PolyRing.hpp"
#include <memory>
#include <ostream>

OMEGAFAN_NAMESPACE_BEGIN

/// An ideal given by a finite list of generators in a fixed ring. Ideals
/// are immutable, so copies share the ring and the generators.
///
/// Two ideals are the same ideal when their reduced Groebner bases agree,
/// which is decided by SymbolicEngine::equal. The operators here only deal
/// with generators.
class Ideal {
public:
  typedef PolyRing::VarIndex VarIndex;

  /// The generators must be polynomials of *ring.
  Ideal(std::shared_ptr<const PolyRing> ring, Basis generators);

  /// The zero ideal of ring.
  static Ideal zero(std::shared_ptr<const PolyRing> ring);

  /// The ideal generated by 1.
  static Ideal unit(std::shared_ptr<const PolyRing> ring);

  /// The ideal generated by the given variables of ring.
  static Ideal variables(
    std::shared_ptr<const PolyRing> ring,
    const std::vector<VarIndex>& vars
  );

  const PolyRing& ring() const {return *mRing;}
  const std::shared_ptr<const PolyRing>& ringPtr() const {return mRing;}
  VarIndex varCount() const {return mRing->varCount();}

  const Basis& generators() const {return *mGenerators;}
  size_t generatorCount() const {return mGenerators->size();}
  const Poly& generator(size_t i) const {return mGenerators->getPoly(i);}

  /// Returns true if every generator is zero.
  bool isZero() const;

  /// Returns true if some generator is a non-zero constant. The unit ideal
  /// may have other generating sets, see SymbolicEngine::isUnit.
  bool hasUnitGenerator() const;

  /// The sum of two ideals, generated by the generators of both. The
  /// rings must have the same variables.
  Ideal operator+(const Ideal& ideal) const;

  /// Returns the same ideal with generators in ring, which must have the
  /// same variables as ring(). Use this to change the monomial order.
  Ideal inRing(std::shared_ptr<const PolyRing> ring) const;

  /// Writes the ring and the generators as Q[x,y] {x*y - 1, x^2}.
  void display(std::ostream& out) const;

private:
  std::shared_ptr<const PolyRing> mRing;
  std::shared_ptr<const Basis> mGenerators;
};

inline std::ostream& operator<<(std::ostream& out, const Ideal& ideal) {
  ideal.display(out);
  return out;
}

OMEGAFAN_NAMESPACE_END
#endif
