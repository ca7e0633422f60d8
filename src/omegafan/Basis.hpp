// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_BASIS_GUARD
#define OMEGAFAN_BASIS_GUARD

#include "Poly.hpp"
#include "PolyRing.hpp"
#include <memory>
#include <vector>
#include <ostream>

OMEGAFAN_NAMESPACE_BEGIN

/// A list of polynomials over a common ring.
class Basis {
public:
  explicit Basis(const PolyRing& ring): mRing(ring) {}
  Basis(Basis&& basis):
    mRing(basis.ring()), mGenerators(std::move(basis.mGenerators)) {}

  void insert(std::unique_ptr<Poly>&& p);
  void insert(Poly&& p) {insert(make_unique<Poly>(std::move(p)));}

  /// Returns a deep copy of this basis.
  Basis clone() const;

  /// Returns the image of every polynomial under Poly::mapped.
  Basis mapped(
    const PolyRing& target,
    const std::vector<PolyRing::VarIndex>& images
  ) const;

  /// Writes the polynomials separated by ",\n", one per line.
  void display(std::ostream& out) const;

  const PolyRing& ring() const {return mRing;}

  const Poly& getPoly(size_t i) const {
    OMEGAFAN_ASSERT(i < size());
    return *mGenerators[i];
  }
  size_t size() const {return mGenerators.size();}
  bool empty() const {return mGenerators.empty();}
  void reserve(size_t size) {mGenerators.reserve(size);}

  /// Sorts the polynomials by ascending lead monomial. Zero polynomials
  /// come first.
  void sort();

  /// Returns true if both bases have the same polynomials in the same
  /// order.
  bool operator==(const Basis& basis) const;

private:
  Basis(const Basis&); // not available
  void operator=(const Basis&); // not available

  const PolyRing& mRing;
  std::vector<std::unique_ptr<Poly>> mGenerators;
};

OMEGAFAN_NAMESPACE_END
#endif
