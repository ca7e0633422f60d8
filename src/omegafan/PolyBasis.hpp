// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_POLY_BASIS_GUARD
#define OMEGAFAN_POLY_BASIS_GUARD

#include "Poly.hpp"
#include "Basis.hpp"
#include <vector>
#include <memory>

OMEGAFAN_NAMESPACE_BEGIN

/// The basis of a Groebner basis computation in progress. Elements are
/// never moved, so an index refers to the same element for the whole
/// computation. Elements whose lead monomial becomes divisible by the lead
/// monomial of a newer element are retired.
class PolyBasis {
public:
  // Ring must live for as long as this object.
  explicit PolyBasis(const PolyRing& ring): mRing(ring) {}

  // Inserts a polynomial into the basis at index size().
  // Lead monomials must be unique among basis elements.
  // So the index is size() - 1 afterwards since size() will increase by 1.
  void insert(std::unique_ptr<Poly> poly);

  // Returns the index of a basis element whose lead term divides mono.
  // Returns -1 if there is no such basis element.
  size_t divisor(Poly::ConstMonoPtr mono) const;

  // Replaces basis element at index with the given new value. The lead
  // term of the new polynomial must be the same as the previous one.
  void replaceSameLeadTerm(size_t index, std::unique_ptr<Poly> newValue) {
    OMEGAFAN_ASSERT(index < size());
    OMEGAFAN_ASSERT(!retired(index));
    OMEGAFAN_ASSERT(newValue.get() != 0);
    OMEGAFAN_ASSERT(!newValue->isZero());
    OMEGAFAN_ASSERT(monoid().equal(leadMono(index), newValue->leadMono()));
    mEntries[index].poly = std::move(newValue);
  }

  // Returns the number of basis elements, including retired elements.
  size_t size() const {return mEntries.size();}

  // Returns the number of basis elements that are not retired.
  size_t activeSize() const {return mActiveSize;}

  const PolyRing& ring() const {return mRing;}
  const Monoid& monoid() const {return mRing.monoid();}

  // Retires the basis element at index and returns it. The element is no
  // longer used for reduction or S-pairs.
  std::unique_ptr<Poly> retire(size_t index) {
    OMEGAFAN_ASSERT(index < size());
    OMEGAFAN_ASSERT(!retired(index));
    mEntries[index].retired = true;
    --mActiveSize;
    return std::move(mEntries[index].poly);
  }

  // Returns true of the basis element at index has been retired.
  bool retired(size_t index) const {
    OMEGAFAN_ASSERT(index < size());
    return mEntries[index].retired;
  }

  // Returns the basis element polynomial at index.
  const Poly& poly(size_t index) const {
    OMEGAFAN_ASSERT(index < size());
    OMEGAFAN_ASSERT(!retired(index));
    return *mEntries[index].poly;
  }

  Poly::ConstMonoPtr leadMono(size_t index) const {
    return poly(index).leadMono();
  }

  const Poly::Coefficient& leadCoef(size_t index) const {
    return poly(index).leadCoef();
  }

  // Returns the total number of terms of the active elements.
  size_t termCount() const;

  // Moves the active elements into a Basis. The basis is empty afterwards.
  Basis toBasis();

private:
  struct Entry {
    Entry(): retired(false) {}
    Entry(Entry&& entry):
      poly(std::move(entry.poly)), retired(entry.retired) {}

    std::unique_ptr<Poly> poly;
    bool retired;
  };

  const PolyRing& mRing;
  std::vector<Entry> mEntries;
  size_t mActiveSize = 0;
};

OMEGAFAN_NAMESPACE_END
#endif
