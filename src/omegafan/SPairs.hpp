// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_S_PAIRS_GUARD
#define OMEGAFAN_S_PAIRS_GUARD

#include "PolyBasis.hpp"
#include <utility>
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

// Stores the set of pending S-pairs for use in the classic Buchberger
// algorithm. Also eliminates useless S-pairs and orders the S-pairs by
// ascending lcm of the lead monomials (the normal selection strategy).
class SPairs {
public:
  explicit SPairs(const PolyBasis& basis);

  // Returns the number of S-pairs in the data structure.
  size_t pairCount() const {return mQueue.size();}

  // Returns true if there all S-pairs have been eliminated or popped.
  bool empty() const {return mQueue.empty();}

  // Removes the minimal S-pair from the data structure and return it.
  // Pairs that involve a retired basis element are skipped.
  //
  // Returns the pair (invalid,invalid) if there are no S-pairs left to
  // return, where invalid is static_cast<size_t>(-1). This can happen even
  // if empty() returned false prior to calling pop(), since the S-pairs in
  // the queue may have been found to be useless.
  std::pair<size_t, size_t> pop();

  // Add the pairs (index,a) to the data structure for those a such that
  // a < index and a is not retired. Pairs whose lead monomials are
  // relatively prime are eliminated.
  //
  // This method assumes that if lead(index) divides lead(x) for a basis
  // element x, then x will be retired from the basis and reduced. Such x
  // get no pair and are appended to toRetireAndReduce.
  void addPairsAssumeAutoReduce(
    size_t index,
    std::vector<size_t>& toRetireAndReduce
  );

  const PolyBasis& basis() const {return mBasis;}

  struct Stats {
    Stats():
      sPairsConsidered(0),
      relativelyPrimeHits(0)
    {}

    unsigned long long sPairsConsidered;
    unsigned long long relativelyPrimeHits;
  };
  Stats stats() const {return mStats;}

private:
  struct Pair {
    size_t a;
    size_t b;
    unsigned long long sequence; // tie breaker for equal lcms
    Monoid::Mono lcm;
  };

  // Orders pairs so that the heap top has the smallest lcm.
  class PairGreater {
  public:
    explicit PairGreater(const Monoid& monoid): mMonoid(&monoid) {}
    bool operator()(const Pair& x, const Pair& y) const;
  private:
    const Monoid* mMonoid;
  };

  const PolyBasis& mBasis;
  std::vector<Pair> mQueue; // a heap
  unsigned long long mSequence;
  Stats mStats;
};

OMEGAFAN_NAMESPACE_END
#endif
