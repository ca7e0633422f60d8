// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_SUBSETS_GUARD
#define OMEGAFAN_SUBSETS_GUARD

#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

typedef std::vector<size_t> IndexSet;

/// Returns the subsets of size k of the sorted list set in lexicographic
/// order. For example the 2-subsets of {1,2,3} are {1,2}, {1,3}, {2,3}.
std::vector<IndexSet> subsetsLex(const IndexSet& set, size_t k);

/// Returns the subsets of size k of the sorted list set in reverse
/// lexicographic order, that is ordered by the largest element first,
/// then the next largest and so on. For example the 2-subsets of {1,2,3}
/// are {1,2}, {1,3}, {2,3} and the 2-subsets of {1,2,3,4} start with
/// {1,2}, {1,3}, {2,3}, {1,4}.
std::vector<IndexSet> subsetsRevLex(const IndexSet& set, size_t k);

/// Returns the set {0, 1, ..., size - 1}.
IndexSet range(size_t size);

/// Returns the elements of {0, ..., size - 1} that are not in the sorted
/// list set.
IndexSet complement(const IndexSet& set, size_t size);

/// Calls f with each subset of size k of {0, 1, ..., size - 1} in
/// lexicographic order until f returns false. Returns false if f did.
template<class Function>
bool forEachSubset(size_t size, size_t k, Function&& f) {
  if (k > size)
    return true;
  IndexSet subset(k);
  for (size_t i = 0; i < k; ++i)
    subset[i] = i;
  while (true) {
    if (!f(static_cast<const IndexSet&>(subset)))
      return false;
    // Find the last entry that can still be increased.
    size_t i = k;
    while (i > 0 && subset[i - 1] == size - k + (i - 1))
      --i;
    if (i == 0)
      return true;
    ++subset[i - 1];
    for (size_t j = i; j < k; ++j)
      subset[j] = subset[j - 1] + 1;
  }
}

OMEGAFAN_NAMESPACE_END
#endif
