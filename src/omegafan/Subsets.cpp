// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Subsets.hpp"

#include <algorithm>

OMEGAFAN_NAMESPACE_BEGIN

std::vector<IndexSet> subsetsLex(const IndexSet& set, const size_t k) {
  OMEGAFAN_ASSERT(std::is_sorted(set.begin(), set.end()));
  std::vector<IndexSet> subsets;
  forEachSubset(set.size(), k, [&](const IndexSet& positions) {
    IndexSet subset;
    subset.reserve(k);
    for (auto it = positions.begin(); it != positions.end(); ++it)
      subset.push_back(set[*it]);
    subsets.push_back(std::move(subset));
    return true;
  });
  return subsets;
}

std::vector<IndexSet> subsetsRevLex(const IndexSet& set, const size_t k) {
  auto subsets = subsetsLex(set, k);
  std::stable_sort(subsets.begin(), subsets.end(),
    [](const IndexSet& a, const IndexSet& b) {
      return std::lexicographical_compare
        (a.rbegin(), a.rend(), b.rbegin(), b.rend());
    });
  return subsets;
}

IndexSet range(const size_t size) {
  IndexSet set(size);
  for (size_t i = 0; i < size; ++i)
    set[i] = i;
  return set;
}

IndexSet complement(const IndexSet& set, const size_t size) {
  OMEGAFAN_ASSERT(std::is_sorted(set.begin(), set.end()));
  IndexSet other;
  for (size_t i = 0; i < size; ++i)
    if (!std::binary_search(set.begin(), set.end(), i))
      other.push_back(i);
  return other;
}

OMEGAFAN_NAMESPACE_END
