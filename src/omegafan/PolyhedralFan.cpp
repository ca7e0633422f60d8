// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "PolyhedralFan.hpp"

#include "Errors.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

namespace {
  void checkLengths(
    const std::vector<IntVector>& vectors,
    const size_t ambientDim,
    const char* const what
  ) {
    for (size_t i = 0; i < vectors.size(); ++i) {
      if (vectors[i].size() != ambientDim) {
        std::ostringstream out;
        out << what << ' ' << i << " has " << vectors[i].size()
          << " entries but the ambient dimension is " << ambientDim << '.';
        throw InconsistentDimensionError(out.str());
      }
    }
  }
}

PolyhedralFan::PolyhedralFan(
  const size_t ambientDim,
  std::vector<IntVector> rays,
  IncidenceMatrix cones,
  std::vector<IntVector> lineality
):
  mAmbientDim(ambientDim),
  mRays(std::move(rays)),
  mCones(std::move(cones)),
  mLineality(std::move(lineality))
{
  checkLengths(mRays, mAmbientDim, "Ray");
  checkLengths(mLineality, mAmbientDim, "Lineality vector");
  if (mCones.colCount() != mRays.size()) {
    std::ostringstream out;
    out << "The cone incidence matrix has " << mCones.colCount()
      << " columns but there are " << mRays.size() << " rays.";
    throw InconsistentDimensionError(out.str());
  }
}

std::vector<QQVector> PolyhedralFan::spanningVectors(
  const IndexSet& rays
) const {
  std::vector<QQVector> vectors;
  vectors.reserve(rays.size() + mLineality.size());
  for (auto it = rays.begin(); it != rays.end(); ++it)
    vectors.push_back(QQVector(mRays[*it].begin(), mRays[*it].end()));
  for (auto it = mLineality.begin(); it != mLineality.end(); ++it)
    vectors.push_back(QQVector(it->begin(), it->end()));
  return vectors;
}

size_t PolyhedralFan::linealityDimension() const {
  return QQMatrix::fromIntegerRows(mLineality, mAmbientDim).rank();
}

size_t PolyhedralFan::coneDimension(const size_t cone) const {
  if (cone >= coneCount())
    throw InconsistentDimensionError("Cone index out of range.");
  return QQMatrix(spanningVectors(mCones.row(cone)), mAmbientDim).rank();
}

size_t PolyhedralFan::dimension() const {
  if (coneCount() == 0)
    return linealityDimension();
  size_t dim = 0;
  for (size_t cone = 0; cone < coneCount(); ++cone)
    dim = std::max(dim, coneDimension(cone));
  return dim;
}

std::vector<size_t> PolyhedralFan::maximalCones() const {
  std::vector<size_t> maximal;
  for (size_t a = 0; a < coneCount(); ++a) {
    bool isMaximal = true;
    for (size_t b = 0; b < coneCount() && isMaximal; ++b) {
      if (a == b || !mCones.rowIsSubset(a, b))
        continue;
      if (mCones.row(a).size() < mCones.row(b).size() || b < a)
        isMaximal = false;
    }
    if (isMaximal)
      maximal.push_back(a);
  }
  return maximal;
}

bool PolyhedralFan::isComplete() const {
  const auto linealityDim = linealityDimension();
  if (linealityDim == mAmbientDim)
    return true;
  const auto maximal = maximalCones();
  if (maximal.empty())
    return false;

  // Each facet of a full dimensional cone is spanned by the lineality
  // space and facetRays of its rays. The facet is identified by the set of
  // all rays of the cone that it contains.
  const size_t facetRays = mAmbientDim - 1 - linealityDim;
  std::map<IndexSet, size_t> facetCounts;
  for (auto cone = maximal.begin(); cone != maximal.end(); ++cone) {
    if (coneDimension(*cone) != mAmbientDim)
      return false;
    const auto& rays = mCones.row(*cone);

    std::set<IndexSet> facets;
    forEachSubset(rays.size(), facetRays, [&](const IndexSet& positions) {
      IndexSet subset;
      for (auto it = positions.begin(); it != positions.end(); ++it)
        subset.push_back(rays[*it]);
      const QQMatrix span(spanningVectors(subset), mAmbientDim);
      if (span.rank() != mAmbientDim - 1)
        return true;
      const auto normal = span.kernel().row(0);

      int side = 0;
      IndexSet facet;
      for (auto ray = rays.begin(); ray != rays.end(); ++ray) {
        const QQVector r(mRays[*ray].begin(), mRays[*ray].end());
        const int s = sgn(dot(normal, r));
        if (s == 0)
          facet.push_back(*ray);
        else if (side == 0)
          side = s;
        else if (side != s)
          return true; // the hyperplane cuts through the cone
      }
      facets.insert(std::move(facet));
      return true;
    });
    for (auto it = facets.begin(); it != facets.end(); ++it)
      ++facetCounts[*it];
  }

  for (auto it = facetCounts.begin(); it != facetCounts.end(); ++it)
    if (it->second != 2)
      return false;
  return true;
}

PolyhedralFan PolyhedralFan::restrictedTo(
  const std::vector<size_t>& cones
) const {
  return PolyhedralFan
    (mAmbientDim, mRays, mCones.restrictedTo(cones), mLineality);
}

OMEGAFAN_NAMESPACE_END
