// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_POLYHEDRAL_FAN_GUARD
#define OMEGAFAN_POLYHEDRAL_FAN_GUARD

#include "IncidenceMatrix.hpp"
#include "QQMatrix.hpp"
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

/// A polyhedral fan given by rays, a lineality space shared by all cones
/// and the incidence matrix of cones versus rays. Cone i is the set of
/// non-negative combinations of the rays in row i plus the lineality
/// space, so an empty row is the lineality space itself.
///
/// A fan is immutable. Operations that select cones return a new fan.
class PolyhedralFan {
public:
  /// Throws InconsistentDimensionError if a ray or lineality vector does
  /// not have ambientDim entries or the incidence matrix does not have one
  /// column per ray.
  PolyhedralFan(
    size_t ambientDim,
    std::vector<IntVector> rays,
    IncidenceMatrix cones,
    std::vector<IntVector> lineality
  );

  size_t ambientDimension() const {return mAmbientDim;}
  const std::vector<IntVector>& rays() const {return mRays;}
  const IncidenceMatrix& cones() const {return mCones;}
  const std::vector<IntVector>& lineality() const {return mLineality;}
  size_t rayCount() const {return mRays.size();}
  size_t coneCount() const {return mCones.rowCount();}

  /// The dimension of the lineality space.
  size_t linealityDimension() const;

  /// The dimension of the cone with the given index, counting the
  /// lineality space.
  size_t coneDimension(size_t cone) const;

  /// The largest cone dimension, or the lineality dimension if there are
  /// no cones.
  size_t dimension() const;

  /// The indices of the cones that are not contained in another cone. A
  /// cone that appears twice is reported once, at its first index.
  std::vector<size_t> maximalCones() const;

  /// Returns true if the cones cover the ambient space: every maximal cone
  /// is full dimensional and every facet of a maximal cone is a facet of
  /// exactly two maximal cones. A fan whose lineality space is the whole
  /// space is complete.
  bool isComplete() const;

  /// The fan of the given cones with the same rays and lineality space.
  PolyhedralFan restrictedTo(const std::vector<size_t>& cones) const;

private:
  // Returns the rays of the row as rational vectors together with the
  // lineality space.
  std::vector<QQVector> spanningVectors(const IndexSet& rays) const;

  size_t mAmbientDim;
  std::vector<IntVector> mRays;
  IncidenceMatrix mCones;
  std::vector<IntVector> mLineality;
};

OMEGAFAN_NAMESPACE_END
#endif
