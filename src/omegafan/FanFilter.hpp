// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_FAN_FILTER_GUARD
#define OMEGAFAN_FAN_FILTER_GUARD

#include "PolyhedralFan.hpp"
#include "SecondaryFanInput.hpp"
#include "RegularSubdivision.hpp"
#include "SymbolicEngine.hpp"
#include <map>
#include <memory>
#include <ostream>
#include <vector>

OMEGAFAN_NAMESPACE_BEGIN

/// Which bound ideal the initial ideals are compared with.
enum FilterVariant {
  /// Omega(I): the initial ideal at w against the lower bound ideal at w.
  Omega,

  /// Omega*(I): the initial ideal at -w against the upper bound ideal at w.
  OmegaStar
};

enum ConeVerdict {
  /// The initial ideal equals the bound ideal at the cone's weight.
  Inside,

  /// The initial ideal differs from the bound ideal.
  Outside,

  /// The computation was stopped by a limit in partial results mode.
  Undecided
};

const char* verdictName(ConeVerdict verdict);

struct FilterParams {
  FilterParams():
    outside(false),
    threadCount(0),
    timeLimitSeconds(0),
    maxBasisSize(0),
    partialResults(false) {}

  /// Return the cones that fail instead of the fan of cones that pass.
  bool outside;

  /// The number of cones evaluated at the same time. 0 uses as many
  /// threads as TBB allows.
  unsigned int threadCount;

  /// Time allowed per cone. 0 means no limit.
  double timeLimitSeconds;

  /// Largest Groebner basis allowed. 0 means no limit.
  unsigned int maxBasisSize;

  /// If true, a cone whose computation exceeds a limit is Undecided.
  /// Otherwise the error aborts the filtering.
  bool partialResults;
};

/// Either the fan of passing cones or the rays and failing cones.
class FilterOutput {
public:
  explicit FilterOutput(PolyhedralFan fan);
  FilterOutput(std::vector<IntVector> rays, IncidenceMatrix cones);

  /// Returns true if this holds the fan of passing cones.
  bool isFan() const {return mFan.get() != 0;}

  /// Only call this if isFan().
  const PolyhedralFan& fan() const;

  const std::vector<IntVector>& rays() const;
  const IncidenceMatrix& cones() const;

private:
  std::shared_ptr<const PolyhedralFan> mFan;
  std::vector<IntVector> mRays;
  std::shared_ptr<const IncidenceMatrix> mCones;
};

/// The verdicts for all cones of a normalized secondary fan. Cone indices
/// refer to the rows of the incidence matrix of fan().
class FilterResult {
public:
  FilterResult(
    FilterVariant variant,
    PolyhedralFan fan,
    std::vector<IntVector> weights,
    std::vector<ConeVerdict> verdicts
  );

  FilterVariant variant() const {return mVariant;}
  const PolyhedralFan& fan() const {return mFan;}
  size_t coneCount() const {return mVerdicts.size();}

  ConeVerdict verdict(size_t cone) const {
    OMEGAFAN_ASSERT(cone < coneCount());
    return mVerdicts[cone];
  }

  /// The representative weight used for the cone.
  const IntVector& weight(size_t cone) const {
    OMEGAFAN_ASSERT(cone < coneCount());
    return mWeights[cone];
  }

  /// The cones with the given verdict in ascending order.
  std::vector<size_t> cones(ConeVerdict verdict) const;
  std::vector<size_t> insideCones() const {return cones(Inside);}
  std::vector<size_t> outsideCones() const {return cones(Outside);}
  std::vector<size_t> undecidedCones() const {return cones(Undecided);}

  /// The fan of the cones that passed, with the lineality space of fan().
  PolyhedralFan insideFan() const;

  /// The rays of fan() and the cones that failed. There is no lineality
  /// space since the cones do not in general form a fan.
  std::pair<std::vector<IntVector>, IncidenceMatrix> outsideData() const;

  /// Counts of cones by verdict for each cone dimension, counting the
  /// lineality space. The array is indexed by ConeVerdict.
  typedef std::map<size_t, std::vector<size_t>> DimensionCounts;
  DimensionCounts countsByDimension() const;

  /// Writes a table of countsByDimension().
  void printSummary(std::ostream& out) const;

  /// insideFan() or, if outside is true, outsideData().
  FilterOutput output(bool outside) const;

private:
  FilterVariant mVariant;
  PolyhedralFan mFan;
  std::vector<IntVector> mWeights;
  std::vector<ConeVerdict> mVerdicts;
};

/// Returns the interior weight of a cone: the sum of its rays made
/// primitive. The empty cone gets the zero vector.
IntVector representativeWeight(
  const PolyhedralFan& fan,
  size_t cone
);

/// Decides for one weight whether the initial ideal agrees with the bound
/// ideal of variant. Throws the errors of the engine.
bool coneAgrees(
  FilterVariant variant,
  const Ideal& ideal,
  const PointConfiguration& points,
  const IntVector& weight,
  const SymbolicEngine& engine
);

/// Evaluates every cone of the secondary fan independently, in parallel
/// unless params.threadCount is 1. The verdicts are in cone order
/// regardless of the order in which cones finish.
FilterResult filterFan(
  FilterVariant variant,
  const Ideal& ideal,
  const PointConfiguration& points,
  const SecondaryFanInput& secondaryFan,
  const FilterParams& params
);


/// Runs filterFan and keeps the part of the result params.outside asks for.
FilterOutput filterOutput(
  FilterVariant variant,
  const Ideal& ideal,
  const PointConfiguration& points,
  const SecondaryFanInput& secondaryFan,
  const FilterParams& params
);

/// Filters by Omega with default parameters apart from outside.
FilterOutput omegaFan(
  const Ideal& ideal,
  const PointConfiguration& points,
  const SecondaryFanInput& secondaryFan,
  bool outside
);

/// Filters by Omega* with default parameters apart from outside.
FilterOutput omegaStarFan(
  const Ideal& ideal,
  const PointConfiguration& points,
  const SecondaryFanInput& secondaryFan,
  bool outside
);

OMEGAFAN_NAMESPACE_END
#endif
