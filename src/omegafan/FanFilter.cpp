// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "FanFilter.hpp"

#include "BoundIdeals.hpp"
#include "Errors.hpp"
#include "LogDomain.hpp"
#include <mathic.h>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <sstream>

OMEGAFAN_DEFINE_LOG_DOMAIN(
  FanFilter,
  "Shows the weight and verdict of each cone of a filtered secondary fan "
  "and counts the cones that were decided."
);

OMEGAFAN_DEFINE_LOG_DOMAIN_WITH_DEFAULTS(
  FanFilterTime,
  "Records the time spent filtering secondary fans.",
  0, 0, 1
);

OMEGAFAN_NAMESPACE_BEGIN

const char* verdictName(const ConeVerdict verdict) {
  switch (verdict) {
  case Inside: return "inside";
  case Outside: return "outside";
  case Undecided: return "undecided";
  }
  OMEGAFAN_UNREACHABLE;
}

FilterResult::FilterResult(
  const FilterVariant variant,
  PolyhedralFan fan,
  std::vector<IntVector> weights,
  std::vector<ConeVerdict> verdicts
):
  mVariant(variant),
  mFan(std::move(fan)),
  mWeights(std::move(weights)),
  mVerdicts(std::move(verdicts))
{
  OMEGAFAN_ASSERT(mVerdicts.size() == mFan.coneCount());
  OMEGAFAN_ASSERT(mWeights.size() == mFan.coneCount());
}

std::vector<size_t> FilterResult::cones(const ConeVerdict verdict) const {
  std::vector<size_t> selected;
  for (size_t cone = 0; cone < coneCount(); ++cone)
    if (mVerdicts[cone] == verdict)
      selected.push_back(cone);
  return selected;
}

PolyhedralFan FilterResult::insideFan() const {
  return mFan.restrictedTo(insideCones());
}

std::pair<std::vector<IntVector>, IncidenceMatrix>
FilterResult::outsideData() const {
  return std::make_pair(mFan.rays(), mFan.cones().restrictedTo(outsideCones()));
}

FilterResult::DimensionCounts FilterResult::countsByDimension() const {
  DimensionCounts counts;
  for (size_t cone = 0; cone < coneCount(); ++cone) {
    auto& count = counts[mFan.coneDimension(cone)];
    count.resize(3);
    ++count[mVerdicts[cone]];
  }
  return counts;
}

void FilterResult::printSummary(std::ostream& out) const {
  mathic::ColumnPrinter pr;
  auto& dim = pr.addColumn(false, " ");
  auto& inside = pr.addColumn(false, "  ");
  auto& outside = pr.addColumn(false, "  ");
  auto& undecided = pr.addColumn(false, "  ");
  dim << "dim\n";
  inside << "inside\n";
  outside << "outside\n";
  undecided << "undecided\n";

  const auto counts = countsByDimension();
  for (auto it = counts.begin(); it != counts.end(); ++it) {
    dim << it->first << '\n';
    inside << mathic::ColumnPrinter::commafy(it->second[Inside]) << '\n';
    outside << mathic::ColumnPrinter::commafy(it->second[Outside]) << '\n';
    undecided << mathic::ColumnPrinter::commafy(it->second[Undecided])
      << '\n';
  }
  out << (mVariant == Omega ? "Omega" : "Omega*") << " filter of "
    << coneCount() << " cones:\n" << pr;
}

FilterOutput FilterResult::output(const bool outside) const {
  if (!outside)
    return FilterOutput(insideFan());
  auto data = outsideData();
  return FilterOutput(std::move(data.first), std::move(data.second));
}

IntVector representativeWeight(const PolyhedralFan& fan, const size_t cone) {
  if (cone >= fan.coneCount())
    throw InconsistentDimensionError("Cone index out of range.");
  IntVector sum(fan.ambientDimension());
  const auto& rays = fan.cones().row(cone);
  for (auto ray = rays.begin(); ray != rays.end(); ++ray) {
    const auto& r = fan.rays()[*ray];
    for (size_t i = 0; i < sum.size(); ++i)
      sum[i] += r[i];
  }
  return primitive(sum);
}

bool coneAgrees(
  const FilterVariant variant,
  const Ideal& ideal,
  const PointConfiguration& points,
  const IntVector& weight,
  const SymbolicEngine& engine
) {
  if (variant == Omega) {
    const Ideal initial = engine.initial(ideal, MinValuation, weight);
    return engine.equal(initial, idealW(ideal, weight, points, engine));
  }

  // The upper bound at w is compared with the initial ideal at -w.
  IntVector negated(weight.size());
  for (size_t i = 0; i < weight.size(); ++i)
    negated[i] = -weight[i];
  const Ideal initial = engine.initial(ideal, MinValuation, negated);
  return engine.equal(initial, idealUpW(ideal, weight, points, engine));
}

FilterResult filterFan(
  const FilterVariant variant,
  const Ideal& ideal,
  const PointConfiguration& points,
  const SecondaryFanInput& secondaryFan,
  const FilterParams& params
) {
  OMEGAFAN_LOG_TIME(FanFilterTime);
  if (points.size() != ideal.varCount()) {
    std::ostringstream out;
    out << "The point configuration has " << points.size()
      << " points but the ring has " << ideal.varCount() << " variables.";
    throw InconsistentDimensionError(out.str());
  }

  const SymbolicEngine setupEngine;
  auto fan = secondaryFan.normalized(ideal, setupEngine);
  const auto coneCount = fan.coneCount();
  std::vector<IntVector> weights;
  weights.reserve(coneCount);
  for (size_t cone = 0; cone < coneCount; ++cone)
    weights.push_back(representativeWeight(fan, cone));

  GroebnerBasisLimits limits;
  limits.maxBasisSize = params.maxBasisSize;
  limits.seconds = params.timeLimitSeconds;

  // Every cone writes only its own verdict, so no locking is needed.
  std::vector<ConeVerdict> verdicts(coneCount, Undecided);
  auto evaluate = [&](const size_t cone) {
    const SymbolicEngine engine(limits);
    try {
      const bool agrees =
        coneAgrees(variant, ideal, points, weights[cone], engine);
      verdicts[cone] = agrees ? Inside : Outside;
    } catch (const BasisSizeLimitExceeded&) {
      if (!params.partialResults)
        throw;
      verdicts[cone] = Undecided;
    } catch (const ComputationTimeout&) {
      if (!params.partialResults)
        throw;
      verdicts[cone] = Undecided;
    }
  };

  if (params.threadCount == 1) {
    for (size_t cone = 0; cone < coneCount; ++cone)
      evaluate(cone);
  } else {
    std::unique_ptr<tbb::global_control> control;
    if (params.threadCount > 1) {
      control = make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism,
        params.threadCount
      );
    }
    tbb::parallel_for(tbb::blocked_range<size_t>(0, coneCount),
      [&](const tbb::blocked_range<size_t>& range) {
        for (auto cone = range.begin(); cone != range.end(); ++cone)
          evaluate(cone);
      }
    );
  }

  size_t decided = 0;
  for (auto it = verdicts.begin(); it != verdicts.end(); ++it)
    if (*it != Undecided)
      ++decided;
  OMEGAFAN_LOGGER(FanFilter).increment(decided);
  OMEGAFAN_IF_STREAM_LOG(FanFilter) {
    auto out = log.stream();
    for (size_t cone = 0; cone < coneCount; ++cone) {
      out << "cone " << cone << " weight (";
      const auto& w = weights[cone];
      for (size_t i = 0; i < w.size(); ++i)
        out << (i == 0 ? "" : ", ") << w[i];
      out << ") " << verdictName(verdicts[cone]) << '\n';
    }
  };

  return FilterResult
    (variant, std::move(fan), std::move(weights), std::move(verdicts));
}

FilterOutput::FilterOutput(PolyhedralFan fan):
  mFan(std::make_shared<const PolyhedralFan>(std::move(fan)))
{}

FilterOutput::FilterOutput(
  std::vector<IntVector> rays,
  IncidenceMatrix cones
):
  mRays(std::move(rays)),
  mCones(std::make_shared<const IncidenceMatrix>(std::move(cones)))
{}

const PolyhedralFan& FilterOutput::fan() const {
  OMEGAFAN_ASSERT(isFan());
  return *mFan;
}

const std::vector<IntVector>& FilterOutput::rays() const {
  return isFan() ? mFan->rays() : mRays;
}

const IncidenceMatrix& FilterOutput::cones() const {
  return isFan() ? mFan->cones() : *mCones;
}

FilterOutput filterOutput(
  const FilterVariant variant,
  const Ideal& ideal,
  const PointConfiguration& points,
  const SecondaryFanInput& secondaryFan,
  const FilterParams& params
) {
  return filterFan(variant, ideal, points, secondaryFan, params)
    .output(params.outside);
}

FilterOutput omegaFan(
  const Ideal& ideal,
  const PointConfiguration& points,
  const SecondaryFanInput& secondaryFan,
  const bool outside
) {
  FilterParams params;
  params.outside = outside;
  return filterOutput(Omega, ideal, points, secondaryFan, params);
}

FilterOutput omegaStarFan(
  const Ideal& ideal,
  const PointConfiguration& points,
  const SecondaryFanInput& secondaryFan,
  const bool outside
) {
  FilterParams params;
  params.outside = outside;
  return filterOutput(OmegaStar, ideal, points, secondaryFan, params);
}

OMEGAFAN_NAMESPACE_END
