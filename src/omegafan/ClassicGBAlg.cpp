// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "ClassicGBAlg.hpp"

#include "Errors.hpp"
#include "LogDomain.hpp"
#include <iostream>
#include <sstream>

OMEGAFAN_DEFINE_LOG_DOMAIN(
  GroebnerBasis,
  "Records the time spent computing Groebner bases and how many were "
  "computed."
);

OMEGAFAN_NAMESPACE_BEGIN

ClassicGBAlg::ClassicGBAlg(const Basis& basis):
  mCallback(0),
  mBreakAfter(0),
  mUseAutoTailReduction(false),
  mStoppedByCallback(false),
  mStoppedByLimit(false),
  mRing(basis.ring()),
  mReducer(basis.ring()),
  mBasis(basis.ring()),
  mSPairs(mBasis),
  mSPolyReductionCount(0)
{
  // Reduce and insert the generators of the ideal into the starting basis
  for (size_t gen = 0; gen != basis.size(); ++gen) {
    const auto& poly = basis.getPoly(gen);
    if (poly.isZero())
      continue;
    auto reduced = mReducer.classicReduce(poly, mBasis);
    if (!reduced->isZero())
      insertReducedPoly(std::move(reduced));
  }
}

void ClassicGBAlg::insertReducedPoly(
  std::unique_ptr<Poly> polyToInsert
) {
  OMEGAFAN_ASSERT(polyToInsert.get() != 0);
  if (polyToInsert->isZero())
    return;
  OMEGAFAN_ASSERT(mBasis.divisor(polyToInsert->leadMono()) ==
    static_cast<size_t>(-1));

  if (tracingLevel > 20) {
    std::cerr << "inserting basis element " << mBasis.size() << ": ";
    if (tracingLevel > 100) {
      polyToInsert->display(std::cerr);
      std::cerr << std::endl;
    } else {
      mRing.monoid().print
        (std::cerr, polyToInsert->leadMono(), mRing.varNames());
      if (polyToInsert->termCount() > 1)
        std::cerr << " + [...]";
      std::cerr << std::endl;
    }
  }

  std::vector<size_t> toRetireAndReduce;
  std::vector<std::unique_ptr<Poly>> toReduce;

  do {
    // reduce polynomial and insert into basis
    {
      std::unique_ptr<Poly> reduced;
      if (toReduce.empty()) // if first iteration
        reduced = std::move(polyToInsert);
      else {
        reduced = mReducer.classicReduce(*toReduce.back(), mBasis);
        if (tracingLevel > 20) {
          std::cerr << (reduced->isZero() ?
            "auto-top-reduce cascade: basis element reduced to zero." :
            "auto-top-reduce cascade: inserting reduced poly.")
            << std::endl;
        }
        toReduce.pop_back();
      }
      if (reduced->isZero())
        continue;
      reduced->makeMonic();
      mBasis.insert(std::move(reduced));
    }

    // form S-pairs and retire basis elements that become top reducible.
    const size_t newGen = mBasis.size() - 1;
    OMEGAFAN_ASSERT(toRetireAndReduce.empty());
    mSPairs.addPairsAssumeAutoReduce(newGen, toRetireAndReduce);
    for (auto it = toRetireAndReduce.begin();
      it != toRetireAndReduce.end(); ++it)
      toReduce.push_back(mBasis.retire(*it));
    toRetireAndReduce.clear();
  } while (!toReduce.empty());
}

void ClassicGBAlg::computeGrobnerBasis() {
  mTimer.reset();
  mStoppedByCallback = false;
  mStoppedByLimit = false;

  if (mUseAutoTailReduction)
    autoTailReduce();

  while (!mSPairs.empty()) {
    if (mCallback != 0 && !mCallback->call()) {
      mStoppedByCallback = true;
      break;
    }
    step();
    if (mBreakAfter != 0 && mBasis.activeSize() > mBreakAfter) {
      if (tracingLevel > 0) {
        std::cerr
          << "Stopping Grobner basis computation due to reaching limit of "
          << mBreakAfter << " basis elements." << std::endl;
      }
      mStoppedByLimit = true;
      break;
    }
  }
}

void ClassicGBAlg::step() {
  OMEGAFAN_ASSERT(!mSPairs.empty());
  if (tracingLevel > 30)
    std::cerr << "Determining next S-pair" << std::endl;

  const std::pair<size_t, size_t> p = mSPairs.pop();
  if (p.first == static_cast<size_t>(-1)) {
    OMEGAFAN_ASSERT(p.second == static_cast<size_t>(-1));
    return; // no more S-pairs
  }
  OMEGAFAN_ASSERT(!mBasis.retired(p.first));
  OMEGAFAN_ASSERT(!mBasis.retired(p.second));

  if (tracingLevel > 20) {
    std::cerr << "Reducing S-pair ("
              << p.first << ", "
              << p.second << ")" << std::endl;
  }
  ++mSPolyReductionCount;
  std::unique_ptr<Poly> reduced
    (mReducer.classicReduceSPoly
     (mBasis.poly(p.first), mBasis.poly(p.second), mBasis));
  if (!reduced->isZero()) {
    insertReducedPoly(std::move(reduced));
    if (mUseAutoTailReduction)
      autoTailReduce();
  }
}

void ClassicGBAlg::autoTailReduce() {
  for (size_t i = 0; i < mBasis.size(); ++i) {
    if (mBasis.retired(i))
      continue;
    mBasis.replaceSameLeadTerm
      (i, mReducer.classicTailReduce(mBasis.poly(i), mBasis));
  }
}

Basis ClassicGBAlg::reducedBasis() {
  OMEGAFAN_ASSERT(!stopped());
  autoTailReduce();
  Basis basis = mBasis.toBasis();
  basis.sort();
  return basis;
}

void ClassicGBAlg::printStats(std::ostream& out) const {
  out << " term order:         " << mRing.order().description() << '\n';
  out << " total compute time: " << mTimer.getMilliseconds() / 1000.0
    << " seconds " << '\n';

  mathic::ColumnPrinter pr;
  pr.addColumn(true, " ");
  pr.addColumn(false, " ");
  pr.addColumn(true, " ");

  std::ostream& name = pr[0];
  std::ostream& value = pr[1];
  std::ostream& extra = pr[2];

  const size_t basisSize = mBasis.activeSize();
  const size_t pending = mSPairs.pairCount();

  name << "Basis elements:\n";
  value << mathic::ColumnPrinter::commafy(basisSize) << '\n';
  extra << mathic::ColumnPrinter::commafy(mBasis.size() - basisSize)
        << " retired\n";

  const size_t basisTermCount = mBasis.termCount();
  name << "Terms for basis:\n";
  value << mathic::ColumnPrinter::commafy(basisTermCount) << '\n';
  extra << mathic::ColumnPrinter::ratioInteger(basisTermCount, basisSize)
        << " terms per basis ele\n";

  const SPairs::Stats sPairStats = mSPairs.stats();
  const unsigned long long considered = sPairStats.sPairsConsidered;
  name << "S-pairs considered:\n";
  value << mathic::ColumnPrinter::commafy(considered) << '\n';
  extra << '\n';

  name << "S-pairs pending:\n";
  value << mathic::ColumnPrinter::commafy(pending) << '\n';
  extra << mathic::ColumnPrinter::percentInteger(pending, considered)
        << " of considered\n";

  const unsigned long long primeHits = sPairStats.relativelyPrimeHits;
  name << "Buchb relatively prime:\n";
  value << mathic::ColumnPrinter::commafy(primeHits) << '\n';
  extra << mathic::ColumnPrinter::percentInteger(primeHits, considered)
        << " of S-pairs\n";

  const unsigned long long reductions = sPolyReductionCount();
  name << "S-pairs reduced:\n";
  value << mathic::ColumnPrinter::commafy(reductions) << '\n';
  extra << '\n';

  const Reducer::Stats& redStats = mReducer.classicStats();
  name << "Classic reductions:\n";
  value << mathic::ColumnPrinter::commafy(redStats.reductions) << '\n';
  extra << mathic::ColumnPrinter::percentInteger
    (redStats.zeroReductions, redStats.reductions) << " to zero\n";

  name << "Classic reduction steps:\n";
  value << mathic::ColumnPrinter::commafy(redStats.steps) << '\n';
  extra << mathic::ColumnPrinter::ratioInteger
    (redStats.steps, redStats.reductions) << " steps per reduction\n";

  name << "Longest classic red:\n";
  value << mathic::ColumnPrinter::commafy(redStats.maxSteps) << '\n';
  extra << '\n';

  out << "***** Classic Buchberger algorithm statistics *****\n"
      << pr << std::flush;
}

Basis computeGBClassicAlg(
  const Basis& basis,
  const ClassicGBAlgParams& params
) {
  OMEGAFAN_LOG_TIME(GroebnerBasis) << "Computing Groebner basis of "
    << basis.size() << " generators for "
    << basis.ring().order().description() << ".\n";
  OMEGAFAN_LOG_INCREMENT(GroebnerBasis);

  ClassicGBAlg alg(basis);
  alg.setBreakAfter(params.breakAfter);
  alg.setUseAutoTailReduction(params.useAutoTailReduction);
  alg.setCallback(params.callback);
  alg.computeGrobnerBasis();

  if (alg.stoppedByCallback())
    throw ComputationTimeout("Groebner basis computation was interrupted.");
  if (alg.stoppedByLimit()) {
    std::ostringstream out;
    out << "Groebner basis exceeded the limit of " << params.breakAfter
      << " elements.";
    throw BasisSizeLimitExceeded(out.str());
  }
  if (tracingLevel > 10)
    alg.printStats(std::cerr);
  return alg.reducedBasis();
}

OMEGAFAN_NAMESPACE_END
