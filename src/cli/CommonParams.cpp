// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"
#include "CommonParams.hpp"

#include "omegafan/IdealIO.hpp"
#include "omegafan/LogDomain.hpp"
#include "omegafan/LogDomainSet.hpp"
#include "omegafan/Scanner.hpp"
#include <fstream>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

CommonParams::CommonParams(size_t minDirectParams, size_t maxDirectParams):
  mTracingLevel("tracingLevel",
    "Verbosity of the Groebner basis computations on standard error. "
    "0 prints nothing.",
    0),

  mThreadCount("threadCount",
    "The largest number of threads to use, which is also the largest "
    "number of cones filtered at the same time. 0 leaves the choice to "
    "TBB.",
    0),

  mLogs("logs",
    "Log commands separated by commas, like \"FanFilter,-GroebnerBasis+\". "
    "See \"help logs\" for the logs and the command syntax.",
    ""),

  mMinDirectParams(minDirectParams),
  mMaxDirectParams(maxDirectParams)
{
}

void CommonParams::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  if (tokens.size() < mMinDirectParams || tokens.size() > mMaxDirectParams) {
    std::ostringstream out;
    out << "Expected ";
    if (mMinDirectParams == mMaxDirectParams)
      out << mMinDirectParams;
    else
      out << "between " << mMinDirectParams << " and " << mMaxDirectParams;
    out << " input files but got " << tokens.size() << '.';
    mathic::reportError(out.str());
  }
  mDirectParameters = std::move(tokens);
}

void CommonParams::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  parameters.push_back(&mLogs);
  parameters.push_back(&mThreadCount);
  parameters.push_back(&mTracingLevel);
}

void CommonParams::perform() {
  LogDomainSet::singleton().performLogCommands(mLogs.value());
  tracingLevel = mTracingLevel.value();

  // The smallest limit of all live global_control objects applies, so the
  // old one has to go first.
  mThreadControl.reset();
  if (threadCount() != 0) {
    mThreadControl = make_unique<tbb::global_control>
      (tbb::global_control::max_allowed_parallelism, threadCount());
  }
}

size_t CommonParams::inputFileCount() const {
  return mDirectParameters.size();
}

const std::string& CommonParams::inputFileName(size_t i) const {
  OMEGAFAN_ASSERT(i < inputFileCount());
  return mDirectParameters[i];
}

Ideal CommonParams::readInputIdeal(size_t i) const {
  const auto& fileName = inputFileName(i);
  std::ifstream file(fileName.c_str());
  if (file.fail())
    mathic::reportError("Cannot open \"" + fileName + "\".");
  Scanner in(file);
  return readIdeal(in);
}

OMEGAFAN_NAMESPACE_END
