// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"
#include "OmegaAction.hpp"

#include "omegafan/FanFilter.hpp"
#include "omegafan/Lineality.hpp"
#include "omegafan/SecondaryFanInput.hpp"
#include "omegafan/TropicalIO.hpp"
#include <fstream>
#include <iostream>

OMEGAFAN_NAMESPACE_BEGIN

OmegaAction::OmegaAction():
  mParams(2, 2),

  mStar(
    "star",
    "Filter by Omega* instead of Omega. A cone passes if the initial ideal "
    "at -w equals the upper bound ideal at w.",
    false),

  mOutside(
    "outside",
    "Write the rays and the cones that fail instead of the fan of the "
    "cones that pass.",
    false),

  mOrbits(
    "orbits",
    "Read the cones from the CONES_ORBITS section of the fan file instead "
    "of the CONES section.",
    false),

  mNegateRays(
    "negateRays",
    "Negate every ray of the fan file. Use this when the secondary fan "
    "was computed with the opposite sign convention.",
    false),

  mTimeLimit(
    "timeLimit",
    "The number of seconds allowed for each cone. A value of 0 means no "
    "limit.",
    0),

  mMaxBasisSize(
    "maxBasisSize",
    "Give up on a cone if a Groebner basis gets more elements than this. "
    "A value of 0 means no limit.",
    0),

  mPartial(
    "partial",
    "Mark a cone that exceeds a limit as undecided and go on instead of "
    "stopping with an error.",
    false),

  mOutput(
    "output",
    "Write the resulting fan to this file. The fan goes to standard output "
    "if no file is given.",
    "")
{}

void OmegaAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(tokens, parser);
}

void OmegaAction::performAction() {
  mParams.perform();

  const auto ideal = mParams.readInputIdeal(0);
  const auto& fanFileName = mParams.inputFileName(1);
  std::ifstream fanFile(fanFileName.c_str());
  if (fanFile.fail())
    mathic::reportError("Could not read fan file \"" + fanFileName + "\".\n");
  auto raysAndCones =
    parseTropicalFan(fanFile, mOrbits.value(), mNegateRays.value());

  const SymbolicEngine engine;
  const auto points = pointConfiguration(ideal, engine);
  const auto secondaryFan = SecondaryFanInput::symmetryReducedPairs(
    std::move(raysAndCones.first),
    std::move(raysAndCones.second)
  );

  FilterParams params;
  params.outside = mOutside.value();
  params.threadCount = mParams.threadCount();
  params.timeLimitSeconds = mTimeLimit.value();
  params.maxBasisSize = mMaxBasisSize.value();
  params.partialResults = mPartial.value();

  const auto variant = mStar.value() ? OmegaStar : Omega;
  const auto result =
    filterFan(variant, ideal, points, secondaryFan, params);

  result.printSummary(std::cerr);

  std::ofstream outFile;
  if (!mOutput.value().empty()) {
    outFile.open(mOutput.value().c_str());
    if (outFile.fail())
      mathic::reportError
        ("Could not write output file \"" + mOutput.value() + "\".\n");
  }
  std::ostream& out = mOutput.value().empty() ? std::cout : outFile;

  const auto output = result.output(params.outside);
  if (output.isFan()) {
    std::cerr << "The fan of the cones that pass is "
      << (output.fan().isComplete() ? "complete" : "not complete") << ".\n";
    writeTropicalFan(out, output.fan());
  } else {
    const PolyhedralFan cones(
      result.fan().ambientDimension(),
      output.rays(),
      output.cones(),
      std::vector<IntVector>()
    );
    writeTropicalFan(out, cones);
  }
}

const char* OmegaAction::staticName() {
  return "omega";
}

const char* OmegaAction::name() const {
  return staticName();
}

const char* OmegaAction::description() const {
  return "Filter the cones of a secondary fan by the Omega or Omega* "
    "criterion. The direct parameters are an ideal file and a fan file. "
    "The number of cones of each verdict is shown per cone dimension.";
}

const char* OmegaAction::shortDescription() const {
  return "Filter a secondary fan by Omega or Omega*.";
}

void OmegaAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
  parameters.push_back(&mStar);
  parameters.push_back(&mOutside);
  parameters.push_back(&mOrbits);
  parameters.push_back(&mNegateRays);
  parameters.push_back(&mTimeLimit);
  parameters.push_back(&mMaxBasisSize);
  parameters.push_back(&mPartial);
  parameters.push_back(&mOutput);
}

OMEGAFAN_NAMESPACE_END
