// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"
#include "PointsAction.hpp"

#include "omegafan/Lineality.hpp"
#include "omegafan/TropicalIO.hpp"
#include <iostream>

OMEGAFAN_NAMESPACE_BEGIN

PointsAction::PointsAction(): mParams(1, 1) {}

void PointsAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(tokens, parser);
}

void PointsAction::performAction() {
  mParams.perform();
  const auto ideal = mParams.readInputIdeal(0);
  const SymbolicEngine engine;

  std::cout << "Lineality space, hyperplanes:\n"
    << linealitySpaceHRep(ideal, engine)
    << "\nLineality space, basis:\n"
    << linealitySpaceVRep(ideal, engine)
    << "\nPoint configuration:\n"
    << pointConfigurationToString(pointConfiguration(ideal, engine))
    << '\n';
}

const char* PointsAction::staticName() {
  return "points";
}

const char* PointsAction::name() const {
  return staticName();
}

const char* PointsAction::description() const {
  return "Print the lineality space of an ideal as hyperplanes and as a "
    "basis, and the point configuration made of the columns of the basis. "
    "The direct parameter is an ideal file.";
}

const char* PointsAction::shortDescription() const {
  return "Print the point configuration of an ideal.";
}

void PointsAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
}

OMEGAFAN_NAMESPACE_END
