// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"
#include "PluckerAction.hpp"

#include "omegafan/IdealIO.hpp"
#include "omegafan/Plucker.hpp"
#include <iostream>

OMEGAFAN_NAMESPACE_BEGIN

PluckerAction::PluckerAction():
  mParams(0, 0),
  mN("n", "The number of points spanning the lines.", 4)
{}

void PluckerAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(tokens, parser);
}

void PluckerAction::performAction() {
  mParams.perform();
  if (mN.value() < 2)
    mathic::reportError("The option -n must be at least 2.\n");
  writeIdeal(std::cout, plucker2Ideal(mN.value()));
}

const char* PluckerAction::staticName() {
  return "plucker";
}

const char* PluckerAction::name() const {
  return staticName();
}

const char* PluckerAction::description() const {
  return "Write the ideal of the Grassmannian G(2,n) generated by the "
    "three-term Pluecker relations, in the input format of ofan.";
}

const char* PluckerAction::shortDescription() const {
  return "Write the Pluecker ideal of G(2,n).";
}

void PluckerAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
  parameters.push_back(&mN);
}

OMEGAFAN_NAMESPACE_END
