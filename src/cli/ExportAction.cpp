// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"
#include "ExportAction.hpp"

#include "omegafan/TropicalIO.hpp"
#include <iostream>

OMEGAFAN_NAMESPACE_BEGIN

ExportAction::ExportAction(): mParams(1, 1) {}

void ExportAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(tokens, parser);
}

void ExportAction::performAction() {
  mParams.perform();
  std::cout << idealToGfan(mParams.readInputIdeal(0)) << '\n';
}

const char* ExportAction::staticName() {
  return "export";
}

const char* ExportAction::name() const {
  return staticName();
}

const char* ExportAction::description() const {
  return "Write an ideal in the input format of tropical geometry software. "
    "The variables are renamed to y1, y2 and so on with numbers padded to "
    "equal width. The direct parameter is an ideal file.";
}

const char* ExportAction::shortDescription() const {
  return "Write an ideal for tropical geometry software.";
}

void ExportAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
}

OMEGAFAN_NAMESPACE_END
