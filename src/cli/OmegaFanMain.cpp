// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"

#include "OmegaAction.hpp"
#include "PointsAction.hpp"
#include "BoundsAction.hpp"
#include "ExportAction.hpp"
#include "PluckerAction.hpp"
#include "HelpAction.hpp"
#include "omegafan/LogDomainSet.hpp"
#include <mathic.h>
#include <iostream>
#include <exception>

int main(int argc, char **argv) {
  try {
    mathic::CliParser parser;
    parser.registerAction<ofan::OmegaAction>();
    parser.registerAction<ofan::PointsAction>();
    parser.registerAction<ofan::BoundsAction>();
    parser.registerAction<ofan::ExportAction>();
    parser.registerAction<ofan::PluckerAction>();
    parser.registerAction<ofan::HelpAction>();

    std::vector<std::string> commandLine(argv, argv + argc);
    commandLine.erase(commandLine.begin());

    parser.parse(commandLine)->performAction();
  } catch (const mathic::MathicException& e) {
    mathic::display(e.what());
    return -1;
  } catch (const std::exception& e) {
    mathic::display(e.what());
    return -1;
  }

  ofan::LogDomainSet::singleton().printReport(std::cerr);
  return 0;
}
