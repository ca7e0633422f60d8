// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"
#include "HelpAction.hpp"

#include "omegafan/LogDomain.hpp"
#include "omegafan/LogDomainSet.hpp"
#include <iostream>

OMEGAFAN_NAMESPACE_BEGIN

void HelpAction::performAction() {
  if (topic() != "logs") {
    mathic::HelpAction::performAction();
    return;
  }

  const char* header =
    "ofan keeps a log for each part of the computation. Logs are enabled "
    "or disabled individually.\n"
    "\n"
    "A log has a streaming component that prints as events happen and a "
    "summary component that prints when the program ends. The summary "
    "counts the events and may include how long they took. The "
    "GroebnerBasis log for example counts the Groebner bases computed "
    "while FanFilterTime reports the time spent filtering a fan.\n"
    "\n"
    "An enabled log prints its summary if it registered any events. "
    "Streaming can be turned off for an enabled log.\n"
    "\n"
    "Specify logs with the option -logs X, where X is a comma-separated "
    "list like\n"
    "\n"
    "    A,+B,-C,D+,E-\n"
    "\n"
    "This enables A, B, D and E and disables C. Streaming for D is turned "
    "on and for E it is turned off. A prefix of - disables the log while "
    "no prefix or + enables it. A suffix of - turns off streaming and a "
    "suffix of + turns it on. A prefix or suffix of 0 means do nothing. "
    "The name all stands for every log.\n"
    "\n"
    "These are the logs. The prefixes and suffixes show the default "
    "state.\n";
  mathic::display(header);
  auto& logs = LogDomainSet::singleton().logDomains();
  for (auto it = logs.begin(); it != logs.end(); ++it) {
    const auto toSign = [](const bool b) {return b ? '+' : '-';};
    std::cerr
      << "\n "
      << toSign((*it)->enabled())
      << (*it)->name()
      << toSign((*it)->streamEnabledPure())
      << '\n';
    mathic::display((*it)->description(), "   ");
  }
}

OMEGAFAN_NAMESPACE_END
