// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "LogDomainSet.hpp"

#include <mathic.h>
#include <algorithm>
#include <cstring>

OMEGAFAN_NAMESPACE_BEGIN

LogDomainSet::LogDomainSet():
  mStartTime(tbb::tick_count::now()) {
}

void LogDomainSet::registerLogDomain(LogDomain<true>& domain) {
  mLogDomains.push_back(&domain);
}

LogDomain<true>* LogDomainSet::logDomain(const char* const name) {
  const auto func = [&](const LogDomain<true>* const ld){
    return std::strcmp(ld->name(), name) == 0;
  };
  const auto it = std::find_if(mLogDomains.begin(), mLogDomains.end(), func);
  return it == mLogDomains.end() ? static_cast<LogDomain<true>*>(0) : *it;
}

void LogDomainSet::performLogCommand(std::string cmd) {
  if (cmd.empty())
    mathic::reportError("Empty log command.");

  // 0 is no change, 1 is set to true and -1 is set to false.
  int enable = 1;
  int stream = 0;
  const char prefix = cmd.front();
  if (prefix == '+' || prefix == '-' || prefix == '0') {
    enable = prefix == '+' ? 1 : prefix == '-' ? -1 : 0;
    cmd.erase(cmd.begin());
  }
  if (!cmd.empty()) {
    const char suffix = cmd.back();
    if (suffix == '+' || suffix == '-' || suffix == '0') {
      stream = suffix == '+' ? 1 : suffix == '-' ? -1 : 0;
      cmd.erase(cmd.end() - 1);
    }
  }

  const auto apply = [&](LogDomain<true>& log) {
    if (enable != 0)
      log.setEnabled(enable > 0);
    if (stream != 0)
      log.setStreamEnabled(stream > 0);
  };

  if (cmd == "all") {
    std::for_each(mLogDomains.begin(), mLogDomains.end(),
      [&](LogDomain<true>* const log) {apply(*log);});
    return;
  }
  if (cmd == "none")
    return;

  const auto log = logDomain(cmd.c_str());
  if (log == 0)
    mathic::reportError("Unknown log \"" + cmd + "\".");
  apply(*log);
}

void LogDomainSet::performLogCommands(const std::string& cmds) {
  if (cmds.empty())
    return;
  size_t offset = 0;
  while (offset < cmds.size()) {
    const size_t next = cmds.find(',', offset);
    const size_t end = next == std::string::npos ? cmds.size() : next;
    performLogCommand(cmds.substr(offset, end - offset));
    offset = end + 1;
  }
}

void LogDomainSet::printReport(std::ostream& out) const {
  const auto elapsed = (tbb::tick_count::now() - mStartTime).seconds();

  mathic::ColumnPrinter pr;
  auto& names = pr.addColumn(true);
  auto& times = pr.addColumn(false, "  ");
  auto& ratios = pr.addColumn(false, "  ");
  auto& counts = pr.addColumn(false, "  ");
  times.precision(3);
  times << std::fixed;
  names << "log\n";
  times << "time/s\n";
  ratios << "of total\n";
  counts << "count\n";
  pr.repeatToEndOfLine('-');

  size_t reported = 0;
  for (auto it = mLogDomains.begin(); it != mLogDomains.end(); ++it) {
    const auto& log = **it;
    if (!log.enabled() || (!log.hasTime() && !log.hasCount()))
      continue;
    ++reported;
    names << log.name() << '\n';
    if (log.hasTime()) {
      times << log.loggedSecondsReal() << '\n';
      ratios << mathic::ColumnPrinter::percentDouble
        (log.loggedSecondsReal(), elapsed) << '\n';
    } else {
      times << '\n';
      ratios << '\n';
    }
    if (log.hasCount())
      counts << mathic::ColumnPrinter::commafy(log.count()) << '\n';
    else
      counts << '\n';
  }
  if (reported == 0)
    return;

  const auto oldFlags = out.flags();
  const auto oldPrecision = out.precision();
  out << std::fixed;
  out.precision(3);
  out << "***** Log report after " << elapsed << "s *****\n" << pr << '\n';
  out.precision(oldPrecision);
  out.flags(oldFlags);
}

LogDomainSet& LogDomainSet::singleton() {
  static LogDomainSet set;
  return set;
}

OMEGAFAN_NAMESPACE_END
