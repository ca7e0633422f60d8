// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_LOG_DOMAIN_SET_GUARD
#define OMEGAFAN_LOG_DOMAIN_SET_GUARD

#include "LogDomain.hpp"
#include <tbb/tick_count.h>
#include <string>
#include <vector>
#include <ostream>

OMEGAFAN_NAMESPACE_BEGIN

/// The registry of the log domains of the program. It runs the commands
/// of the -logs option and prints the report at exit.
class LogDomainSet {
public:
  void registerLogDomain(LogDomain<true>& domain);
  void registerLogDomain(const LogDomain<false>&) {}

  /// Applies one command of the form [+-0]NAME[+-0]. NAME is a log domain
  /// or "all". The optional prefix enables (+ or nothing) or disables (-)
  /// the domain and the optional suffix turns streaming on (+) or off (-);
  /// 0 leaves the setting alone. Streaming only produces output while the
  /// domain is enabled. For example -FanFilter+ keeps FanFilter disabled
  /// but makes it stream as soon as +FanFilter enables it.
  ///
  /// Calls mathic::reportError for a malformed command or an unknown name.
  void performLogCommand(std::string cmd);

  /// Performs commands separated by commas, such as
  /// "FanFilter,GroebnerBasis+,-Subdivision".
  void performLogCommands(const std::string& cmds);

  /// Returns the log with the given name, or null if there is none.
  LogDomain<true>* logDomain(const char* const name);

  const std::vector<LogDomain<true>*>& logDomains() const {return mLogDomains;}

  /// Prints a table of the time and count of each enabled log that
  /// recorded anything. Prints nothing if there are no such logs.
  void printReport(std::ostream& out) const;

  static LogDomainSet& singleton();

private:
  LogDomainSet(); // private for singleton

  std::vector<LogDomain<true>*> mLogDomains;
  tbb::tick_count mStartTime;
};

OMEGAFAN_NAMESPACE_END
#endif
