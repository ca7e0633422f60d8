// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_LOG_DOMAIN_GUARD
#define OMEGAFAN_LOG_DOMAIN_GUARD

#include <tbb/spin_mutex.h>
#include <tbb/tick_count.h>
#include <memory>
#include <ostream>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

/// Collects one log message and writes it to std::cerr in a single piece
/// when destructed, so that messages from threads filtering different
/// cones do not interleave.
class LogLine {
public:
  LogLine(): mBuffer(new std::ostringstream()) {}
  LogLine(LogLine&& line): mBuffer(std::move(line.mBuffer)) {}
  ~LogLine();

  template<class T>
  LogLine& operator<<(const T& value) {
    *mBuffer << value;
    return *this;
  }

  LogLine& operator<<(std::ostream& (*manipulator)(std::ostream&)) {
    manipulator(*mBuffer);
    return *this;
  }

  /// For code that needs a std::ostream. The text still goes out in one
  /// piece when the LogLine is destructed.
  std::ostream& buffer() {return *mBuffer;}

private:
  LogLine(const LogLine&); // not available
  void operator=(const LogLine&); // not available

  std::unique_ptr<std::ostringstream> mBuffer;
};

/// A named area of logging that can be turned on or off at runtime and at
/// compile time.
///
/// A logger that is turned off at compile time emits no code
/// into the executable and all the code that writes to that logger is also
/// removed by the optimizer if it is written in the correct way. Use the
/// logging macroes to ensure proper use so that compile-time disabled
/// LogDomains properly have zero overhead.
///
/// An enabled log has a streaming component, which prints messages as
/// events happen, and a summary component of recorded time and event
/// counts that is printed by LogDomainSet::printReport. Recording time
/// and counts is safe from several threads at once.
///
/// Compile-time enabled loggers automatically register themselves with
/// LogDomainSet::singleton().
template<bool CompileTimeEnabled>
class LogDomain {};

template<>
class LogDomain<true> {
public:
  static const bool compileTimeEnabled = true;

  LogDomain(
    const char* const name,
    const char* const description,
    const bool enabled,
    const bool streamEnabled
  );

  const char* name() const {return mName;}
  const char* description() const {return mDescription;}
  bool enabled() const {return mEnabled;}
  bool streamEnabled() const {return enabled() && mStreamEnabled;}

  /// Returns the streaming setting without regard to enabled().
  bool streamEnabledPure() const {return mStreamEnabled;}

  void setEnabled(const bool enabled) {mEnabled = enabled;}
  void setStreamEnabled(const bool enabled) {mStreamEnabled = enabled;}

  /// Returns a message that is written to std::cerr when it goes out of
  /// scope.
  LogLine stream();

  /// Class for recording time that is logged.
  class Timer;

  /// Returns a started timer.
  Timer timer();

  double loggedSecondsReal() const {return mRealSeconds;}

  /// Indicates if any period of time has been recorded, even if that period
  /// of time was recorded as 0 seconds.
  bool hasTime() const {return mHasTime;}

  /// Adds by to the event count. Does nothing if the log is disabled.
  void increment(unsigned long long by = 1);

  unsigned long long count() const {return mCount;}

  /// Indicates if increment() has been called while the log was enabled.
  bool hasCount() const {return mHasCount;}

private:
  LogDomain(const LogDomain&); // not available
  void operator=(const LogDomain&); // not available

  void recordTime(double realSeconds);

  bool mEnabled;
  bool mStreamEnabled;
  const char* mName;
  const char* mDescription;

  double mRealSeconds; /// Total amount of time recorded on this log.
  bool mHasTime;
  unsigned long long mCount;
  bool mHasCount;
  tbb::spin_mutex mMutex;
};

class LogDomain<true>::Timer {
public:
  /// Start the timer running. The elapsed time will be logged to the logger
  /// once the timer is stopped or destructed.
  explicit Timer(LogDomain<true>& logger);

  /// The moved-from timer stops running without logging anything.
  Timer(Timer&& timer);

  /// Stops the timer.
  ~Timer();

  /// Returns true if the timer is currently recording time.
  bool running() const {return mTimerRunning;}

  /// Stops recording time and logs the elapsed time to the logger.
  ///
  /// This is a no-op if the timer is not running. If the logger
  /// is disabled then no time is logged.
  void stop();

  /// Start recording time on a stopped timer.
  ///
  /// This is a no-op is the timer is already running or if the logger is
  /// disabled.
  void start();

private:
  Timer(const Timer&); // not available

  LogDomain<true>& mLogger;
  bool mTimerRunning;
  tbb::tick_count mRealTicks; // high precision
};

/// This is a compile-time disabled logger.
template<>
class LogDomain<false> {
public:
  static const bool compileTimeEnabled = false;

  LogDomain(const char* const, const char* const, const bool, const bool) {}

  bool enabled() const {return false;}
  bool streamEnabled() const {return false;}
  void increment(unsigned long long = 1) {}

  class Timer {
  public:
    explicit Timer(LogDomain<false>&) {}
    bool running() const {return false;}
    void stop() {}
    void start() {}
  };

  LogLine stream() {
    OMEGAFAN_ASSERT(false);
    return LogLine();
  }
};

namespace LogDomainInternal {
  // Support code for the logging macroes

  template<class L>
  struct LambdaRunner {L& log;};

  template<class L>
  LambdaRunner<L> lambdaRunner(L& log) {
    LambdaRunner<L> runner = {log};
    return runner;
  }

  template<class L, class T>
  void operator+(LambdaRunner<L> runner, const T& lambda) {lambda(runner.log);}
}

OMEGAFAN_NAMESPACE_END

#define OMEGAFAN_CONCATENATE(A, B) A##B
#define OMEGAFAN_CONCATENATE_AFTER_EXPANSION(A, B) OMEGAFAN_CONCATENATE(A, B)

/// Defines a LogDomain with the given name and description. Use this at
/// global scope in exactly one .cpp file.
///
/// The logger is initially runtime enabled depending on
/// DEFAULT_RUNTIME_ENABLED and streams depending on DEFAULT_STREAM_ENABLED.
#define OMEGAFAN_DEFINE_LOG_DOMAIN_WITH_DEFAULTS( \
  NAME, DESCRIPTION, \
  DEFAULT_RUNTIME_ENABLED, DEFAULT_STREAM_ENABLED, COMPILE_TIME_ENABLED \
) \
  namespace logs { \
    typedef ::ofan::LogDomain<COMPILE_TIME_ENABLED> Type##NAME; \
    Type##NAME NAME( \
      #NAME, DESCRIPTION, DEFAULT_RUNTIME_ENABLED, DEFAULT_STREAM_ENABLED \
    ); \
  }

/// Defines a LogDomain with the given name and description.
///
/// By default, the logger is compile-time enabled, runtime disabled and
/// streams when it is enabled.
#define OMEGAFAN_DEFINE_LOG_DOMAIN(NAME, DESCRIPTION) \
  OMEGAFAN_DEFINE_LOG_DOMAIN_WITH_DEFAULTS(NAME, DESCRIPTION, 0, 1, 1)

/// Makes a log domain defined in another .cpp file available. Use this at
/// global scope.
#define OMEGAFAN_DECLARE_LOG_DOMAIN(NAME) \
  namespace logs { \
    typedef ::ofan::LogDomain<true> Type##NAME; \
    extern Type##NAME NAME; \
  }

/// This expression yields an l-value reference to the indicated logger.
///
/// Example:
///   auto timer = OMEGAFAN_LOGGER(MyDomain).timer();
#define OMEGAFAN_LOGGER(DOMAIN) ::logs::DOMAIN

/// This expression yields the type of the indicated logger.
#define OMEGAFAN_LOGGER_TYPE(DOMAIN) ::logs::Type##DOMAIN

/// Runs the code in the following scope delimited by braces {} if the
/// indicated logger is streaming - otherwise does nothing. Within the
/// following scope there is a local reference variable log that refers to
/// the indicated logger.
///
/// Example:
///   OMEGAFAN_IF_STREAM_LOG(MyDomain) {
///     std::string msg;
///     expensiveFunction(msg);
///     log.stream() << msg;
///   };
#define OMEGAFAN_IF_STREAM_LOG(DOMAIN) \
  if (OMEGAFAN_LOGGER(DOMAIN).streamEnabled()) \
    ::ofan::LogDomainInternal::lambdaRunner(OMEGAFAN_LOGGER(DOMAIN)) + \
      [&](OMEGAFAN_LOGGER_TYPE(DOMAIN)& log)

/// Display information to the log using <<.
/// If domain is not streaming then the log message is not displayed and the
/// code after << is not executed.
///
/// Example: (f() only called if logger is enabled)
///   OMEGAFAN_LOG(domain) << "f() = " << f();
#define OMEGAFAN_LOG(DOMAIN) \
  if (OMEGAFAN_LOGGER(DOMAIN).streamEnabled()) OMEGAFAN_LOGGER(DOMAIN).stream()

/// Increments the event count of the indicated domain.
#define OMEGAFAN_LOG_INCREMENT(DOMAIN) OMEGAFAN_LOGGER(DOMAIN).increment()

/// Will log the time to execute the remaining code in the current scope
/// to the indicated domain. Also supports printing a message using <<.
/// The message is printed right away while the time is printed when
/// the scope ends.
///
/// Example:
///   OMEGAFAN_LOG_TIME(MyDomain) << "Starting timed task";
#define OMEGAFAN_LOG_TIME(DOMAIN) \
  OMEGAFAN_LOGGER_TYPE(DOMAIN)::Timer \
    OMEGAFAN_CONCATENATE_AFTER_EXPANSION(omegafanLogTimer, __LINE__) \
      (OMEGAFAN_LOGGER(DOMAIN)); \
  OMEGAFAN_LOG(DOMAIN)

#endif
