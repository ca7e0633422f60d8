// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "LogDomain.hpp"

#include "LogDomainSet.hpp"
#include <iomanip>
#include <iostream>

OMEGAFAN_NAMESPACE_BEGIN

int tracingLevel = 0;

namespace {
  // Guards std::cerr for log output.
  tbb::spin_mutex outputMutex;
}

LogLine::~LogLine() {
  if (mBuffer.get() == 0)
    return;
  const auto text = mBuffer->str();
  if (text.empty())
    return;
  tbb::spin_mutex::scoped_lock lock(outputMutex);
  std::cerr << text << std::flush;
}

LogDomain<true>::LogDomain(
  const char* const name,
  const char* const description,
  const bool enabled,
  const bool streamEnabled
):
  mEnabled(enabled),
  mStreamEnabled(streamEnabled),
  mName(name),
  mDescription(description),
  mRealSeconds(0),
  mHasTime(false),
  mCount(0),
  mHasCount(false)
{
  LogDomainSet::singleton().registerLogDomain(*this);
}

LogLine LogDomain<true>::stream() {
  return LogLine();
}

LogDomain<true>::Timer LogDomain<true>::timer() {
  return Timer(*this);
}

void LogDomain<true>::increment(const unsigned long long by) {
  if (!enabled())
    return;
  tbb::spin_mutex::scoped_lock lock(mMutex);
  mCount += by;
  mHasCount = true;
}

void LogDomain<true>::recordTime(const double realSeconds) {
  if (!enabled())
    return;
  {
    tbb::spin_mutex::scoped_lock lock(mMutex);
    mRealSeconds += realSeconds;
    mHasTime = true;
  }
  if (streamEnabled()) {
    OMEGAFAN_ASSERT(mName != 0);
    auto line = stream();
    line.buffer() << mName << " time recorded: " << std::fixed
      << std::setprecision(3) << realSeconds << "s (real)\n";
  }
}

LogDomain<true>::Timer::Timer(LogDomain<true>& logger):
  mLogger(logger),
  mTimerRunning(false),
  mRealTicks()
{
  start();
}

LogDomain<true>::Timer::Timer(Timer&& timer):
  mLogger(timer.mLogger),
  mTimerRunning(timer.mTimerRunning),
  mRealTicks(timer.mRealTicks)
{
  timer.mTimerRunning = false;
}

LogDomain<true>::Timer::~Timer() {
  stop();
}

void LogDomain<true>::Timer::stop() {
  if (!running())
    return;
  mTimerRunning = false;
  if (mLogger.enabled())
    mLogger.recordTime((tbb::tick_count::now() - mRealTicks).seconds());
}

void LogDomain<true>::Timer::start() {
  if (!mLogger.enabled() || mTimerRunning)
    return;
  mTimerRunning = true;
  mRealTicks = tbb::tick_count::now();
}

OMEGAFAN_NAMESPACE_END
