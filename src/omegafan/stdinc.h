// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifdef OMEGAFAN_STDINC_GUARD
#error stdinc.h included twice. Only include stdinc.h once per cpp file.
#endif
#define OMEGAFAN_STDINC_GUARD

// Included first by every cpp file of the library, the command line tool
// and the tests, and by nothing else.

#if defined(_MSC_VER)
#define OMEGAFAN_UNREACHABLE __assume(false)
#pragma warning (disable: 4127) // while (true)
#pragma warning (disable: 4800) // int to bool conversion
#elif defined(__GNUC__)
#define OMEGAFAN_UNREACHABLE __builtin_unreachable()
#else
#define OMEGAFAN_UNREACHABLE
#endif

#include <cstddef>
#include <memory>
#include <utility>

// OMEGAFAN_ASSERT checks internal invariants in debug builds only. Errors
// in input are never reported through it; those throw.
#ifdef OMEGAFAN_DEBUG
#include <cassert>
#include <iostream>
#define OMEGAFAN_ASSERT(X) do {assert(X);} while (0)
#else
#define OMEGAFAN_ASSERT(X) do {} while (0)
#endif

#define OMEGAFAN_NAMESPACE_BEGIN namespace ofan {
#define OMEGAFAN_NAMESPACE_END }

// C++11 lacks std::make_unique.
template<class T, class... Args>
std::unique_ptr<T> make_unique(Args&&... args) {
  return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
}

typedef signed long long int64;

OMEGAFAN_NAMESPACE_BEGIN

/// Verbosity of the Buchberger algorithm on std::cerr. 0 is silent.
extern int tracingLevel;

OMEGAFAN_NAMESPACE_END
