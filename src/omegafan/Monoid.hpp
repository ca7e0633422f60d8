// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_MONOID_GUARD
#define OMEGAFAN_MONOID_GUARD

#include "TermOrder.hpp"
#include <memtailor.h>
#include <vector>
#include <ostream>
#include <string>
#include <algorithm>

OMEGAFAN_NAMESPACE_BEGIN

/// Implements the monoid of (monic) monomials with integer exponents
/// ordered by a TermOrder.
///
/// A monomial is stored as a contiguous array of entryCount() exponents.
/// The first gradingCount() entries cache the degree of the monomial with
/// respect to each row of the gradings matrix, which makes comparisons
/// cheap. The remaining varCount() entries are the exponents.
class Monoid {
public:
  typedef int64 Exponent;
  typedef TermOrder::VarIndex VarIndex;
  typedef Exponent* MonoPtr;
  typedef const Exponent* ConstMonoPtr;

  /// An owning monomial. Use monoid.ptr(mono) to get at the entries.
  typedef std::vector<Exponent> Mono;

  enum CompareResult {
    LessThan = -1,
    EqualTo = 0,
    GreaterThan = 1
  };

  explicit Monoid(const TermOrder& order):
    mOrder(order),
    mVarCount(order.varCount()),
    mGradingCount(order.gradingCount())
  {}

  const TermOrder& order() const {return mOrder;}
  VarIndex varCount() const {return mVarCount;}
  size_t gradingCount() const {return mGradingCount;}
  size_t entryCount() const {return mGradingCount + mVarCount;}

  // *** Allocation

  Mono alloc() const {return Mono(entryCount(), 0);}

  /// Allocates an uninitialized monomial from an arena.
  MonoPtr alloc(memt::Arena& arena) const {
    return static_cast<MonoPtr>(arena.alloc(entryCount() * sizeof(Exponent)));
  }

  static MonoPtr ptr(Mono& mono) {return mono.data();}
  static ConstMonoPtr ptr(const Mono& mono) {return mono.data();}

  // *** Access

  Exponent exponent(ConstMonoPtr mono, const VarIndex var) const {
    OMEGAFAN_ASSERT(var < varCount());
    return mono[mGradingCount + var];
  }

  /// Returns a pointer to the varCount() exponents of mono.
  ConstMonoPtr exponents(ConstMonoPtr mono) const {
    return mono + mGradingCount;
  }

  Exponent degree(ConstMonoPtr mono, const size_t grading) const {
    OMEGAFAN_ASSERT(grading < gradingCount());
    return mono[grading];
  }

  Exponent totalDegree(ConstMonoPtr mono) const {
    Exponent sum = 0;
    for (VarIndex var = 0; var < varCount(); ++var)
      sum += exponent(mono, var);
    return sum;
  }

  bool isIdentity(ConstMonoPtr mono) const {
    const auto exps = exponents(mono);
    return std::find_if(exps, exps + varCount(),
      [](Exponent e) {return e != 0;}) == exps + varCount();
  }

  // *** Modification

  void setIdentity(MonoPtr mono) const {
    std::fill_n(mono, entryCount(), static_cast<Exponent>(0));
  }

  /// Sets mono to the monomial with the given varCount() exponents.
  void setExponents(const Exponent* exps, MonoPtr mono) const;

  void setExponent(const VarIndex var, const Exponent e, MonoPtr mono) const;

  void copy(ConstMonoPtr from, MonoPtr to) const {
    std::copy_n(from, entryCount(), to);
  }

  // *** Arithmetic

  void multiply(ConstMonoPtr a, ConstMonoPtr b, MonoPtr prod) const {
    for (size_t i = 0; i < entryCount(); ++i)
      prod[i] = a[i] + b[i];
  }

  /// Sets quo to a/by where by must divide a.
  void divide(ConstMonoPtr by, ConstMonoPtr a, MonoPtr quo) const {
    OMEGAFAN_ASSERT(divides(by, a));
    for (size_t i = 0; i < entryCount(); ++i)
      quo[i] = a[i] - by[i];
  }

  void lcm(ConstMonoPtr a, ConstMonoPtr b, MonoPtr lcmOut) const;

  /// Returns true if a divides b.
  bool divides(ConstMonoPtr a, ConstMonoPtr b) const {
    for (VarIndex var = 0; var < varCount(); ++var)
      if (exponent(a, var) > exponent(b, var))
        return false;
    return true;
  }

  /// Returns true if a and b have no variable in common.
  bool relativelyPrime(ConstMonoPtr a, ConstMonoPtr b) const {
    for (VarIndex var = 0; var < varCount(); ++var)
      if (exponent(a, var) > 0 && exponent(b, var) > 0)
        return false;
    return true;
  }

  // *** Comparison

  bool equal(ConstMonoPtr a, ConstMonoPtr b) const {
    return std::equal(a + mGradingCount, a + entryCount(), b + mGradingCount);
  }

  CompareResult compare(ConstMonoPtr a, ConstMonoPtr b) const;

  bool lessThan(ConstMonoPtr a, ConstMonoPtr b) const {
    return compare(a, b) == LessThan;
  }

  // *** Output

  /// Prints mono like x1*x2^3, using the given variable names. The
  /// identity is printed as 1.
  void print(
    std::ostream& out,
    ConstMonoPtr mono,
    const std::vector<std::string>& varNames
  ) const;

private:
  TermOrder mOrder;
  VarIndex mVarCount;
  size_t mGradingCount;
};

OMEGAFAN_NAMESPACE_END
#endif
