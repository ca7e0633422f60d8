// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_TERM_ORDER_GUARD
#define OMEGAFAN_TERM_ORDER_GUARD

#include <vector>
#include <string>
#include <algorithm>

OMEGAFAN_NAMESPACE_BEGIN

/// Describes a monomial order. Use this class to construct a Monoid. The
/// monoid does the actual comparisons.
///
/// Monomials are compared by the rows of an integer gradings matrix first
/// and then by a base order used as a tie-breaker.
class TermOrder {
public:
  typedef int64 Weight;
  typedef size_t VarIndex;
  typedef std::vector<Weight> Gradings;

  enum BaseOrder {
    /// Lexicographic order with x0 > x1 > ... > x_n.
    LexBaseOrder = 0,

    /// Reverse lexicographic order with x0 > x1 > ... > x_n. Orders with
    /// this base order always have total degree as their last grading.
    RevLexBaseOrder = 1
  };

  /// Graded reverse lexicographic order.
  explicit TermOrder(const VarIndex varCount):
    mVarCount(varCount),
    mGradings(addTotalDegree(Gradings(), varCount, RevLexBaseOrder)),
    mBaseOrder(RevLexBaseOrder)
  {}

  /// The base order is refined by the rows of the gradings matrix.
  ///
  /// The layout of the gradings matrix is row-major. For comparisons,
  /// the degree with respect to the first row is considered first,
  /// then the degree with respect to the second row and so on. The
  /// base order is used as a tie-breaker. The gradings vector can be
  /// empty. The order must be a monomial order - in particular, 1
  /// must be strictly less than all other monomials.
  TermOrder(
    const VarIndex varCount,
    Gradings gradings,
    const BaseOrder baseOrder = RevLexBaseOrder
  ):
    mVarCount(varCount),
    mGradings(addTotalDegree(std::move(gradings), varCount, baseOrder)),
    mBaseOrder(baseOrder)
  {
    OMEGAFAN_ASSERT(varCount == 0 || mGradings.size() % varCount == 0);
    OMEGAFAN_ASSERT(isMonomialOrder());
  }

  /// Graded reverse lexicographic order refined from the single grading
  /// weights.
  static TermOrder weighted(const Gradings& weights) {
    return TermOrder(weights.size(), weights, RevLexBaseOrder);
  }

  /// An elimination order for the given variables: any monomial containing
  /// one of them is greater than every monomial without them. Ties are
  /// broken by graded reverse lexicographic order.
  static TermOrder elimination(
    const VarIndex varCount,
    const std::vector<VarIndex>& eliminate
  ) {
    Gradings row(varCount, 0);
    for (auto it = eliminate.begin(); it != eliminate.end(); ++it) {
      OMEGAFAN_ASSERT(*it < varCount);
      row[*it] = 1;
    }
    return TermOrder(varCount, std::move(row), RevLexBaseOrder);
  }

  VarIndex varCount() const {return mVarCount;}

  /// Returns the number of rows in the grading vector.
  size_t gradingCount() const {
    return varCount() == 0 ? 0 : mGradings.size() / varCount();
  }

  /// Returns the grading matrix in row-major layout.
  const Gradings& gradings() const {return mGradings;}

  Weight weight(const size_t grading, const VarIndex var) const {
    OMEGAFAN_ASSERT(grading < gradingCount());
    OMEGAFAN_ASSERT(var < varCount());
    return mGradings[grading * varCount() + var];
  }

  /// Returns true if the grading matrix is a single row of 1's.
  bool isTotalDegree() const {
    return varCount() != 0 && mGradings.size() == varCount() &&
      isAllOnes(mGradings.begin(), mGradings.end());
  }

  BaseOrder baseOrder() const {return mBaseOrder;}

  /// Returns true if the order is a monomial order, which here means that
  /// x>1 for all variables x.
  bool isMonomialOrder() const {
    for (VarIndex var = 0; var < varCount(); ++var) {
      // Check that x_var > 1.
      for (size_t grading = 0; ; ++grading) {
        if (grading == gradingCount()) {
          // The column was entirely zero, so x_var > 1 if and only if the
          // base ordering is lex.
          if (baseOrder() != LexBaseOrder)
            return false;
          break;
        }
        const auto w = weight(grading, var);
        if (w != 0) {
          // We have found the first non-zero weight in this column,
          // so x_var > 1 if and only if this weight is positive.
          if (w < 0)
            return false;
          break;
        }
      }
    }
    return true;
  }

  std::string description() const;

  bool operator==(const TermOrder& order) const {
    return mVarCount == order.mVarCount &&
      mBaseOrder == order.mBaseOrder &&
      mGradings == order.mGradings;
  }

  bool operator!=(const TermOrder& order) const {return !(*this == order);}

private:
  template<class It>
  static bool isAllOnes(It begin, It end) {
    return std::find_if(begin, end, [](Weight w) {return w != 1;}) == end;
  }

  static Gradings addTotalDegree(
    Gradings gradings,
    const VarIndex varCount,
    const BaseOrder baseOrder
  ) {
    if (baseOrder != RevLexBaseOrder || varCount == 0)
      return gradings;
    if (
      gradings.size() >= varCount &&
      isAllOnes(gradings.end() - varCount, gradings.end())
    )
      return gradings;
    gradings.insert(gradings.end(), varCount, 1);
    return gradings;
  }

  VarIndex mVarCount;
  Gradings mGradings;
  BaseOrder mBaseOrder;
};

OMEGAFAN_NAMESPACE_END
#endif
