// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_QQ_MATRIX_GUARD
#define OMEGAFAN_QQ_MATRIX_GUARD

#include <gmpxx.h>
#include <vector>
#include <ostream>

OMEGAFAN_NAMESPACE_BEGIN

typedef std::vector<mpq_class> QQVector;
typedef std::vector<mpz_class> IntVector;

/// A dense matrix of rational numbers stored row by row.
class QQMatrix {
public:
  QQMatrix(): mColCount(0) {}

  /// A zero matrix of the given size.
  QQMatrix(size_t rowCount, size_t colCount);

  /// Every row must have colCount entries.
  QQMatrix(std::vector<QQVector> rows, size_t colCount);

  static QQMatrix identity(size_t size);
  static QQMatrix fromIntegerRows(const std::vector<IntVector>& rows,
    size_t colCount);

  size_t rowCount() const {return mRows.size();}
  size_t colCount() const {return mColCount;}
  bool empty() const {return mRows.empty();}

  mpq_class& operator()(size_t row, size_t col) {
    OMEGAFAN_ASSERT(row < rowCount());
    OMEGAFAN_ASSERT(col < colCount());
    return mRows[row][col];
  }

  const mpq_class& operator()(size_t row, size_t col) const {
    OMEGAFAN_ASSERT(row < rowCount());
    OMEGAFAN_ASSERT(col < colCount());
    return mRows[row][col];
  }

  const QQVector& row(size_t row) const {
    OMEGAFAN_ASSERT(row < rowCount());
    return mRows[row];
  }

  const std::vector<QQVector>& rows() const {return mRows;}

  QQVector column(size_t col) const;

  void appendRow(QQVector row);

  /// Brings the matrix into reduced row echelon form in place. Returns the
  /// rank. The columns of the pivots are stored in pivots if it is not
  /// null. The zero rows end up at the bottom.
  size_t reduce(std::vector<size_t>* pivots = 0);

  QQMatrix reducedRowEchelonForm() const;

  /// The rows of the reduced row echelon form that are not zero.
  QQMatrix nonzeroRows() const;

  size_t rank() const;

  /// Returns a matrix whose rows are a basis of the vectors v with
  /// M v = 0. There is one row per non-pivot column of the reduced row
  /// echelon form.
  QQMatrix kernel() const;

  QQMatrix transpose() const;

  bool operator==(const QQMatrix& matrix) const {
    return mColCount == matrix.mColCount && mRows == matrix.mRows;
  }
  bool operator!=(const QQMatrix& matrix) const {return !(*this == matrix);}

  /// Writes one row per line with entries separated by spaces.
  void print(std::ostream& out) const;

private:
  size_t mColCount;
  std::vector<QQVector> mRows;
};

inline std::ostream& operator<<(std::ostream& out, const QQMatrix& matrix) {
  matrix.print(out);
  return out;
}

/// Returns the dot product of two vectors of the same length.
mpq_class dot(const QQVector& a, const QQVector& b);

/// Scales a rational vector to an integer vector whose entries have no
/// common factor. The zero vector maps to the zero vector.
IntVector primitive(const QQVector& vector);

IntVector primitive(const IntVector& vector);

OMEGAFAN_NAMESPACE_END
#endif
