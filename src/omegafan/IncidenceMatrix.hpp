// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_INCIDENCE_MATRIX_GUARD
#define OMEGAFAN_INCIDENCE_MATRIX_GUARD

#include "Subsets.hpp"
#include <vector>
#include <ostream>

OMEGAFAN_NAMESPACE_BEGIN

/// A boolean matrix stored as one sorted list of column indices per row.
/// Row i of the cone incidence matrix of a fan lists the rays of cone i.
class IncidenceMatrix {
public:
  typedef IndexSet Row;

  explicit IncidenceMatrix(size_t colCount): mColCount(colCount) {}

  /// Each row is sorted and duplicates are removed. Throws
  /// InconsistentDimensionError if an entry is not less than colCount.
  IncidenceMatrix(size_t colCount, std::vector<Row> rows);

  size_t rowCount() const {return mRows.size();}
  size_t colCount() const {return mColCount;}

  const Row& row(size_t index) const {
    OMEGAFAN_ASSERT(index < rowCount());
    return mRows[index];
  }

  const std::vector<Row>& rows() const {return mRows;}

  bool contains(size_t row, size_t col) const;

  /// Returns true if every entry of row a is also in row b.
  bool rowIsSubset(size_t a, size_t b) const;

  void appendRow(Row row);

  /// The matrix of the given rows, in the given order.
  IncidenceMatrix restrictedTo(const std::vector<size_t>& rows) const;

  bool operator==(const IncidenceMatrix& matrix) const {
    return mColCount == matrix.mColCount && mRows == matrix.mRows;
  }
  bool operator!=(const IncidenceMatrix& matrix) const {
    return !(*this == matrix);
  }

  /// Writes one row per line as {0 2 5}. Indices are shifted by offset,
  /// so an offset of 1 gives one-based output.
  void print(std::ostream& out, size_t offset = 0) const;

private:
  size_t mColCount;
  std::vector<Row> mRows;
};

OMEGAFAN_NAMESPACE_END
#endif
