// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "QQMatrix.hpp"

#include "Errors.hpp"

OMEGAFAN_NAMESPACE_BEGIN

QQMatrix::QQMatrix(const size_t rowCount, const size_t colCount):
  mColCount(colCount),
  mRows(rowCount, QQVector(colCount))
{}

QQMatrix::QQMatrix(std::vector<QQVector> rows, const size_t colCount):
  mColCount(colCount),
  mRows(std::move(rows))
{
  for (auto it = mRows.begin(); it != mRows.end(); ++it)
    if (it->size() != colCount)
      throw InconsistentDimensionError("Matrix rows have different lengths.");
}

QQMatrix QQMatrix::identity(const size_t size) {
  QQMatrix matrix(size, size);
  for (size_t i = 0; i < size; ++i)
    matrix(i, i) = 1;
  return matrix;
}

QQMatrix QQMatrix::fromIntegerRows(
  const std::vector<IntVector>& rows,
  const size_t colCount
) {
  QQMatrix matrix;
  matrix.mColCount = colCount;
  for (auto it = rows.begin(); it != rows.end(); ++it)
    matrix.appendRow(QQVector(it->begin(), it->end()));
  return matrix;
}

QQVector QQMatrix::column(const size_t col) const {
  OMEGAFAN_ASSERT(col < colCount());
  QQVector column;
  column.reserve(rowCount());
  for (auto it = mRows.begin(); it != mRows.end(); ++it)
    column.push_back((*it)[col]);
  return column;
}

void QQMatrix::appendRow(QQVector row) {
  if (row.size() != colCount())
    throw InconsistentDimensionError("Matrix rows have different lengths.");
  mRows.push_back(std::move(row));
}

size_t QQMatrix::reduce(std::vector<size_t>* pivots) {
  if (pivots != 0)
    pivots->clear();
  size_t rank = 0;
  for (size_t col = 0; col < colCount() && rank < rowCount(); ++col) {
    size_t pivot = rank;
    while (pivot < rowCount() && mRows[pivot][col] == 0)
      ++pivot;
    if (pivot == rowCount())
      continue;
    std::swap(mRows[rank], mRows[pivot]);

    auto& pivotRow = mRows[rank];
    const mpq_class inverse = 1 / pivotRow[col];
    for (size_t c = col; c < colCount(); ++c)
      pivotRow[c] *= inverse;

    for (size_t r = 0; r < rowCount(); ++r) {
      if (r == rank || mRows[r][col] == 0)
        continue;
      const mpq_class factor = mRows[r][col];
      for (size_t c = col; c < colCount(); ++c)
        mRows[r][c] -= factor * pivotRow[c];
    }
    if (pivots != 0)
      pivots->push_back(col);
    ++rank;
  }
  return rank;
}

QQMatrix QQMatrix::reducedRowEchelonForm() const {
  QQMatrix copy(*this);
  copy.reduce();
  return copy;
}

QQMatrix QQMatrix::nonzeroRows() const {
  QQMatrix copy(*this);
  copy.mRows.resize(copy.reduce());
  return copy;
}

size_t QQMatrix::rank() const {
  return QQMatrix(*this).reduce();
}

QQMatrix QQMatrix::kernel() const {
  QQMatrix echelon(*this);
  std::vector<size_t> pivots;
  echelon.reduce(&pivots);

  QQMatrix kernel;
  kernel.mColCount = colCount();
  size_t nextPivot = 0;
  for (size_t free = 0; free < colCount(); ++free) {
    if (nextPivot < pivots.size() && pivots[nextPivot] == free) {
      ++nextPivot;
      continue;
    }
    // Set the free variable to 1, the other free variables to 0 and solve
    // for the pivot variables.
    QQVector v(colCount());
    v[free] = 1;
    for (size_t r = 0; r < pivots.size(); ++r)
      v[pivots[r]] = -echelon(r, free);
    kernel.mRows.push_back(std::move(v));
  }
  return kernel;
}

QQMatrix QQMatrix::transpose() const {
  QQMatrix transposed(colCount(), rowCount());
  for (size_t r = 0; r < rowCount(); ++r)
    for (size_t c = 0; c < colCount(); ++c)
      transposed(c, r) = mRows[r][c];
  return transposed;
}

void QQMatrix::print(std::ostream& out) const {
  for (auto it = mRows.begin(); it != mRows.end(); ++it) {
    for (size_t c = 0; c < it->size(); ++c)
      out << (c == 0 ? "" : " ") << (*it)[c];
    out << '\n';
  }
}

mpq_class dot(const QQVector& a, const QQVector& b) {
  OMEGAFAN_ASSERT(a.size() == b.size());
  mpq_class sum;
  for (size_t i = 0; i < a.size(); ++i)
    sum += a[i] * b[i];
  return sum;
}

IntVector primitive(const QQVector& vector) {
  mpz_class denominators = 1;
  for (auto it = vector.begin(); it != vector.end(); ++it)
    mpz_lcm(denominators.get_mpz_t(), denominators.get_mpz_t(),
      it->get_den_mpz_t());

  IntVector scaled;
  scaled.reserve(vector.size());
  for (auto it = vector.begin(); it != vector.end(); ++it) {
    const mpq_class entry = *it * denominators;
    scaled.push_back(entry.get_num());
  }
  return primitive(scaled);
}

IntVector primitive(const IntVector& vector) {
  mpz_class divisor = 0;
  for (auto it = vector.begin(); it != vector.end(); ++it)
    mpz_gcd(divisor.get_mpz_t(), divisor.get_mpz_t(), it->get_mpz_t());
  if (divisor == 0)
    return vector;

  IntVector result;
  result.reserve(vector.size());
  for (auto it = vector.begin(); it != vector.end(); ++it)
    result.push_back(*it / divisor);
  return result;
}

OMEGAFAN_NAMESPACE_END
