// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "IncidenceMatrix.hpp"

#include "Errors.hpp"
#include <algorithm>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

IncidenceMatrix::IncidenceMatrix(size_t colCount, std::vector<Row> rows):
  mColCount(colCount)
{
  mRows.reserve(rows.size());
  for (auto it = rows.begin(); it != rows.end(); ++it)
    appendRow(std::move(*it));
}

bool IncidenceMatrix::contains(size_t row, size_t col) const {
  const auto& r = this->row(row);
  return std::binary_search(r.begin(), r.end(), col);
}

bool IncidenceMatrix::rowIsSubset(size_t a, size_t b) const {
  return std::includes(row(b).begin(), row(b).end(),
    row(a).begin(), row(a).end());
}

void IncidenceMatrix::appendRow(Row row) {
  std::sort(row.begin(), row.end());
  row.erase(std::unique(row.begin(), row.end()), row.end());
  if (!row.empty() && row.back() >= mColCount) {
    std::ostringstream out;
    out << "Index " << row.back() << " in row " << mRows.size()
      << " is out of range for " << mColCount << " columns.";
    throw InconsistentDimensionError(out.str());
  }
  mRows.push_back(std::move(row));
}

IncidenceMatrix IncidenceMatrix::restrictedTo(
  const std::vector<size_t>& rows
) const {
  IncidenceMatrix restricted(mColCount);
  restricted.mRows.reserve(rows.size());
  for (auto it = rows.begin(); it != rows.end(); ++it) {
    if (*it >= rowCount())
      throw InconsistentDimensionError("Row index out of range.");
    restricted.mRows.push_back(row(*it));
  }
  return restricted;
}

void IncidenceMatrix::print(std::ostream& out, size_t offset) const {
  for (auto row = mRows.begin(); row != mRows.end(); ++row) {
    out << '{';
    for (auto it = row->begin(); it != row->end(); ++it)
      out << (it == row->begin() ? "" : " ") << (*it + offset);
    out << "}\n";
  }
}

OMEGAFAN_NAMESPACE_END
