// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "TermOrder.hpp"

#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

std::string TermOrder::description() const {
  std::ostringstream out;
  out << (baseOrder() == LexBaseOrder ? "lex" : "revlex");
  if (isTotalDegree())
    out << " graded by total degree";
  else if (gradingCount() > 0) {
    out << " graded by";
    for (size_t grading = 0; grading < gradingCount(); ++grading) {
      out << (grading == 0 ? " (" : ", (");
      for (VarIndex var = 0; var < varCount(); ++var)
        out << (var == 0 ? "" : " ") << weight(grading, var);
      out << ')';
    }
  }
  return out.str();
}

OMEGAFAN_NAMESPACE_END
