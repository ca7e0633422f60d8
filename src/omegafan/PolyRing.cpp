// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "PolyRing.hpp"

#include "Errors.hpp"
#include <algorithm>
#include <set>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

namespace {
  void checkVariables(
    const std::vector<std::string>& varNames,
    const TermOrder& order
  ) {
    if (order.varCount() != varNames.size()) {
      std::ostringstream out;
      out << "The monomial order is for " << order.varCount()
        << " variables but the ring has " << varNames.size() << '.';
      throw InconsistentDimensionError(out.str());
    }
    std::set<std::string> seen;
    for (auto it = varNames.begin(); it != varNames.end(); ++it) {
      if (it->empty())
        throw OmegaFanError("Empty variable name.");
      if (!seen.insert(*it).second)
        throw OmegaFanError("Variable " + *it + " appears twice.");
    }
  }
}

PolyRing::PolyRing(std::vector<std::string> varNames, const TermOrder& order):
  mVarNames(std::move(varNames)),
  mMonoid(order)
{
  checkVariables(mVarNames, order);
}

PolyRing::PolyRing(std::vector<std::string> varNames):
  mVarNames(std::move(varNames)),
  mMonoid(TermOrder(mVarNames.size()))
{
  checkVariables(mVarNames, order());
}

std::shared_ptr<const PolyRing> PolyRing::standard(const VarIndex varCount) {
  std::vector<std::string> names;
  for (VarIndex var = 0; var < varCount; ++var) {
    std::ostringstream name;
    name << 'x' << (var + 1);
    names.push_back(name.str());
  }
  return std::make_shared<PolyRing>(std::move(names));
}

PolyRing::VarIndex PolyRing::varIndex(const std::string& name) const {
  const auto it = std::find(mVarNames.begin(), mVarNames.end(), name);
  if (it == mVarNames.end())
    return static_cast<VarIndex>(-1);
  return static_cast<VarIndex>(it - mVarNames.begin());
}

std::shared_ptr<const PolyRing> PolyRing::withOrder(
  const TermOrder& order
) const {
  return std::make_shared<PolyRing>(mVarNames, order);
}

std::shared_ptr<const PolyRing> PolyRing::withExtraVariable(
  const std::string& name
) const {
  auto names = mVarNames;
  names.push_back(name);
  return std::make_shared<PolyRing>(std::move(names));
}

std::shared_ptr<const PolyRing> PolyRing::subring(
  const std::vector<VarIndex>& vars
) const {
  OMEGAFAN_ASSERT(std::is_sorted(vars.begin(), vars.end()));
  std::vector<std::string> names;
  for (auto it = vars.begin(); it != vars.end(); ++it) {
    if (*it >= varCount())
      throw InconsistentDimensionError("Subring variable out of range.");
    names.push_back(mVarNames[*it]);
  }
  return std::make_shared<PolyRing>(std::move(names));
}

void PolyRing::write(std::ostream& out) const {
  out << "Q[";
  for (VarIndex var = 0; var < varCount(); ++var)
    out << (var == 0 ? "" : ",") << mVarNames[var];
  out << ']';
}

OMEGAFAN_NAMESPACE_END
