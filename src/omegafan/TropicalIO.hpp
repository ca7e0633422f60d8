// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_TROPICAL_IO_GUARD
#define OMEGAFAN_TROPICAL_IO_GUARD

#include "Ideal.hpp"
#include "PolyhedralFan.hpp"
#include "RegularSubdivision.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <utility>

OMEGAFAN_NAMESPACE_BEGIN

/// The rays of a fan and the incidence matrix of its cones.
typedef std::pair<std::vector<IntVector>, IncidenceMatrix> RaysAndCones;

/// Reads the rays and cones of a fan in the text format of tropical
/// geometry software. A line that starts with RAYS, CONES_ORBITS or CONES
/// starts a section and an empty line ends it. Lines of other sections are
/// ignored, as is everything after # on a line. Index lines like {0 3 4}
/// are zero-based.
///
/// If coneOrbitsGiven then the cones are read from CONES_ORBITS, otherwise
/// from CONES. If negateRays then every ray is negated.
RaysAndCones parseTropicalFan(
  std::istream& in,
  bool coneOrbitsGiven,
  bool negateRays
);

RaysAndCones parseTropicalFan(
  const std::string& text,
  bool coneOrbitsGiven,
  bool negateRays
);

/// Writes fan in the format read by parseTropicalFan.
void writeTropicalFan(std::ostream& out, const PolyhedralFan& fan);

/// Pads the number of each letters-then-digits token like x12 with zeros
/// to the width of the largest such number in s, so that sorting the
/// names as strings agrees with sorting by number.
std::string padVariableNumbers(const std::string& s);

/// Returns Q[y1,...,yn] with padded numbers.
std::string ringToGfan(size_t varCount);

/// Returns ringToGfan, an empty line and the generators of ideal in braces
/// written in the variables y1, ..., yn. Returns an empty string for the
/// zero ideal.
std::string idealToGfan(const Ideal& ideal);

/// Returns the homogenized points like {(1, 0, 1), (1, 1, 0)}.
std::string pointConfigurationToString(const PointConfiguration& points);

OMEGAFAN_NAMESPACE_END
#endif
