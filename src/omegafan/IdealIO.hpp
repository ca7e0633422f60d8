// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_IDEAL_IO_GUARD
#define OMEGAFAN_IDEAL_IO_GUARD

#include "Ideal.hpp"
#include "Scanner.hpp"
#include <memory>
#include <ostream>
#include <string>

OMEGAFAN_NAMESPACE_BEGIN

/// Reads a ring declaration like Q[x,y,z].
std::shared_ptr<const PolyRing> readRing(Scanner& in);

/// Reads a polynomial like 2*x^2*y - 1/3*z + 5 in the variables of ring.
Poly readPoly(Scanner& in, const PolyRing& ring);

/// Reads a ring declaration followed by generators in braces:
///
///   Q[x,y]
///   {
///     x*y - 1, # a comment
///     x^2
///   }
Ideal readIdeal(Scanner& in);

/// As readIdeal but also checks that there is nothing after the ideal.
Ideal parseIdeal(const std::string& text);

/// Writes ideal in the format read by readIdeal.
void writeIdeal(std::ostream& out, const Ideal& ideal);

OMEGAFAN_NAMESPACE_END
#endif
