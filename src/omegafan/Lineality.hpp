// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_LINEALITY_GUARD
#define OMEGAFAN_LINEALITY_GUARD

#include "Ideal.hpp"
#include "QQMatrix.hpp"
#include "RegularSubdivision.hpp"
#include "SymbolicEngine.hpp"

OMEGAFAN_NAMESPACE_BEGIN

/// Returns a basis, in reduced row echelon form, of the span of the
/// differences of the exponent vectors of any two terms of the same
/// element of the reduced Groebner basis of ideal. These are the
/// hyperplanes whose intersection is the lineality space.
///
/// Throws DegenerateIdealError if ideal is zero or the whole ring.
QQMatrix linealitySpaceHRep(const Ideal& ideal, const SymbolicEngine& engine);

/// Returns a basis of the lineality space in reduced row echelon form. The
/// columns belong to the variables.
QQMatrix linealitySpaceVRep(const Ideal& ideal, const SymbolicEngine& engine);

/// Returns the columns of linealitySpaceVRep(ideal) in variable order, so
/// point i belongs to variable i.
PointConfiguration pointConfiguration(
  const Ideal& ideal,
  const SymbolicEngine& engine
);

OMEGAFAN_NAMESPACE_END
#endif
