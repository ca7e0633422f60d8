// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_PLUCKER_GUARD
#define OMEGAFAN_PLUCKER_GUARD

#include "Ideal.hpp"
#include <string>

OMEGAFAN_NAMESPACE_BEGIN

/// Returns the name of the Pluecker coordinate of the one-based pair i < j
/// among n indices: p12 if n < 10 and p1_12 otherwise.
std::string pluckerName(size_t i, size_t j, size_t n);

/// Returns the ideal of the Grassmannian G(2,n) of lines. There is one
/// variable p_ij for each pair i < j of {1, ..., n}, in lexicographic order
/// of the pairs, and one generator
///
///   p_ij*p_kl - p_ik*p_jl + p_il*p_jk
///
/// for each i < j < k < l. n must be at least 2.
Ideal plucker2Ideal(size_t n);

OMEGAFAN_NAMESPACE_END
#endif
