// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_ERRORS_GUARD
#define OMEGAFAN_ERRORS_GUARD

#include <stdexcept>
#include <string>

OMEGAFAN_NAMESPACE_BEGIN

/// Base class of the errors raised by the library. Malformed text input is
/// reported through mathic::reportError instead.
class OmegaFanError : public std::runtime_error {
public:
  explicit OmegaFanError(const std::string& what): std::runtime_error(what) {}
};

/// The ideal is zero or the whole ring, so it has no point configuration.
class DegenerateIdealError : public OmegaFanError {
public:
  explicit DegenerateIdealError(const std::string& what): OmegaFanError(what) {}
};

/// Sizes of ideals, point configurations, weights, rays or cones do not
/// fit together.
class InconsistentDimensionError : public OmegaFanError {
public:
  explicit InconsistentDimensionError(const std::string& what):
    OmegaFanError(what) {}
};

/// A Groebner basis computation was stopped or cannot be carried out.
class SymbolicEngineFailure : public OmegaFanError {
public:
  explicit SymbolicEngineFailure(const std::string& what):
    OmegaFanError(what) {}
};

/// A Groebner basis computation ran past its deadline.
class ComputationTimeout : public SymbolicEngineFailure {
public:
  explicit ComputationTimeout(const std::string& what):
    SymbolicEngineFailure(what) {}
};

/// A Groebner basis grew beyond the allowed number of elements.
class BasisSizeLimitExceeded : public SymbolicEngineFailure {
public:
  explicit BasisSizeLimitExceeded(const std::string& what):
    SymbolicEngineFailure(what) {}
};

/// Polyhedral data that does not describe what it should.
class PolyhedralEngineFailure : public OmegaFanError {
public:
  explicit PolyhedralEngineFailure(const std::string& what):
    OmegaFanError(what) {}
};

OMEGAFAN_NAMESPACE_END
#endif
