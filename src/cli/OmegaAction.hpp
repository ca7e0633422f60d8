// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_OMEGA_ACTION_GUARD
#define OMEGAFAN_OMEGA_ACTION_GUARD

#include "CommonParams.hpp"
#include <mathic.h>

OMEGAFAN_NAMESPACE_BEGIN

/// Filters the cones of a secondary fan by comparing initial ideals with
/// the bound ideals at each cone.
class OmegaAction : public mathic::Action {
public:
  OmegaAction();

  virtual void directOptions(
    std::vector<std::string> tokens,
    mathic::CliParser& parser
  );

  virtual void performAction();

  static const char* staticName();

  virtual const char* name() const;
  virtual const char* description() const;
  virtual const char* shortDescription() const;

  virtual void pushBackParameters(
    std::vector<mathic::CliParameter*>& parameters
  );

private:
  CommonParams mParams;
  mathic::BoolParameter mStar;
  mathic::BoolParameter mOutside;
  mathic::BoolParameter mOrbits;
  mathic::BoolParameter mNegateRays;
  mathic::IntegerParameter mTimeLimit;
  mathic::IntegerParameter mMaxBasisSize;
  mathic::BoolParameter mPartial;
  mathic::StringParameter mOutput;
};

OMEGAFAN_NAMESPACE_END
#endif
