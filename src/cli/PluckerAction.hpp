// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_PLUCKER_ACTION_GUARD
#define OMEGAFAN_PLUCKER_ACTION_GUARD

#include "CommonParams.hpp"
#include <mathic.h>

OMEGAFAN_NAMESPACE_BEGIN

/// Writes the ideal of the Grassmannian of lines G(2,n).
class PluckerAction : public mathic::Action {
public:
  PluckerAction();

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
  mathic::IntegerParameter mN;
};

OMEGAFAN_NAMESPACE_END
#endif
