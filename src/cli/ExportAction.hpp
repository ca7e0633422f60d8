// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_EXPORT_ACTION_GUARD
#define OMEGAFAN_EXPORT_ACTION_GUARD

#include "CommonParams.hpp"
#include <mathic.h>

OMEGAFAN_NAMESPACE_BEGIN

/// Writes an ideal in the input format of tropical geometry software.
class ExportAction : public mathic::Action {
public:
  ExportAction();

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
};

OMEGAFAN_NAMESPACE_END
#endif
