// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_HELP_ACTION_GUARD
#define OMEGAFAN_HELP_ACTION_GUARD

#include <mathic.h>

OMEGAFAN_NAMESPACE_BEGIN

/// The mathic help action with an extra topic "logs".
class HelpAction : public mathic::HelpAction {
public:
  virtual void performAction();
};

OMEGAFAN_NAMESPACE_END

#endif
