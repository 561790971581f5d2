#pragma once

// Main fuzzynav header
// You can also include the parts individually:
//   #include "fuzzynav/fuzzy/engine.hpp"
//   #include "fuzzynav/nav/cycle.hpp"

#include "fuzzynav/config.hpp"
#include "fuzzynav/fuzzy/engine.hpp"
#include "fuzzynav/nav/cycle.hpp"
#include "fuzzynav/nav/decision.hpp"
#include "fuzzynav/nav/rule_base.hpp"
#include "fuzzynav/navigator.hpp"
#include "fuzzynav/transport/sim.hpp"
#include "fuzzynav/transport/transport.hpp"
#include "fuzzynav/types.hpp"
#include "fuzzynav/utils/visualize.hpp"
