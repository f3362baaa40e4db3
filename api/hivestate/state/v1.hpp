#pragma once

#include <vector>

#include "hivestate/state/v1/state.pb.h"

namespace hivestate::state::v1 {

using AgentList = std::vector<Agent>;
using TaskList  = std::vector<Task>;

} // namespace hivestate::state::v1
