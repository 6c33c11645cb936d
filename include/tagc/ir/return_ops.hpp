#pragma once

#include <vector>

#include "tagc/sexpr.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::return_ops {

// (ret <ty> %x) / (ret void): releases every live binding listed in the node's "drops",
// innermost scope first, then returns.
bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst);

}
