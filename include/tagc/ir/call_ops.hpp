#pragma once

#include <vector>

#include "tagc/sexpr.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::call_ops {

// (call %dst <ret> callee %args...). Heap arguments transfer ownership to the callee,
// which releases them on exit; the caller emits no drop for them.
bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst);

}
