#pragma once

#include <vector>

#include "tagc/sexpr.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::list_ops {

// list-new / list-with-capacity / list-push / list-get / list-pop / list-len / list-is-empty
bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst);

}
