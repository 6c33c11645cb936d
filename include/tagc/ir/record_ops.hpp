#pragma once

#include <vector>

#include "tagc/sexpr.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::record_ops {

// struct-new / struct-get / tuple-new / tuple-get. Structs and tuples share the runtime
// record representation; fields are stored boxed in declaration order.
bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst);

}
