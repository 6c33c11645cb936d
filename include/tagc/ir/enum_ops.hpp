#pragma once

#include <vector>

#include "tagc/sexpr.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::enum_ops {

// (enum-new %c Color RGB [ %r %g %b ])
bool handle_enum_new(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst);

// (match Color %c :cases [ (case RGB :binds [ (bind %r 0) ] :body [ ... ]) ] :default [ ... ])
// Lowered to a compare chain on the discriminant. Without a :default the final fallthrough
// panics; the checker guarantees every variant has a case in that situation.
bool handle_match(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst);

}
