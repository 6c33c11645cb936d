#pragma once

#include <vector>

#include "tagc/sexpr.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::core_ops {

// Each handler returns true if the instruction vector 'il' was recognized and emitted.
bool handle_literal(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst);
bool handle_arith(builder::State& S, const std::vector<tagc::node_ptr>& il);
bool handle_compare(builder::State& S, const std::vector<tagc::node_ptr>& il);
// var / set / let
bool handle_binding(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst);
bool handle_print(builder::State& S, const std::vector<tagc::node_ptr>& il);
bool handle_panic(builder::State& S, const std::vector<tagc::node_ptr>& il);

// Calls tagc_rt_panic with a constant message and terminates the block.
void emit_panic(builder::State& S, const std::string& message);

}
