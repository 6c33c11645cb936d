#pragma once

#include <vector>

#include "tagc/sexpr.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::control_ops {

// block / if / while. Nested instruction vectors are emitted through S.emit_scope so each
// arm releases its own scope on fallthrough.
bool handle(builder::State& S, const std::vector<tagc::node_ptr>& il, const tagc::node_ptr& inst);

// Closes a join block: with no predecessor it becomes `unreachable`.
void seal_join(builder::State& S, llvm::BasicBlock* join);

}
