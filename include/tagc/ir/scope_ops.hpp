#pragma once

#include <vector>

#include "tagc/ownership.hpp"
#include "tagc/ir/builder.hpp"

namespace tagc::ir::scope_ops {

// Releases one owned binding with the runtime destructor for its type.
void emit_drop(builder::State& S, const tagc::OwnershipRecord& rec);
// Releases in the given order (the checker already lists them innermost-first, LIFO).
void emit_drops(builder::State& S, const std::vector<tagc::OwnershipRecord>& drops);

// Emits a nested instruction vector followed by its "scope-drops" when control falls off the end.
void emit_scope(builder::State& S, const tagc::node_ptr& vec,
                const std::function<void(const std::vector<tagc::node_ptr>&)>& emit_list);

} // namespace tagc::ir::scope_ops
