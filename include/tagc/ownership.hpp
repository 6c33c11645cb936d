// Single-owner move tracking for heap-owning bindings.
#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include "tagc/sexpr.hpp"
#include "tagc/types.hpp"

namespace tagc
{

    // A binding that currently owns a heap resource and owes one destruction.
    struct OwnershipRecord
    {
        std::string name;
        TypeId type;
        int depth;
    };

    enum class Access
    {
        Ok,
        Undefined,
        Moved,
        MovedInLoop // source declared outside the innermost loop body
    };

    class OwnershipTracker
    {
    public:
        struct State
        {
            struct Binding
            {
                TypeId type;
                int depth;
            };
            std::unordered_map<std::string, Binding> bindings;
            std::vector<OwnershipRecord> records; // declaration order
            std::unordered_set<std::string> moved;
            std::vector<std::vector<std::string>> scopes;
            std::vector<int> loops; // depth of each enclosing loop body
        };

        explicit OwnershipTracker(const TypeContext &ctx) : ctx_(ctx) {}

        int enter_scope();
        // Ends the innermost scope; returns the records it owed, in destruction (LIFO) order.
        std::vector<OwnershipRecord> exit_scope();
        int depth() const { return static_cast<int>(st_.scopes.size()); }

        void enter_loop() { st_.loops.push_back(depth() + 1); }
        void exit_loop()
        {
            if (!st_.loops.empty())
                st_.loops.pop_back();
        }

        bool is_heap_owning(TypeId t) const { return ctx_.is_heap_owning(t); }
        bool is_declared(const std::string &name) const { return st_.bindings.count(name) != 0; }
        bool is_moved(const std::string &name) const { return st_.moved.count(name) != 0; }
        bool owns(const std::string &name) const;
        const State::Binding *binding(const std::string &name) const;

        // Registers a binding in the current scope; heap-owning types get a Live record.
        void declare(const std::string &name, TypeId type);
        // Non-consuming use.
        Access read(const std::string &name) const;
        // Ownership-transferring use. Copy-typed bindings are only read.
        Access move(const std::string &name);
        // Applies a move already validated on another path (branch merge).
        void mark_moved(const std::string &name);

        // Every live record, innermost first (the order a return must destroy them).
        std::vector<OwnershipRecord> live_records() const;
        // Records alive in `before` that have been moved since.
        std::vector<OwnershipRecord> moved_since(const State &before) const;

        const State &snapshot() const { return st_; }
        void restore(State s) { st_ = std::move(s); }

    private:
        const TypeContext &ctx_;
        State st_;
    };

    // Destruction obligations are stored on the tree as a vector of (drop %name <type-id> <depth>).
    node_ptr encode_drops(const std::vector<OwnershipRecord> &drops);
    std::vector<OwnershipRecord> decode_drops(const node &n, const std::string &key);

} // namespace tagc
