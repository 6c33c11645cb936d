#include "tagc/ownership.hpp"
#include <algorithm>

namespace tagc
{

    int OwnershipTracker::enter_scope()
    {
        st_.scopes.emplace_back();
        return depth();
    }

    std::vector<OwnershipRecord> OwnershipTracker::exit_scope()
    {
        std::vector<OwnershipRecord> out;
        if (st_.scopes.empty())
            return out;
        int d = depth();
        for (auto it = st_.records.rbegin(); it != st_.records.rend(); ++it)
            if (it->depth == d)
                out.push_back(*it);
        st_.records.erase(std::remove_if(st_.records.begin(), st_.records.end(), [&](const OwnershipRecord &r) { return r.depth == d; }), st_.records.end());
        for (auto &name : st_.scopes.back())
        {
            st_.bindings.erase(name);
            st_.moved.erase(name);
        }
        st_.scopes.pop_back();
        return out;
    }

    bool OwnershipTracker::owns(const std::string &name) const
    {
        return std::any_of(st_.records.begin(), st_.records.end(), [&](const OwnershipRecord &r) { return r.name == name; });
    }

    const OwnershipTracker::State::Binding *OwnershipTracker::binding(const std::string &name) const
    {
        auto it = st_.bindings.find(name);
        return it == st_.bindings.end() ? nullptr : &it->second;
    }

    void OwnershipTracker::declare(const std::string &name, TypeId type)
    {
        if (st_.scopes.empty())
            enter_scope();
        int d = depth();
        st_.bindings[name] = State::Binding{type, d};
        st_.scopes.back().push_back(name);
        st_.moved.erase(name);
        if (ctx_.is_heap_owning(type))
            st_.records.push_back(OwnershipRecord{name, type, d});
    }

    Access OwnershipTracker::read(const std::string &name) const
    {
        if (!is_declared(name))
            return Access::Undefined;
        if (is_moved(name))
            return Access::Moved;
        return Access::Ok;
    }

    Access OwnershipTracker::move(const std::string &name)
    {
        Access a = read(name);
        if (a != Access::Ok)
            return a;
        auto &b = st_.bindings.at(name);
        if (!ctx_.is_heap_owning(b.type))
            return Access::Ok;
        bool outside_loop = !st_.loops.empty() && b.depth < st_.loops.back();
        st_.records.erase(std::remove_if(st_.records.begin(), st_.records.end(), [&](const OwnershipRecord &r) { return r.name == name; }), st_.records.end());
        st_.moved.insert(name);
        return outside_loop ? Access::MovedInLoop : Access::Ok;
    }

    void OwnershipTracker::mark_moved(const std::string &name)
    {
        st_.records.erase(std::remove_if(st_.records.begin(), st_.records.end(), [&](const OwnershipRecord &r) { return r.name == name; }), st_.records.end());
        if (is_declared(name))
            st_.moved.insert(name);
    }

    std::vector<OwnershipRecord> OwnershipTracker::live_records() const
    {
        return std::vector<OwnershipRecord>(st_.records.rbegin(), st_.records.rend());
    }

    std::vector<OwnershipRecord> OwnershipTracker::moved_since(const State &before) const
    {
        std::vector<OwnershipRecord> out;
        for (auto &r : before.records)
            if (!owns(r.name))
                out.push_back(r);
        return out;
    }

    node_ptr encode_drops(const std::vector<OwnershipRecord> &drops)
    {
        vector_t v;
        for (auto &d : drops)
            v.elems.push_back(node_list({n_sym("drop"), n_sym("%" + d.name), n_i64((int64_t)d.type), n_i64(d.depth)}));
        return detail::make_node(std::move(v));
    }

    std::vector<OwnershipRecord> decode_drops(const node &n, const std::string &key)
    {
        std::vector<OwnershipRecord> out;
        auto it = n.metadata.find(key);
        if (it == n.metadata.end() || !it->second)
            return out;
        auto v = as_vector(*it->second);
        if (!v)
            return out;
        for (auto &e : v->elems)
        {
            auto l = as_list(*e);
            if (!l || l->elems.size() != 4)
                continue;
            std::string name = name_of(l->elems[1]);
            if (!name.empty() && name[0] == '%')
                name.erase(0, 1);
            auto ty = std::get_if<int64_t>(&l->elems[2]->data);
            auto dp = std::get_if<int64_t>(&l->elems[3]->data);
            if (!ty || !dp)
                continue;
            out.push_back(OwnershipRecord{name, (TypeId)*ty, (int)*dp});
        }
        return out;
    }

} // namespace tagc
