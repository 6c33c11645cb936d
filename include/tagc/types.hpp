// Static type registry for the tagc core.
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <stdexcept>
#include "tagc/sexpr.hpp"
#include "tagc/value.hpp"

namespace tagc
{

    using TypeId = uint32_t;

    enum class BaseType
    {
        Bool,
        I64,
        F64,
        Null,
        Void
    };

    struct Type
    {
        enum class Kind
        {
            Base,
            String,
            List,
            Value, // raw tagged value
            Tuple,
            Struct,
            Enum
        } kind;
        BaseType base{};            // Base
        std::string name;           // Struct / Enum
        std::vector<TypeId> params; // Tuple elements
    };

    struct type_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    class TypeContext
    {
    public:
        TypeContext()
        {
            get_base(BaseType::Bool);
            get_base(BaseType::I64);
            get_base(BaseType::F64);
            get_base(BaseType::Null);
            get_base(BaseType::Void);
            string_ = add_type(Type{Type::Kind::String, {}, {}, {}});
            list_ = add_type(Type{Type::Kind::List, {}, {}, {}});
            value_ = add_type(Type{Type::Kind::Value, {}, {}, {}});
        }

        TypeId get_base(BaseType b)
        {
            auto key = static_cast<int>(b);
            auto it = base_index_.find(key);
            if (it != base_index_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Base;
            t.base = b;
            TypeId id = add_type(std::move(t));
            base_index_[key] = id;
            return id;
        }
        TypeId get_string() const { return string_; }
        TypeId get_list() const { return list_; }
        TypeId get_value() const { return value_; }
        TypeId get_tuple(const std::vector<TypeId> &elems)
        {
            auto it = tuple_cache_.find(elems);
            if (it != tuple_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Tuple;
            t.params = elems;
            TypeId id = add_type(std::move(t));
            tuple_cache_[elems] = id;
            return id;
        }
        // Named types must be declared before parse_type can resolve them.
        TypeId declare_struct(const std::string &name) { return declare_named(Type::Kind::Struct, name); }
        TypeId declare_enum(const std::string &name) { return declare_named(Type::Kind::Enum, name); }
        std::optional<TypeId> lookup_named(const std::string &name) const
        {
            auto it = named_.find(name);
            if (it == named_.end())
                return std::nullopt;
            return it->second;
        }

        const Type &at(TypeId id) const { return types_.at(id); }
        bool is_base(TypeId id, BaseType b) const { return at(id).kind == Type::Kind::Base && at(id).base == b; }
        bool is_void(TypeId id) const { return is_base(id, BaseType::Void); }
        bool is_numeric(TypeId id) const { return is_base(id, BaseType::I64) || is_base(id, BaseType::F64); }

        // Heap-owning types carry a destruction obligation; everything else is copied.
        bool is_heap_owning(TypeId id) const
        {
            switch (at(id).kind)
            {
            case Type::Kind::Base:
                return false;
            default:
                return true;
            }
        }

        // Discriminant implied by a static type, none for `value` and `void`.
        std::optional<ValueTag> tag_for(TypeId id) const
        {
            const Type &t = at(id);
            switch (t.kind)
            {
            case Type::Kind::Base:
                switch (t.base)
                {
                case BaseType::Bool: return ValueTag::Boolean;
                case BaseType::I64: return ValueTag::Integer;
                case BaseType::F64: return ValueTag::Float;
                case BaseType::Null: return ValueTag::Null;
                case BaseType::Void: return std::nullopt;
                }
                return std::nullopt;
            case Type::Kind::String: return ValueTag::String;
            case Type::Kind::List: return ValueTag::List;
            case Type::Kind::Tuple: return ValueTag::Tuple;
            case Type::Kind::Struct: return ValueTag::Struct;
            case Type::Kind::Enum: return ValueTag::Enum;
            case Type::Kind::Value:
                return std::nullopt;
            }
            return std::nullopt;
        }

        std::string to_string(TypeId id) const
        {
            const Type &t = at(id);
            switch (t.kind)
            {
            case Type::Kind::Base: return base_name(t.base);
            case Type::Kind::String: return "string";
            case Type::Kind::List: return "list";
            case Type::Kind::Value: return "value";
            case Type::Kind::Struct:
            case Type::Kind::Enum:
                return t.name;
            case Type::Kind::Tuple:
            {
                std::string s = "(tuple";
                for (auto e : t.params)
                    s += " " + to_string(e);
                return s + ")";
            }
            }
            return "<bad-type>";
        }

        // Parse a type form -> TypeId. Throws type_error for unknown names.
        TypeId parse_type(const node_ptr &n)
        {
            if (auto s = as_symbol(*n))
            {
                const auto &name = s->name;
                if (name == "i1" || name == "bool")
                    return get_base(BaseType::Bool);
                if (name == "i64")
                    return get_base(BaseType::I64);
                if (name == "f64")
                    return get_base(BaseType::F64);
                if (name == "null")
                    return get_base(BaseType::Null);
                if (name == "void")
                    return get_base(BaseType::Void);
                if (name == "string")
                    return string_;
                if (name == "list")
                    return list_;
                if (name == "value")
                    return value_;
                if (auto id = lookup_named(name))
                    return *id;
                throw type_error("unknown type '" + name + "'");
            }
            if (auto l = as_list(*n))
            {
                if (head_of(*n) == "tuple")
                {
                    std::vector<TypeId> elems;
                    for (size_t i = 1; i < l->elems.size(); ++i)
                        elems.push_back(parse_type(l->elems[i]));
                    if (elems.empty())
                        throw type_error("tuple type needs at least one element");
                    return get_tuple(elems);
                }
            }
            throw type_error("invalid type form " + tagc::to_string(n));
        }

    private:
        TypeId add_type(Type t)
        {
            types_.push_back(std::move(t));
            return static_cast<TypeId>(types_.size() - 1);
        }
        TypeId declare_named(Type::Kind k, const std::string &name)
        {
            if (auto id = lookup_named(name))
            {
                if (at(*id).kind != k)
                    throw type_error("'" + name + "' already declared as a different kind of type");
                return *id;
            }
            Type t{};
            t.kind = k;
            t.name = name;
            TypeId id = add_type(std::move(t));
            named_[name] = id;
            return id;
        }
        static std::string base_name(BaseType b)
        {
            switch (b)
            {
            case BaseType::Bool: return "bool";
            case BaseType::I64: return "i64";
            case BaseType::F64: return "f64";
            case BaseType::Null: return "null";
            case BaseType::Void: return "void";
            }
            return "?";
        }

        std::vector<Type> types_;
        std::unordered_map<int, TypeId> base_index_;
        std::map<std::vector<TypeId>, TypeId> tuple_cache_;
        std::unordered_map<std::string, TypeId> named_;
        TypeId string_{0}, list_{0}, value_{0};
    };

} // namespace tagc
