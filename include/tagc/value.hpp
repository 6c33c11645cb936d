// Tagged value encoding shared by the compiler and the runtime.
#pragma once
#include <cstdint>
#include <cstring>
#include <cstddef>
#include <optional>
#include <string_view>
#include "tagc/runtime/runtime.h"

namespace tagc
{

    enum class ValueTag : int32_t
    {
        Integer = TAGC_TAG_INTEGER,
        Float = TAGC_TAG_FLOAT,
        Boolean = TAGC_TAG_BOOLEAN,
        String = TAGC_TAG_STRING,
        List = TAGC_TAG_LIST,
        Struct = TAGC_TAG_STRUCT,
        Tuple = TAGC_TAG_TUPLE,
        Enum = TAGC_TAG_ENUM,
        Null = TAGC_TAG_NULL
    };

    static_assert(sizeof(TagcValue) == 16, "tagged value must be 16 bytes");
    static_assert(offsetof(TagcValue, payload) == 8, "payload must sit at offset 8");

    constexpr int32_t kValueTagCount = 9;

    inline bool is_valid_tag(int32_t t) { return t >= 0 && t < kValueTagCount; }
    // tags whose payload is an owned heap reference
    inline bool is_heap_tag(ValueTag t)
    {
        switch (t)
        {
        case ValueTag::String:
        case ValueTag::List:
        case ValueTag::Struct:
        case ValueTag::Tuple:
        case ValueTag::Enum:
            return true;
        default:
            return false;
        }
    }

    inline const char *tag_name(ValueTag t)
    {
        switch (t)
        {
        case ValueTag::Integer: return "Integer";
        case ValueTag::Float: return "Float";
        case ValueTag::Boolean: return "Boolean";
        case ValueTag::String: return "String";
        case ValueTag::List: return "List";
        case ValueTag::Struct: return "Struct";
        case ValueTag::Tuple: return "Tuple";
        case ValueTag::Enum: return "Enum";
        case ValueTag::Null: return "Null";
        }
        return "Unknown";
    }

    inline TagcValue make_value(ValueTag tag, uint64_t raw_bits)
    {
        TagcValue v;
        v.tag = static_cast<int32_t>(tag);
        v.payload = raw_bits;
        return v;
    }
    inline ValueTag tag_of(const TagcValue &v) { return static_cast<ValueTag>(v.tag); }

    // Bit-level reinterpretation helpers. Floats keep their exact pattern (NaN payloads, -0.0).
    inline uint64_t float_bits(double d)
    {
        uint64_t u;
        std::memcpy(&u, &d, sizeof u);
        return u;
    }
    inline double bits_float(uint64_t u)
    {
        double d;
        std::memcpy(&d, &u, sizeof d);
        return d;
    }
    inline uint64_t ref_bits(const void *p) { return static_cast<uint64_t>(reinterpret_cast<uintptr_t>(p)); }
    inline void *bits_ref(uint64_t u) { return reinterpret_cast<void *>(static_cast<uintptr_t>(u)); }

    inline std::optional<ValueTag> tag_from_name(std::string_view n)
    {
        for (int32_t i = 0; i < kValueTagCount; ++i)
            if (n == tag_name(static_cast<ValueTag>(i)))
                return static_cast<ValueTag>(i);
        return std::nullopt;
    }

} // namespace tagc
