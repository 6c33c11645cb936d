#include "internal.hpp"

using tagc::ValueTag;

extern "C" TagcValue tagc_rt_value_new_int(int64_t v) { return tagc::make_value(ValueTag::Integer, static_cast<uint64_t>(v)); }
extern "C" TagcValue tagc_rt_value_new_float(double v) { return tagc::make_value(ValueTag::Float, tagc::float_bits(v)); }
extern "C" TagcValue tagc_rt_value_new_bool(int32_t v) { return tagc::make_value(ValueTag::Boolean, v ? 1u : 0u); }
extern "C" TagcValue tagc_rt_value_new_null(void) { return tagc::make_value(ValueTag::Null, 0); }

extern "C" int32_t tagc_rt_value_tag(const TagcValue *v) { return v->tag; }
extern "C" int64_t tagc_rt_value_as_int(const TagcValue *v) { return static_cast<int64_t>(v->payload); }
extern "C" double tagc_rt_value_as_float(const TagcValue *v) { return tagc::bits_float(v->payload); }
extern "C" int32_t tagc_rt_value_as_bool(const TagcValue *v) { return v->payload != 0; }
extern "C" void *tagc_rt_value_as_ref(const TagcValue *v) { return tagc::bits_ref(v->payload); }

extern "C" const char *tagc_rt_tag_name(int32_t tag)
{
    if (!tagc::is_valid_tag(tag))
        return "Unknown";
    return tagc::tag_name(static_cast<ValueTag>(tag));
}

// Releases whatever heap object the value references; scalars are a no-op.
extern "C" void tagc_rt_value_free(const TagcValue *v)
{
    if (!v)
        return;
    void *ref = tagc::bits_ref(v->payload);
    switch (static_cast<ValueTag>(v->tag))
    {
    case ValueTag::String:
        tagc_rt_string_free(static_cast<TagcString *>(ref));
        break;
    case ValueTag::List:
        tagc_rt_list_free(static_cast<TagcList *>(ref));
        break;
    case ValueTag::Struct:
    case ValueTag::Tuple:
        tagc_rt_record_free(static_cast<TagcRecord *>(ref));
        break;
    case ValueTag::Enum:
        tagc_rt_enum_free(static_cast<TagcEnum *>(ref));
        break;
    case ValueTag::Integer:
    case ValueTag::Float:
    case ValueTag::Boolean:
    case ValueTag::Null:
        break;
    default:
        tagc::rt::fail("value_free: invalid tag %d", v->tag);
    }
}
