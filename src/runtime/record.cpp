// Heap records backing struct, tuple and enum values.
#include "internal.hpp"

namespace
{
    TagcValue *new_fields(int64_t n)
    {
        if (n < 0)
            tagc::rt::fail("negative field count %lld", (long long)n);
        auto *f = static_cast<TagcValue *>(tagc::rt::allocate_array(static_cast<size_t>(n), sizeof(TagcValue)));
        for (int64_t i = 0; i < n; ++i)
            f[i] = tagc::make_value(tagc::ValueTag::Null, 0);
        return f;
    }

    void free_fields(TagcValue *fields, int64_t n)
    {
        for (int64_t i = 0; i < n; ++i)
            tagc_rt_value_free(&fields[i]);
        tagc::rt::release(fields);
    }

    void check_index(const char *what, const char *name, int64_t index, int64_t count)
    {
        if (index < 0 || index >= count)
            tagc::rt::fail("%s %s: field index %lld out of bounds (%lld fields)", what, name ? name : "?", (long long)index, (long long)count);
    }
}

extern "C" TagcRecord *tagc_rt_record_new(int32_t kind, const char *type_name, int64_t field_count)
{
    if (kind != TAGC_TAG_STRUCT && kind != TAGC_TAG_TUPLE)
        tagc::rt::fail("record_new: invalid record kind %d", kind);
    auto *r = static_cast<TagcRecord *>(tagc::rt::allocate(sizeof(TagcRecord)));
    r->kind = kind;
    r->type_name = type_name;
    r->field_count = field_count;
    r->fields = new_fields(field_count);
    return r;
}

extern "C" void tagc_rt_record_set(TagcRecord *r, int64_t index, const TagcValue *v)
{
    check_index("record", r->type_name, index, r->field_count);
    r->fields[index] = *v;
}

extern "C" void tagc_rt_record_get(const TagcRecord *r, int64_t index, TagcValue *out)
{
    check_index("record", r->type_name, index, r->field_count);
    *out = r->fields[index];
}

extern "C" void tagc_rt_record_take(TagcRecord *r, int64_t index, TagcValue *out)
{
    check_index("record", r->type_name, index, r->field_count);
    *out = r->fields[index];
    r->fields[index] = tagc::make_value(tagc::ValueTag::Null, 0);
}

extern "C" int64_t tagc_rt_record_len(const TagcRecord *r) { return r->field_count; }

extern "C" void tagc_rt_record_free(TagcRecord *r)
{
    if (!r)
        return;
    tagc::rt::notify_free(r->kind, r);
    free_fields(r->fields, r->field_count);
    tagc::rt::release(r);
}

extern "C" TagcEnum *tagc_rt_enum_new(const char *enum_name, const char *variant_name, int32_t discriminant, int64_t field_count)
{
    auto *e = static_cast<TagcEnum *>(tagc::rt::allocate(sizeof(TagcEnum)));
    e->discriminant = discriminant;
    e->enum_name = enum_name;
    e->variant_name = variant_name;
    e->field_count = field_count;
    e->fields = new_fields(field_count);
    return e;
}

extern "C" int32_t tagc_rt_enum_discriminant(const TagcEnum *e) { return e->discriminant; }
extern "C" const char *tagc_rt_enum_variant_name(const TagcEnum *e) { return e->variant_name; }

extern "C" void tagc_rt_enum_set_field(TagcEnum *e, int64_t index, const TagcValue *v)
{
    check_index("enum variant", e->variant_name, index, e->field_count);
    e->fields[index] = *v;
}

extern "C" void tagc_rt_enum_get_field(const TagcEnum *e, int64_t index, TagcValue *out)
{
    check_index("enum variant", e->variant_name, index, e->field_count);
    *out = e->fields[index];
}

extern "C" void tagc_rt_enum_take_field(TagcEnum *e, int64_t index, TagcValue *out)
{
    check_index("enum variant", e->variant_name, index, e->field_count);
    *out = e->fields[index];
    e->fields[index] = tagc::make_value(tagc::ValueTag::Null, 0);
}

extern "C" void tagc_rt_enum_free(TagcEnum *e)
{
    if (!e)
        return;
    tagc::rt::notify_free(TAGC_TAG_ENUM, e);
    free_fields(e->fields, e->field_count);
    tagc::rt::release(e);
}
