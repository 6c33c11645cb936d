#include "internal.hpp"
#include <cinttypes>
#include <cstdio>

namespace
{
    void write_value(std::FILE *out, const TagcValue &v);

    // strings carry their length and may contain NUL
    void write_string(std::FILE *out, const TagcString *s)
    {
        std::fwrite(s->data, 1, static_cast<std::size_t>(s->length), out);
    }

    void write_fields(std::FILE *out, const TagcValue *fields, int64_t n)
    {
        for (int64_t i = 0; i < n; ++i)
        {
            if (i)
                std::fputs(", ", out);
            write_value(out, fields[i]);
        }
    }

    void write_value(std::FILE *out, const TagcValue &v)
    {
        using tagc::ValueTag;
        void *ref = tagc::bits_ref(v.payload);
        switch (static_cast<ValueTag>(v.tag))
        {
        case ValueTag::Integer: std::fprintf(out, "%" PRId64, static_cast<int64_t>(v.payload)); break;
        case ValueTag::Float: std::fprintf(out, "%g", tagc::bits_float(v.payload)); break;
        case ValueTag::Boolean: std::fputs(v.payload ? "true" : "false", out); break;
        case ValueTag::Null: std::fputs("null", out); break;
        case ValueTag::String:
            std::fputc('"', out);
            write_string(out, static_cast<TagcString *>(ref));
            std::fputc('"', out);
            break;
        case ValueTag::List:
        {
            auto *l = static_cast<TagcList *>(ref);
            std::fputc('[', out);
            write_fields(out, l->buffer, l->length);
            std::fputc(']', out);
            break;
        }
        case ValueTag::Struct:
        case ValueTag::Tuple:
        {
            auto *r = static_cast<TagcRecord *>(ref);
            std::fprintf(out, "%s(", r->kind == TAGC_TAG_TUPLE ? "" : r->type_name);
            write_fields(out, r->fields, r->field_count);
            std::fputc(')', out);
            break;
        }
        case ValueTag::Enum:
        {
            auto *e = static_cast<TagcEnum *>(ref);
            std::fprintf(out, "%s::%s", e->enum_name, e->variant_name);
            if (e->field_count)
            {
                std::fputc('(', out);
                write_fields(out, e->fields, e->field_count);
                std::fputc(')', out);
            }
            break;
        }
        default:
            std::fprintf(out, "<invalid tag %d>", v.tag);
            break;
        }
    }
}

extern "C" void tagc_rt_print_int(int64_t v) { std::printf("%" PRId64 "\n", v); }
extern "C" void tagc_rt_print_float(double v) { std::printf("%g\n", v); }
extern "C" void tagc_rt_print_bool(int32_t v) { std::puts(v ? "true" : "false"); }
extern "C" void tagc_rt_print_string(const TagcString *s)
{
    write_string(stdout, s);
    std::fputc('\n', stdout);
}

extern "C" void tagc_rt_print_value(const TagcValue *v)
{
    write_value(stdout, *v);
    std::fputc('\n', stdout);
}
