// Object layouts and allocation helpers private to the runtime library.
#pragma once
#include <cstddef>
#include <cstdint>
#include "tagc/runtime/runtime.h"
#include "tagc/value.hpp"

struct TagcList
{
    TagcValue *buffer;
    int64_t length;
    int64_t capacity;
};

struct TagcString
{
    char *data; // nul terminated copy
    int64_t length;
};

struct TagcRecord
{
    int32_t kind;
    const char *type_name; // static storage owned by the compiled module
    int64_t field_count;
    TagcValue *fields;
};

struct TagcEnum
{
    int32_t discriminant;
    const char *enum_name;
    const char *variant_name;
    int64_t field_count;
    TagcValue *fields;
};

namespace tagc::rt
{
    // Every runtime allocation goes through these so live_allocations() stays exact.
    void *allocate(std::size_t bytes);
    void *allocate_array(std::size_t count, std::size_t elem);
    void release(void *p);
    void notify_free(int32_t kind, const void *object);

    [[noreturn]] void fail(const char *fmt, ...);
} // namespace tagc::rt
