#include "internal.hpp"
#include <cstring>

namespace
{
    constexpr int64_t kInitialCapacity = 4;

    TagcList *checked(TagcList *l, const char *op)
    {
        if (!l)
            tagc::rt::fail("%s: null list handle", op);
        return l;
    }
    const TagcList *checked(const TagcList *l, const char *op)
    {
        if (!l)
            tagc::rt::fail("%s: null list handle", op);
        return l;
    }

    void grow(TagcList *l)
    {
        int64_t cap = l->capacity * 2;
        auto *fresh = static_cast<TagcValue *>(tagc::rt::allocate_array(static_cast<size_t>(cap), sizeof(TagcValue)));
        if (l->length)
            std::memcpy(fresh, l->buffer, static_cast<size_t>(l->length) * sizeof(TagcValue));
        tagc::rt::release(l->buffer);
        l->buffer = fresh;
        l->capacity = cap;
    }
}

extern "C" TagcList *tagc_rt_list_create(void) { return tagc_rt_list_create_with_capacity(kInitialCapacity); }

extern "C" TagcList *tagc_rt_list_create_with_capacity(int64_t capacity)
{
    if (capacity < 1)
        capacity = 1;
    auto *l = static_cast<TagcList *>(tagc::rt::allocate(sizeof(TagcList)));
    l->buffer = static_cast<TagcValue *>(tagc::rt::allocate_array(static_cast<size_t>(capacity), sizeof(TagcValue)));
    l->length = 0;
    l->capacity = capacity;
    return l;
}

extern "C" void tagc_rt_list_push(TagcList *list, const TagcValue *v)
{
    checked(list, "list_push");
    if (list->length == list->capacity)
        grow(list);
    list->buffer[list->length++] = *v;
}

extern "C" void tagc_rt_list_get(const TagcList *list, int64_t index, TagcValue *out)
{
    checked(list, "list_get");
    if (index < 0 || index >= list->length)
        tagc::rt::fail("list index out of bounds: index %lld, length %lld", (long long)index, (long long)list->length);
    *out = list->buffer[index];
}

extern "C" void tagc_rt_list_pop(TagcList *list, TagcValue *out)
{
    checked(list, "list_pop");
    if (list->length == 0)
        tagc::rt::fail("list_pop on empty list");
    *out = list->buffer[--list->length];
}

extern "C" int64_t tagc_rt_list_len(const TagcList *list) { return checked(list, "list_len")->length; }
extern "C" int64_t tagc_rt_list_capacity(const TagcList *list) { return checked(list, "list_capacity")->capacity; }
extern "C" int32_t tagc_rt_list_is_empty(const TagcList *list) { return checked(list, "list_is_empty")->length == 0; }

extern "C" void tagc_rt_list_free(TagcList *list)
{
    if (!list)
        return;
    tagc::rt::notify_free(TAGC_TAG_LIST, list);
    for (int64_t i = 0; i < list->length; ++i)
        tagc_rt_value_free(&list->buffer[i]);
    tagc::rt::release(list->buffer);
    list->buffer = nullptr;
    list->length = list->capacity = 0;
    tagc::rt::release(list);
}

extern "C" void tagc_rt_list_destroy(TagcList *list) { tagc_rt_list_free(list); }
