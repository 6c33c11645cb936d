#include "internal.hpp"
#include <cstring>

extern "C" TagcString *tagc_rt_string_new(const char *data, int64_t len)
{
    if (len < 0)
        len = data ? static_cast<int64_t>(std::strlen(data)) : 0;
    auto *s = static_cast<TagcString *>(tagc::rt::allocate(sizeof(TagcString)));
    s->data = static_cast<char *>(tagc::rt::allocate(static_cast<size_t>(len) + 1));
    if (len)
        std::memcpy(s->data, data, static_cast<size_t>(len));
    s->data[len] = '\0';
    s->length = len;
    return s;
}

extern "C" int64_t tagc_rt_string_len(const TagcString *s) { return s ? s->length : 0; }
extern "C" const char *tagc_rt_string_data(const TagcString *s) { return s ? s->data : ""; }

extern "C" void tagc_rt_string_free(TagcString *s)
{
    if (!s)
        return;
    tagc::rt::notify_free(TAGC_TAG_STRING, s);
    tagc::rt::release(s->data);
    tagc::rt::release(s);
}
