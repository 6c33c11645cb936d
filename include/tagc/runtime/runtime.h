// C ABI of the tagc runtime, linked into every compiled program.
// Layouts and tag numbers here are shared bit-for-bit with generated code.
#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum TagcTag
{
    TAGC_TAG_INTEGER = 0,
    TAGC_TAG_FLOAT = 1,
    TAGC_TAG_BOOLEAN = 2,
    TAGC_TAG_STRING = 3,
    TAGC_TAG_LIST = 4,
    TAGC_TAG_STRUCT = 5,
    TAGC_TAG_TUPLE = 6,
    TAGC_TAG_ENUM = 7,
    TAGC_TAG_NULL = 8
} TagcTag;

typedef struct TagcValue
{
    int32_t tag;
    uint64_t payload;
} TagcValue;

typedef struct TagcList TagcList;
typedef struct TagcString TagcString;
typedef struct TagcRecord TagcRecord;
typedef struct TagcEnum TagcEnum;

// values
TagcValue tagc_rt_value_new_int(int64_t v);
TagcValue tagc_rt_value_new_float(double v);
TagcValue tagc_rt_value_new_bool(int32_t v);
TagcValue tagc_rt_value_new_null(void);
int32_t tagc_rt_value_tag(const TagcValue *v);
// unchecked extraction, only valid after the tag was verified
int64_t tagc_rt_value_as_int(const TagcValue *v);
double tagc_rt_value_as_float(const TagcValue *v);
int32_t tagc_rt_value_as_bool(const TagcValue *v);
void *tagc_rt_value_as_ref(const TagcValue *v);
const char *tagc_rt_tag_name(int32_t tag);
void tagc_rt_value_free(const TagcValue *v);

// lists
TagcList *tagc_rt_list_create(void);
TagcList *tagc_rt_list_create_with_capacity(int64_t capacity);
void tagc_rt_list_push(TagcList *list, const TagcValue *v);
void tagc_rt_list_get(const TagcList *list, int64_t index, TagcValue *out);
void tagc_rt_list_pop(TagcList *list, TagcValue *out);
int64_t tagc_rt_list_len(const TagcList *list);
int64_t tagc_rt_list_capacity(const TagcList *list);
int32_t tagc_rt_list_is_empty(const TagcList *list);
void tagc_rt_list_free(TagcList *list);
void tagc_rt_list_destroy(TagcList *list);

// strings
TagcString *tagc_rt_string_new(const char *data, int64_t len);
int64_t tagc_rt_string_len(const TagcString *s);
const char *tagc_rt_string_data(const TagcString *s);
void tagc_rt_string_free(TagcString *s);

// struct and tuple records; kind is TAGC_TAG_STRUCT or TAGC_TAG_TUPLE
TagcRecord *tagc_rt_record_new(int32_t kind, const char *type_name, int64_t field_count);
void tagc_rt_record_set(TagcRecord *r, int64_t index, const TagcValue *v);
void tagc_rt_record_get(const TagcRecord *r, int64_t index, TagcValue *out);
// moves a field out, leaving Null behind so a later record_free skips it
void tagc_rt_record_take(TagcRecord *r, int64_t index, TagcValue *out);
int64_t tagc_rt_record_len(const TagcRecord *r);
void tagc_rt_record_free(TagcRecord *r);

// enums
TagcEnum *tagc_rt_enum_new(const char *enum_name, const char *variant_name, int32_t discriminant, int64_t field_count);
int32_t tagc_rt_enum_discriminant(const TagcEnum *e);
const char *tagc_rt_enum_variant_name(const TagcEnum *e);
void tagc_rt_enum_set_field(TagcEnum *e, int64_t index, const TagcValue *v);
void tagc_rt_enum_get_field(const TagcEnum *e, int64_t index, TagcValue *out);
void tagc_rt_enum_take_field(TagcEnum *e, int64_t index, TagcValue *out);
void tagc_rt_enum_free(TagcEnum *e);

// output
void tagc_rt_print_int(int64_t v);
void tagc_rt_print_float(double v);
void tagc_rt_print_bool(int32_t v);
void tagc_rt_print_string(const TagcString *s);
void tagc_rt_print_value(const TagcValue *v);

// failure channel
#ifdef __cplusplus
[[noreturn]]
#endif
void tagc_rt_panic(const char *message, int64_t len);
#ifdef __cplusplus
[[noreturn]]
#endif
void tagc_rt_panic_tag_mismatch(int32_t expected, int32_t actual);

// allocation accounting
int64_t tagc_rt_live_allocations(void);
typedef void (*TagcFreeHook)(int32_t kind, const void *object);
void tagc_rt_set_free_hook(TagcFreeHook hook);

#ifdef __cplusplus
}
#endif
