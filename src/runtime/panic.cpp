#include "internal.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace
{
    bool panic_should_abort()
    {
        const char *v = std::getenv("TAGC_PANIC_ABORT");
        return v && v[0] == '1';
    }
}

extern "C" void tagc_rt_panic(const char *message, int64_t len)
{
    std::fputs("panic: ", stderr);
    if (message)
    {
        if (len < 0)
            std::fputs(message, stderr);
        else
            std::fwrite(message, 1, static_cast<size_t>(len), stderr);
    }
    std::fputc('\n', stderr);
    std::fflush(stderr);
    std::fflush(stdout);
    if (panic_should_abort())
        std::abort();
    std::_Exit(101);
}

extern "C" void tagc_rt_panic_tag_mismatch(int32_t expected, int32_t actual)
{
    tagc::rt::fail("type tag mismatch: expected %s, found %s", tagc_rt_tag_name(expected), tagc_rt_tag_name(actual));
}

namespace tagc::rt
{
    [[noreturn]] void fail(const char *fmt, ...)
    {
        char buf[512];
        va_list ap;
        va_start(ap, fmt);
        int n = std::vsnprintf(buf, sizeof buf, fmt, ap);
        va_end(ap);
        if (n < 0)
            n = 0;
        if (n >= static_cast<int>(sizeof buf))
            n = static_cast<int>(sizeof buf) - 1;
        tagc_rt_panic(buf, n);
    }
} // namespace tagc::rt
