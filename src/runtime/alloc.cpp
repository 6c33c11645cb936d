#include "internal.hpp"
#include <atomic>
#include <cstdlib>
#include <cstdio>

namespace tagc::rt
{
    namespace
    {
        std::atomic<int64_t> g_live{0};
        TagcFreeHook g_free_hook = nullptr;
    }

    void *allocate(std::size_t bytes)
    {
        void *p = std::malloc(bytes ? bytes : 1);
        if (!p)
            fail("out of memory (%zu bytes)", bytes);
        ++g_live;
        return p;
    }

    void *allocate_array(std::size_t count, std::size_t elem)
    {
        void *p = std::calloc(count ? count : 1, elem);
        if (!p)
            fail("out of memory (%zu x %zu bytes)", count, elem);
        ++g_live;
        return p;
    }

    void release(void *p)
    {
        if (!p)
            return;
        std::free(p);
        --g_live;
    }

    void notify_free(int32_t kind, const void *object)
    {
        if (g_free_hook)
            g_free_hook(kind, object);
    }
} // namespace tagc::rt

extern "C" int64_t tagc_rt_live_allocations(void) { return tagc::rt::g_live.load(); }

extern "C" void tagc_rt_set_free_hook(TagcFreeHook hook) { tagc::rt::g_free_hook = hook; }
