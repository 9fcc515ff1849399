#include "assert.hh"

#include <chunked-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#ifdef CK_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef CK_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: not thread-safe, must be externally synchronized
std::vector<ck::impl::assertion_handler> g_assertion_handlers;

void default_assert_handler(ck::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
    std::cerr.flush();
}
} // namespace

void ck::impl::push_assertion_handler(assertion_handler handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void ck::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

int ck::impl::assertion_handler_count()
{
    return int(g_assertion_handlers.size());
}

ck::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

ck::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

CK_COLD_FUNC void ck::impl::handle_assert_failure(char const* expression, char const* message, ck::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool ck::impl::is_debugger_connected() noexcept
{
#ifdef CK_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(CK_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a tracer is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                if (std::sscanf(buf + 10, "%d", &pid) != 1)
                    pid = 0;
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void ck::impl::perform_abort() noexcept
{
    std::abort();
}
