#pragma once

// Lean header with minimal dependencies, included by every container.
#include <chunked-core/macros.hh>

#include <source_location>

// =========================================================================================================
// CK_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
// Active when CK_ASSERT_ENABLED is 1 (debug and release-with-debug-info builds by default).
//
// Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS, i.e. programmer errors.
// They are NOT for user input, external conditions, or expected failures:
//   - Assertions      -> programmer errors, violated contracts
//   - optional<T>     -> expected "no value" results (e.g. chunked_vector::get, pop_back)
//
// Before aborting, the topmost assertion handler is called (see <chunked-core/assert-handler.hh>).
// Handlers may throw to unwind to a recovery point, which is how tests observe violations.
//
// Usage:
//   CK_ASSERT(0 <= i && i < size(), "index out of bounds");
//
#define CK_ASSERT(cond, msg) CK_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// CK_ASSERT_ALWAYS - Always-active assertion
//
// Like CK_ASSERT but remains active in all build configurations, including release builds.
// Used for checks whose violation would corrupt memory in every build (e.g. allocation failure).
//
#define CK_ASSERT_ALWAYS(cond, msg) CK_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// CK_DEBUG_BREAK - Breaks into the debugger if one is attached, otherwise does nothing
//
#define CK_DEBUG_BREAK() CK_IMPL_DEBUG_BREAK()

// =========================================================================================================
// CK_BREAK_AND_ABORT - Debug break (if attached) followed by program termination
//
#define CK_BREAK_AND_ABORT() (CK_DEBUG_BREAK(), ::ck::impl::perform_abort())


namespace ck
{
using source_location = std::source_location;
}

// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ck::impl
{
// Called when an assertion fails
// Dispatches to the active handler, or prints diagnostics to stderr
// Note: does not abort, caller must follow with CK_BREAK_AND_ABORT()
CK_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ck::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ck::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef CK_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define CK_IMPL_DEBUG_BREAK() (::ck::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(CK_COMPILER_POSIX)

// raise(SIGTRAP) instead of __builtin_trap() so we only break, the abort follows separately
// NOTE: declared here to avoid pulling <csignal> into every header; SIGTRAP is 5 on all posix targets
extern "C" int raise(int) noexcept;
#define CK_IMPL_DEBUG_BREAK() (::ck::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define CK_IMPL_DEBUG_BREAK() void(0)

#endif

#define CK_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ck::impl::handle_assert_failure(#cond, msg, ::ck::source_location::current()); \
            CK_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if CK_ASSERT_ENABLED

#define CK_IMPL_ASSERT(cond, msg) CK_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but cond and msg must still compile
#define CK_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        CK_UNUSED(cond);          \
        CK_UNUSED(msg);           \
    } while (false)

#endif
