#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: CK_COMPILER_MSVC, CK_COMPILER_CLANG, CK_COMPILER_GCC, CK_COMPILER_POSIX

#if defined(_MSC_VER)
#define CK_COMPILER_MSVC
#elif defined(__clang__)
#define CK_COMPILER_CLANG
#elif defined(__GNUC__)
#define CK_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(CK_COMPILER_CLANG) || defined(CK_COMPILER_GCC)
#define CK_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: CK_OS_WINDOWS, CK_OS_LINUX, CK_OS_APPLE, CK_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define CK_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define CK_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define CK_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define CK_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: CK_DEBUG, CK_RELEASE, CK_RELWITHDEBINFO
// Optional:   CK_ENABLE_ASSERT_IN_RELEASE
// Always defined: CK_ASSERT_ENABLED (0 or 1)

#if defined(CK_DEBUG) || defined(CK_RELWITHDEBINFO) || defined(CK_ENABLE_ASSERT_IN_RELEASE)
#define CK_ASSERT_ENABLED 1
#else
#define CK_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// CK_FORCE_INLINE - Force function to be inlined
#define CK_FORCE_INLINE CK_IMPL_FORCE_INLINE

// CK_COLD_FUNC - Mark function as rarely executed (error paths, assertions, growth)
// Usage: CK_COLD_FUNC void handle_error() { ... }
#define CK_COLD_FUNC CK_IMPL_COLD_FUNC

// CK_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define CK_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(CK_COMPILER_MSVC)

#define CK_IMPL_FORCE_INLINE __forceinline
#define CK_IMPL_COLD_FUNC

#elif defined(CK_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define CK_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define CK_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

