#pragma once

// =========================================================================================================
// Toolchain
// =========================================================================================================
// RC_COMPILER_MSVC or RC_COMPILER_POSIX (gcc, clang, mingw and the embedded gcc/clang toolchains)

#if defined(_MSC_VER) && !defined(__clang__)
#define RC_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__)
#define RC_COMPILER_POSIX
#else
#error "rack-core needs MSVC or a gcc-compatible compiler"
#endif

// RC_OS_LINUX: /proc is available for debugger detection
// RC_OS_BARE_METAL: no OS at all, so no signals and no debugger query
#if defined(__linux__)
#define RC_OS_LINUX
#elif !defined(_WIN32) && !defined(__APPLE__) && !defined(__unix__)
#define RC_OS_BARE_METAL
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// CMake defines one of RC_DEBUG, RC_RELWITHDEBINFO, RC_RELEASE.
// RC_ASSERT is compiled in unless RC_RELEASE is set; RC_ENABLE_ASSERT_IN_RELEASE keeps it there too.
// Code built without our CMake (e.g. dropped into a firmware project) keeps its checks.

#if !defined(RC_RELEASE) || defined(RC_ENABLE_ASSERT_IN_RELEASE)
#define RC_ASSERT_ENABLED 1
#else
#define RC_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

#ifdef RC_COMPILER_MSVC
#define RC_FORCE_INLINE __forceinline
#define RC_COLD_FUNC
#else
// gcc wants the extra 'inline' next to always_inline
#define RC_FORCE_INLINE __attribute__((always_inline)) inline
#define RC_COLD_FUNC __attribute__((cold))
#endif

// type-checks expr without evaluating it
#define RC_UNUSED(expr) (void)(sizeof((expr)))
