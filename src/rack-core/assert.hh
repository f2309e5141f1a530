#pragma once

#include <rack-core/macros.hh>
#include <rack-core/source_location.hh>

// =========================================================================================================
// Checks
// =========================================================================================================
//
// RC_ASSERT(cond, msg)
//   Internal invariants of the rack: free-list links in range, no double release, no slot
//   occupied twice. Compiled out with RC_RELEASE (see RC_ASSERT_ENABLED).
//
// RC_ASSERT_ALWAYS(cond, msg)
//   Checks a caller relies on for memory safety, active in every configuration:
//   using a spent unit, breaking the borrow rules, exhausting a rack through must_add.
//
// msg is a string literal. Recoverable failures (rack::add on a full rack) are reported
// through rc::result instead.
//
// On failure the innermost rc::scoped_assertion_handler is called (stderr by default),
// then an attached debugger breaks and the program aborts.
// A handler that throws unwinds out of the failed check and skips the abort.

#define RC_ASSERT_ALWAYS(cond, msg)                                                          \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::rc::impl::handle_assert_failure(#cond, msg, ::rc::source_location::current()); \
            RC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if RC_ASSERT_ENABLED
#define RC_ASSERT(cond, msg) RC_ASSERT_ALWAYS(cond, msg)
#else
#define RC_ASSERT(cond, msg) \
    do                       \
    {                        \
        RC_UNUSED(cond);     \
        RC_UNUSED(msg);      \
    } while (false)
#endif

// stays a macro so the debugger stops at the failed check, not inside a helper
#define RC_BREAK_AND_ABORT() (RC_IMPL_DEBUG_BREAK(), ::rc::impl::perform_abort())

namespace rc::impl
{
RC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, rc::source_location location);

// false on targets without a way to ask
bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace rc::impl

#if defined(RC_COMPILER_MSVC)
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? __debugbreak() : void(0))
#elif !defined(RC_OS_BARE_METAL)
// SIGTRAP, declared by hand to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#else
#define RC_IMPL_DEBUG_BREAK() void(0)
#endif
