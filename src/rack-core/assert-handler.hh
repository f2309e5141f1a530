#pragma once

#include <rack-core/source_location.hh>

#include <functional>
#include <string>

namespace rc
{
/// Failed check as seen by an assertion handler.
struct assertion_info
{
    std::string expression;
    std::string message;
    rc::source_location location;
};

/// Returning from a handler aborts the program, throwing unwinds out of the failed check.
using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// Routes assertion failures to handler while in scope, shadowing outer handlers.
/// The handler list is process-global and unsynchronized, like the racks themselves.
///
///   rc::scoped_assertion_handler on_fail([](rc::assertion_info const& info) {
///       uart_write(info.message.c_str());
///       watchdog_reset();
///   });
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace rc
