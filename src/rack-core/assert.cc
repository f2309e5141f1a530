#include "assert.hh"

#include <rack-core/assert-handler.hh>

#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#ifdef RC_OS_LINUX
#include <fstream>
#include <string_view>
#endif

#ifdef RC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent();
#endif

namespace
{
// innermost handler at the back
std::vector<rc::assertion_handler>& installed_handlers()
{
    static std::vector<rc::assertion_handler> handlers;
    return handlers;
}

void print_to_stderr(rc::assertion_info const& info)
{
    auto const& at = info.location;
    std::cerr << at.file_name() << ':' << at.line() << ": rack-core check `" << info.expression
              << "` failed: " << info.message << "\n    in " << at.function_name() << std::endl;
}
} // namespace

rc::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    installed_handlers().push_back(std::move(handler));
}

rc::scoped_assertion_handler::~scoped_assertion_handler()
{
    installed_handlers().pop_back();
}

void rc::impl::handle_assert_failure(char const* expression, char const* message, rc::source_location location)
{
    auto const info = assertion_info{expression, message, location};

    auto& handlers = installed_handlers();
    if (handlers.empty())
        print_to_stderr(info);
    else
        handlers.back()(info);
}

bool rc::impl::is_debugger_connected() noexcept
{
#if defined(RC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(RC_OS_LINUX)
    // a traced process reports its tracer's pid
    constexpr std::string_view key = "TracerPid:";
    std::ifstream status("/proc/self/status");
    for (std::string line; std::getline(status, line);)
        if (line.starts_with(key))
            return std::atoi(line.c_str() + key.size()) != 0;
    return false;
#else
    return false;
#endif
}

void rc::impl::perform_abort() noexcept
{
    std::abort();
}
