#pragma once

#include <source_location>

namespace rc
{
/// Type alias for std::source_location
/// Captured by the assertion macros so diagnostics point at the failing call site
/// Usage:
///   void check(rc::source_location loc = rc::source_location::current()) {
///       std::cerr << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace rc
