#pragma once

#include <source_location>

namespace lc
{
/// Type alias for std::source_location
/// Used to record where an lc::error was raised and where an assertion fired
/// Usage:
///   void fail(lc::source_location site = lc::source_location::current()) {
///       throw lc::error("setup failed", site);
///   }
using source_location = std::source_location;
} // namespace lc
