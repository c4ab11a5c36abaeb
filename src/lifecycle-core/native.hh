#pragma once

#include <lifecycle-core/fwd.hh>

#include <string>
#include <string_view>

// =========================================================================================================
// Platform-specific native utilities
// =========================================================================================================
//
// Symbol demangling:
//   demangle_symbol(symbol)           - demangle C++ symbol names to human-readable format
//   current_exception_type_name()     - demangled type of the exception currently being handled
//

namespace lc
{
/// Demangle a C++ mangled symbol name into a human-readable format.
/// Platform-specific implementation:
///   - MSVC: type names from type_info::name() are already readable and returned unchanged
///   - GCC/Clang: Uses __cxa_demangle from libstdc++/libc++
///
/// If demangling fails or is unavailable on the platform, returns the original symbol.
///
/// Usage:
///   auto demangled = lc::demangle_symbol("_Z3fooi");  // "foo(int)"
[[nodiscard]] std::string demangle_symbol(std::string_view symbol);

/// Demangled type name of the exception object currently being handled
/// Must be called from within a catch block, returns "<unknown exception type>" if the ABI cannot tell
/// Used to describe failures that do not derive from std::exception (e.g. "throw 42;")
[[nodiscard]] std::string current_exception_type_name();
} // namespace lc
