#include "native.hh"

#include <lifecycle-core/macros.hh>

#include <mutex>

#ifdef LC_COMPILER_POSIX
#include <cxxabi.h>

#include <cstdlib>
#include <typeinfo>
#endif

std::string lc::demangle_symbol(std::string_view symbol)
{
#ifdef LC_COMPILER_POSIX
    // __cxa_demangle thread-safety is not guaranteed
    static std::mutex demangle_mutex;
    std::lock_guard<std::mutex> lock(demangle_mutex);

    // __cxa_demangle expects a null-terminated string
    auto const symbol_nt = std::string(symbol);

    int status = 0;
    char* demangled = abi::__cxa_demangle(symbol_nt.c_str(), nullptr, nullptr, &status);

    if (status == 0 && demangled != nullptr)
    {
        auto result = std::string(demangled);
        std::free(demangled);
        return result;
    }

    // Failed to demangle, return original symbol
    if (demangled != nullptr)
        std::free(demangled);
    return symbol_nt;
#else
    return std::string(symbol);
#endif
}

std::string lc::current_exception_type_name()
{
#if defined(LC_COMPILER_POSIX) && defined(LC_HAS_RTTI)
    if (auto const* type = abi::__cxa_current_exception_type())
        return lc::demangle_symbol(type->name());
#endif
    return "<unknown exception type>";
}
