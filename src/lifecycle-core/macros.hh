#pragma once

// Platform and build configuration macros used by lifecycle-core
//
// Compiler:   LC_COMPILER_MSVC or LC_COMPILER_POSIX (gcc, clang and mingw, all with the Itanium C++ ABI)
// Platform:   LC_OS_LINUX (debugger detection via /proc), LC_OS_POSIX (signal waiting via sigwait)
// Features:   LC_HAS_RTTI (needed to name the type of non-std::exception failures)
// Assertions: LC_ASSERT_ENABLED is always defined to 0 or 1
//             derived from LC_RELEASE and LC_ENABLE_ASSERT_IN_RELEASE, which the CMake build sets

#if defined(_MSC_VER)
#define LC_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__) || defined(__MINGW32__)
#define LC_COMPILER_POSIX
#else
#error "lifecycle-core: unsupported compiler"
#endif

#if defined(__linux__)
#define LC_OS_LINUX
#endif

#if defined(__unix__) || defined(__APPLE__)
#define LC_OS_POSIX
#endif

#if defined(__cpp_rtti) || defined(__GXX_RTTI) || defined(_CPPRTTI)
#define LC_HAS_RTTI
#endif

// setup, teardown and usage failures are exceptions, there is no other channel to report them
#if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && !defined(_CPPUNWIND)
#error "lifecycle-core requires C++ exceptions to be enabled"
#endif

// builds without any configuration macro (e.g. consumers not using our CMake) keep assertions on
#ifndef LC_ASSERT_ENABLED
#if defined(LC_RELEASE) && !defined(LC_ENABLE_ASSERT_IN_RELEASE)
#define LC_ASSERT_ENABLED 0
#else
#define LC_ASSERT_ENABLED 1
#endif
#endif

#ifdef LC_COMPILER_MSVC
#define LC_FORCE_INLINE __forceinline
#define LC_COLD_FUNC
#else
// 'inline' is still required next to always_inline on gcc
#define LC_FORCE_INLINE __attribute__((always_inline)) inline
#define LC_COLD_FUNC __attribute__((cold))
#endif

// type-checks expr without evaluating it
#define LC_UNUSED(expr) (void)(sizeof((expr)))
