#pragma once

#include <cstddef>
#include <cstdint>


namespace lc
{
//
// Values
//

// the value of links that exist only for their side effects
struct unit;

//
// Callables
//

template <class T>
struct unique_function;

//
// Lifecycle
//

template <class T>
struct resource;
template <class T>
struct managed;

// specialize for custom types to make them usable with lc::from
template <class T>
struct teardown_traits;

//
// Errors
//

struct error;
struct teardown_double_error;

//
// Threading
//

template <class T>
struct mutex;

} // namespace lc
