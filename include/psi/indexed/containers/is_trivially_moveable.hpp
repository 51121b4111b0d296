////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

// template <typename T>
// bool is_trivially_moveable;
//
// Whether crt_vector may grow a block of T through realloc: objects have to
// survive being 'picked up' from one address and 'dropped' at another w/o a
// constructor or destructor call (trivial relocation, P1144/P2786). Entry
// slots and bucket positions of the hashed containers are the main clients:
// a slot qualifies iff both its key and its value do.
//
// Conservative: libstdc++'s std::string (SSO pointer into itself) and similar
// self-referencing types stay false and get grown by an explicit move.

// allowed/expected to be user-specialized for custom key and value types
template <typename T>
bool constexpr is_trivially_moveable
{
#ifdef __clang__
    __is_trivially_relocatable( T ) ||
#endif
    std::is_trivially_copyable_v<T>
}; // is_trivially_moveable

template <typename T>
requires requires{ T::is_trivially_moveable; }
bool constexpr is_trivially_moveable<T>{ T::is_trivially_moveable };

template <typename T1, typename T2>
bool constexpr is_trivially_moveable<std::pair<T1, T2>>{ is_trivially_moveable<T1> && is_trivially_moveable<T2> };

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
