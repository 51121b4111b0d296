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
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// Poor man's automatized boost::call_traits: small trivial types (positions,
// hashes, integral keys...) are passed by value, everything else by const
// reference.
////////////////////////////////////////////////////////////////////////////////

template <typename T>
bool constexpr can_be_passed_in_reg
{
    (
        std::is_trivial_v<T> &&
        ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV
    )
#if defined( __GNUC__ ) || defined( __clang__ )
    || // SIMD types
    requires{ __builtin_convertvector( T{}, T ); }
#endif
}; // can_be_passed_in_reg

template <typename T>
using in_param = std::conditional_t<can_be_passed_in_reg<T>, T const, T const &>;


namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_out_of_range();
    [[ noreturn, gnu::cold ]] void throw_bad_alloc   ();
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
