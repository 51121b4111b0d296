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
#include <psi/indexed/containers/abi.hpp>

#include <new>
#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * const msg ) { throw std::out_of_range( msg ); }
    [[ noreturn, gnu::cold ]] void throw_out_of_range() { throw_out_of_range( "psi::indexed vector access out of bounds" ); }
    [[ noreturn, gnu::cold ]] void throw_bad_alloc   () { throw std::bad_alloc(); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
