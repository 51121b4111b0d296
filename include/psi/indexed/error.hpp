////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
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

#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/policy/terminate.hpp>
#include <boost/outcome/success_failure.hpp>

#include <cstddef>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// capacity_exceeded
//
// The only failure a container operation can report: fixed backing storage
// cannot accommodate the requested number of entries. Carries the total entry
// count the operation needed and the bound it ran into.
////////////////////////////////////////////////////////////////////////////////

struct capacity_exceeded
{
    std::size_t requested{ 0 };
    std::size_t capacity { 0 };

    friend constexpr bool operator==( capacity_exceeded const &, capacity_exceeded const & ) noexcept = default;
}; // capacity_exceeded

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

// Observing the value of a failed result is a contract violation (not an
// exception) - callers are expected to branch on has_value()/has_error().
template <typename Result>
using fallible_result = outcome::basic_result<Result, capacity_exceeded, outcome::policy::terminate>;

using outcome::success;
using outcome::failure;

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
