////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for the psi::indexed hashed containers.
///
/// Provides:
///   - transparent_lookup   - detects hasher+equality pairs that accept
///                            heterogeneous keys
///   - LookupType concept   - constrains heterogeneous lookup key types
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

#include <concepts>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

/// Heterogeneous lookup requires both halves of the hash/equality contract to
/// opt in: a transparent equality paired with a non-transparent hasher would
/// hash the probe key differently from the stored one.
template <typename Hash, typename KeyEqual>
bool constexpr transparent_lookup
{
    requires{ typename Hash    ::is_transparent; } &&
    requires{ typename KeyEqual::is_transparent; }
};

/// LookupType - constrains which key types the lookup functions accept.
///
/// A type K is a valid lookup key if either:
///   (a) the hasher and key equality are transparent, or
///   (b) K is implicitly convertible to key_type - the conversion then happens
///       once at the public API boundary (before hashing) rather than at every
///       equality comparison along the probe sequence.
/// This merges the traditional two-overload pattern
///   iterator find( key_type const & );
///   template <class K> iterator find( K const & ) requires transparent;
/// into a single constrained template.
template <typename K, bool transparent, typename StoredKeyType>
concept LookupType =
    transparent ||
    std::convertible_to<K const &, StoredKeyType const &>;

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
