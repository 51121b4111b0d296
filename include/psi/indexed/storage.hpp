////////////////////////////////////////////////////////////////////////////////
///
/// \file storage.hpp
/// -----------------
///
/// Backing storage policies: the capability the Entry Store and Hash Index are
/// written against (grow-or-reallocate vs grow-or-fail), selected at compile
/// time through the Storage template parameter of index_map/index_set.
///
/// A policy provides:
///  - size_type                   - entry position/count type
///  - entry_vector <T>            - contiguous storage for the entries
///  - bucket_vector<T>            - contiguous storage for the hash buckets
///  - fixed                       - whether the bound is a compile time one
///  - max_entries()               - the bound on the number of entries
///  - overflow()                  - reaction of infallible operations to a
///                                  request exceeding max_entries()
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

#include <psi/indexed/detail/config.hpp>

#include <psi/indexed/containers/fc_vector.hpp>
#if PSI_INDEXED_HEAP
#include <psi/indexed/containers/crt_vector.hpp>
#endif

#include <boost/integer.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

namespace detail
{
    inline std::size_t constexpr min_bucket_count{ 8 };

    // load factor bound: entries <= 7/8 * buckets
    [[ gnu::const ]] constexpr std::size_t max_load( std::size_t const bucket_count ) noexcept { return bucket_count - bucket_count / 8; }

    // smallest power of two bucket count (>= min_bucket_count) that can hold
    // the given number of entries w/o exceeding the load factor bound
    [[ gnu::const ]] constexpr std::size_t bucket_count_for( std::size_t const entries ) noexcept
    {
        if ( !entries )
            return 0;
        auto buckets{ min_bucket_count };
        while ( max_load( buckets ) < entries )
            buckets *= 2;
        return buckets;
    }
} // namespace detail


#if PSI_INDEXED_HEAP
////////////////////////////////////////////////////////////////////////////////
/// Heap backed (growable) storage: entries grow geometrically, the hash
/// buckets are reallocated and rehashed whenever the load factor would be
/// exceeded.
////////////////////////////////////////////////////////////////////////////////

template <typename sz_t = std::size_t>
struct heap_storage
{
    using size_type = sz_t;

    template <typename T> using entry_vector  = crt_vector<T, sz_t>;
    template <typename T> using bucket_vector = crt_vector<T, sz_t>;

    static bool constexpr fixed{ false };

    // positions are kept below max() which marks an empty bucket; the
    // containers further cap this by what the entry and bucket vectors can
    // address (max() bytes), which is the binding limit for narrow sz_t
    [[ gnu::const ]] static constexpr std::size_t max_entries() noexcept { return std::numeric_limits<size_type>::max() / 2; }

    [[ noreturn ]] static void overflow() { detail::throw_bad_alloc(); }
}; // heap_storage
#endif // PSI_INDEXED_HEAP


////////////////////////////////////////////////////////////////////////////////
/// Fixed capacity storage: both the entries and the hash buckets live inline
/// (in the container object) - never touches an allocator. Requests beyond
/// capacity fail (fallible operations) or invoke overflow_handler (infallible
/// ones).
////////////////////////////////////////////////////////////////////////////////

template <std::uint32_t capacity, auto overflow_handler = throw_on_overflow{}>
struct fixed_storage
{
    static_assert( capacity > 0, "Zero capacity storage" );

    using size_type = typename boost::uint_value_t<std::uintmax_t{ capacity } + 1>::least;

    static std::uint32_t constexpr static_capacity    { capacity };
    static std::uint32_t constexpr static_bucket_count{ static_cast<std::uint32_t>( detail::bucket_count_for( capacity ) ) };

    template <typename T> using entry_vector  = fc_vector<T, static_capacity    , overflow_handler>;
    template <typename T> using bucket_vector = fc_vector<T, static_bucket_count, overflow_handler>;

    static bool constexpr fixed{ true };

    [[ gnu::const ]] static constexpr std::size_t max_entries() noexcept { return static_capacity; }

    static void overflow() noexcept( noexcept( overflow_handler() ) ) { overflow_handler(); }
}; // fixed_storage


#if PSI_INDEXED_HEAP
using default_storage = heap_storage<>;
#else
// allocation-free builds have no default: the containers require an explicit
// fixed_storage<N> (this placeholder fails the storage_policy check)
struct default_storage {};
#endif


template <typename S>
concept storage_policy = requires
{
    typename S::size_type;
    typename S::template entry_vector <int>;
    typename S::template bucket_vector<int>;
    { S::fixed         } -> std::convertible_to<bool>;
    { S::max_entries() } -> std::convertible_to<std::size_t>;
};

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
