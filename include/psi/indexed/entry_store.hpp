////////////////////////////////////////////////////////////////////////////////
///
/// \file entry_store.hpp
/// ---------------------
///
/// Dense, insertion ordered sequence of (hash, key, value) slots addressed by
/// position (0..size). Append-only except for the two removal strategies:
///  - swap_remove : O(1), moves the last entry into the vacated position
///  - shift_remove: O(size - position), preserves the relative order of the
///                  remaining entries
/// The entry store knows nothing of the hash index - the owner (index_map) is
/// responsible for reconciling the positions that a removal changes.
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

#include <psi/indexed/error.hpp>
#include <psi/indexed/storage.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

/// Value type of valueless containers (index_set).
struct unit
{
    friend constexpr bool operator==( unit, unit ) noexcept { return true; }
}; // unit

template <typename Key, typename T>
struct slot
{
    // the full hash is cached: rehashing and probing never call the hasher
    // (or touch the key) of a mismatching entry
    std::size_t hash;
    Key         key;
    [[ no_unique_address ]] T value;

    template <typename K, typename ...Args>
    constexpr slot( std::size_t const key_hash, K && k, Args &&... args )
        : hash{ key_hash }, key( std::forward<K>( k ) ), value( std::forward<Args>( args )... ) {}

    constexpr slot( slot const &  ) = default;
    constexpr slot( slot       && ) = default;
    constexpr slot & operator=( slot const &  ) = default;
    constexpr slot & operator=( slot       && ) = default;

    friend constexpr bool operator==( slot const & left, slot const & right )
    {
        return ( left.key == right.key ) && ( left.value == right.value );
    }
}; // slot

template <typename Key, typename T>
bool constexpr is_trivially_moveable<slot<Key, T>>{ is_trivially_moveable<Key> && is_trivially_moveable<T> };


template <typename Key, typename T, storage_policy Storage>
class entry_store
{
public:
    using value_type   = slot<Key, T>;
    using storage_type = typename Storage::template entry_vector<value_type>;
    using size_type    = typename Storage::size_type;

    static_assert( sizeof( size_type ) <= sizeof( std::size_t ) );

    constexpr entry_store() noexcept = default;
    constexpr entry_store( entry_store const & other ) : entries_( other.entries_ ) {}
    constexpr entry_store( entry_store && ) noexcept = default;
    constexpr entry_store & operator=( entry_store const & ) = default;
    constexpr entry_store & operator=( entry_store && ) noexcept = default;

    [[ nodiscard ]] size_type size    () const noexcept { return static_cast<size_type>( entries_.size() ); }
    [[ nodiscard ]] bool      empty   () const noexcept { return entries_.empty(); }
    [[ nodiscard ]] size_type capacity() const noexcept { return static_cast<size_type>( entries_.capacity() ); }

    // the storage bound or what the entry vector can address (in bytes, for
    // narrow heap size types), whichever is lower
    [[ nodiscard ]] static constexpr std::size_t max_size() noexcept { return std::min<std::size_t>( Storage::max_entries(), storage_type::max_size() ); }

    [[ nodiscard ]] bool can_push( std::size_t const count = 1 ) const noexcept { return count <= max_size() - size(); }

    /// Appends a new entry - returns its position.
    /// Requires: can_push() (checked by the caller so that a failure can be
    /// reported before anything was mutated).
    template <typename K, typename ...Args>
    size_type emplace( std::size_t const hash, K && key, Args &&... args )
    {
        BOOST_ASSERT_MSG( can_push(), "Entry store overflow" );
        auto const position{ size() };
        entries_.emplace_back( hash, std::forward<K>( key ), std::forward<Args>( args )... );
        return position;
    }
    template <typename K, typename V>
    size_type push( std::size_t const hash, K && key, V && value ) { return emplace( hash, std::forward<K>( key ), std::forward<V>( value ) ); }

    /// Fallible push: never invokes the storage's overflow handler.
    template <typename K, typename V>
    fallible_result<size_type> try_push( std::size_t const hash, K && key, V && value )
    {
        if ( !can_push() ) [[ unlikely ]]
            return failure( capacity_exceeded{ std::size_t{ size() } + 1, max_size() } );
        return success( push( hash, std::forward<K>( key ), std::forward<V>( value ) ) );
    }

    [[ nodiscard ]] value_type       & operator[]( size_type const position )       noexcept { return entries_[ position ]; }
    [[ nodiscard ]] value_type const & operator[]( size_type const position ) const noexcept { return entries_[ position ]; }
    [[ nodiscard ]] value_type const & get       ( size_type const position ) const noexcept { return entries_[ position ]; }

    [[ nodiscard ]] std::size_t hash_at( size_type const position ) const noexcept { return entries_[ position ].hash; }

    [[ nodiscard ]] value_type       & back()       noexcept { return entries_.back(); }
    [[ nodiscard ]] value_type const & back() const noexcept { return entries_.back(); }

    /// Removes the entry at position, moving the last entry into its slot.
    /// The entry previously at size() - 1 (if it is not the removed one) is
    /// afterwards at position.
    value_type swap_remove( size_type const position )
    {
        BOOST_ASSERT( position < size() );
        value_type removed{ std::move( entries_[ position ] ) };
        entries_.swap_erase( entries_.nth( position ) );
        return removed;
    }

    /// Removes the entry at position, shifting every subsequent entry down by
    /// one (all their positions decrease by one).
    value_type shift_remove( size_type const position )
    {
        BOOST_ASSERT( position < size() );
        value_type removed{ std::move( entries_[ position ] ) };
        entries_.erase( entries_.nth( position ) );
        return removed;
    }

    value_type pop()
    {
        BOOST_ASSERT( !empty() );
        value_type removed{ std::move( entries_.back() ) };
        entries_.pop_back();
        return removed;
    }

    /// Ensures room for (at least) total_entries w/o further growth.
    /// Requires: total_entries <= max_size().
    void reserve( std::size_t const total_entries )
    {
        BOOST_ASSERT( total_entries <= max_size() );
        entries_.reserve( static_cast<typename storage_type::size_type>( total_entries ) );
    }

    fallible_result<void> try_reserve( std::size_t const total_entries )
    {
        if ( total_entries > max_size() ) [[ unlikely ]]
            return failure( capacity_exceeded{ total_entries, max_size() } );
        reserve( total_entries );
        return success();
    }

    void clear() noexcept { entries_.clear(); }

    [[ nodiscard ]] std::span<value_type      > span()       noexcept { return entries_.span(); }
    [[ nodiscard ]] std::span<value_type const> span() const noexcept { return entries_.span(); }

    [[ nodiscard ]] auto begin()       noexcept { return entries_.begin(); }
    [[ nodiscard ]] auto begin() const noexcept { return entries_.begin(); }
    [[ nodiscard ]] auto end  ()       noexcept { return entries_.end  (); }
    [[ nodiscard ]] auto end  () const noexcept { return entries_.end  (); }

    friend bool operator==( entry_store const & left, entry_store const & right ) { return left.entries_ == right.entries_; }

private:
    storage_type entries_;
}; // class entry_store

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
