////////////////////////////////////////////////////////////////////////////////
///
/// \file hash_index.hpp
/// --------------------
///
/// Open addressing (linear probing) table of entry store positions.
///
/// The buckets hold positions, never keys or values: the index is a derived
/// structure that can always be rebuilt from the entry store's cached hashes.
/// Every operation that needs to inspect an entry (key comparison, the hash of
/// an occupied bucket's entry) does so through a caller supplied callable
/// taking a position - the index never owns or references entries.
///
/// Properties:
///  - power of two bucket count (>= 8 once anything is stored), Fibonacci
///    hashing for the home bucket
///  - load factor <= 7/8 so every probe sequence reaches an empty bucket
///  - no tombstones: removal uses backward shift deletion (Knuth's
///    Algorithm R) so lookups of absent keys stay short after churn
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

#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

template <storage_policy Storage>
class hash_index
{
public:
    using position_type = typename Storage::size_type;
    using storage_type  = typename Storage::template bucket_vector<position_type>;

    static position_type constexpr empty_bucket{ std::numeric_limits<position_type>::max() };

private:
    static std::size_t constexpr fibonacci_multiplier
    {
        sizeof( std::size_t ) == 8
            ? static_cast<std::size_t>( 0x9E3779B97F4A7C15ULL )
            : static_cast<std::size_t>( 0x9E3779B9UL )
    };

public:
    hash_index()
    {
        // inline buckets cost nothing extra: size them for the full capacity
        // up front so that a fixed map never rehashes
        if constexpr ( Storage::fixed )
            buckets_.grow_to( Storage::static_bucket_count, empty_bucket );
    }
    hash_index( hash_index const & other ) : buckets_( other.buckets_ ) {}
    hash_index( hash_index && other ) noexcept : buckets_( std::move( other.buckets_ ) ) { other.reset_after_move(); }
    hash_index & operator=( hash_index const & ) = default;
    hash_index & operator=( hash_index && other ) noexcept
    {
        buckets_ = std::move( other.buckets_ );
        other.reset_after_move();
        return *this;
    }

    [[ nodiscard ]] std::size_t bucket_count() const noexcept { return buckets_.size(); }
    /// Maximum number of positions the current bucket array can hold w/o
    /// exceeding the load factor.
    [[ nodiscard ]] std::size_t max_load    () const noexcept { return detail::max_load( bucket_count() ); }

    /// Most positions the index can ever hold: the load factor bound of the
    /// largest bucket array the bucket vector can address.
    [[ nodiscard ]] static constexpr std::size_t max_positions() noexcept
    {
        if constexpr ( Storage::fixed )
            return Storage::max_entries();
        else
            return detail::max_load( std::bit_floor( std::size_t{ storage_type::max_size() } ) );
    }

    [[ nodiscard ]] std::span<position_type const> buckets() const noexcept { return buckets_.span(); }

    /// Probe distance of the position stored in the given bucket from its home
    /// bucket (diagnostics).
    [[ nodiscard ]] std::size_t probe_distance( std::size_t const bucket, std::size_t const hash ) const noexcept
    {
        return ( bucket - home_bucket( hash ) ) & mask();
    }

    /// Finds the position for which matches( position ) holds, probing from
    /// the home bucket of hash until an empty bucket is reached.
    template <typename Matches>
    [[ nodiscard ]] std::optional<position_type> find( std::size_t const hash, Matches && matches ) const
    {
        if ( buckets_.empty() ) [[ unlikely ]]
            return std::nullopt;
        for ( auto bucket{ home_bucket( hash ) }; ; bucket = next( bucket ) )
        {
            auto const position{ buckets_[ bucket ] };
            if ( position == empty_bucket )
                return std::nullopt;
            if ( matches( position ) )
                return position;
        }
    }

    /// Records position under hash.
    /// Requires: the position is not yet present and there is room for it
    /// within the load factor (see reserve()).
    void insert_position( std::size_t const hash, position_type const position ) noexcept
    {
        BOOST_ASSERT( position != empty_bucket );
        BOOST_ASSERT( position < max_load() );
        auto bucket{ home_bucket( hash ) };
        while ( buckets_[ bucket ] != empty_bucket )
            bucket = next( bucket );
        buckets_[ bucket ] = position;
    }

    /// Removes position (stored under hash) and closes the gap by shifting
    /// back the entries of the following probe run which are allowed to move
    /// closer to their home bucket - hash_of( position ) must return the hash
    /// of the entry at the given (still current) position.
    template <typename HashOf>
    void remove( std::size_t const hash, position_type const position, HashOf && hash_of ) noexcept
    {
        auto hole{ bucket_of( hash, position ) };
        buckets_[ hole ] = empty_bucket;
        for ( auto bucket{ next( hole ) }; buckets_[ bucket ] != empty_bucket; bucket = next( bucket ) )
        {
            auto const home{ home_bucket( hash_of( buckets_[ bucket ] ) ) };
            // movable iff the hole lies on the probe path from home to bucket
            if ( ( ( bucket - home ) & mask() ) >= ( ( bucket - hole ) & mask() ) )
            {
                buckets_[ hole   ] = buckets_[ bucket ];
                buckets_[ bucket ] = empty_bucket;
                hole               = bucket;
            }
        }
    }

    /// Repoints the bucket holding old_position (stored under hash) to
    /// new_position.
    void replace_position( std::size_t const hash, position_type const old_position, position_type const new_position ) noexcept
    {
        buckets_[ bucket_of( hash, old_position ) ] = new_position;
    }

    /// Decrements every stored position greater than removed_position - a
    /// whole table pass, the alternative to per-entry replace_position() calls
    /// after a shift removal displaced a large share of the entries.
    void shift_positions_down( position_type const removed_position ) noexcept
    {
        for ( auto & position : buckets_ )
        {
            if ( ( position != empty_bucket ) && ( position > removed_position ) )
                --position;
        }
    }

    /// Ensures room for total_entries positions within the load factor -
    /// rebuilding (from hash_of) the positions [0, current_size) if the bucket
    /// array has to grow.
    template <typename HashOf>
    fallible_result<void> try_reserve( std::size_t const total_entries, std::size_t const current_size, HashOf && hash_of )
    {
        if ( total_entries <= max_load() )
            return success();
        if constexpr ( Storage::fixed )
        {
            return failure( capacity_exceeded{ total_entries, max_load() } );
        }
        else
        {
            rebuild( detail::bucket_count_for( total_entries ), current_size, hash_of );
            return success();
        }
    }

    /// Reallocates the bucket array to bucket_count buckets and re-inserts the
    /// positions [0, current_size) - never touches the entries themselves.
    template <typename HashOf>
    void rebuild( std::size_t const new_bucket_count, std::size_t const current_size, HashOf && hash_of )
    {
        BOOST_ASSERT( std::has_single_bit( new_bucket_count ) );
        BOOST_ASSERT( detail::max_load( new_bucket_count ) >= current_size );
        using bucket_size_type = typename storage_type::size_type;
        buckets_.clear();
        buckets_.grow_to( static_cast<bucket_size_type>( new_bucket_count ), empty_bucket );
        for ( std::size_t position{ 0 }; position < current_size; ++position )
            insert_position( hash_of( static_cast<position_type>( position ) ), static_cast<position_type>( position ) );
    }

    /// Forgets all positions (keeps the bucket array).
    void clear() noexcept
    {
        for ( auto & position : buckets_ )
            position = empty_bucket;
    }

    /// Number of occupied buckets - O(bucket_count), for consistency checks.
    [[ nodiscard ]] std::size_t occupied() const noexcept
    {
        std::size_t count{ 0 };
        for ( auto const position : buckets_ )
            count += ( position != empty_bucket );
        return count;
    }

private:
    // a moved-from fixed index has to stay usable (with all buckets empty)
    void reset_after_move() noexcept
    {
        if constexpr ( Storage::fixed )
        {
            buckets_.clear();
            buckets_.grow_to( Storage::static_bucket_count, empty_bucket );
        }
    }

    [[ nodiscard ]] std::size_t mask() const noexcept { return bucket_count() - 1; }
    [[ nodiscard ]] std::size_t next( std::size_t const bucket ) const noexcept { return ( bucket + 1 ) & mask(); }

    [[ nodiscard ]] std::size_t home_bucket( std::size_t const hash ) const noexcept
    {
        BOOST_ASSERT( bucket_count() >= detail::min_bucket_count );
        BOOST_ASSERT( std::has_single_bit( bucket_count() ) );
        auto const shift{ std::numeric_limits<std::size_t>::digits - std::countr_zero( bucket_count() ) };
        return ( hash * fibonacci_multiplier ) >> shift;
    }

    [[ nodiscard ]] std::size_t bucket_of( std::size_t const hash, position_type const position ) const noexcept
    {
        auto bucket{ home_bucket( hash ) };
        while ( buckets_[ bucket ] != position )
        {
            BOOST_ASSERT_MSG( buckets_[ bucket ] != empty_bucket, "Position not present in the hash index" );
            bucket = next( bucket );
        }
        return bucket;
    }

private:
    storage_type buckets_;
}; // class hash_index

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
