////////////////////////////////////////////////////////////////////////////////
/// psi::indexed::hash_index unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/indexed/hash_index.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::indexed {
//------------------------------------------------------------------------------

namespace
{
    // the index only ever sees positions: the 'entries' here are just their hashes
    template <typename Storage = heap_storage<>>
    struct indexed_hashes
    {
        using index_type = hash_index<Storage>;
        using position   = typename index_type::position_type;

        std::vector<std::size_t> hashes;
        index_type               index;

        auto hash_of() const { return [ this ]( position const p ) { return hashes[ p ]; }; }

        position push( std::size_t const hash )
        {
            auto const p{ static_cast<position>( hashes.size() ) };
            hashes.push_back( hash );
            EXPECT_TRUE( index.try_reserve( hashes.size(), p, hash_of() ) );
            index.insert_position( hash, p );
            return p;
        }

        bool reachable( position const p ) const
        {
            return index.find( hashes[ p ], [ p ]( position const candidate ) { return candidate == p; } ) == p;
        }

        bool all_reachable() const
        {
            for ( std::size_t p{ 0 }; p < hashes.size(); ++p )
                if ( !reachable( static_cast<position>( p ) ) )
                    return false;
            return index.occupied() == hashes.size();
        }

        // a hash whose home is the given bucket (of the current bucket array)
        std::size_t hash_homed_at( std::size_t const bucket ) const
        {
            std::size_t hash{ 1 };
            while ( index.probe_distance( bucket, hash ) != 0 )
                ++hash;
            return hash;
        }
    }; // indexed_hashes
} // anonymous namespace

//==============================================================================
// Sizing
//==============================================================================

TEST( hash_index, starts_without_buckets )
{
    hash_index<heap_storage<>> index;
    EXPECT_EQ( index.bucket_count(), 0 );
    EXPECT_EQ( index.max_load(), 0 );
    EXPECT_EQ( index.find( 42, []( std::size_t ) { return true; } ), std::nullopt );
}

TEST( hash_index, grows_in_powers_of_two_within_load_factor )
{
    indexed_hashes<> table;
    table.push( 11 );
    EXPECT_EQ( table.index.bucket_count(), detail::min_bucket_count );
    EXPECT_EQ( table.index.max_load(), 7 );

    for ( std::size_t i{ 1 }; i < 7; ++i )
        table.push( i * 0x9E37 );
    EXPECT_EQ( table.index.bucket_count(), 8 );

    table.push( 0xBEEF );
    EXPECT_EQ( table.index.bucket_count(), 16 );
    EXPECT_TRUE( table.all_reachable() );

    for ( std::size_t i{ 0 }; i < 1000; ++i )
        table.push( i * 7919 );
    EXPECT_LE( table.hashes.size(), table.index.max_load() );
    EXPECT_TRUE( table.all_reachable() );
}

TEST( hash_index, bucket_count_for )
{
    EXPECT_EQ( detail::bucket_count_for( 0 ), 0 );
    EXPECT_EQ( detail::bucket_count_for( 1 ), 8 );
    EXPECT_EQ( detail::bucket_count_for( 7 ), 8 );
    EXPECT_EQ( detail::bucket_count_for( 8 ), 16 );
    EXPECT_EQ( detail::bucket_count_for( 14 ), 16 );
    EXPECT_EQ( detail::bucket_count_for( 15 ), 32 );
}

//==============================================================================
// Collisions and removal (backward shift)
//==============================================================================

TEST( hash_index, collisions_probe_linearly )
{
    indexed_hashes<> table;
    for ( int i{ 0 }; i < 3; ++i )
        table.push( 0 ); // all homed at bucket 0

    auto const buckets{ table.index.buckets() };
    EXPECT_EQ( buckets[ 0 ], 0 );
    EXPECT_EQ( buckets[ 1 ], 1 );
    EXPECT_EQ( buckets[ 2 ], 2 );
    EXPECT_EQ( table.index.probe_distance( 2, 0 ), 2 );
    EXPECT_TRUE( table.all_reachable() );
}

TEST( hash_index, remove_shifts_back_displaced_entries )
{
    indexed_hashes<> table;
    for ( int i{ 0 }; i < 3; ++i )
        table.push( 0 );

    table.index.remove( 0, 0, table.hash_of() );

    auto const buckets{ table.index.buckets() };
    EXPECT_EQ( buckets[ 0 ], 1 );
    EXPECT_EQ( buckets[ 1 ], 2 );
    EXPECT_EQ( buckets[ 2 ], table.index.empty_bucket );
    EXPECT_EQ( table.index.occupied(), 2 );
    EXPECT_TRUE( table.reachable( 1 ) );
    EXPECT_TRUE( table.reachable( 2 ) );
}

TEST( hash_index, remove_keeps_entries_at_their_home )
{
    indexed_hashes<> table;
    table.push( 0 );
    table.push( table.hash_homed_at( 1 ) );

    table.index.remove( 0, 0, table.hash_of() );

    auto const buckets{ table.index.buckets() };
    EXPECT_EQ( buckets[ 0 ], table.index.empty_bucket );
    EXPECT_EQ( buckets[ 1 ], 1 );
    EXPECT_TRUE( table.reachable( 1 ) );
}

TEST( hash_index, remove_wraps_around )
{
    indexed_hashes<> table;
    table.push( 0 ); // keeps the table from rehashing to a different layout below
    auto const last_bucket{ table.index.bucket_count() - 1 };
    auto const tail_hash{ table.hash_homed_at( last_bucket ) };
    auto const a{ table.push( tail_hash ) }; // at the last bucket
    auto const b{ table.push( tail_hash ) }; // wraps past bucket 0 (occupied) into bucket 1
    EXPECT_EQ( table.index.buckets()[ 1 ], b );

    table.index.remove( tail_hash, a, table.hash_of() );
    EXPECT_EQ( table.index.buckets()[ last_bucket ], b );
    EXPECT_EQ( table.index.buckets()[ 1 ], table.index.empty_bucket );
    EXPECT_TRUE( table.reachable( 0 ) );
    EXPECT_TRUE( table.reachable( b ) );
}

//==============================================================================
// Position maintenance
//==============================================================================

TEST( hash_index, replace_position )
{
    indexed_hashes<> table;
    for ( std::size_t i{ 0 }; i < 5; ++i )
        table.push( i * 31 );

    table.index.replace_position( table.hashes[ 4 ], 4, 9 );
    EXPECT_EQ( table.index.find( table.hashes[ 4 ], []( std::size_t const p ) { return p == 9; } ), 9 );
    EXPECT_FALSE( table.reachable( 4 ) );
}

TEST( hash_index, shift_positions_down )
{
    indexed_hashes<> table;
    for ( std::size_t i{ 0 }; i < 5; ++i )
        table.push( i * 31 + 5 );

    table.index.remove( table.hashes[ 1 ], 1, table.hash_of() );
    table.index.shift_positions_down( 1 );
    table.hashes.erase( table.hashes.begin() + 1 );
    EXPECT_TRUE( table.all_reachable() );
}

TEST( hash_index, rebuild_and_clear )
{
    indexed_hashes<> table;
    for ( std::size_t i{ 0 }; i < 6; ++i )
        table.push( i << 20 );

    table.index.rebuild( 64, table.hashes.size(), table.hash_of() );
    EXPECT_EQ( table.index.bucket_count(), 64 );
    EXPECT_TRUE( table.all_reachable() );

    table.index.clear();
    EXPECT_EQ( table.index.bucket_count(), 64 );
    EXPECT_EQ( table.index.occupied(), 0 );
    EXPECT_FALSE( table.reachable( 0 ) );
}

//==============================================================================
// Fixed storage
//==============================================================================

TEST( hash_index, fixed_buckets_are_preallocated )
{
    indexed_hashes<fixed_storage<4>> table;
    EXPECT_EQ( table.index.bucket_count(), 8 );
    for ( std::size_t i{ 0 }; i < 4; ++i )
        table.push( i * 1000003 );
    EXPECT_EQ( table.index.bucket_count(), 8 );
    EXPECT_TRUE( table.all_reachable() );

    auto const overflow{ table.index.try_reserve( 8, 4, table.hash_of() ) };
    ASSERT_FALSE( overflow );
    EXPECT_EQ( overflow.error(), ( capacity_exceeded{ 8, 7 } ) );
    EXPECT_TRUE( table.all_reachable() );
}

TEST( hash_index, moved_from_fixed_index_stays_usable )
{
    hash_index<fixed_storage<4>> source;
    source.insert_position( 3, 0 );
    hash_index<fixed_storage<4>> target{ std::move( source ) };
    EXPECT_EQ( target.occupied(), 1 );
    EXPECT_EQ( source.bucket_count(), 8 );
    EXPECT_EQ( source.occupied(), 0 );
}

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
