////////////////////////////////////////////////////////////////////////////////
/// Fixed capacity (allocation-free) index_map/index_set behaviour
////////////////////////////////////////////////////////////////////////////////

#include <psi/indexed/index_set.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::indexed {
//------------------------------------------------------------------------------

namespace
{
    using fixed_map = index_map<char, int, boost::hash<char>, std::equal_to<char>, fixed_storage<4>>;
    using fixed_set = index_set<std::string, boost::hash<std::string>, std::equal_to<std::string>, fixed_storage<4>>;

    std::vector<char> keys_of( fixed_map const & map )
    {
        std::vector<char> keys;
        for ( auto const & [ key, value ] : map )
            keys.push_back( key );
        return keys;
    }
} // anonymous namespace

TEST( fixed_capacity, capacity_is_the_static_bound )
{
    fixed_map map;
    EXPECT_EQ( fixed_map::max_size(), 4 );
    EXPECT_EQ( map.capacity(), 4 );
    EXPECT_EQ( map.bucket_count(), 8 );
    static_assert( sizeof( fixed_map::size_type ) == 1 );
}

TEST( fixed_capacity, try_insert_fails_atomically )
{
    fixed_map map{ { 'a', 1 }, { 'b', 2 }, { 'c', 3 }, { 'd', 4 } };
    auto const overflow{ map.try_insert( 'e', 5 ) };
    ASSERT_FALSE( overflow );
    EXPECT_EQ( overflow.error(), ( capacity_exceeded{ 5, 4 } ) );

    EXPECT_EQ( map.size(), 4 );
    EXPECT_FALSE( map.contains( 'e' ) );
    EXPECT_EQ( keys_of( map ), ( std::vector<char>{ 'a', 'b', 'c', 'd' } ) );
    EXPECT_TRUE( map.verify_consistency() );
}

TEST( fixed_capacity, infallible_insert_invokes_overflow_handler )
{
    fixed_map map{ { 'a', 1 }, { 'b', 2 }, { 'c', 3 }, { 'd', 4 } };
    EXPECT_THROW( map.insert( 'e', 5 ), std::out_of_range );
    EXPECT_THROW( map[ 'f' ], std::out_of_range );
    EXPECT_EQ( map.size(), 4 );
    EXPECT_FALSE( map.contains( 'e' ) );
    EXPECT_FALSE( map.contains( 'f' ) );
    EXPECT_TRUE( map.verify_consistency() );
}

TEST( fixed_capacity, overwriting_a_full_map_succeeds )
{
    fixed_map map{ { 'a', 1 }, { 'b', 2 }, { 'c', 3 }, { 'd', 4 } };
    auto const replaced{ map.try_insert( 'b', 20 ) };
    ASSERT_TRUE( replaced );
    EXPECT_EQ( replaced.value(), 2 );
    EXPECT_EQ( *map.get( 'b' ), 20 );
    EXPECT_EQ( keys_of( map ), ( std::vector<char>{ 'a', 'b', 'c', 'd' } ) );
}

TEST( fixed_capacity, removal_frees_room )
{
    fixed_map map;
    map.insert( 'a', 1 );
    map.insert( 'b', 2 );
    map.insert( 'c', 3 );
    EXPECT_EQ( keys_of( map ), ( std::vector<char>{ 'a', 'b', 'c' } ) );

    EXPECT_EQ( map.swap_remove( 'a' ), 1 );
    EXPECT_EQ( keys_of( map ), ( std::vector<char>{ 'c', 'b' } ) );

    ASSERT_TRUE( map.try_insert( 'd', 4 ) );
    EXPECT_EQ( keys_of( map ), ( std::vector<char>{ 'c', 'b', 'd' } ) );

    ASSERT_TRUE( map.try_insert( 'e', 5 ) );
    auto const overflow{ map.try_insert( 'f', 6 ) };
    ASSERT_FALSE( overflow );
    EXPECT_EQ( overflow.error(), ( capacity_exceeded{ 5, 4 } ) );
    EXPECT_EQ( keys_of( map ), ( std::vector<char>{ 'c', 'b', 'd', 'e' } ) );
    EXPECT_TRUE( map.verify_consistency() );
}

TEST( fixed_capacity, reservation_requests )
{
    fixed_map map{ { 'a', 1 }, { 'b', 2 } };
    EXPECT_TRUE( map.try_reserve( 2 ) );
    auto const overflow{ map.try_reserve( 3 ) };
    ASSERT_FALSE( overflow );
    EXPECT_EQ( overflow.error(), ( capacity_exceeded{ 5, 4 } ) );
    EXPECT_EQ( map.size(), 2 );
    EXPECT_THROW( map.reserve( 3 ), std::out_of_range );

    EXPECT_TRUE ( fixed_map::try_with_capacity( 4 ) );
    auto const too_large{ fixed_map::try_with_capacity( 5 ) };
    ASSERT_FALSE( too_large );
    EXPECT_EQ( too_large.error(), ( capacity_exceeded{ 5, 4 } ) );
    EXPECT_THROW( std::ignore = fixed_map::with_capacity( 5 ), std::out_of_range );
}

TEST( fixed_capacity, moved_from_map_stays_usable )
{
    fixed_map source{ { 'a', 1 }, { 'b', 2 } };
    fixed_map target{ std::move( source ) };
    EXPECT_EQ( keys_of( target ), ( std::vector<char>{ 'a', 'b' } ) );
    EXPECT_TRUE( target.verify_consistency() );

    source.clear();
    source.insert( 'z', 26 );
    EXPECT_EQ( *source.get( 'z' ), 26 );
    EXPECT_TRUE( source.verify_consistency() );
}

TEST( fixed_capacity, set )
{
    fixed_set set{ "w", "x", "y" };
    EXPECT_TRUE( set.insert( "z" ) );
    EXPECT_FALSE( set.insert( "z" ) );

    auto const overflow{ set.try_insert( "v" ) };
    ASSERT_FALSE( overflow );
    EXPECT_EQ( overflow.error(), ( capacity_exceeded{ 5, 4 } ) );
    EXPECT_THROW( set.insert( "v" ), std::out_of_range );
    EXPECT_EQ( set.size(), 4 );

    EXPECT_TRUE( set.shift_remove( "w" ) );
    EXPECT_TRUE( set.insert( "v" ) );
    EXPECT_EQ( *set.first(), "x" );
    EXPECT_EQ( *set.last (), "v" );
    EXPECT_TRUE( set.verify_consistency() );
}

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
