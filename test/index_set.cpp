////////////////////////////////////////////////////////////////////////////////
/// psi::indexed::index_set and set algebra unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/indexed/index_set.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::indexed {
//------------------------------------------------------------------------------

namespace
{
    using int_set    = index_set<int>;
    using string_set = index_set<std::string>;
    using ints       = std::vector<int>;

    template <typename Range>
    auto to_vector( Range && range )
    {
        using value_type = std::ranges::range_value_t<Range>;
        std::vector<value_type> result;
        for ( auto const & element : range )
            result.push_back( element );
        return result;
    }
} // anonymous namespace

//==============================================================================
// Set wrapper
//==============================================================================

TEST( index_set, insert_reports_novelty_and_keeps_position )
{
    string_set set;
    EXPECT_TRUE ( set.insert( "b" ) );
    EXPECT_TRUE ( set.insert( "a" ) );
    EXPECT_FALSE( set.insert( "b" ) );
    EXPECT_EQ( set.size(), 2 );
    EXPECT_EQ( to_vector( set ), ( std::vector<std::string>{ "b", "a" } ) );

    auto const [ position, inserted ]{ set.insert_full( "a" ) };
    EXPECT_EQ( position, 1 );
    EXPECT_FALSE( inserted );
    EXPECT_TRUE( set.verify_consistency() );
}

TEST( index_set, try_insert )
{
    int_set set;
    auto const fresh{ set.try_insert( 1 ) };
    ASSERT_TRUE( fresh );
    EXPECT_TRUE( fresh.value() );
    auto const again{ set.try_insert( 1 ) };
    ASSERT_TRUE( again );
    EXPECT_FALSE( again.value() );
}

TEST( index_set, construction )
{
    int_set const from_list{ 3, 1, 3, 2 };
    EXPECT_EQ( to_vector( from_list ), ( ints{ 3, 1, 2 } ) );

    ints const source{ 9, 8, 9, 7 };
    int_set const from_range( source.begin(), source.end() );
    EXPECT_EQ( to_vector( from_range ), ( ints{ 9, 8, 7 } ) );

    auto const reserved{ int_set::with_capacity( 20 ) };
    EXPECT_GE( reserved.capacity(), 20 );
    EXPECT_TRUE( reserved.empty() );
}

TEST( index_set, lookup )
{
    string_set const set{ "x", "y", "z" };
    EXPECT_TRUE ( set.contains( "y" ) );
    EXPECT_FALSE( set.contains( "w" ) );

    auto const stored{ set.get( "z" ) };
    ASSERT_NE( stored, nullptr );
    EXPECT_EQ( *stored, "z" );
    EXPECT_EQ( set.get( "w" ), nullptr );

    EXPECT_EQ( set.get_index_of( "y" ), 1 );
    EXPECT_EQ( *set.get_index( 2 ), "z" );
    EXPECT_EQ( set.get_index( 3 ), nullptr );
    EXPECT_EQ( *set.find( "y" ), "y" );
    EXPECT_EQ( set.find( "w" ), set.end() );
    EXPECT_EQ( *set.first(), "x" );
    EXPECT_EQ( *set.last (), "z" );
}

TEST( index_set, removal )
{
    int_set set{ 1, 2, 3, 4, 5 };
    EXPECT_TRUE ( set.swap_remove( 2 ) );
    EXPECT_FALSE( set.swap_remove( 2 ) );
    EXPECT_EQ( to_vector( set ), ( ints{ 1, 5, 3, 4 } ) );

    EXPECT_TRUE( set.shift_remove( 1 ) );
    EXPECT_EQ( to_vector( set ), ( ints{ 5, 3, 4 } ) );

    EXPECT_EQ( set.swap_take ( 5 ), 5 );
    EXPECT_EQ( set.shift_take( 7 ), std::nullopt );
    EXPECT_EQ( to_vector( set ), ( ints{ 4, 3 } ) );

    EXPECT_EQ( set.shift_remove_index( 0 ), 4 );
    EXPECT_EQ( set.swap_remove_index ( 5 ), std::nullopt );
    EXPECT_EQ( set.pop(), 3 );
    EXPECT_TRUE( set.empty() );
    EXPECT_EQ( set.pop(), std::nullopt );
    EXPECT_TRUE( set.verify_consistency() );
}

TEST( index_set, equality_is_order_sensitive )
{
    int_set const a{ 1, 2, 3 };
    int_set const b{ 1, 2, 3 };
    int_set const c{ 3, 2, 1 };
    EXPECT_TRUE ( a == b );
    EXPECT_FALSE( a == c );
}

TEST( index_set, clear )
{
    int_set set{ 1, 2, 3 };
    set.clear();
    EXPECT_TRUE( set.empty() );
    EXPECT_FALSE( set.contains( 1 ) );
    EXPECT_TRUE( set.insert( 1 ) );
    EXPECT_TRUE( set.verify_consistency() );
}

//==============================================================================
// Set algebra (primary operand order first)
//==============================================================================

TEST( set_algebra, union_ )
{
    int_set const left { 1, 2, 3, 4 };
    int_set const right{ 6, 4, 5, 2 };
    EXPECT_EQ( to_vector( left .set_union( right ) ), ( ints{ 1, 2, 3, 4, 6, 5 } ) );
    EXPECT_EQ( to_vector( right.set_union( left  ) ), ( ints{ 6, 4, 5, 2, 1, 3 } ) );
}

TEST( set_algebra, intersection_follows_primary_order )
{
    int_set const left { 1, 2, 3, 4 };
    int_set const right{ 4, 9, 2 };
    EXPECT_EQ( to_vector( left .set_intersection( right ) ), ( ints{ 2, 4 } ) );
    EXPECT_EQ( to_vector( right.set_intersection( left  ) ), ( ints{ 4, 2 } ) );
}

TEST( set_algebra, difference )
{
    int_set const left { 1, 2, 3, 4 };
    int_set const right{ 4, 9, 2 };
    EXPECT_EQ( to_vector( left .set_difference( right ) ), ( ints{ 1, 3 } ) );
    EXPECT_EQ( to_vector( right.set_difference( left  ) ), ( ints{ 9 } ) );
}

TEST( set_algebra, symmetric_difference )
{
    int_set const left { 1, 2, 3, 4 };
    int_set const right{ 4, 9, 2, 0 };
    EXPECT_EQ( to_vector( left.set_symmetric_difference( right ) ), ( ints{ 1, 3, 9, 0 } ) );
}

TEST( set_algebra, empty_operands )
{
    int_set const empty;
    int_set const some{ 1, 2 };
    EXPECT_TRUE( empty.set_union( empty ).empty() );
    EXPECT_EQ( to_vector( empty.set_union( some ) ), ( ints{ 1, 2 } ) );
    EXPECT_EQ( to_vector( some.set_union( empty ) ), ( ints{ 1, 2 } ) );
    EXPECT_TRUE( some.set_intersection( empty ).empty() );
    EXPECT_EQ( to_vector( some.set_difference( empty ) ), ( ints{ 1, 2 } ) );
    EXPECT_TRUE( empty.set_symmetric_difference( empty ).empty() );
    EXPECT_TRUE( some.set_symmetric_difference( some ).empty() );
}

TEST( set_algebra, views_are_lazy_forward_ranges )
{
    static_assert( std::ranges::forward_range<decltype( std::declval<int_set const &>().set_union( std::declval<int_set const &>() ) )> );

    int_set const left { 1, 2, 3 };
    int_set const right{ 3, 4 };
    auto const view{ left.set_union( right ) };
    EXPECT_EQ( std::ranges::distance( view ), 4 );
    EXPECT_EQ( view.front(), 1 );
    EXPECT_EQ( std::ranges::count_if( view, []( int const x ) { return x % 2 == 0; } ), 2 );
    // multi-pass
    EXPECT_EQ( to_vector( view ), to_vector( view ) );
}

TEST( set_algebra, mixed_storage_operands )
{
    int_set const heap{ 1, 2, 3 };
    index_set<int, boost::hash<int>, std::equal_to<int>, fixed_storage<8>> fixed{ 3, 4 };
    EXPECT_EQ( to_vector( heap .set_union       ( fixed ) ), ( ints{ 1, 2, 3, 4 } ) );
    EXPECT_EQ( to_vector( fixed.set_intersection( heap  ) ), ( ints{ 3 } ) );
}

TEST( set_algebra, relations )
{
    int_set const small{ 2, 3 };
    int_set const large{ 1, 2, 3, 4 };
    int_set const other{ 7, 8 };
    EXPECT_TRUE ( small.is_subset  ( large ) );
    EXPECT_FALSE( large.is_subset  ( small ) );
    EXPECT_TRUE ( large.is_superset( small ) );
    EXPECT_TRUE ( small.is_subset  ( small ) );
    EXPECT_TRUE ( small.is_disjoint( other ) );
    EXPECT_FALSE( small.is_disjoint( large ) );
    EXPECT_TRUE ( int_set{}.is_subset( other ) );
}

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
