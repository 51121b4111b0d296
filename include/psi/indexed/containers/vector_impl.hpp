////////////////////////////////////////////////////////////////////////////////
/// Base CRTP implementation of shared, standard C++ functionality for the
/// vector-like containers backing the hashed containers (heap backed
/// crt_vector and fixed capacity fc_vector). Also provides extensions like
/// default vs value initialization, explicit grow and shrink (noexcept) vs
/// resize methods, swap_erase, configurable size_type and pass-by-value ABI for
/// trivial types...
/// w/ special emphasis on code reuse and bloat reduction.
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

#include <psi/indexed/containers/abi.hpp>
#include <psi/indexed/containers/is_trivially_moveable.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <memory>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

namespace detail
{
    struct init_policy_tag{};
} // namespace detail

template <std::unsigned_integral Target>
[[ gnu::const ]] constexpr Target verified_cast( std::unsigned_integral auto const source ) noexcept
{
    BOOST_ASSERT( source <= std::numeric_limits<Target>::max() );
    return static_cast<Target>( source );
}

struct no_init_t      : detail::init_policy_tag{}; inline constexpr no_init_t      no_init     ;
struct default_init_t : detail::init_policy_tag{}; inline constexpr default_init_t default_init;

template <typename T>
concept init_policy = std::is_base_of_v<detail::init_policy_tag, T>;


// Storage protocol expected from Impl (accessible to vector_impl):
//  - data(), size(), capacity(), max_size()
//  - storage_init          ( initial_size ) -> value_type *
//  - storage_grow_to       ( target_size  ) -> value_type * (may reallocate)
//  - storage_shrink_size_to( target_size  ) (never releases capacity)
//  - storage_dec_size      (              )
template <typename Impl, typename T, typename sz_t>
class [[ clang::trivial_abi ]] vector_impl
{
public:
    using value_type             = T;
    using       pointer          = value_type       *;
    using const_pointer          = value_type const *;
    using       reference        = value_type       &;
    using const_reference        = value_type const &;
    using param_const_ref        = in_param<value_type>;
    using       size_type        = sz_t;
    using difference_type        = std::make_signed_t<size_type>;
    using       iterator         =       pointer;
    using const_iterator         = const_pointer;
    using       reverse_iterator = std::reverse_iterator<      iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

private:
    [[ gnu::const ]] constexpr Impl       & impl()       noexcept { return static_cast<Impl       &>( *this ); }
    [[ gnu::const ]] constexpr Impl const & impl() const noexcept { return static_cast<Impl const &>( *this ); }

    // constructor helpers - for initializing the derived Impl class
    // (simplifying or minimizing the need to write specialized Impl
    // constructors) - to be used only in vector_impl constructors!
    constexpr Impl & initialized_impl( size_type const initial_size, no_init_t )
    {
        auto & self{ impl() };
        self.storage_init( initial_size );
        BOOST_ASSERT( self.size() == initial_size );
        return self;
    }

protected:
    constexpr  vector_impl(                      ) noexcept = default;
    constexpr  vector_impl( vector_impl const &  ) noexcept = default;
    constexpr  vector_impl( vector_impl       && ) noexcept = default;
    constexpr ~vector_impl(                      ) noexcept = default;

    constexpr vector_impl & operator=( vector_impl const &  ) noexcept = default;
    constexpr vector_impl & operator=( vector_impl       && ) noexcept = default;

public:
    constexpr vector_impl( size_type const count, param_const_ref value )
    {
        auto & self{ initialized_impl( count, no_init ) };
        std::uninitialized_fill_n( self.data(), count, value );
    }

    template <std::input_iterator It>
    constexpr vector_impl( It const first, It const last )
    {
        if constexpr ( std::random_access_iterator<It> )
        {
            auto const sz{ static_cast<size_type>( std::distance( first, last ) ) };
            auto & self{ initialized_impl( sz, no_init ) };
            // STL utility functions handle EH safety - no need to catch to
            // reset size as Impl/the derived class should not attempt cleanup
            // if this (its base constructor) fails.
            std::uninitialized_copy_n( first, sz, self.data() );
        }
        else
        {
            auto & self{ initialized_impl( 0, no_init ) };
            std::copy( first, last, std::back_inserter( self ) );
        }
    }

    constexpr vector_impl( std::initializer_list<value_type> const initial_values )
        : vector_impl( initial_values.begin(), initial_values.end() )
    {}

    //////////////////////////////////////////////
    //
    //                iterators
    //
    //////////////////////////////////////////////

    [[ nodiscard ]] constexpr       iterator  begin()       noexcept { return impl().data(); }
    [[ nodiscard ]] constexpr const_iterator  begin() const noexcept { return impl().data(); }
    [[ nodiscard ]] constexpr const_iterator cbegin() const noexcept { return begin(); }

    [[ nodiscard ]] constexpr       iterator  end()       noexcept { return impl().data() + impl().size(); }
    [[ nodiscard ]] constexpr const_iterator  end() const noexcept { return impl().data() + impl().size(); }
    [[ nodiscard ]] constexpr const_iterator cend() const noexcept { return end(); }

    [[ nodiscard ]] constexpr       reverse_iterator rbegin()       noexcept { return       reverse_iterator{ end() }; }
    [[ nodiscard ]] constexpr const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    [[ nodiscard ]] constexpr       reverse_iterator rend  ()       noexcept { return       reverse_iterator{ begin() }; }
    [[ nodiscard ]] constexpr const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //////////////////////////////////////////////
    //
    //                capacity
    //
    //////////////////////////////////////////////

    [[ nodiscard, gnu::pure ]] constexpr bool empty() const noexcept { return BOOST_UNLIKELY( impl().size() == 0 ); }

    //! <b>Effects</b>: Returns the largest possible size of the vector.
    //! <b>Note</b>: Fixed capacity implementations shadow this with their
    //!   static capacity.
    [[ nodiscard ]] static constexpr size_type max_size() noexcept { return static_cast<size_type>( std::numeric_limits<size_type>::max() / sizeof( value_type ) ); }

    void resize( size_type const new_size, init_policy auto const policy )
    {
        if ( new_size > impl().size() ) grow_to( new_size, policy );
        else                            shrink_to( new_size );
    }
    // intentional non-standard behaviour: default_init by default
    void resize( size_type const new_size ) { resize( new_size, default_init ); }

    //////////////////////////////////////////////
    //
    //               element access
    //
    //////////////////////////////////////////////

    [[ nodiscard ]] constexpr       reference front()       noexcept { BOOST_ASSERT( !empty() ); return *begin(); }
    [[ nodiscard ]] constexpr const_reference front() const noexcept { BOOST_ASSERT( !empty() ); return *begin(); }
    [[ nodiscard ]] constexpr       reference back ()       noexcept { BOOST_ASSERT( !empty() ); return end()[ -1 ]; }
    [[ nodiscard ]] constexpr const_reference back () const noexcept { BOOST_ASSERT( !empty() ); return end()[ -1 ]; }

    //! <b>Requires</b>: size() > n.
    [[ nodiscard ]] constexpr       reference operator[]( size_type const n )       noexcept { BOOST_ASSERT( n < impl().size() ); return impl().data()[ n ]; }
    [[ nodiscard ]] constexpr const_reference operator[]( size_type const n ) const noexcept { BOOST_ASSERT( n < impl().size() ); return impl().data()[ n ]; }

    //! <b>Requires</b>: size() >= n.
    //!
    //! <b>Effects</b>: Returns an iterator to the nth element
    //!   from the beginning of the container. Returns end()
    //!   if n == size().
    //!
    //! <b>Note</b>: Non-standard extension
    [[ nodiscard ]] constexpr       iterator nth( size_type const n )       noexcept { BOOST_ASSERT( n <= impl().size() ); return begin() + n; }
    [[ nodiscard ]] constexpr const_iterator nth( size_type const n ) const noexcept { BOOST_ASSERT( n <= impl().size() ); return begin() + n; }

    //! <b>Requires</b>: begin() <= p <= end().
    //!
    //! <b>Effects</b>: Returns the index of the element pointed by p
    //!   and size() if p == end().
    //!
    //! <b>Note</b>: Non-standard extension
    [[ nodiscard ]] constexpr size_type index_of( const_iterator const p ) const noexcept
    {
        verify_iterator( p );
        return static_cast<size_type>( p - begin() );
    }

    //! <b>Throws</b>: std::out_of_range if n >= size()
    [[ nodiscard ]] reference at( size_type const n )
    {
        if ( n >= impl().size() ) [[ unlikely ]]
            detail::throw_out_of_range();
        return (*this)[ n ];
    }
    [[ nodiscard ]] const_reference at( size_type const n ) const { return const_cast<vector_impl &>( *this ).at( n ); }

    //////////////////////////////////////////////
    //
    //                 data access
    //
    //////////////////////////////////////////////

    [[ nodiscard, gnu::pure ]] constexpr std::span<value_type      > span()       noexcept { return { impl().data(), impl().size() }; }
    [[ nodiscard, gnu::pure ]] constexpr std::span<value_type const> span() const noexcept { return { impl().data(), impl().size() }; }

    //////////////////////////////////////////////
    //
    //                modifiers
    //
    //////////////////////////////////////////////

    template <class ...Args>
    static reference construct_at( value_type & placeholder, Args &&...args ) noexcept( std::is_nothrow_constructible_v<value_type, Args...> )
    {
        return *std::construct_at( &placeholder, std::forward<Args>( args )... );
    }
    static reference construct_at( value_type & placeholder ) noexcept( std::is_nothrow_default_constructible_v<value_type> )
    {
        return *(new (&placeholder) value_type); // default to default init
    }

    //! <b>Effects</b>: Inserts an object of type T constructed with
    //!   std::forward<Args>(args)... at the end of the vector.
    //!
    //! <b>Returns</b>: A reference to the created object.
    //!
    //! <b>Throws</b>: If memory allocation throws, the in-place constructor
    //!   throws or (fixed capacity) the overflow handler throws.
    //!
    //! <b>Complexity</b>: Amortized constant time.
    //!
    //! <b>Note</b>: args may refer to elements of this vector (as with
    //!   std::vector): a reallocating append constructs the new element before
    //!   the old block is released.
    template <class ...Args>
    reference emplace_back( Args &&...args )
    {
        if ( impl().size() == impl().capacity() ) [[ unlikely ]]
        {
            value_type element( std::forward<Args>( args )... );
            return append_constructed( std::move( element ) );
        }
        return append_constructed( std::forward<Args>( args )... );
    }

    void push_back( param_const_ref x ) { emplace_back( x ); }
    void push_back( value_type && x ) requires( !std::is_trivial_v<value_type> ) { emplace_back( std::move( x ) ); }

    template <std::ranges::range Rng>
    void append_range( Rng && rng )
    {
        auto & self{ impl() };
        auto const current_size{ self.size() };
        if constexpr ( requires{ std::ranges::size( rng ); } )
        {
            auto const additional_size{ verified_cast<size_type>( std::ranges::size( rng ) ) };
            auto const input_begin    { std::ranges::begin( rng ) };
            auto const target_position{ grow_by( additional_size, no_init ) + current_size };
            try
            {
                if constexpr ( std::is_rvalue_reference_v<Rng &&> )
                    std::uninitialized_move_n( input_begin, additional_size, target_position );
                else
                    std::uninitialized_copy_n( input_begin, additional_size, target_position );
            }
            catch (...)
            {
                self.storage_shrink_size_to( current_size );
                throw;
            }
        }
        else
        {
            try
            {
                for ( auto && element : rng )
                    emplace_back( std::forward<decltype( element )>( element ) );
            }
            catch (...)
            {
                shrink_to( current_size );
                throw;
            }
        }
    }
    void append_range( std::initializer_list<value_type> const rng ) { append_range( std::span{ rng.begin(), rng.end() } ); }

    //! <b>Effects</b>: Removes the last element from the container.
    //!
    //! <b>Complexity</b>: Constant time.
    void pop_back() noexcept
    {
        BOOST_ASSERT( !empty() );
        std::destroy_at( &back() );
        impl().storage_dec_size();
    }

    //! <b>Effects</b>: Erases the element at position pos, shifting all the
    //!   subsequent elements down by one (order preserving).
    //!
    //! <b>Complexity</b>: Linear to the elements between pos and the
    //!   last element. Constant if pos is the last element.
    iterator erase( const_iterator const position ) noexcept( std::is_nothrow_move_assignable_v<value_type> )
    {
        verify_iterator( position );
        BOOST_ASSERT( position != end() );
        auto const pos_index{ index_of( position ) };
        std::shift_left( nth( pos_index ), end(), 1 );
        pop_back();
        return nth( pos_index );
    }

    //! <b>Effects</b>: Erases the element at position pos by moving the last
    //!   element into its place (does not preserve the order of elements).
    //!
    //! <b>Complexity</b>: Constant.
    //!
    //! <b>Note</b>: Non-standard extension
    iterator swap_erase( const_iterator const position ) noexcept( std::is_nothrow_move_assignable_v<value_type> )
    {
        verify_iterator( position );
        BOOST_ASSERT( position != end() );
        auto const pos_index{ index_of( position ) };
        auto const last_index{ static_cast<size_type>( impl().size() - 1 ) };
        if ( pos_index != last_index )
            (*this)[ pos_index ] = std::move( (*this)[ last_index ] );
        pop_back();
        return nth( pos_index );
    }

    //! <b>Effects</b>: Erases all the elements of the vector.
    //!
    //! <b>Complexity</b>: Linear to the number of elements in the container.
    //!
    //! <b>Note</b>: Retains the capacity (as std::vector).
    void clear() noexcept { shrink_to( 0 ); }

    ///////////////////////////////////////////////////////////////////////////
    // Extensions
    ///////////////////////////////////////////////////////////////////////////

    value_type * grow_to( size_type const target_size, no_init_t ) { return impl().storage_grow_to( target_size ); }
    value_type * grow_to( size_type const target_size, default_init_t )
    {
        auto const current_size{ impl().size() };
        auto const data{ grow_to( target_size, no_init ) };
        if constexpr ( !std::is_trivially_default_constructible_v<value_type> ) {
            try {
                std::uninitialized_default_construct( &data[ current_size ], &data[ target_size ] );
            } catch(...) {
                impl().storage_shrink_size_to( current_size );
                throw;
            }
        }
        return data;
    }

    template <typename U>
    value_type * grow_to( size_type const target_size, U && default_value )
    requires( std::constructible_from<T, U> && !init_policy<std::remove_cvref_t<U>> )
    {
        auto const current_size{ impl().size() };
        BOOST_ASSERT( target_size >= current_size );
        auto const data{ grow_to( target_size, no_init ) };
        try {
            std::uninitialized_fill( &data[ current_size ], &data[ target_size ], std::forward<U>( default_value ) );
        } catch(...) {
            impl().storage_shrink_size_to( current_size );
            throw;
        }
        return data;
    }

    value_type * grow_by( size_type const delta, auto && init_policy )
    {
        return grow_to( static_cast<size_type>( impl().size() + delta ), std::forward<decltype( init_policy )>( init_policy ) );
    }

    void shrink_to( size_type const target_size ) noexcept
    {
        BOOST_ASSERT( target_size <= impl().size() );
        std::destroy( nth( target_size ), end() );
        impl().storage_shrink_size_to( target_size ); // std::vector behaviour: never release/shrink capacity
    }

    //! <b>Effects</b>: Element-wise comparison (sizes first).
    [[ nodiscard ]] friend constexpr bool operator==( Impl const & left, Impl const & right ) noexcept
    {
        return std::equal( left.begin(), left.end(), right.begin(), right.end() );
    }

private:
    template <class ...Args>
    reference append_constructed( Args &&...args )
    {
        auto & self{ impl() };
        auto const current_size{ self.size() };
        auto const data{ grow_by( 1, no_init ) };
        try {
            return construct_at( data[ current_size ], std::forward<Args>( args )... );
        } catch( ... ) {
            self.storage_shrink_size_to( current_size );
            throw;
        }
    }

    void verify_iterator( [[ maybe_unused ]] const_iterator const iter ) const noexcept
    {
        BOOST_ASSERT( iter >= begin() );
        BOOST_ASSERT( iter <= end  () );
    }
}; // class vector_impl

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
