////////////////////////////////////////////////////////////////////////////////
/// Fixed capacity vector
///
/// Yet another take on prior art a la boost::container::static_vector and
/// std::inplace_vector: the allocation-free backing storage of the hashed
/// containers, with emphasis on:
///  - never touching an allocator (usable in PSI_INDEXED_NO_HEAP builds)
///  - improved debuggability w/o custom type visualizers (i.e. seeing the
///    contained values rather than random bytes)
///  - configurability (overflow handler)
///  - in addition to extensions provided by vector_impl.
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

#include <psi/indexed/containers/vector_impl.hpp>

#include <boost/assert.hpp>
#include <boost/integer.hpp>

#include <cstdint>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

struct assert_on_overflow {
    [[ noreturn ]] void operator()() const noexcept {
        BOOST_ASSERT_MSG( false, "Fixed capacity vector overflow!" );
        std::unreachable();
    }
}; // assert_on_overflow
struct throw_on_overflow {
    [[ noreturn ]] void operator()() const { detail::throw_out_of_range( "psi::indexed::fc_vector overflow" ); }
}; // throw_on_overflow


////////////////////////////////////////////////////////////////////////////////
/// Fixed capacity vector
////////////////////////////////////////////////////////////////////////////////

template <typename T, std::uint32_t capacity_param, auto overflow_handler = throw_on_overflow{}>
class [[ clang::trivial_abi ]] fc_vector
    :
    // one past the capacity has to be representable so that grow requests
    // cannot wrap around before reaching the overflow check
    public vector_impl<fc_vector<T, capacity_param, overflow_handler>, T, typename boost::uint_value_t<std::uintmax_t{ capacity_param } + 1>::least>
{
    static_assert( capacity_param > 0, "Zero capacity storage" );

public:
    using  size_type = typename boost::uint_value_t<std::uintmax_t{ capacity_param } + 1>::least;
    using value_type = T;

    static size_type constexpr static_capacity{ capacity_param };

private:
    using base = vector_impl<fc_vector<T, capacity_param, overflow_handler>, T, size_type>;

public:
    using base::base;
    constexpr fc_vector() noexcept : size_{ 0 } {}
    constexpr explicit fc_vector( fc_vector const & other ) noexcept( std::is_nothrow_copy_constructible_v<T> )
    {
        std::uninitialized_copy_n( other.data(), other.size(), this->data() );
        this->size_ = other.size();
    }
    constexpr fc_vector( fc_vector && other ) noexcept( std::is_nothrow_move_constructible_v<T> )
    {
        std::uninitialized_move_n( other.data(), other.size(), this->data() );
        this->size_ = other.size();
        other.clear();
    }
    constexpr fc_vector & operator=( fc_vector const & other ) noexcept( std::is_nothrow_copy_constructible_v<T> )
    {
        if ( this != &other )
        {
            this->clear();
            std::uninitialized_copy_n( other.data(), other.size(), this->data() );
            this->size_ = other.size();
        }
        return *this;
    }
    constexpr fc_vector & operator=( fc_vector && other ) noexcept( std::is_nothrow_move_constructible_v<T> )
    {
        if ( this != &other )
        {
            this->clear();
            std::uninitialized_move_n( other.data(), other.size(), this->data() );
            this->size_ = other.size();
            other.clear();
        }
        return *this;
    }

    constexpr ~fc_vector() noexcept { std::destroy_n( data(), size() ); }

    [[ nodiscard, gnu::pure  ]]        constexpr size_type size    () const noexcept { BOOST_ASSERT( size_ <= static_capacity ); return size_; }
    [[ nodiscard, gnu::const ]] static constexpr size_type capacity()       noexcept { return static_capacity; }
    [[ nodiscard, gnu::const ]] static constexpr size_type max_size()       noexcept { return static_capacity; }

    [[ nodiscard, gnu::const  ]] constexpr value_type       * data()       noexcept { return array_.data; }
    [[ nodiscard, gnu::const  ]] constexpr value_type const * data() const noexcept { return array_.data; }

    constexpr void reserve( size_type const new_capacity ) const noexcept( noexcept( overflow_handler() ) )
    {
        if ( new_capacity > static_capacity ) [[ unlikely ]]
            overflow_handler();
    }

private: friend base; // contiguous storage implementation
    constexpr value_type * storage_init   ( size_type const initial_size ) noexcept( noexcept( overflow_handler() ) ) { size_ = 0; return storage_grow_to( initial_size ); }
    constexpr value_type * storage_grow_to( size_type const  target_size ) noexcept( noexcept( overflow_handler() ) )
    {
        if ( target_size > static_capacity ) [[ unlikely ]] {
            overflow_handler();
        }
        size_ = target_size;
        return data();
    }

    constexpr void storage_shrink_size_to( size_type const target_size ) noexcept
    {
        BOOST_ASSERT( size_ >= target_size );
        size_ = target_size;
    }
    constexpr void storage_dec_size() noexcept { BOOST_ASSERT( size_ >= 1 ); --size_; }

private:
    // a union (rather than a byte buffer) keeps the live elements visible in
    // the debugger; members are constructed/destroyed by vector_impl only
    union [[ clang::trivial_abi ]] slots
    {
        constexpr  slots() noexcept {}
        constexpr ~slots() noexcept {}

        T data[ capacity_param ];
    }; // slots

    size_type size_;
    slots     array_;
}; // class fc_vector

template <typename T, std::uint32_t capacity, auto overflow_handler>
bool constexpr is_trivially_moveable<fc_vector<T, capacity, overflow_handler>>{ is_trivially_moveable<T> };

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
