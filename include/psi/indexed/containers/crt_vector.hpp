////////////////////////////////////////////////////////////////////////////////
/// Zero bloat implementation of a classic std::vector around the CRT
/// allocation APIs: the heap backed storage of the hashed containers.
/// Trivially moveable types are grown in place with realloc (eliminating the
/// copy-on-resize overhead of std::vector), everything else is move-relocated
/// into a fresh block.
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

#include <psi/indexed/detail/config.hpp>

#if !PSI_INDEXED_HEAP
#   error "crt_vector is not available in allocation-free (PSI_INDEXED_NO_HEAP) builds"
#endif

#include <psi/indexed/containers/vector_impl.hpp>

#include <boost/assert.hpp>

#include <cstdlib>
#include <cstring>

#ifdef __linux__
#include <malloc.h>
#elif defined( __APPLE__ )
#include <malloc/malloc.h>
#endif
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

namespace detail
{
    // https://www.gnu.org/software/libc/manual/html_node/Aligned-Memory-Blocks.html
    inline std::uint8_t constexpr guaranteed_alignment{ 16 }; // all known x64 and arm64 platforms

    [[ gnu::pure ]] inline std::size_t crt_alloc_size( void const * const address ) noexcept
    {
        // https://lemire.me/blog/2017/09/15/how-fast-are-malloc_size-and-malloc_usable_size-in-c
#   if defined( _MSC_VER )
        return _msize( const_cast<void *>( address ) );
#   elif defined( __linux__ )
        return ::malloc_usable_size( const_cast<void *>( address ) ); // fast
#   elif defined( __APPLE__ )
        return ::malloc_size( address ); // not so fast
#   else
        static_assert( false, "no malloc size implementation" );
#   endif
    }

    [[ using gnu: assume_aligned( guaranteed_alignment ), malloc, returns_nonnull ]]
    inline void * crt_realloc( void * const existing_allocation_address, std::size_t const new_size )
    {
        auto const new_allocation{ std::realloc( existing_allocation_address, new_size ) };
        if ( !new_allocation ) [[ unlikely ]]
            throw_bad_alloc();
        return new_allocation;
    }
} // namespace detail

template <typename T, typename sz_t = std::size_t, std::uint8_t alignment = alignof( T )>
struct crt_aligned_allocator
{
    using value_type      = T;
    using       pointer   = T *;
    using const_pointer   = T const *;
    using       size_type = sz_t;
    using difference_type = std::make_signed_t<size_type>;

    static bool constexpr overaligned{ alignment > detail::guaranteed_alignment };

    //! Allocates memory for an array of count elements.
    //! Throws bad_alloc if there is no enough memory.
    [[ nodiscard ]]
    [[ using gnu: cold, assume_aligned( alignment ), malloc, returns_nonnull ]]
    static pointer allocate( size_type const count )
    {
        BOOST_ASSERT( count <= max_size() );
        auto const byte_size{ std::max<std::size_t>( count * sizeof( T ), 1 ) };
        void * new_allocation{ nullptr };
        if constexpr ( overaligned )
        {
            if ( ::posix_memalign( &new_allocation, alignment, byte_size ) != 0 )
                new_allocation = nullptr;
        }
        else
        {
            new_allocation = std::malloc( byte_size );
        }

        if ( !new_allocation ) [[ unlikely ]]
            detail::throw_bad_alloc();
        return std::assume_aligned<alignment>( static_cast<pointer>( new_allocation ) );
    }

    //! Deallocates previously allocated memory.
    static void deallocate( pointer const ptr ) noexcept { std::free( ptr ); }

    //! Bitwise (realloc) growth - only for trivially moveable types.
    [[ nodiscard ]] static pointer grow_to( pointer const current_address, size_type const target_size )
    requires( !overaligned )
    {
        return std::assume_aligned<alignment>( static_cast<pointer>(
            detail::crt_realloc( current_address, target_size * sizeof( T ) )
        ));
    }

    //! Returns the maximum number of elements that could be allocated.
    [[ gnu::const ]] static constexpr size_type max_size() noexcept { return std::numeric_limits<size_type>::max() / sizeof( T ); }

    //! Returns the maximum number of objects the previously allocated memory
    //! pointed by p can hold.
    [[ nodiscard, gnu::pure ]] static size_type size( const_pointer const p ) noexcept
    {
        return static_cast<size_type>( detail::crt_alloc_size( p ) / sizeof( T ) );
    }
}; // class crt_aligned_allocator


template <typename T, typename sz_t = std::size_t>
class [[ clang::trivial_abi ]] crt_vector
    :
    public vector_impl<crt_vector<T, sz_t>, T, sz_t>
{
public:
    using size_type      = sz_t;
    using value_type     = T;
    using allocator_type = crt_aligned_allocator<T, sz_t>;

    static bool constexpr realloc_growth{ is_trivially_moveable<T> && !allocator_type::overaligned };

private:
    using al   = allocator_type;
    using base = vector_impl<crt_vector<T, sz_t>, T, sz_t>;

public:
    using base::base;
    constexpr crt_vector() noexcept : p_array_{ nullptr }, size_{ 0 }, capacity_{ 0 } {}
    constexpr explicit crt_vector( crt_vector const & other ) : crt_vector()
    {
        if ( other.empty() )
            return;
        auto const data{ storage_init( other.size() ) };
        try { std::uninitialized_copy_n( other.data(), other.size(), data ); }
        catch(...) { al::deallocate( data ); mark_freed(); throw; }
    }
    constexpr crt_vector( crt_vector && other ) noexcept : p_array_{ other.p_array_ }, size_{ other.size_ }, capacity_{ other.capacity_ } { other.mark_freed(); }

    constexpr crt_vector & operator=( crt_vector const & other )
    {
        if ( this != &other )
            *this = crt_vector( other );
        return *this;
    }
    constexpr crt_vector & operator=( crt_vector && other ) noexcept
    {
        std::swap( this->p_array_ , other.p_array_  );
        std::swap( this->size_    , other.size_     );
        std::swap( this->capacity_, other.capacity_ );
        other.free();
        return *this;
    }
    constexpr ~crt_vector() noexcept { free(); }

    [[ nodiscard, gnu::pure ]] size_type size    () const noexcept { return size_; }
    [[ nodiscard, gnu::pure ]] size_type capacity() const noexcept
    {
        BOOST_ASSERT( capacity_ >= size_ );
        BOOST_ASSERT( !p_array_ || ( capacity_ <= al::size( p_array_ ) ) );
        return capacity_;
    }

    [[ nodiscard, gnu::pure ]] value_type       * data()       noexcept { return p_array_; }
    [[ nodiscard, gnu::pure ]] value_type const * data() const noexcept { return p_array_; }

    void reserve( size_type const new_capacity )
    {
        if ( new_capacity > capacity() )
            reallocate( new_capacity );
    }

private: friend base;
    [[ gnu::cold ]]
    value_type * storage_init( size_type const initial_size )
    {
        size_     = 0;
        capacity_ = 0;
        if ( initial_size )
        {
            p_array_ = al::allocate( initial_size );
            update_capacity( initial_size );
        }
        else
        {
            p_array_ = nullptr;
        }
        size_ = initial_size;
        return data();
    }
    value_type * storage_grow_to( size_type const target_size )
    {
        auto const current_capacity{ capacity() };
        BOOST_ASSERT( target_size >= size_ );
        if ( target_size > current_capacity ) [[ unlikely ]] {
            do_grow( target_size, current_capacity );
        }
        size_ = target_size;
        return data();
    }

    constexpr void storage_shrink_size_to( size_type const target_size ) noexcept
    {
        BOOST_ASSERT( size_ >= target_size );
        size_ = target_size;
    }
    void storage_dec_size() noexcept { BOOST_ASSERT( size_ >= 1 ); --size_; }

private:
    [[ gnu::cold, gnu::noinline ]]
    void do_grow( size_type const target_size, size_type const cached_current_capacity )
    {
        if ( target_size > al::max_size() ) [[ unlikely ]]
            detail::throw_bad_alloc();
        // geometric (2x) growth for amortized constant time push
        auto const doubled{ cached_current_capacity > al::max_size() / 2 ? al::max_size() : static_cast<size_type>( cached_current_capacity * 2U ) };
        reallocate( std::max( target_size, doubled ) );
    }

    void reallocate( size_type const new_capacity )
    {
        BOOST_ASSERT( new_capacity >= size_ );
        if constexpr ( realloc_growth )
        {
            p_array_ = al::grow_to( p_array_, new_capacity );
        }
        else
        {
            auto const new_array{ al::allocate( new_capacity ) };
            if constexpr ( std::is_nothrow_move_constructible_v<T> )
            {
                std::uninitialized_move_n( p_array_, size_, new_array );
            }
            else
            {
                try { std::uninitialized_copy_n( p_array_, size_, new_array ); }
                catch(...) { al::deallocate( new_array ); throw; }
            }
            std::destroy_n( p_array_, size_ );
            al::deallocate( p_array_ );
            p_array_ = new_array;
        }
        update_capacity( new_capacity );
    }

    void update_capacity( [[ maybe_unused ]] size_type const requested_capacity ) noexcept
    {
        BOOST_ASSERT( p_array_ );
        capacity_ = std::max( requested_capacity, std::min( al::size( p_array_ ), al::max_size() ) );
    }

    void free() noexcept
    {
        std::destroy_n( p_array_, size_ );
        al::deallocate( p_array_ );
        mark_freed();
    }

    void mark_freed() noexcept { p_array_ = nullptr; size_ = 0; capacity_ = 0; }

private:
    T *       p_array_;
    size_type size_;
    size_type capacity_;
}; // class crt_vector

template <typename T, typename sz_t>
bool constexpr is_trivially_moveable<crt_vector<T, sz_t>>{ true };

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
