////////////////////////////////////////////////////////////////////////////////
///
/// \file set_algebra.hpp
/// ---------------------
///
/// Lazy set algebra views over two index_sets.
///
/// The result order is fixed by convention: the elements contributed by the
/// primary (left hand) operand come first, in its order, followed (for the
/// union and the symmetric difference) by the contributions of the other
/// operand, in its order. Nothing is materialized: each step is a membership
/// test against the other set.
///
/// A view references both operands - it is invalidated by any modification
/// of either of them.
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

#include <boost/assert.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

enum class set_operation : std::uint8_t
{
    union_,
    intersection,
    difference,
    symmetric_difference
};

template <typename Primary, typename Other, set_operation operation>
class set_algebra_view
    :
    public std::ranges::view_interface<set_algebra_view<Primary, Other, operation>>
{
    static_assert( std::is_same_v<typename Primary::key_type, typename Other::key_type>, "Set algebra over different key types" );

    // the union and the symmetric difference continue into the other operand
    static bool constexpr two_phase{ operation == set_operation::union_ || operation == set_operation::symmetric_difference };

public:
    using key_type = typename Primary::key_type;

    class iterator
    {
    public:
        using iterator_concept  = std::forward_iterator_tag;
        using iterator_category = std::forward_iterator_tag;
        using value_type        = key_type;
        using difference_type   = std::ptrdiff_t;
        using reference         = key_type const &;
        using pointer           = key_type const *;

        constexpr iterator() noexcept = default;

        reference operator* () const noexcept { return *current(); }
        pointer   operator->() const noexcept { return  current(); }

        iterator & operator++(     ) { ++index_; settle(); return *this; }
        iterator   operator++( int ) { auto tmp{ *this }; ++*this; return tmp; }

        friend constexpr bool operator==( iterator const & a, iterator const & b ) noexcept
        {
            BOOST_ASSERT( a.primary_ == b.primary_ );
            return ( a.second_phase_ == b.second_phase_ ) && ( a.index_ == b.index_ );
        }

    private: friend set_algebra_view;
        iterator( Primary const & primary, Other const & other, bool const second_phase, std::size_t const index )
            : primary_{ &primary }, other_{ &other }, index_{ index }, second_phase_{ second_phase } {}

        [[ nodiscard ]] pointer current() const noexcept
        {
            auto const key{ second_phase_ ? other_->get_index( index_ ) : primary_->get_index( index_ ) };
            BOOST_ASSERT_MSG( key, "Dereferencing the end of a set algebra view" );
            return key;
        }

        // advances to the next element that belongs to the result (or the end)
        void settle()
        {
            if ( !second_phase_ )
            {
                for ( ; index_ < primary_->size(); ++index_ )
                {
                    if ( primary_accepts( *primary_->get_index( index_ ) ) )
                        return;
                }
                if constexpr ( !two_phase )
                    return;
                second_phase_ = true;
                index_        = 0;
            }
            // both two phase operations take the other operand's elements not in the primary
            while ( ( index_ < other_->size() ) && primary_->contains( *other_->get_index( index_ ) ) )
                ++index_;
        }

        [[ nodiscard ]] bool primary_accepts( key_type const & key ) const
        {
            if constexpr ( operation == set_operation::union_ )
                return true;
            else
            if constexpr ( operation == set_operation::intersection )
                return other_->contains( key );
            else
                return !other_->contains( key );
        }

        Primary const * primary_{ nullptr };
        Other   const * other_  { nullptr };
        std::size_t     index_  { 0 };
        bool            second_phase_{ false };
    }; // class iterator

    set_algebra_view( Primary const & primary, Other const & other ) noexcept : primary_{ &primary }, other_{ &other } {}

    [[ nodiscard ]] iterator begin() const
    {
        iterator first{ *primary_, *other_, false, 0 };
        first.settle();
        return first;
    }
    [[ nodiscard ]] iterator end() const noexcept
    {
        if constexpr ( two_phase )
            return { *primary_, *other_, true , other_  ->size() };
        else
            return { *primary_, *other_, false, primary_->size() };
    }

private:
    Primary const * primary_;
    Other   const * other_;
}; // class set_algebra_view

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
