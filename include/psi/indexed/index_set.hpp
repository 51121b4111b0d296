////////////////////////////////////////////////////////////////////////////////
///
/// \file index_set.hpp
/// -------------------
///
/// psi::indexed::index_set - insertion ordered hash set: an index_map with the
/// (zero sized) unit value type plus set algebra.
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

#include <psi/indexed/index_map.hpp>
#include <psi/indexed/set_algebra.hpp>

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

template
<
    typename Key,
    typename Hash     = boost::hash<Key>,
    typename KeyEqual = std::equal_to<Key>,
    typename Storage  = default_storage
>
class index_set
{
    using map_type = index_map<Key, unit, Hash, KeyEqual, Storage>;

public:
    using key_type        = Key;
    using value_type      = Key;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using storage_type    = Storage;
    using size_type       = typename map_type::size_type;
    using difference_type = typename map_type::difference_type;
    using reference       = key_type const &;
    using const_reference = key_type const &;
    using iterator        = typename map_type::key_iterator;
    using const_iterator  = iterator;

    static bool constexpr transparent{ map_type::transparent };

    index_set() = default;
    explicit index_set( hasher const & hash, key_equal const & equal = key_equal{} ) : map_{ hash, equal } {}

    template <std::input_iterator It>
    index_set( It const first, It const last ) { insert( first, last ); }
    index_set( std::initializer_list<key_type> const init ) { insert( init ); }

    [[ nodiscard ]] static index_set with_capacity( std::size_t const capacity )
    {
        index_set set;
        set.reserve( capacity );
        return set;
    }
    [[ nodiscard ]] static fallible_result<index_set> try_with_capacity( std::size_t const capacity )
    {
        index_set set;
        if ( auto const reserved{ set.try_reserve( capacity ) }; !reserved )
            return failure( reserved.error() );
        return success( std::move( set ) );
    }

    [[ nodiscard ]] iterator begin() const noexcept { return map_.keys().begin(); }
    [[ nodiscard ]] iterator end  () const noexcept { return map_.keys().end  (); }
    [[ nodiscard ]] iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]] iterator cend  () const noexcept { return end  (); }

    [[ nodiscard ]] bool                  empty   () const noexcept { return map_.empty(); }
    [[ nodiscard ]] size_type             size    () const noexcept { return map_.size (); }
    [[ nodiscard ]] std::size_t           capacity() const noexcept { return map_.capacity(); }
    [[ nodiscard ]] static constexpr std::size_t max_size() noexcept { return map_type::max_size(); }

    void reserve( std::size_t const additional ) { map_.reserve( additional ); }
    [[ nodiscard ]] fallible_result<void> try_reserve( std::size_t const additional ) { return map_.try_reserve( additional ); }

    /// Appends key unless already present (an existing key keeps its
    /// position) - returns whether key was added.
    bool insert( key_type const & key ) { return insert_full( key ).second; }
    bool insert( key_type &&      key ) { return insert_full( std::move( key ) ).second; }

    std::pair<size_type, bool> insert_full( key_type const & key )
    {
        auto const [ it, inserted ]{ map_.try_emplace( key ) };
        return { map_.index_of( it ), inserted };
    }
    std::pair<size_type, bool> insert_full( key_type && key )
    {
        auto const [ it, inserted ]{ map_.try_emplace( std::move( key ) ) };
        return { map_.index_of( it ), inserted };
    }

    [[ nodiscard ]] fallible_result<bool> try_insert( key_type const & key ) { return try_insert_impl( key ); }
    [[ nodiscard ]] fallible_result<bool> try_insert( key_type &&      key ) { return try_insert_impl( std::move( key ) ); }

    template <std::input_iterator It>
    void insert( It first, It const last )
    {
        for ( ; first != last; ++first )
            insert( *first );
    }
    void insert( std::initializer_list<key_type> const init ) { insert( init.begin(), init.end() ); }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] bool contains( K const & key ) const { return map_.contains( key ); }

    /// The stored element equal to key (or nullptr).
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] key_type const * get( K const & key ) const
    {
        auto const entry{ map_.get_key_value( key ) };
        return entry ? &entry->first : nullptr;
    }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] std::optional<size_type> get_index_of( K const & key ) const { return map_.get_index_of( key ); }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] iterator find( K const & key ) const
    {
        auto const position{ map_.get_index_of( key ) };
        return position ? std::next( begin(), static_cast<difference_type>( *position ) ) : end();
    }

    [[ nodiscard ]] key_type const * get_index( size_type const position ) const
    {
        auto const entry{ map_.get_index( position ) };
        return entry ? &entry->first : nullptr;
    }
    [[ nodiscard ]] key_type const * first() const { return get_index( 0 ); }
    [[ nodiscard ]] key_type const * last () const { return empty() ? nullptr : get_index( static_cast<size_type>( size() - 1 ) ); }

    template <LookupType<transparent, key_type> K = key_type>
    bool swap_remove ( K const & key ) { return map_.swap_remove ( key ).has_value(); }
    template <LookupType<transparent, key_type> K = key_type>
    bool shift_remove( K const & key ) { return map_.shift_remove( key ).has_value(); }

    template <LookupType<transparent, key_type> K = key_type>
    std::optional<key_type> swap_take ( K const & key ) { return key_of( map_.swap_remove_entry ( key ) ); }
    template <LookupType<transparent, key_type> K = key_type>
    std::optional<key_type> shift_take( K const & key ) { return key_of( map_.shift_remove_entry( key ) ); }

    std::optional<key_type> swap_remove_index ( size_type const position ) { return key_of( map_.swap_remove_index ( position ) ); }
    std::optional<key_type> shift_remove_index( size_type const position ) { return key_of( map_.shift_remove_index( position ) ); }
    std::optional<key_type> pop() { return key_of( map_.pop() ); }

    void clear() noexcept { map_.clear(); }

    void swap( index_set & other ) noexcept { map_.swap( other.map_ ); }

    [[ nodiscard ]] hasher    hash_function() const { return map_.hash_function(); }
    [[ nodiscard ]] key_equal key_eq       () const { return map_.key_eq       (); }

    [[ nodiscard ]] map_type const & map() const noexcept { return map_; }
    [[ nodiscard ]] bool verify_consistency() const { return map_.verify_consistency(); }

    //--------------------------------------------------------------------------
    // Set algebra (lazy - see set_algebra.hpp for the ordering convention)
    //--------------------------------------------------------------------------

    template <typename OtherSet>
    [[ nodiscard ]] auto set_union( OtherSet const & other ) const noexcept { return set_algebra_view<index_set, OtherSet, set_operation::union_>{ *this, other }; }
    template <typename OtherSet>
    [[ nodiscard ]] auto set_intersection( OtherSet const & other ) const noexcept { return set_algebra_view<index_set, OtherSet, set_operation::intersection>{ *this, other }; }
    template <typename OtherSet>
    [[ nodiscard ]] auto set_difference( OtherSet const & other ) const noexcept { return set_algebra_view<index_set, OtherSet, set_operation::difference>{ *this, other }; }
    template <typename OtherSet>
    [[ nodiscard ]] auto set_symmetric_difference( OtherSet const & other ) const noexcept { return set_algebra_view<index_set, OtherSet, set_operation::symmetric_difference>{ *this, other }; }

    template <typename OtherSet>
    [[ nodiscard ]] bool is_subset( OtherSet const & other ) const
    {
        return ( size() <= other.size() ) && std::ranges::all_of( *this, [ & ]( key_type const & key ) { return other.contains( key ); } );
    }
    template <typename OtherSet>
    [[ nodiscard ]] bool is_superset( OtherSet const & other ) const { return other.is_subset( *this ); }
    template <typename OtherSet>
    [[ nodiscard ]] bool is_disjoint( OtherSet const & other ) const
    {
        if ( size() > other.size() )
            return other.is_disjoint( *this );
        return std::ranges::none_of( *this, [ & ]( key_type const & key ) { return other.contains( key ); } );
    }

    /// Order sensitive (equal elements at equal positions).
    friend bool operator==( index_set const & left, index_set const & right ) { return left.map_ == right.map_; }

private:
    template <typename Entry>
    static std::optional<key_type> key_of( std::optional<Entry> && entry )
    {
        if ( !entry )
            return std::nullopt;
        return std::move( entry->first );
    }

    template <typename K>
    fallible_result<bool> try_insert_impl( K && key )
    {
        auto const inserted{ map_.try_insert( std::forward<K>( key ), unit{} ) };
        if ( !inserted ) [[ unlikely ]]
            return failure( inserted.error() );
        // an existing key reports its previous (unit) value
        return success( !inserted.value().has_value() );
    }

    map_type map_;
}; // class index_set

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
