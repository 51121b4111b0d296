////////////////////////////////////////////////////////////////////////////////
///
/// \file index_map.hpp
/// -------------------
///
/// psi::indexed::index_map - insertion ordered hash map.
///
/// The pairing of two explicitly owned structures:
///  - an entry_store: the dense, ordered sequence of (hash, key, value) slots
///    - the source of truth, iterated directly and addressable by position
///  - a hash_index: open addressing table of entry store positions - a derived
///    structure, reconciled after every mutation and rebuildable from the
///    entry store's cached hashes at any time.
///
/// New keys are always appended; overwriting the value of an existing key
/// keeps its position. Removal is always explicit about the trade-off:
///   swap_remove*  - O(1), moves the last entry into the vacated position
///   shift_remove* - O(n), preserves the relative order of the rest
/// There is no erase( key ) that would silently pick one of the two.
///
/// Every operation that may need to grow has a try_ variant reporting
/// capacity_exceeded (as a fallible_result) instead of invoking the storage
/// policy's overflow handler - in both variants the check precedes any
/// mutation (a failed insertion leaves the container unchanged).
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

#include <psi/indexed/containers/lookup.hpp>
#include <psi/indexed/entry_store.hpp>
#include <psi/indexed/error.hpp>
#include <psi/indexed/hash_index.hpp>
#include <psi/indexed/storage.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

template <typename It>
concept pair_iterator = std::input_iterator<It> && requires( It it ) { ( *it ).first; ( *it ).second; };

template
<
    typename Key,
    typename T,
    typename Hash     = boost::hash<Key>,
    typename KeyEqual = std::equal_to<Key>,
    typename Storage  = default_storage
>
class index_map
{
    static_assert( storage_policy<Storage>, "No default storage in allocation-free (PSI_INDEXED_NO_HEAP) builds: specify fixed_storage<N>" );

    using store_type = entry_store<Key, T, Storage>;
    using index_type = hash_index <Storage>;
    using slot_type  = typename store_type::value_type;

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<key_type, mapped_type>;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using storage_type    = Storage;
    using reference       = std::pair<key_type const &, mapped_type       &>;
    using const_reference = std::pair<key_type const &, mapped_type const &>;
    using size_type       = typename Storage::size_type;
    using difference_type = std::ptrdiff_t;

    static bool constexpr transparent{ transparent_lookup<Hash, KeyEqual> };

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
private:
    enum class projection : std::uint8_t { entry, key, value };

    template <bool IsConst, projection Projection = projection::entry>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::random_access_iterator_tag;
        using iterator_category = std::random_access_iterator_tag;
        using difference_type   = index_map::difference_type;
        using value_type        = std::conditional_t
        <
            Projection == projection::entry, index_map::value_type,
            std::conditional_t<Projection == projection::key, key_type, mapped_type>
        >;
        using reference         = std::conditional_t
        <
            Projection == projection::entry,
            std::conditional_t<IsConst, index_map::const_reference, index_map::reference>,
            std::conditional_t
            <
                Projection == projection::key,
                key_type const &,
                std::conditional_t<IsConst, mapped_type const &, mapped_type &>
            >
        >;

        struct arrow_proxy {
            reference ref;
            constexpr reference const * operator->() const noexcept { return &ref; }
        };
        using pointer = std::conditional_t<Projection == projection::entry, arrow_proxy, std::add_pointer_t<reference>>;

    private:
        friend index_map;
        friend iterator_impl<!IsConst, Projection>;

        using map_ptr = std::conditional_t<IsConst, index_map const *, index_map *>;

        map_ptr         map_{ nullptr };
        difference_type idx_{ 0 };

        constexpr iterator_impl( map_ptr const m, difference_type const i ) noexcept : map_{ m }, idx_{ i } {}

    public:
        constexpr iterator_impl() noexcept = default;
        constexpr iterator_impl( iterator_impl const & ) noexcept = default;
        constexpr iterator_impl & operator=( iterator_impl const & ) noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst, Projection> const & other ) noexcept requires IsConst
            : map_{ other.map_ }, idx_{ other.idx_ } {}

        constexpr reference operator*() const noexcept
        {
            BOOST_ASSERT( ( idx_ >= 0 ) && ( idx_ < static_cast<difference_type>( map_->size() ) ) );
            auto & entry{ map_->entries_[ static_cast<size_type>( idx_ ) ] };
            if constexpr ( Projection == projection::entry )
                return { entry.key, entry.value };
            else
            if constexpr ( Projection == projection::key )
                return entry.key;
            else
                return entry.value;
        }

        constexpr pointer operator->() const noexcept
        {
            if constexpr ( Projection == projection::entry )
                return { **this };
            else
                return &**this;
        }

        constexpr reference operator[]( difference_type const n ) const noexcept { return *( *this + n ); }

        constexpr iterator_impl & operator++(     ) noexcept { ++idx_; return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto tmp{ *this }; ++idx_; return tmp; }
        constexpr iterator_impl & operator--(     ) noexcept { --idx_; return *this; }
        constexpr iterator_impl   operator--( int ) noexcept { auto tmp{ *this }; --idx_; return tmp; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept { idx_ += n; return *this; }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { idx_ -= n; return *this; }

        friend constexpr iterator_impl operator+( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl it ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator-( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ - n }; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ - b.idx_; }

        friend constexpr bool operator== ( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ ==  b.idx_; }
        friend constexpr auto operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ <=> b.idx_; }
    }; // iterator_impl

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true >;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;
    using key_iterator           = iterator_impl<true , projection::key  >;
    using value_iterator         = iterator_impl<false, projection::value>;
    using const_value_iterator   = iterator_impl<true , projection::value>;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------

    index_map() = default;
    explicit index_map( hasher const & hash, key_equal const & equal = key_equal{} ) : hash_{ hash }, equal_{ equal } {}

    template <pair_iterator It>
    index_map( It const first, It const last ) { insert( first, last ); }

    index_map( std::initializer_list<value_type> const init ) { insert( init ); }

    index_map( index_map const &  ) = default;
    index_map( index_map       && ) noexcept = default;
    index_map & operator=( index_map const &  ) = default;
    index_map & operator=( index_map       && ) noexcept = default;

    /// Pre-sized map: room for (at least) capacity entries w/o rehashing.
    /// Invokes the overflow handler for a capacity beyond a fixed bound.
    [[ nodiscard ]] static index_map with_capacity( std::size_t const capacity )
    {
        index_map map;
        map.reserve( capacity );
        return map;
    }
    [[ nodiscard ]] static fallible_result<index_map> try_with_capacity( std::size_t const capacity )
    {
        index_map map;
        if ( auto const reserved{ map.try_reserve( capacity ) }; !reserved )
            return failure( reserved.error() );
        return success( std::move( map ) );
    }

    //--------------------------------------------------------------------------
    // Iteration (entry store order - never consults the hash index)
    //--------------------------------------------------------------------------

    [[ nodiscard ]]       iterator  begin()       noexcept { return {  this, 0 }; }
    [[ nodiscard ]] const_iterator  begin() const noexcept { return {  this, 0 }; }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]]       iterator  end  ()       noexcept { return {  this, static_cast<difference_type>( size() ) }; }
    [[ nodiscard ]] const_iterator  end  () const noexcept { return {  this, static_cast<difference_type>( size() ) }; }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end(); }

    [[ nodiscard ]]       reverse_iterator  rbegin()       noexcept { return       reverse_iterator{ end() }; }
    [[ nodiscard ]] const_reverse_iterator  rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    [[ nodiscard ]]       reverse_iterator  rend  ()       noexcept { return       reverse_iterator{ begin() }; }
    [[ nodiscard ]] const_reverse_iterator  rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    [[ nodiscard ]] auto keys  () const noexcept { return std::ranges::subrange{ key_iterator        { this, 0 }, key_iterator        { this, static_cast<difference_type>( size() ) } }; }
    [[ nodiscard ]] auto values()       noexcept { return std::ranges::subrange{ value_iterator      { this, 0 }, value_iterator      { this, static_cast<difference_type>( size() ) } }; }
    [[ nodiscard ]] auto values() const noexcept { return std::ranges::subrange{ const_value_iterator{ this, 0 }, const_value_iterator{ this, static_cast<difference_type>( size() ) } }; }

    //! <b>Requires</b>: position <= size().
    [[ nodiscard ]]       iterator nth( size_type const position )       noexcept { BOOST_ASSERT( position <= size() ); return { this, static_cast<difference_type>( position ) }; }
    [[ nodiscard ]] const_iterator nth( size_type const position ) const noexcept { BOOST_ASSERT( position <= size() ); return { this, static_cast<difference_type>( position ) }; }

    [[ nodiscard ]] size_type index_of( const_iterator const it ) const noexcept
    {
        BOOST_ASSERT( ( it.map_ == this ) && ( it.idx_ >= 0 ) && ( it.idx_ <= static_cast<difference_type>( size() ) ) );
        return static_cast<size_type>( it.idx_ );
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------

    [[ nodiscard ]] bool      empty() const noexcept { return entries_.empty(); }
    [[ nodiscard ]] size_type size () const noexcept { return entries_.size (); }

    [[ nodiscard ]] static constexpr std::size_t max_size() noexcept { return std::min( store_type::max_size(), index_type::max_positions() ); }

    /// Number of entries the map can hold w/o reallocating the entry store or
    /// rehashing the hash index.
    [[ nodiscard ]] std::size_t capacity() const noexcept { return std::min<std::size_t>( entries_.capacity(), index_.max_load() ); }

    [[ nodiscard ]] std::size_t bucket_count() const noexcept { return index_.bucket_count(); }

    /// Makes room for (at least) additional more entries (on top of size()).
    void reserve( std::size_t const additional ) { checked( try_reserve( additional ) ); }

    [[ nodiscard ]] fallible_result<void> try_reserve( std::size_t const additional )
    {
        auto const current{ std::size_t{ size() } };
        if ( additional > max_size() - current ) [[ unlikely ]]
            return failure( capacity_exceeded{ saturated_add( current, additional ), max_size() } );
        auto const total{ current + additional };
        if ( auto const reserved{ index_.try_reserve( total, current, hash_of() ) }; !reserved ) [[ unlikely ]]
            return reserved;
        return entries_.try_reserve( total );
    }

    //--------------------------------------------------------------------------
    // Insertion
    //--------------------------------------------------------------------------

    /// Inserts key -> value: a new key is appended (and std::nullopt
    /// returned), an existing key keeps its position and gets its value
    /// replaced (the previous value is returned).
    template <typename M = mapped_type>
    requires std::is_constructible_v<mapped_type, M &&>
    std::optional<mapped_type> insert( key_type const & key, M && value ) { return insert_full( key, std::forward<M>( value ) ).second; }
    template <typename M = mapped_type>
    requires std::is_constructible_v<mapped_type, M &&>
    std::optional<mapped_type> insert( key_type && key, M && value ) { return insert_full( std::move( key ), std::forward<M>( value ) ).second; }

    template <typename M = mapped_type>
    requires std::is_constructible_v<mapped_type, M &&>
    [[ nodiscard ]] fallible_result<std::optional<mapped_type>> try_insert( key_type const & key, M && value ) { return try_insert_impl( key, std::forward<M>( value ) ); }
    template <typename M = mapped_type>
    requires std::is_constructible_v<mapped_type, M &&>
    [[ nodiscard ]] fallible_result<std::optional<mapped_type>> try_insert( key_type && key, M && value ) { return try_insert_impl( std::move( key ), std::forward<M>( value ) ); }

    /// insert() that also reports the position of the key.
    template <typename M = mapped_type>
    requires std::is_constructible_v<mapped_type, M &&>
    std::pair<size_type, std::optional<mapped_type>> insert_full( key_type const & key, M && value ) { return checked( try_insert_full_impl( key, std::forward<M>( value ) ) ); }
    template <typename M = mapped_type>
    requires std::is_constructible_v<mapped_type, M &&>
    std::pair<size_type, std::optional<mapped_type>> insert_full( key_type && key, M && value ) { return checked( try_insert_full_impl( std::move( key ), std::forward<M>( value ) ) ); }

    /// Extends the map with a sequence of (key, value) pairs - duplicates
    /// overwrite the value of the first occurrence (which keeps its position).
    template <pair_iterator It>
    void insert( It first, It const last )
    {
        if constexpr ( std::forward_iterator<It> && !Storage::fixed )
            reserve( static_cast<std::size_t>( std::distance( first, last ) ) );
        for ( ; first != last; ++first )
        {
            auto && element{ *first };
            insert( element.first, element.second );
        }
    }
    void insert( std::initializer_list<value_type> const init ) { insert( init.begin(), init.end() ); }

    /// Constructs the value from args only if key is not present (an existing
    /// entry is left untouched).
    template <typename ...Args>
    std::pair<iterator, bool> try_emplace( key_type const & key, Args &&... args )
    {
        auto const [ position, inserted ]{ checked( try_emplace_impl( key, std::forward<Args>( args )... ) ) };
        return { nth( position ), inserted };
    }
    template <typename ...Args>
    std::pair<iterator, bool> try_emplace( key_type && key, Args &&... args )
    {
        auto const [ position, inserted ]{ checked( try_emplace_impl( std::move( key ), std::forward<Args>( args )... ) ) };
        return { nth( position ), inserted };
    }

    template <typename M>
    std::pair<iterator, bool> insert_or_assign( key_type const & key, M && value ) { return insert_or_assign_impl( key, std::forward<M>( value ) ); }
    template <typename M>
    std::pair<iterator, bool> insert_or_assign( key_type && key, M && value ) { return insert_or_assign_impl( std::move( key ), std::forward<M>( value ) ); }

    /// Value of key - default constructed (and appended) if absent.
    mapped_type & operator[]( key_type const & key ) { return entries_[ checked( try_emplace_impl( key ) ).first ].value; }
    mapped_type & operator[]( key_type &&      key ) { return entries_[ checked( try_emplace_impl( std::move( key ) ) ).first ].value; }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] mapped_type * get( K const & key )
    {
        auto const position{ find_position( key ) };
        return position ? &entries_[ *position ].value : nullptr;
    }
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] mapped_type const * get( K const & key ) const { return const_cast<index_map &>( *this ).get( key ); }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] bool contains( K const & key ) const { return find_position( key ).has_value(); }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] iterator find( K const & key )
    {
        auto const position{ find_position( key ) };
        return position ? nth( *position ) : end();
    }
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] const_iterator find( K const & key ) const { return const_cast<index_map &>( *this ).find( key ); }

    /// Throws std::out_of_range for an absent key.
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] mapped_type & at( K const & key )
    {
        if ( auto const value{ get( key ) } ) [[ likely ]]
            return *value;
        detail::throw_out_of_range( "psi::indexed::index_map::at: key not found" );
    }
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] mapped_type const & at( K const & key ) const { return const_cast<index_map &>( *this ).at( key ); }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] std::optional<const_reference> get_key_value( K const & key ) const
    {
        auto const position{ find_position( key ) };
        if ( !position )
            return std::nullopt;
        auto const & entry{ entries_[ *position ] };
        return const_reference{ entry.key, entry.value };
    }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] std::optional<std::tuple<size_type, key_type const &, mapped_type &>> get_full( K const & key )
    {
        auto const position{ find_position( key ) };
        if ( !position )
            return std::nullopt;
        auto & entry{ entries_[ *position ] };
        return std::tuple<size_type, key_type const &, mapped_type &>{ *position, entry.key, entry.value };
    }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] std::optional<size_type> get_index_of( K const & key ) const { return find_position( key ); }

    //--------------------------------------------------------------------------
    // Positional access
    //--------------------------------------------------------------------------

    /// (key, value) at position or std::nullopt if position >= size().
    [[ nodiscard ]] std::optional<reference> get_index( size_type const position )
    {
        if ( position >= size() )
            return std::nullopt;
        auto & entry{ entries_[ position ] };
        return reference{ entry.key, entry.value };
    }
    [[ nodiscard ]] std::optional<const_reference> get_index( size_type const position ) const
    {
        if ( position >= size() )
            return std::nullopt;
        auto const & entry{ entries_[ position ] };
        return const_reference{ entry.key, entry.value };
    }

    [[ nodiscard ]] std::optional<reference      > first()       { return get_index( 0 ); }
    [[ nodiscard ]] std::optional<const_reference> first() const { return get_index( 0 ); }
    [[ nodiscard ]] std::optional<reference      > last ()       { return empty() ? std::nullopt : get_index( static_cast<size_type>( size() - 1 ) ); }
    [[ nodiscard ]] std::optional<const_reference> last () const { return empty() ? std::nullopt : get_index( static_cast<size_type>( size() - 1 ) ); }

    //--------------------------------------------------------------------------
    // Removal
    //--------------------------------------------------------------------------

    /// O(1) removal: the last entry takes the place of the removed one.
    template <LookupType<transparent, key_type> K = key_type>
    std::optional<mapped_type> swap_remove( K const & key )
    {
        auto const position{ find_position( key ) };
        if ( !position )
            return std::nullopt;
        return std::move( swap_remove_at( *position ).value );
    }
    /// O(n) removal preserving the relative order of the remaining entries.
    template <LookupType<transparent, key_type> K = key_type>
    std::optional<mapped_type> shift_remove( K const & key )
    {
        auto const position{ find_position( key ) };
        if ( !position )
            return std::nullopt;
        return std::move( shift_remove_at( *position ).value );
    }

    template <LookupType<transparent, key_type> K = key_type>
    std::optional<value_type> swap_remove_entry( K const & key )
    {
        auto const position{ find_position( key ) };
        if ( !position )
            return std::nullopt;
        return to_value( swap_remove_at( *position ) );
    }
    template <LookupType<transparent, key_type> K = key_type>
    std::optional<value_type> shift_remove_entry( K const & key )
    {
        auto const position{ find_position( key ) };
        if ( !position )
            return std::nullopt;
        return to_value( shift_remove_at( *position ) );
    }

    std::optional<value_type> swap_remove_index( size_type const position )
    {
        if ( position >= size() )
            return std::nullopt;
        return to_value( swap_remove_at( position ) );
    }
    std::optional<value_type> shift_remove_index( size_type const position )
    {
        if ( position >= size() )
            return std::nullopt;
        return to_value( shift_remove_at( position ) );
    }

    /// Removes the last entry (order preserving, O(1)).
    std::optional<value_type> pop()
    {
        if ( empty() )
            return std::nullopt;
        auto const position{ static_cast<size_type>( size() - 1 ) };
        index_.remove( entries_.hash_at( position ), position, hash_of() );
        return to_value( entries_.pop() );
    }

    /// Destroys all entries - retains the capacity.
    void clear() noexcept
    {
        entries_.clear();
        index_  .clear();
    }

    void swap( index_map & other ) noexcept { std::swap( *this, other ); }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------

    [[ nodiscard ]] hasher    hash_function() const { return hash_; }
    [[ nodiscard ]] key_equal key_eq       () const { return equal_; }

    [[ nodiscard ]] store_type const & entries() const noexcept { return entries_; }
    [[ nodiscard ]] index_type const & index  () const noexcept { return index_  ; }

    /// O(n) audit of the entry store <-> hash index consistency:
    ///  - every entry's cached hash matches its key
    ///  - every entry is reachable from its hash in the index
    ///  - the index holds exactly size() positions, all in range
    ///  - the load factor bound holds
    [[ nodiscard ]] bool verify_consistency() const
    {
        if ( size() > index_.max_load() || index_.occupied() != size() )
            return false;
        for ( auto const position : index_.buckets() )
        {
            if ( ( position != index_type::empty_bucket ) && ( position >= size() ) )
                return false;
        }
        for ( size_type position{ 0 }; position < size(); ++position )
        {
            auto const & entry{ entries_[ position ] };
            if ( entry.hash != hash_key( entry.key ) )
                return false;
            if ( index_.find( entry.hash, [ position ]( size_type const candidate ) noexcept { return candidate == position; } ) != position )
                return false;
        }
        return true;
    }

    /// Order sensitive: equal iff equal (key, value) pairs at equal positions.
    friend bool operator==( index_map const & left, index_map const & right ) { return left.entries_ == right.entries_; }

private:
    [[ nodiscard ]] static std::size_t saturated_add( std::size_t const a, std::size_t const b ) noexcept
    {
        return ( b > std::numeric_limits<std::size_t>::max() - a ) ? std::numeric_limits<std::size_t>::max() : a + b;
    }

    template <typename Result>
    static Result checked( fallible_result<Result> && result )
    {
        if ( !result ) [[ unlikely ]]
            Storage::overflow(); // (required to) not return
        if constexpr ( !std::is_void_v<Result> )
            return std::move( result ).assume_value();
    }

    [[ nodiscard ]] static value_type to_value( slot_type && entry ) { return { std::move( entry.key ), std::move( entry.value ) }; }

    [[ nodiscard ]] auto hash_of() const noexcept
    {
        return [ this ]( size_type const position ) noexcept { return entries_.hash_at( position ); };
    }

    template <typename K>
    [[ nodiscard ]] std::size_t hash_key( K const & key ) const { return static_cast<std::size_t>( hash_( key ) ); }

    template <typename K>
    [[ nodiscard ]] std::optional<size_type> find_position( K const & key ) const
    {
        if constexpr ( !transparent && !std::is_same_v<K, key_type> )
            return find_position<key_type>( key ); // convert once, before hashing
        else
            return find_position( hash_key( key ), key );
    }
    template <typename K>
    [[ nodiscard ]] std::optional<size_type> find_position( std::size_t const hash, K const & key ) const
    {
        return index_.find
        (
            hash,
            [ & ]( size_type const position )
            {
                auto const & entry{ entries_[ position ] };
                return ( entry.hash == hash ) && equal_( entry.key, key );
            }
        );
    }

    /// Room for total_entries (index-wise and w/o exceeding the storage bound).
    [[ nodiscard ]] fallible_result<void> try_grow_for( std::size_t const total_entries )
    {
        if ( total_entries > max_size() ) [[ unlikely ]]
            return failure( capacity_exceeded{ total_entries, max_size() } );
        return index_.try_reserve( total_entries, size(), hash_of() );
    }

    template <typename K, typename ...Args>
    [[ nodiscard ]] fallible_result<size_type> try_append( std::size_t const hash, K && key, Args &&... args )
    {
        if ( auto const room{ try_grow_for( std::size_t{ size() } + 1 ) }; !room ) [[ unlikely ]]
            return failure( room.error() );
        auto const position{ entries_.emplace( hash, std::forward<K>( key ), std::forward<Args>( args )... ) };
        index_.insert_position( hash, position );
        return success( position );
    }

    template <typename K, typename ...Args>
    [[ nodiscard ]] fallible_result<std::pair<size_type, bool>> try_emplace_impl( K && key, Args &&... args )
    {
        auto const hash{ hash_key( key ) };
        if ( auto const existing{ find_position( hash, key ) } )
            return success( std::pair{ *existing, false } );
        auto const appended{ try_append( hash, std::forward<K>( key ), std::forward<Args>( args )... ) };
        if ( !appended ) [[ unlikely ]]
            return failure( appended.error() );
        return success( std::pair{ appended.value(), true } );
    }

    template <typename K, typename M>
    [[ nodiscard ]] fallible_result<std::pair<size_type, std::optional<mapped_type>>> try_insert_full_impl( K && key, M && value )
    {
        using result_type = std::pair<size_type, std::optional<mapped_type>>;
        auto const hash{ hash_key( key ) };
        if ( auto const existing{ find_position( hash, key ) } )
        {
            // value may be (a reference to) the very value being replaced
            mapped_type replacement( std::forward<M>( value ) );
            return success( result_type{ *existing, std::exchange( entries_[ *existing ].value, std::move( replacement ) ) } );
        }
        auto const appended{ try_append( hash, std::forward<K>( key ), std::forward<M>( value ) ) };
        if ( !appended ) [[ unlikely ]]
            return failure( appended.error() );
        return success( result_type{ appended.value(), std::nullopt } );
    }

    template <typename K, typename M>
    [[ nodiscard ]] fallible_result<std::optional<mapped_type>> try_insert_impl( K && key, M && value )
    {
        auto full{ try_insert_full_impl( std::forward<K>( key ), std::forward<M>( value ) ) };
        if ( !full ) [[ unlikely ]]
            return failure( full.error() );
        return success( std::move( full ).assume_value().second );
    }

    template <typename K, typename M>
    std::pair<iterator, bool> insert_or_assign_impl( K && key, M && value )
    {
        auto const hash{ hash_key( key ) };
        if ( auto const existing{ find_position( hash, key ) } )
        {
            mapped_type replacement( std::forward<M>( value ) );
            entries_[ *existing ].value = std::move( replacement );
            return { nth( *existing ), false };
        }
        auto const position{ checked( try_append( hash, std::forward<K>( key ), std::forward<M>( value ) ) ) };
        return { nth( position ), true };
    }

    // Hash index reconciliation happens before the entry store is mutated:
    // the index reads the (cached) hashes of entries at their current
    // positions.
    slot_type swap_remove_at( size_type const position )
    {
        BOOST_ASSERT( position < size() );
        auto const last{ static_cast<size_type>( size() - 1 ) };
        index_.remove( entries_.hash_at( position ), position, hash_of() );
        if ( position != last )
            index_.replace_position( entries_.hash_at( last ), last, position );
        return entries_.swap_remove( position );
    }

    slot_type shift_remove_at( size_type const position )
    {
        BOOST_ASSERT( position < size() );
        index_.remove( entries_.hash_at( position ), position, hash_of() );
        auto const displaced{ static_cast<std::size_t>( size() - position - 1 ) };
        if ( displaced > index_.bucket_count() / 2 )
        {
            index_.shift_positions_down( position );
        }
        else
        {
            for ( auto shifted{ static_cast<size_type>( position + 1 ) }; shifted < size(); ++shifted )
                index_.replace_position( entries_.hash_at( shifted ), shifted, static_cast<size_type>( shifted - 1 ) );
        }
        return entries_.shift_remove( position );
    }

private:
    store_type entries_;
    index_type index_;
    [[ no_unique_address ]] hasher    hash_;
    [[ no_unique_address ]] key_equal equal_;
}; // class index_map

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
