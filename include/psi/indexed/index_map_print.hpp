#pragma once

#include "index_map.hpp"
#include "index_set.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdio>
#include <iterator>
#include <string>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::indexed
{
//------------------------------------------------------------------------------

/// Writes the entry store (in order, with the cached hashes) followed by the
/// hash index buckets (with the probe distance of every occupied one).
template <typename OutputIt, typename Key, typename T, typename Hash, typename KeyEqual, typename Storage>
OutputIt format_to( OutputIt out, index_map<Key, T, Hash, KeyEqual, Storage> const & map )
{
    using size_type = typename index_map<Key, T, Hash, KeyEqual, Storage>::size_type;
    auto const & entries{ map.entries() };
    auto const & index  { map.index  () };

    if ( map.empty() )
        out = fmt::format_to( out, "The map is empty.\n" );
    else
        out = fmt::format_to( out, "Entries ({} / {}):\n", map.size(), map.capacity() );

    for ( std::size_t position{ 0 }; position < map.size(); ++position )
    {
        auto const & entry{ entries[ static_cast<size_type>( position ) ] };
        if constexpr ( std::is_same_v<T, unit> )
            out = fmt::format_to( out, "\t[{}] {}\t#{:016x}\n", position, entry.key, entry.hash );
        else
            out = fmt::format_to( out, "\t[{}] {}: {}\t#{:016x}\n", position, entry.key, entry.value, entry.hash );
    }

    out = fmt::format_to( out, "Buckets ({}, max load {}):\n", index.bucket_count(), index.max_load() );
    auto const buckets{ index.buckets() };
    for ( std::size_t bucket{ 0 }; bucket < buckets.size(); ++bucket )
    {
        auto const position{ buckets[ bucket ] };
        if ( position == index.empty_bucket )
        {
            out = fmt::format_to( out, "\t[{}] -\n", bucket );
            continue;
        }
        out = fmt::format_to
        (
            out, "\t[{}] -> {} (probe distance {})\n",
            bucket, std::size_t{ position }, index.probe_distance( bucket, entries.hash_at( position ) )
        );
    }
    return out;
}

template <typename Key, typename T, typename Hash, typename KeyEqual, typename Storage>
[[ nodiscard ]] std::string dump( index_map<Key, T, Hash, KeyEqual, Storage> const & map )
{
    std::string result;
    indexed::format_to( std::back_inserter( result ), map );
    return result;
}

template <typename Key, typename Hash, typename KeyEqual, typename Storage>
[[ nodiscard ]] std::string dump( index_set<Key, Hash, KeyEqual, Storage> const & set ) { return dump( set.map() ); }

template <typename Key, typename T, typename Hash, typename KeyEqual, typename Storage>
void print( index_map<Key, T, Hash, KeyEqual, Storage> const & map, std::FILE * const stream = stdout )
{
    fmt::print( stream, "{}", dump( map ) );
}

template <typename Key, typename Hash, typename KeyEqual, typename Storage>
void print( index_set<Key, Hash, KeyEqual, Storage> const & set, std::FILE * const stream = stdout ) { print( set.map(), stream ); }

//------------------------------------------------------------------------------
} // namespace psi::indexed
//------------------------------------------------------------------------------
