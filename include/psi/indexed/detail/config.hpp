////////////////////////////////////////////////////////////////////////////////
///
/// \file config.hpp
/// ----------------
///
/// Compile time selection of the backing storage modes available to the
/// containers.
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

#include <boost/config.hpp>
//------------------------------------------------------------------------------
// PSI_INDEXED_NO_HEAP
//   Allocation-free build: no container may call into an allocator. Every
// heap backed component (crt_vector, heap_storage) is removed from the build
// and index_map/index_set lose their default storage policy (fixed_storage<N>
// has to be spelled out).
#if defined( PSI_INDEXED_NO_HEAP )
#   define PSI_INDEXED_HEAP 0
#else
#   define PSI_INDEXED_HEAP 1
#endif

#if defined( BOOST_NO_EXCEPTIONS )
#   define PSI_INDEXED_EXCEPTIONS 0
#else
#   define PSI_INDEXED_EXCEPTIONS 1
#endif
//------------------------------------------------------------------------------
