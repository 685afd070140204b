////////////////////////////////////////////////////////////////////////////////
/// Storage adaptors: expose a psi::equa policy object through the hasher /
/// key_equal / strict-weak-ordering functor protocols that the Boost
/// containers expect.
///
/// The functors hold a non-owning pointer: the owning collection keeps the
/// policy alive through its shared_ptr for as long as its storage exists.
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

#include <psi/equa/equality.hpp>

#include <boost/assert.hpp>

#include <cstddef>
//------------------------------------------------------------------------------
namespace psi::equa::detail
{
//------------------------------------------------------------------------------

template <typename T>
struct policy_hasher
{
    hashing_equality<T> const * policy{ nullptr };

    [[ gnu::pure ]] std::size_t operator()( T const & value ) const { BOOST_ASSERT( policy ); return policy->hash_code( value ); }
}; // struct policy_hasher

template <typename T>
struct policy_equal
{
    hashing_equality<T> const * policy{ nullptr };

    [[ gnu::pure ]] bool operator()( T const & left, T const & right ) const { BOOST_ASSERT( policy ); return policy->are_equal( left, right ); }
}; // struct policy_equal

/// Strict weak ordering (compare() < 0) for the sorted variants.
template <typename T>
struct policy_less
{
    ordering_equality<T> const * policy{ nullptr };

    [[ gnu::pure ]] bool operator()( T const & left, T const & right ) const { BOOST_ASSERT( policy ); return policy->compare( left, right ) < 0; }
}; // struct policy_less

//------------------------------------------------------------------------------
} // namespace psi::equa::detail
//------------------------------------------------------------------------------
