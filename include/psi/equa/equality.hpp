////////////////////////////////////////////////////////////////////////////////
/// psi::equa equality policies
///
/// Equality is a swappable policy object rather than a fixed property of the
/// element type:
///   equality<T>          - are_equal
///   equivalence<T>       - are_equivalent (a normalization-decided equality)
///   hashing_equality<T>  - equality + hash_code (hashed storage)
///   ordering_equality<T> - hashing_equality + compare (sorted storage)
///
/// Policy author obligations (NOT checked at runtime):
///   are_equal( a, b )   ⇒ hash_code( a ) == hash_code( b )
///   compare( a, b ) == 0 ⟺ are_equal( a, b )
///   compare is a strict weak order over which equal elements are a total
///   order of equivalence classes.
/// Collections built over a policy that violates these have undefined
/// behaviour (duplicate elements, lost lookups, broken algebra).
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

#include "fwd.hpp"

#include <boost/container_hash/hash.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <memory>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

template <typename T>
class equality
{
public:
    using value_type = T;

    virtual ~equality() = default;

    [[ nodiscard ]] virtual bool are_equal( T const & a, T const & b ) const = 0;
}; // class equality

template <typename T>
class equivalence
{
public:
    using value_type = T;

    virtual ~equivalence() = default;

    [[ nodiscard ]] virtual bool are_equivalent( T const & a, T const & b ) const = 0;
}; // class equivalence

template <typename T>
class hashing_equality : public equality<T>
{
public:
    [[ nodiscard ]] virtual std::size_t hash_code( T const & value ) const = 0;
}; // class hashing_equality

template <typename T>
class ordering_equality : public hashing_equality<T>
{
public:
    [[ nodiscard ]] virtual std::weak_ordering compare( T const & a, T const & b ) const = 0;
}; // class ordering_equality


namespace detail
{
    template <typename T>
    [[ nodiscard ]] std::weak_ordering natural_compare( T const & a, T const & b )
    {
        return std::compare_weak_order_fallback( a, b );
    }

    /// Equality that agrees with natural_compare() (for floating point
    /// std::weak_order, where NaNs of one sign are equivalent).
    template <typename T>
    [[ nodiscard ]] bool natural_ordered_equal( T const & a, T const & b )
    {
        if constexpr ( std::floating_point<T> )
            return std::is_eq( natural_compare( a, b ) );
        else
            return a == b;
    }
} // namespace detail

//==============================================================================
// Natural policies: the element type's own ==, <=> (or <) and boost::hash.
// instance() returns one process-wide object per T so that every natural
// factory for T is compatible with every other one.
// For floating point T the ordering policy's are_equal() follows compare()
// (std::weak_order) rather than ==, so NaN is equal to NaN there while the
// hashing policy keeps IEEE ==.
//==============================================================================

template <typename T>
class natural_hashing_equality final : public hashing_equality<T>
{
public:
    [[ nodiscard ]] bool        are_equal( T const & a, T const & b ) const override { return a == b; }
    [[ nodiscard ]] std::size_t hash_code( T const & value          ) const override { return boost::hash<T>{}( value ); }

    [[ nodiscard ]] static hashing_equality_ptr<T> const & instance()
    {
        static hashing_equality_ptr<T> const natural{ std::make_shared<natural_hashing_equality const>() };
        return natural;
    }
}; // class natural_hashing_equality

template <typename T>
class natural_ordering_equality final : public ordering_equality<T>
{
public:
    [[ nodiscard ]] bool               are_equal( T const & a, T const & b ) const override { return detail::natural_ordered_equal( a, b ); }
    [[ nodiscard ]] std::size_t        hash_code( T const & value          ) const override { return boost::hash<T>{}( value ); }
    [[ nodiscard ]] std::weak_ordering compare  ( T const & a, T const & b ) const override { return detail::natural_compare( a, b ); }

    [[ nodiscard ]] static ordering_equality_ptr<T> const & instance()
    {
        static ordering_equality_ptr<T> const natural{ std::make_shared<natural_ordering_equality const>() };
        return natural;
    }
}; // class natural_ordering_equality

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
