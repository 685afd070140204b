////////////////////////////////////////////////////////////////////////////////
/// psi::equa::equa_box - a value paired with the equality policy that governs
/// it.
///
/// Equality and hashing of boxes are delegated to the policy, never to the
/// value's native operators. Boxes minted by factories carrying different
/// policy objects are never equal (even for structurally identical
/// policies). Printing a box prints the wrapped value only.
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

#include "equality.hpp"

#include <boost/assert.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

template <typename T>
class equa_box
{
public:
    using value_type = T;

    equa_box( T value, hashing_equality_ptr<T> policy ) : value_{ std::move( value ) }, policy_{ std::move( policy ) } { BOOST_ASSERT( policy_ ); }

    [[ nodiscard ]] T                   const & value  () const noexcept { return value_; }
    [[ nodiscard ]] hashing_equality<T> const & policy () const noexcept { return *policy_; }
    [[ nodiscard ]] hashing_equality<T> const * path_id() const noexcept { return policy_.get(); }

    [[ nodiscard ]] std::size_t hash_code() const { return policy_->hash_code( value_ ); }

    [[ nodiscard ]] std::string to_string() const
    {
        std::ostringstream out;
        out << value_;
        return std::move( out ).str();
    }

    [[ nodiscard ]] friend bool operator==( equa_box const & left, equa_box const & right )
    {
        return ( left.policy_ == right.policy_ ) && left.policy_->are_equal( left.value_, right.value_ );
    }

    friend std::size_t    hash_value( equa_box const & box ) { return box.hash_code(); }
    friend std::ostream & operator<<( std::ostream & out, equa_box const & box ) { return out << box.value_; }

private:
    T                       value_;
    hashing_equality_ptr<T> policy_;
}; // class equa_box


/// Orders boxes of one sorted factory by its policy's compare().
template <typename T>
struct box_ordering
{
    ordering_equality<T> const * policy{ nullptr };

    [[ nodiscard ]] std::weak_ordering compare( equa_box<T> const & left, equa_box<T> const & right ) const
    {
        BOOST_ASSERT( left.path_id() == policy && right.path_id() == policy );
        return policy->compare( left.value(), right.value() );
    }

    [[ nodiscard ]] bool operator()( equa_box<T> const & left, equa_box<T> const & right ) const { return compare( left, right ) < 0; }
}; // struct box_ordering

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------

template <typename T>
struct std::hash<psi::equa::equa_box<T>>
{
    std::size_t operator()( psi::equa::equa_box<T> const & box ) const { return box.hash_code(); }
};
//------------------------------------------------------------------------------
