////////////////////////////////////////////////////////////////////////////////
/// psi::equa normalizations and uniformities
///
/// normalization<T> - a pure T -> T transform applied before comparison,
///   composable with and_then() (left operand first; associative).
/// uniformity<T>    - a normalization that is idempotent and sufficient on
///   its own to decide equality. A plain normalization never converts to a
///   uniformity implicitly, and composing a uniformity yields a plain
///   normalization: the caller must opt in explicitly.
///
/// Promotions turn a normalization into an equality policy that compares
/// (hashes, orders) normalized values through a base policy:
///   are_equal( a, b ) := base.are_equal( n( a ), n( b ) )
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

#include <functional>
#include <memory>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

template <typename T>
class normalization
{
public:
    using value_type    = T;
    using function_type = std::function<T( T const & )>;

    explicit normalization( function_type transform ) : transform_{ std::move( transform ) } { BOOST_ASSERT( transform_ ); }

    [[ nodiscard ]] T normalized( T const & value ) const { return transform_( value ); }
    [[ nodiscard ]] T operator()( T const & value ) const { return transform_( value ); }

    [[ nodiscard ]] normalization and_then( normalization const & next ) const
    {
        return normalization
        {
            [ first{ transform_ }, second{ next.transform_ } ]( T const & value ) { return second( first( value ) ); }
        };
    }

    [[ nodiscard ]] equality_ptr         <T> to_equality         ( equality_ptr         <T> base ) const;
    [[ nodiscard ]] hashing_equality_ptr <T> to_hashing_equality ( hashing_equality_ptr <T> base ) const;
    [[ nodiscard ]] ordering_equality_ptr<T> to_ordering_equality( ordering_equality_ptr<T> base ) const;

private:
    function_type transform_;
}; // class normalization


template <typename T>
class uniformity : public normalization<T>
{
public:
    using base          = normalization<T>;
    using function_type = typename base::function_type;

    explicit uniformity( function_type transform ) : base{ std::move( transform ) } {}
    /// Opt-in promotion: the caller vouches for idempotence.
    explicit uniformity( base const & proven ) : base{ proven } {}

    using base::to_equality;
    using base::to_hashing_equality;
    using base::to_ordering_equality;

    [[ nodiscard ]] equality_ptr         <T> to_equality         () const;
    [[ nodiscard ]] equivalence_ptr      <T> to_equivalence      () const;
    [[ nodiscard ]] hashing_equality_ptr <T> to_hashing_equality () const;
    [[ nodiscard ]] ordering_equality_ptr<T> to_ordering_equality() const;
}; // class uniformity


//==============================================================================
// Normalizing policies (results of the promotions above)
//==============================================================================

template <typename T>
class normalizing_equality final : public equality<T>
{
public:
    normalizing_equality( normalization<T> n, equality_ptr<T> base ) : n_{ std::move( n ) }, base_{ std::move( base ) } { BOOST_ASSERT( base_ ); }

    [[ nodiscard ]] bool are_equal( T const & a, T const & b ) const override { return base_->are_equal( n_( a ), n_( b ) ); }

private:
    normalization<T> n_;
    equality_ptr <T> base_;
}; // class normalizing_equality

template <typename T>
class normalizing_hashing_equality final : public hashing_equality<T>
{
public:
    normalizing_hashing_equality( normalization<T> n, hashing_equality_ptr<T> base ) : n_{ std::move( n ) }, base_{ std::move( base ) } { BOOST_ASSERT( base_ ); }

    [[ nodiscard ]] bool        are_equal( T const & a, T const & b ) const override { return base_->are_equal( n_( a ), n_( b ) ); }
    [[ nodiscard ]] std::size_t hash_code( T const & value          ) const override { return base_->hash_code( n_( value ) ); }

private:
    normalization       <T> n_;
    hashing_equality_ptr<T> base_;
}; // class normalizing_hashing_equality

template <typename T>
class normalizing_ordering_equality final : public ordering_equality<T>
{
public:
    normalizing_ordering_equality( normalization<T> n, ordering_equality_ptr<T> base ) : n_{ std::move( n ) }, base_{ std::move( base ) } { BOOST_ASSERT( base_ ); }

    [[ nodiscard ]] bool               are_equal( T const & a, T const & b ) const override { return base_->are_equal( n_( a ), n_( b ) ); }
    [[ nodiscard ]] std::size_t        hash_code( T const & value          ) const override { return base_->hash_code( n_( value ) ); }
    [[ nodiscard ]] std::weak_ordering compare  ( T const & a, T const & b ) const override { return base_->compare  ( n_( a ), n_( b ) ); }

private:
    normalization        <T> n_;
    ordering_equality_ptr<T> base_;
}; // class normalizing_ordering_equality

template <typename T>
class normalizing_equivalence final : public equivalence<T>
{
public:
    explicit normalizing_equivalence( uniformity<T> u ) : u_{ std::move( u ) } {}

    [[ nodiscard ]] bool are_equivalent( T const & a, T const & b ) const override { return u_( a ) == u_( b ); }

private:
    uniformity<T> u_;
}; // class normalizing_equivalence


//------------------------------------------------------------------------------
// Promotions
//------------------------------------------------------------------------------

template <typename T>
equality_ptr<T> normalization<T>::to_equality( equality_ptr<T> base ) const
{
    return std::make_shared<normalizing_equality<T> const>( *this, std::move( base ) );
}

template <typename T>
hashing_equality_ptr<T> normalization<T>::to_hashing_equality( hashing_equality_ptr<T> base ) const
{
    return std::make_shared<normalizing_hashing_equality<T> const>( *this, std::move( base ) );
}

template <typename T>
ordering_equality_ptr<T> normalization<T>::to_ordering_equality( ordering_equality_ptr<T> base ) const
{
    return std::make_shared<normalizing_ordering_equality<T> const>( *this, std::move( base ) );
}

template <typename T>
equality_ptr<T> uniformity<T>::to_equality() const
{
    return base::to_equality( natural_hashing_equality<T>::instance() );
}

template <typename T>
equivalence_ptr<T> uniformity<T>::to_equivalence() const
{
    return std::make_shared<normalizing_equivalence<T> const>( *this );
}

template <typename T>
hashing_equality_ptr<T> uniformity<T>::to_hashing_equality() const
{
    return base::to_hashing_equality( natural_hashing_equality<T>::instance() );
}

template <typename T>
ordering_equality_ptr<T> uniformity<T>::to_ordering_equality() const
{
    return base::to_ordering_equality( natural_ordering_equality<T>::instance() );
}

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
