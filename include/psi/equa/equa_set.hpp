////////////////////////////////////////////////////////////////////////////////
/// psi::equa hash-backed sets
///
///   equa_set<T>      - boost::unordered_set keyed by the path's
///                      hashing_equality; unspecified iteration order.
///   fast_equa_set<T> - Boost.MultiIndex sequenced + hashed_unique: hashed
///                      membership, iteration in insertion order.
///
/// Both dedup first-wins: inserting an element equal (under the policy) to
/// one already present keeps the stored one. Instances are minted only by
/// collections<T> (and the operations of existing instances).
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

#include "detail/equa_set_impl.hpp"
#include "detail/policy_functors.hpp"
#include "lazy_view.hpp"

#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/identity.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/tuple/tuple.hpp>
#include <boost/unordered_set.hpp>

#include <cstddef>
#include <string_view>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename T>
    using hashed_storage = boost::unordered_set<T, policy_hasher<T>, policy_equal<T>>;
} // namespace detail

template <typename T>
class equa_set
    :
    public detail::equa_set_impl<equa_set<T>, T, hashing_equality<T>, detail::hashed_storage<T>>
{
private:
    using base = detail::equa_set_impl<equa_set<T>, T, hashing_equality<T>, detail::hashed_storage<T>>;

public:
    using storage_type = typename base::storage_type;
    using view_type    = lazy_bag<T>;
    using path_type    = collections<T>;

    template <typename U> using rebind = equa_set<U>;

    static constexpr std::string_view prefix{ "EquaSet" };

    template <typename Range>
    [[ nodiscard ]] static equa_set mint( collections<T> const & path, Range && elements ) { return path.equa_set_from( std::forward<Range>( elements ) ); }

private:
    friend base;
    friend class collections<T>;

    explicit equa_set( typename base::policy_ptr_type policy ) : base{ std::move( policy ) } {}

    [[ nodiscard ]] static storage_type make_storage( hashing_equality<T> const & policy )
    {
        return storage_type( 0, detail::policy_hasher<T>{ &policy }, detail::policy_equal<T>{ &policy } );
    }

    template <typename U>
    static bool storage_insert( storage_type & storage, U && value ) { return storage.insert( std::forward<U>( value ) ).second; }
    static bool storage_find  ( storage_type const & storage, T const & value ) { return storage.find( value ) != storage.end(); }
    static void storage_erase ( storage_type       & storage, T const & value ) { storage.erase( value ); }
}; // class equa_set


namespace detail
{
    namespace bmi = boost::multi_index;

    template <typename T>
    using insertion_ordered_storage = bmi::multi_index_container
    <
        T,
        bmi::indexed_by
        <
            bmi::sequenced<>,
            bmi::hashed_unique<bmi::identity<T>, policy_hasher<T>, policy_equal<T>>
        >
    >;
} // namespace detail

template <typename T>
class fast_equa_set
    :
    public detail::equa_set_impl<fast_equa_set<T>, T, hashing_equality<T>, detail::insertion_ordered_storage<T>>
{
private:
    using base = detail::equa_set_impl<fast_equa_set<T>, T, hashing_equality<T>, detail::insertion_ordered_storage<T>>;

public:
    using storage_type = typename base::storage_type;
    using view_type    = lazy_bag<T>;
    using path_type    = collections<T>;

    template <typename U> using rebind = fast_equa_set<U>;

    static constexpr std::string_view prefix{ "FastEquaSet" };

    template <typename Range>
    [[ nodiscard ]] static fast_equa_set mint( collections<T> const & path, Range && elements ) { return path.fast_equa_set_from( std::forward<Range>( elements ) ); }

private:
    friend base;
    friend class collections<T>;

    explicit fast_equa_set( typename base::policy_ptr_type policy ) : base{ std::move( policy ) } {}

    [[ nodiscard ]] static storage_type make_storage( hashing_equality<T> const & policy )
    {
        // sequenced<> takes no arguments (null_type), hashed_unique takes
        // ( bucket count, key extractor, hasher, key_equal )
        using args_list   = typename storage_type::ctor_args_list;
        using hashed_args = typename storage_type::template nth_index<1>::type::ctor_args;
        args_list const args
        (
            boost::tuples::null_type(),
            typename args_list::tail_type
            (
                hashed_args( std::size_t{ 0 }, detail::bmi::identity<T>(), detail::policy_hasher<T>{ &policy }, detail::policy_equal<T>{ &policy } )
            )
        );
        return storage_type( args );
    }

    template <typename U>
    static bool storage_insert( storage_type & storage, U && value ) { return storage.push_back( std::forward<U>( value ) ).second; }
    static bool storage_find  ( storage_type const & storage, T const & value ) { auto const & hashed{ storage.template get<1>() }; return hashed.find( value ) != hashed.end(); }
    static void storage_erase ( storage_type       & storage, T const & value ) { storage.template get<1>().erase( value ); }
}; // class fast_equa_set

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
