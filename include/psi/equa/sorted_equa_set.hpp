////////////////////////////////////////////////////////////////////////////////
/// psi::equa sorted sets
///
///   sorted_equa_set<T> - boost::container::flat_set (sorted contiguous
///                        storage) ordered by the path's ordering_equality.
///   tree_equa_set<T>   - boost::container::set (red-black tree), same order.
///
/// Both iterate ascending by compare(), dedup first-wins and are minted only
/// by sorted_collections<T>. Their views are order preserving lazy_seqs.
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

#include <boost/container/flat_set.hpp>
#include <boost/container/set.hpp>

#include <optional>
#include <string_view>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename T> using flat_sorted_storage = boost::container::flat_set<T, policy_less<T>>;
    template <typename T> using tree_sorted_storage = boost::container::set     <T, policy_less<T>>;

    //==========================================================================
    // Lookups available only on ordered storage (mixed into both variants)
    //==========================================================================

    template <typename Derived, typename T>
    class sorted_lookup
    {
    public:
        /// Elements e with from <= e < until (by the policy's order).
        [[ nodiscard ]] Derived range( T const & from, T const & until ) const
        {
            return derived().filter
            (
                [ & ]( T const & element ) { return derived().policy().compare( element, from ) >= 0 && derived().policy().compare( element, until ) < 0; }
            );
        }

        /// The stored element equivalent to value (the first inserted one).
        [[ nodiscard ]] std::optional<T> lookup( T const & value ) const
        {
            auto const & storage{ derived().storage() };
            auto const pos{ storage.find( value ) };
            if ( pos == storage.end() )
                return std::nullopt;
            return *pos;
        }

        [[ nodiscard ]] box_ordering<T> ordering() const noexcept { return { &derived().policy() }; }

    private:
        [[ nodiscard ]] Derived const & derived() const noexcept { return static_cast<Derived const &>( *this ); }
    }; // class sorted_lookup
} // namespace detail


template <typename T>
class sorted_equa_set
    :
    public detail::equa_set_impl<sorted_equa_set<T>, T, ordering_equality<T>, detail::flat_sorted_storage<T>>,
    public detail::sorted_lookup<sorted_equa_set<T>, T>
{
private:
    using base = detail::equa_set_impl<sorted_equa_set<T>, T, ordering_equality<T>, detail::flat_sorted_storage<T>>;

public:
    using storage_type = typename base::storage_type;
    using view_type    = lazy_seq<T>;
    using path_type    = sorted_collections<T>;

    template <typename U> using rebind = sorted_equa_set<U>;

    static constexpr std::string_view prefix{ "SortedEquaSet" };

    template <typename Range>
    [[ nodiscard ]] static sorted_equa_set mint( sorted_collections<T> const & path, Range && elements ) { return path.sorted_equa_set_from( std::forward<Range>( elements ) ); }

private:
    friend base;
    friend class detail::sorted_lookup<sorted_equa_set<T>, T>;
    friend class sorted_collections<T>;

    explicit sorted_equa_set( typename base::policy_ptr_type policy ) : base{ std::move( policy ) } {}

    [[ nodiscard ]] storage_type const & storage() const noexcept { return this->storage_view(); }

    [[ nodiscard ]] static storage_type make_storage( ordering_equality<T> const & policy ) { return storage_type( detail::policy_less<T>{ &policy } ); }

    template <typename U>
    static bool storage_insert( storage_type & storage, U && value ) { return storage.insert( std::forward<U>( value ) ).second; }
    static bool storage_find  ( storage_type const & storage, T const & value ) { return storage.find( value ) != storage.end(); }
    static void storage_erase ( storage_type       & storage, T const & value ) { storage.erase( value ); }
}; // class sorted_equa_set


template <typename T>
class tree_equa_set
    :
    public detail::equa_set_impl<tree_equa_set<T>, T, ordering_equality<T>, detail::tree_sorted_storage<T>>,
    public detail::sorted_lookup<tree_equa_set<T>, T>
{
private:
    using base = detail::equa_set_impl<tree_equa_set<T>, T, ordering_equality<T>, detail::tree_sorted_storage<T>>;

public:
    using storage_type = typename base::storage_type;
    using view_type    = lazy_seq<T>;
    using path_type    = sorted_collections<T>;

    template <typename U> using rebind = tree_equa_set<U>;

    static constexpr std::string_view prefix{ "TreeEquaSet" };

    template <typename Range>
    [[ nodiscard ]] static tree_equa_set mint( sorted_collections<T> const & path, Range && elements ) { return path.tree_equa_set_from( std::forward<Range>( elements ) ); }

private:
    friend base;
    friend class detail::sorted_lookup<tree_equa_set<T>, T>;
    friend class sorted_collections<T>;

    explicit tree_equa_set( typename base::policy_ptr_type policy ) : base{ std::move( policy ) } {}

    [[ nodiscard ]] storage_type const & storage() const noexcept { return this->storage_view(); }

    [[ nodiscard ]] static storage_type make_storage( ordering_equality<T> const & policy ) { return storage_type( detail::policy_less<T>{ &policy } ); }

    template <typename U>
    static bool storage_insert( storage_type & storage, U && value ) { return storage.insert( std::forward<U>( value ) ).second; }
    static bool storage_find  ( storage_type const & storage, T const & value ) { return storage.find( value ) != storage.end(); }
    static void storage_erase ( storage_type       & storage, T const & value ) { storage.erase( value ); }
}; // class tree_equa_set

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
