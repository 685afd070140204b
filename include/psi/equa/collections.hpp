////////////////////////////////////////////////////////////////////////////////
/// psi::equa collection factories ("paths")
///
/// A path carries one equality policy and is the only source of collections
/// (and boxes) bound to it. The path's identity is its policy object: paths
/// built from the same policy object, including a collections<T> and a
/// sorted_collections<T> sharing one ordering_equality, mint mutually
/// compatible collections; paths built from distinct policy objects never
/// do, however similar the policies.
///
///   collections<T>        - hash variants (equa_set, fast_equa_set, equa_map)
///   sorted_collections<T> - additionally the sorted variants
///                           (sorted_equa_set, tree_equa_set, tree_equa_map)
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

#include "equa_box.hpp"
#include "equa_bridge.hpp"
#include "equa_map.hpp"
#include "equa_set.hpp"
#include "equality.hpp"
#include "lazy_view.hpp"
#include "normalization.hpp"
#include "sorted_equa_set.hpp"
#include "subsets.hpp"

#include <boost/assert.hpp>

#include <initializer_list>
#include <ranges>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

template <typename T>
class collections
{
public:
    using value_type = T;

    explicit collections( hashing_equality_ptr<T> policy ) noexcept : policy_{ std::move( policy ) } { BOOST_ASSERT( policy_ ); }

    /// Path over the process-wide natural policy for T.
    [[ nodiscard ]] static collections native() { return collections{ natural_hashing_equality<T>::instance() }; }

    [[ nodiscard ]] hashing_equality<T>     const & equality    () const noexcept { return *policy_; }
    [[ nodiscard ]] hashing_equality_ptr<T> const & equality_ptr() const noexcept { return  policy_; }
    [[ nodiscard ]] hashing_equality<T>     const * path_id     () const noexcept { return  policy_.get(); }

    [[ nodiscard ]] equa_box<T> box( T value ) const { return { std::move( value ), policy_ }; }

    //--------------------------------------------------------------------------
    // equa_set
    //--------------------------------------------------------------------------

    [[ nodiscard ]] equa_set<T> empty_equa_set() const { return equa_set<T>{ policy_ }; }

    template <typename... Elements>
    [[ nodiscard ]] equa_set<T> equa_set_of( Elements &&... elements ) const { return equa_set_from( elements_of( std::forward<Elements>( elements )... ) ); }

    template <std::ranges::input_range Range>
    [[ nodiscard ]] equa_set<T> equa_set_from( Range && elements ) const { return equa_set<T>::build( policy_, std::forward<Range>( elements ) ); }

    //--------------------------------------------------------------------------
    // fast_equa_set
    //--------------------------------------------------------------------------

    [[ nodiscard ]] fast_equa_set<T> empty_fast_equa_set() const { return fast_equa_set<T>{ policy_ }; }

    template <typename... Elements>
    [[ nodiscard ]] fast_equa_set<T> fast_equa_set_of( Elements &&... elements ) const { return fast_equa_set_from( elements_of( std::forward<Elements>( elements )... ) ); }

    template <std::ranges::input_range Range>
    [[ nodiscard ]] fast_equa_set<T> fast_equa_set_from( Range && elements ) const { return fast_equa_set<T>::build( policy_, std::forward<Range>( elements ) ); }

    //--------------------------------------------------------------------------
    // equa_map (keyed by this path)
    //--------------------------------------------------------------------------

    template <typename V>
    [[ nodiscard ]] equa_map<T, V> empty_equa_map() const { return equa_map<T, V>{ policy_ }; }

    template <typename V>
    [[ nodiscard ]] equa_map<T, V> equa_map_of( std::initializer_list<std::pair<T, V>> const entries ) const { return equa_map<T, V>::build( policy_, entries ); }

    template <typename V, std::ranges::input_range Range>
    [[ nodiscard ]] equa_map<T, V> equa_map_from( Range && entries ) const { return equa_map<T, V>::build( policy_, std::forward<Range>( entries ) ); }

    /// Same policy object.
    [[ nodiscard ]] friend bool operator==( collections const & left, collections const & right ) noexcept { return left.path_id() == right.path_id(); }

protected:
    template <typename... Elements>
    [[ nodiscard ]] static std::vector<T> elements_of( Elements &&... elements )
    {
        std::vector<T> result;
        result.reserve( sizeof...( Elements ) );
        ( result.emplace_back( std::forward<Elements>( elements ) ), ... );
        return result;
    }

private:
    hashing_equality_ptr<T> policy_;
}; // class collections


template <typename T>
class sorted_collections : public collections<T>
{
public:
    explicit sorted_collections( ordering_equality_ptr<T> policy ) noexcept : collections<T>{ policy }, ordering_{ std::move( policy ) } {}

    [[ nodiscard ]] static sorted_collections native() { return sorted_collections{ natural_ordering_equality<T>::instance() }; }

    [[ nodiscard ]] ordering_equality<T>     const & equality    () const noexcept { return *ordering_; }
    [[ nodiscard ]] ordering_equality_ptr<T> const & equality_ptr() const noexcept { return  ordering_; }

    /// Orders boxes minted by this path.
    [[ nodiscard ]] box_ordering<T> ordering() const noexcept { return { ordering_.get() }; }

    //--------------------------------------------------------------------------
    // sorted_equa_set
    //--------------------------------------------------------------------------

    [[ nodiscard ]] sorted_equa_set<T> empty_sorted_equa_set() const { return sorted_equa_set<T>{ ordering_ }; }

    template <typename... Elements>
    [[ nodiscard ]] sorted_equa_set<T> sorted_equa_set_of( Elements &&... elements ) const { return sorted_equa_set_from( this->elements_of( std::forward<Elements>( elements )... ) ); }

    template <std::ranges::input_range Range>
    [[ nodiscard ]] sorted_equa_set<T> sorted_equa_set_from( Range && elements ) const { return sorted_equa_set<T>::build( ordering_, std::forward<Range>( elements ) ); }

    //--------------------------------------------------------------------------
    // tree_equa_set
    //--------------------------------------------------------------------------

    [[ nodiscard ]] tree_equa_set<T> empty_tree_equa_set() const { return tree_equa_set<T>{ ordering_ }; }

    template <typename... Elements>
    [[ nodiscard ]] tree_equa_set<T> tree_equa_set_of( Elements &&... elements ) const { return tree_equa_set_from( this->elements_of( std::forward<Elements>( elements )... ) ); }

    template <std::ranges::input_range Range>
    [[ nodiscard ]] tree_equa_set<T> tree_equa_set_from( Range && elements ) const { return tree_equa_set<T>::build( ordering_, std::forward<Range>( elements ) ); }

    //--------------------------------------------------------------------------
    // tree_equa_map
    //--------------------------------------------------------------------------

    template <typename V>
    [[ nodiscard ]] tree_equa_map<T, V> empty_tree_equa_map() const { return tree_equa_map<T, V>{ ordering_ }; }

    template <typename V>
    [[ nodiscard ]] tree_equa_map<T, V> tree_equa_map_of( std::initializer_list<std::pair<T, V>> const entries ) const { return tree_equa_map<T, V>::build( ordering_, entries ); }

    template <typename V, std::ranges::input_range Range>
    [[ nodiscard ]] tree_equa_map<T, V> tree_equa_map_from( Range && entries ) const { return tree_equa_map<T, V>::build( ordering_, std::forward<Range>( entries ) ); }

private:
    ordering_equality_ptr<T> ordering_;
}; // class sorted_collections

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
