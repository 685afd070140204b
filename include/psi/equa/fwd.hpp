////////////////////////////////////////////////////////////////////////////////
/// Forward declarations and the collection concepts shared by all psi::equa
/// headers.
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

#include <concepts>
#include <cstddef>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

template <typename T> class equality;
template <typename T> class equivalence;
template <typename T> class hashing_equality;
template <typename T> class ordering_equality;

template <typename T> using equality_ptr          = std::shared_ptr<equality         <T> const>;
template <typename T> using equivalence_ptr       = std::shared_ptr<equivalence      <T> const>;
template <typename T> using hashing_equality_ptr  = std::shared_ptr<hashing_equality <T> const>;
template <typename T> using ordering_equality_ptr = std::shared_ptr<ordering_equality<T> const>;

template <typename T> class normalization;
template <typename T> class uniformity;

template <typename T> class equa_box;

template <typename T> class collections;
template <typename T> class sorted_collections;

template <typename T> class equa_set;
template <typename T> class fast_equa_set;
template <typename T> class sorted_equa_set;
template <typename T> class tree_equa_set;

template <typename T> class lazy_bag;
template <typename T> class lazy_seq;

template <typename K, typename V> class equa_map;
template <typename K, typename V> class tree_equa_map;

template <typename Source, typename TargetPath> class equa_bridge;


/// equa_collection - any of the four set variants. The path_id() is the
/// address of the equality policy object the collection was minted with: two
/// collections interoperate iff their path_ids are identical.
template <typename C>
concept equa_collection = requires( C const & c, typename C::value_type const & v )
{
    typename C::value_type;
    { c.path_id()    } -> std::same_as<hashing_equality<typename C::value_type> const *>;
    { c.contains( v ) } -> std::same_as<bool>;
    { c.size()       } -> std::convertible_to<std::size_t>;
    c.begin();
    c.end  ();
};

template <typename C, typename T>
concept equa_collection_of = equa_collection<C> && std::same_as<typename C::value_type, T>;

/// equa_map_collection - either map variant (keyed by a policy).
template <typename M>
concept equa_map_collection = requires( M const & m, typename M::key_type const & k )
{
    typename M::key_type;
    typename M::mapped_type;
    { m.path_id()    } -> std::same_as<hashing_equality<typename M::key_type> const *>;
    { m.contains( k ) } -> std::same_as<bool>;
};


namespace detail
{
    template <typename T> struct is_pair                        : std::false_type {};
    template <typename A, typename B> struct is_pair<std::pair<A, B>> : std::true_type  {};

    template <typename T> struct is_triple                                 : std::false_type {};
    template <typename A, typename B, typename C> struct is_triple<std::tuple<A, B, C>> : std::true_type  {};

    template <typename T> concept pair_like   = is_pair  <std::remove_cvref_t<T>>::value;
    template <typename T> concept triple_like = is_triple<std::remove_cvref_t<T>>::value;

    template <typename F, typename... Args>
    using result_t = std::remove_cvref_t<std::invoke_result_t<F &, Args...>>;
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
