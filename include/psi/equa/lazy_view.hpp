////////////////////////////////////////////////////////////////////////////////
/// psi::equa lazy views
///
/// A view is an immutable chain of pipeline nodes (source, map, flat_map,
/// filter, collect, scan_left, scan_right, zip, zip_all, zip_with_index),
/// each holding its upstream node(s) and its transform. Nothing runs until a
/// terminal operation (iteration through to_vector()/for_each(), size(),
/// to_string(), ==, hash_code()) or forcing into a concrete collection; every
/// terminal operation re-evaluates the whole chain from the source, so the
/// transforms must be pure.
///
///   lazy_bag<T> - views of the hash variants: bag semantics (duplicates
///                 kept, order irrelevant to == and hash_code()).
///   lazy_seq<T> - views of the sorted variants: sequence semantics (order
///                 significant); force() yields the (not deduplicated)
///                 sequence, to_*_equa_set() deduplicate under a target path.
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
#include "detail/print.hpp"

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

enum class view_kind : std::uint8_t
{
    source,
    map,
    flat_map,
    filter,
    collect,
    scan_left,
    scan_right,
    zip,
    zip_all,
    zip_with_index
}; // enum class view_kind

namespace detail
{
//==============================================================================
// Pipeline nodes
//==============================================================================

template <typename T>
class view_node
{
public:
    virtual ~view_node() = default;

    /// Appends this node's output to out (re-running the upstream chain).
    virtual void evaluate( std::vector<T> & out ) const = 0;

    [[ nodiscard ]] virtual view_kind   kind () const noexcept = 0;
    [[ nodiscard ]] virtual std::size_t depth() const noexcept = 0;
}; // class view_node

template <typename T>
using view_node_ptr = std::shared_ptr<view_node<T> const>;

template <typename T>
[[ nodiscard ]] std::vector<T> materialize( view_node<T> const & node )
{
    std::vector<T> elements;
    node.evaluate( elements );
    return elements;
}


template <typename T>
class source_node final : public view_node<T>
{
public:
    explicit source_node( std::vector<T> elements ) noexcept : elements_{ std::move( elements ) } {}

    void evaluate( std::vector<T> & out ) const override { out.insert( out.end(), elements_.begin(), elements_.end() ); }

    [[ nodiscard ]] view_kind   kind () const noexcept override { return view_kind::source; }
    [[ nodiscard ]] std::size_t depth() const noexcept override { return 0; }

private:
    std::vector<T> elements_;
}; // class source_node

/// Output T from a single upstream of U.
template <typename T, typename U, view_kind Kind>
class unary_node : public view_node<T>
{
public:
    [[ nodiscard ]] view_kind   kind () const noexcept final { return Kind; }
    [[ nodiscard ]] std::size_t depth() const noexcept final { return upstream_->depth() + 1; }

protected:
    explicit unary_node( view_node_ptr<U> upstream ) noexcept : upstream_{ std::move( upstream ) } { BOOST_ASSERT( upstream_ ); }

    [[ nodiscard ]] std::vector<U> upstream_elements() const { return materialize( *upstream_ ); }

private:
    view_node_ptr<U> upstream_;
}; // class unary_node

template <typename T, typename U>
class map_node final : public unary_node<T, U, view_kind::map>
{
public:
    map_node( view_node_ptr<U> upstream, std::function<T( U const & )> transform )
        : unary_node<T, U, view_kind::map>{ std::move( upstream ) }, transform_{ std::move( transform ) } {}

    void evaluate( std::vector<T> & out ) const override
    {
        for ( auto const & element : this->upstream_elements() )
            out.push_back( transform_( element ) );
    }

private:
    std::function<T( U const & )> transform_;
}; // class map_node

template <typename T, typename U>
class flat_map_node final : public unary_node<T, U, view_kind::flat_map>
{
public:
    flat_map_node( view_node_ptr<U> upstream, std::function<std::vector<T>( U const & )> transform )
        : unary_node<T, U, view_kind::flat_map>{ std::move( upstream ) }, transform_{ std::move( transform ) } {}

    void evaluate( std::vector<T> & out ) const override
    {
        for ( auto const & element : this->upstream_elements() )
        {
            auto produced{ transform_( element ) };
            std::move( produced.begin(), produced.end(), std::back_inserter( out ) );
        }
    }

private:
    std::function<std::vector<T>( U const & )> transform_;
}; // class flat_map_node

template <typename T>
class filter_node final : public unary_node<T, T, view_kind::filter>
{
public:
    filter_node( view_node_ptr<T> upstream, std::function<bool( T const & )> predicate )
        : unary_node<T, T, view_kind::filter>{ std::move( upstream ) }, predicate_{ std::move( predicate ) } {}

    void evaluate( std::vector<T> & out ) const override
    {
        for ( auto & element : this->upstream_elements() )
            if ( predicate_( element ) )
                out.push_back( std::move( element ) );
    }

private:
    std::function<bool( T const & )> predicate_;
}; // class filter_node

template <typename T, typename U>
class collect_node final : public unary_node<T, U, view_kind::collect>
{
public:
    collect_node( view_node_ptr<U> upstream, std::function<std::optional<T>( U const & )> partial )
        : unary_node<T, U, view_kind::collect>{ std::move( upstream ) }, partial_{ std::move( partial ) } {}

    void evaluate( std::vector<T> & out ) const override
    {
        for ( auto const & element : this->upstream_elements() )
            if ( auto collected{ partial_( element ) } )
                out.push_back( std::move( *collected ) );
    }

private:
    std::function<std::optional<T>( U const & )> partial_;
}; // class collect_node

/// zero, op(zero, e0), op(op(zero, e0), e1) ...
template <typename T, typename U>
class scan_left_node final : public unary_node<T, U, view_kind::scan_left>
{
public:
    scan_left_node( view_node_ptr<U> upstream, T zero, std::function<T( T const &, U const & )> op )
        : unary_node<T, U, view_kind::scan_left>{ std::move( upstream ) }, zero_{ std::move( zero ) }, op_{ std::move( op ) } {}

    void evaluate( std::vector<T> & out ) const override
    {
        auto const upstream{ this->upstream_elements() };
        out.reserve( out.size() + upstream.size() + 1 );
        T accumulator{ zero_ };
        out.push_back( accumulator );
        for ( auto const & element : upstream )
        {
            accumulator = op_( accumulator, element );
            out.push_back( accumulator );
        }
    }

private:
    T                                        zero_;
    std::function<T( T const &, U const & )> op_;
}; // class scan_left_node

/// ... op(e(n-2), op(e(n-1), zero)), op(e(n-1), zero), zero
template <typename T, typename U>
class scan_right_node final : public unary_node<T, U, view_kind::scan_right>
{
public:
    scan_right_node( view_node_ptr<U> upstream, T zero, std::function<T( U const &, T const & )> op )
        : unary_node<T, U, view_kind::scan_right>{ std::move( upstream ) }, zero_{ std::move( zero ) }, op_{ std::move( op ) } {}

    void evaluate( std::vector<T> & out ) const override
    {
        auto const upstream{ this->upstream_elements() };
        std::vector<T> scanned;
        scanned.reserve( upstream.size() + 1 );
        scanned.push_back( zero_ );
        for ( auto pos{ upstream.rbegin() }; pos != upstream.rend(); ++pos )
            scanned.push_back( op_( *pos, scanned.back() ) );
        std::move( scanned.rbegin(), scanned.rend(), std::back_inserter( out ) );
    }

private:
    T                                        zero_;
    std::function<T( U const &, T const & )> op_;
}; // class scan_right_node

template <typename A, typename B>
class zip_node final : public view_node<std::pair<A, B>>
{
public:
    zip_node( view_node_ptr<A> left, view_node_ptr<B> right ) noexcept : left_{ std::move( left ) }, right_{ std::move( right ) } {}

    void evaluate( std::vector<std::pair<A, B>> & out ) const override
    {
        auto const left { materialize( *left_  ) };
        auto const right{ materialize( *right_ ) };
        auto const n{ std::min( left.size(), right.size() ) };
        for ( std::size_t i{ 0 }; i < n; ++i )
            out.emplace_back( left[ i ], right[ i ] );
    }

    [[ nodiscard ]] view_kind   kind () const noexcept override { return view_kind::zip; }
    [[ nodiscard ]] std::size_t depth() const noexcept override { return std::max( left_->depth(), right_->depth() ) + 1; }

private:
    view_node_ptr<A> left_;
    view_node_ptr<B> right_;
}; // class zip_node

/// Pads the shorter side with its fill value.
template <typename A, typename B>
class zip_all_node final : public view_node<std::pair<A, B>>
{
public:
    zip_all_node( view_node_ptr<A> left, view_node_ptr<B> right, A left_fill, B right_fill )
        : left_{ std::move( left ) }, right_{ std::move( right ) }, left_fill_{ std::move( left_fill ) }, right_fill_{ std::move( right_fill ) } {}

    void evaluate( std::vector<std::pair<A, B>> & out ) const override
    {
        auto const left { materialize( *left_  ) };
        auto const right{ materialize( *right_ ) };
        auto const n{ std::max( left.size(), right.size() ) };
        for ( std::size_t i{ 0 }; i < n; ++i )
            out.emplace_back( i < left.size() ? left[ i ] : left_fill_, i < right.size() ? right[ i ] : right_fill_ );
    }

    [[ nodiscard ]] view_kind   kind () const noexcept override { return view_kind::zip_all; }
    [[ nodiscard ]] std::size_t depth() const noexcept override { return std::max( left_->depth(), right_->depth() ) + 1; }

private:
    view_node_ptr<A> left_;
    view_node_ptr<B> right_;
    A                left_fill_;
    B                right_fill_;
}; // class zip_all_node

template <typename T>
class zip_with_index_node final : public unary_node<std::pair<T, std::size_t>, T, view_kind::zip_with_index>
{
public:
    explicit zip_with_index_node( view_node_ptr<T> upstream ) noexcept
        : unary_node<std::pair<T, std::size_t>, T, view_kind::zip_with_index>{ std::move( upstream ) } {}

    void evaluate( std::vector<std::pair<T, std::size_t>> & out ) const override
    {
        std::size_t index{ 0 };
        for ( auto & element : this->upstream_elements() )
            out.emplace_back( std::move( element ), index++ );
    }
}; // class zip_with_index_node


//==============================================================================
// flat_map result adaptation: views and equa collections (to_vector()) or
// plain ranges.
//==============================================================================

template <typename R>
concept has_to_vector = requires( R const & r ) { typename R::value_type; r.to_vector(); };

template <typename R> struct produced_element                    { using type = std::ranges::range_value_t<R>; };
template <has_to_vector R> struct produced_element<R>            { using type = typename R::value_type;       };

template <typename U, typename R>
[[ nodiscard ]] std::vector<U> produced_elements( R const & produced )
{
    if constexpr ( has_to_vector<R> )
        return produced.to_vector();
    else
        return std::vector<U>( std::ranges::begin( produced ), std::ranges::end( produced ) );
}


//==============================================================================
// basic_lazy_view - operations common to lazy_bag and lazy_seq (CRTP over the
// view template so that every transform stays in the same view family)
//==============================================================================

template <template <typename> class View, typename T>
class basic_lazy_view
{
public:
    using value_type = T;

    template <typename... Elements>
    [[ nodiscard ]] static View<T> of( Elements &&... elements )
    {
        std::vector<T> source;
        source.reserve( sizeof...( Elements ) );
        ( source.emplace_back( std::forward<Elements>( elements ) ), ... );
        return from_vector( std::move( source ) );
    }

    [[ nodiscard ]] static View<T> from_vector( std::vector<T> elements )
    {
        return make<T>( std::make_shared<source_node<T> const>( std::move( elements ) ) );
    }

    //--------------------------------------------------------------------------
    // Transforms (deferred)
    //--------------------------------------------------------------------------

    template <typename F, typename U = result_t<F, T const &>>
    [[ nodiscard ]] View<U> map( F transform ) const
    {
        return make<U>( std::make_shared<map_node<U, T> const>( node_, std::move( transform ) ) );
    }

    template <typename F, typename R = result_t<F, T const &>, typename U = typename produced_element<R>::type>
    [[ nodiscard ]] View<U> flat_map( F transform ) const
    {
        return make<U>
        (
            std::make_shared<flat_map_node<U, T> const>
            (
                node_,
                [ transform{ std::move( transform ) } ]( T const & element ) { return produced_elements<U>( transform( element ) ); }
            )
        );
    }

    template <typename Pred>
    [[ nodiscard ]] View<T> filter( Pred predicate ) const
    {
        return make<T>( std::make_shared<filter_node<T> const>( node_, std::move( predicate ) ) );
    }
    template <typename Pred>
    [[ nodiscard ]] View<T> filter_not( Pred predicate ) const
    {
        return filter( [ predicate{ std::move( predicate ) } ]( T const & element ) { return !predicate( element ); } );
    }
    template <typename Pred>
    [[ nodiscard ]] View<T> with_filter( Pred predicate ) const { return filter( std::move( predicate ) ); }

    /// partial: T -> std::optional<U>; keeps the engaged results.
    template <typename F, typename R = result_t<F, T const &>, typename U = typename R::value_type>
    [[ nodiscard ]] View<U> collect( F partial ) const
    {
        return make<U>( std::make_shared<collect_node<U, T> const>( node_, std::move( partial ) ) );
    }

    template <typename A, typename Op>
    [[ nodiscard ]] View<A> scan_left( A zero, Op op ) const
    {
        return make<A>( std::make_shared<scan_left_node<A, T> const>( node_, std::move( zero ), std::move( op ) ) );
    }
    template <typename A, typename Op>
    [[ nodiscard ]] View<A> scan_right( A zero, Op op ) const
    {
        return make<A>( std::make_shared<scan_right_node<A, T> const>( node_, std::move( zero ), std::move( op ) ) );
    }
    template <typename Op>
    [[ nodiscard ]] View<T> scan( T zero, Op op ) const { return scan_left( std::move( zero ), std::move( op ) ); }

    template <template <typename> class OtherView, typename U>
    [[ nodiscard ]] View<std::pair<T, U>> zip( basic_lazy_view<OtherView, U> const & other ) const
    {
        return make<std::pair<T, U>>( std::make_shared<zip_node<T, U> const>( node_, other.node_ ) );
    }
    template <typename U>
    [[ nodiscard ]] View<std::pair<T, U>> zip( std::vector<U> other ) const { return zip( View<U>::from_vector( std::move( other ) ) ); }

    template <template <typename> class OtherView, typename U>
    [[ nodiscard ]] View<std::pair<T, U>> zip_all( basic_lazy_view<OtherView, U> const & other, T this_fill, std::type_identity_t<U> other_fill ) const
    {
        return make<std::pair<T, U>>( std::make_shared<zip_all_node<T, U> const>( node_, other.node_, std::move( this_fill ), std::move( other_fill ) ) );
    }

    [[ nodiscard ]] View<std::pair<T, std::size_t>> zip_with_index() const
    {
        return make<std::pair<T, std::size_t>>( std::make_shared<zip_with_index_node<T> const>( node_ ) );
    }

    template <typename Element = T> requires pair_like<Element>
    [[ nodiscard ]] auto unzip() const
    {
        return std::make_pair
        (
            map( []( Element const & element ) { return element.first ; } ),
            map( []( Element const & element ) { return element.second; } )
        );
    }

    template <typename Element = T> requires triple_like<Element>
    [[ nodiscard ]] auto unzip3() const
    {
        return std::make_tuple
        (
            map( []( Element const & element ) { return std::get<0>( element ); } ),
            map( []( Element const & element ) { return std::get<1>( element ); } ),
            map( []( Element const & element ) { return std::get<2>( element ); } )
        );
    }

    //--------------------------------------------------------------------------
    // Terminal operations (each one re-runs the chain)
    //--------------------------------------------------------------------------

    [[ nodiscard ]] std::vector<T> to_vector() const { return materialize( *node_ ); }
    [[ nodiscard ]] std::list  <T> to_list  () const { auto const elements{ to_vector() }; return { elements.begin(), elements.end() }; }

    [[ nodiscard ]] std::size_t size () const { return to_vector().size (); }
    [[ nodiscard ]] bool        empty() const { return to_vector().empty(); }

    template <typename F>
    void for_each( F && f ) const { for ( auto const & element : to_vector() ) f( element ); }

    [[ nodiscard ]] std::string to_string() const { return join( to_vector(), std::string{ View<T>::prefix } + '(', ", ", ")" ); }

    friend std::ostream & operator<<( std::ostream & out, View<T> const & view ) { return out << view.to_string(); }

    //--------------------------------------------------------------------------
    // Introspection
    //--------------------------------------------------------------------------

    [[ nodiscard ]] view_kind   kind () const noexcept { return node_->kind (); }
    [[ nodiscard ]] std::size_t depth() const noexcept { return node_->depth(); }

protected:
    explicit basic_lazy_view( view_node_ptr<T> node ) noexcept : node_{ std::move( node ) } { BOOST_ASSERT( node_ ); }

    template <typename U>
    [[ nodiscard ]] static View<U> make( view_node_ptr<U> node ) { return View<U>{ std::move( node ) }; }

private:
    template <template <typename> class, typename> friend class basic_lazy_view;

    view_node_ptr<T> node_;
}; // class basic_lazy_view

} // namespace detail


//==============================================================================
// lazy_bag
//==============================================================================

template <typename T>
class lazy_bag : public detail::basic_lazy_view<lazy_bag, T>
{
private:
    using base = detail::basic_lazy_view<lazy_bag, T>;
    template <template <typename> class, typename> friend class detail::basic_lazy_view;

    explicit lazy_bag( detail::view_node_ptr<T> node ) noexcept : base{ std::move( node ) } {}

public:
    static constexpr std::string_view prefix{ "LazyBag" };

    [[ nodiscard ]] static constexpr std::string_view string_prefix() noexcept { return prefix; }

    /// Evaluates the chain and deduplicates under path's policy.
    [[ nodiscard ]] equa_set     <T> force           ( collections<T> const & path ) const { return to_equa_set( path ); }
    [[ nodiscard ]] equa_set     <T> to_equa_set     ( collections<T> const & path ) const { return path.equa_set_from     ( this->to_vector() ); }
    [[ nodiscard ]] fast_equa_set<T> to_fast_equa_set( collections<T> const & path ) const { return path.fast_equa_set_from( this->to_vector() ); }

    /// Same elements with the same multiplicities, in any order.
    [[ nodiscard ]] friend bool operator==( lazy_bag const & left, lazy_bag const & right )
    {
        auto const mine  { left .to_vector() };
        auto const theirs{ right.to_vector() };
        return std::is_permutation( mine.begin(), mine.end(), theirs.begin(), theirs.end() );
    }

    [[ nodiscard ]] std::size_t hash_code() const
    {
        std::size_t hash{ 0 };
        for ( auto const & element : this->to_vector() )
            hash += boost::hash<T>{}( element );
        return hash;
    }

    friend std::size_t hash_value( lazy_bag const & view ) { return view.hash_code(); }
}; // class lazy_bag


//==============================================================================
// lazy_seq
//==============================================================================

template <typename T>
class lazy_seq : public detail::basic_lazy_view<lazy_seq, T>
{
private:
    using base = detail::basic_lazy_view<lazy_seq, T>;
    template <template <typename> class, typename> friend class detail::basic_lazy_view;

    explicit lazy_seq( detail::view_node_ptr<T> node ) noexcept : base{ std::move( node ) } {}

public:
    static constexpr std::string_view prefix{ "LazySeq" };

    [[ nodiscard ]] static constexpr std::string_view string_prefix() noexcept { return prefix; }

    /// The evaluated sequence in order, NOT deduplicated.
    [[ nodiscard ]] std::vector<T> force() const { return this->to_vector(); }

    [[ nodiscard ]] sorted_equa_set<T> to_sorted_equa_set( sorted_collections<T> const & path ) const { return path.sorted_equa_set_from( this->to_vector() ); }
    [[ nodiscard ]] tree_equa_set  <T> to_tree_equa_set  ( sorted_collections<T> const & path ) const { return path.tree_equa_set_from  ( this->to_vector() ); }
    [[ nodiscard ]] equa_set       <T> to_equa_set       ( collections       <T> const & path ) const { return path.equa_set_from       ( this->to_vector() ); }
    [[ nodiscard ]] fast_equa_set  <T> to_fast_equa_set  ( collections       <T> const & path ) const { return path.fast_equa_set_from  ( this->to_vector() ); }

    [[ nodiscard ]] friend bool operator==( lazy_seq const & left, lazy_seq const & right ) { return left.to_vector() == right.to_vector(); }

    [[ nodiscard ]] std::size_t hash_code() const
    {
        auto const elements{ this->to_vector() };
        return boost::hash_range( elements.begin(), elements.end() );
    }

    friend std::size_t hash_value( lazy_seq const & view ) { return view.hash_code(); }
}; // class lazy_seq

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------

// force() and the set headers' view()/into() instantiate against the paths
// and the bridge: pull them in for every entry point.
#include "collections.hpp"
