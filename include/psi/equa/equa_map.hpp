////////////////////////////////////////////////////////////////////////////////
/// psi::equa equivalence-keyed maps
///
///   equa_map<K, V>      - hashed keys (Boost.MultiIndex sequenced +
///                         hashed_unique on the pair's key), iteration in
///                         insertion order.
///   tree_equa_map<K, V> - boost::container::map ordered by the key policy.
///
/// Keys are unique under the path's policy: plus() of an entry whose key is
/// already present keeps the stored key and replaces the value.
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

#include "detail/policy_functors.hpp"
#include "detail/print.hpp"
#include "equa_box.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <boost/assert.hpp>
#include <boost/container/map.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index_container.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

namespace detail
{
//------------------------------------------------------------------------------

template <typename Derived, typename K, typename V, typename Policy, typename Storage>
class equa_map_impl
{
public:
    using key_type        = K;
    using mapped_type     = V;
    using entry_type      = std::pair<K, V>;
    using value_type      = typename Storage::value_type;
    using size_type       = std::size_t;
    using policy_type     = Policy;
    using policy_ptr_type = std::shared_ptr<Policy const>;
    using storage_type    = Storage;
    using const_iterator  = typename Storage::const_iterator;
    using iterator        = const_iterator;

    [[ nodiscard ]] Policy              const & policy () const noexcept { return *policy_; }
    [[ nodiscard ]] hashing_equality<K> const * path_id() const noexcept { return  policy_.get(); }

    [[ nodiscard ]] static constexpr std::string_view string_prefix() noexcept { return Derived::prefix; }

    [[ nodiscard ]] const_iterator begin() const noexcept { return storage_.begin(); }
    [[ nodiscard ]] const_iterator end  () const noexcept { return storage_.end  (); }

    [[ nodiscard ]] size_type size () const noexcept { return static_cast<size_type>( storage_.size() ); }
    [[ nodiscard ]] bool      empty() const noexcept { return storage_.empty(); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    [[ nodiscard ]] bool contains( K const & key ) const { return Derived::storage_find( storage_, key ) != nullptr; }

    [[ nodiscard ]] V const & get( K const & key ) const
    {
        auto const value{ Derived::storage_find( storage_, key ) };
        if ( !value )
            throw_out_of_range( "equa::get: key not found" );
        return *value;
    }

    [[ nodiscard ]] std::optional<V> get_option( K const & key ) const
    {
        if ( auto const value{ Derived::storage_find( storage_, key ) } )
            return *value;
        return std::nullopt;
    }

    [[ nodiscard ]] V get_or_else( K const & key, V fallback ) const
    {
        if ( auto const value{ Derived::storage_find( storage_, key ) } )
            return *value;
        return fallback;
    }

    //--------------------------------------------------------------------------
    // Entry algebra
    //--------------------------------------------------------------------------

    [[ nodiscard ]] Derived plus( entry_type const & entry ) const
    {
        Derived result{ self() };
        Derived::storage_upsert( result.storage_, entry.first, entry.second );
        return result;
    }
    template <typename... Rest>
    [[ nodiscard ]] Derived plus( entry_type const & first, entry_type const & second, Rest const &... rest ) const
    {
        Derived result{ self() };
        for ( entry_type const & entry : { first, second, entry_type( rest )... } )
            Derived::storage_upsert( result.storage_, entry.first, entry.second );
        return result;
    }

    template <std::ranges::input_range Range> requires( !equa_map_collection<std::remove_cvref_t<Range>> )
    [[ nodiscard ]] Derived concat( Range const & entries ) const
    {
        Derived result{ self() };
        for ( auto const & [ key, value ] : entries )
            Derived::storage_upsert( result.storage_, key, value );
        return result;
    }
    template <equa_map_collection Other> requires std::same_as<typename Other::key_type, K> && std::same_as<typename Other::mapped_type, V>
    [[ nodiscard ]] Derived concat( Other const & other ) const
    {
        require_same_path( other, "concat" );
        Derived result{ self() };
        for ( auto const & [ key, value ] : other )
            Derived::storage_upsert( result.storage_, key, value );
        return result;
    }

    [[ nodiscard ]] Derived minus( K const & key ) const
    {
        Derived result{ self() };
        Derived::storage_erase( result.storage_, key );
        return result;
    }
    template <typename... Rest>
    [[ nodiscard ]] Derived minus( K const & first, K const & second, Rest const &... rest ) const
    {
        Derived result{ self() };
        Derived::storage_erase( result.storage_, first  );
        Derived::storage_erase( result.storage_, second );
        ( Derived::storage_erase( result.storage_, K( rest ) ), ... );
        return result;
    }

    /// Removes every key of a same-path set.
    template <equa_collection_of<K> Keys>
    [[ nodiscard ]] Derived remove_all( Keys const & keys ) const
    {
        require_same_path( keys, "remove_all" );
        Derived result{ self() };
        for ( auto const & key : keys )
            Derived::storage_erase( result.storage_, key );
        return result;
    }
    template <std::ranges::input_range Range> requires( !equa_collection<std::remove_cvref_t<Range>> )
    [[ nodiscard ]] Derived remove_all( Range const & keys ) const
    {
        Derived result{ self() };
        for ( auto const & key : keys )
            Derived::storage_erase( result.storage_, K( key ) );
        return result;
    }

    template <typename Pred>
    [[ nodiscard ]] Derived filter( Pred pred ) const
    {
        Derived result{ policy_ };
        for ( auto const & entry : *this )
            if ( pred( entry ) )
                Derived::storage_upsert( result.storage_, entry.first, entry.second );
        return result;
    }

    //--------------------------------------------------------------------------
    // Traversal & conversions
    //--------------------------------------------------------------------------

    [[ nodiscard ]] std::vector<K> keys() const
    {
        std::vector<K> result;
        result.reserve( size() );
        for ( auto const & entry : *this )
            result.push_back( entry.first );
        return result;
    }
    [[ nodiscard ]] std::vector<V> values() const
    {
        std::vector<V> result;
        result.reserve( size() );
        for ( auto const & entry : *this )
            result.push_back( entry.second );
        return result;
    }

    template <typename A, typename Op>
    [[ nodiscard ]] A fold_left( A accumulator, Op op ) const
    {
        for ( auto const & entry : *this )
            accumulator = op( std::move( accumulator ), entry );
        return accumulator;
    }

    [[ nodiscard ]] std::unordered_map<K, V, boost::hash<K>> to_map() const
    {
        std::unordered_map<K, V, boost::hash<K>> result;
        for ( auto const & [ key, value ] : *this )
            result.insert_or_assign( key, value );
        return result;
    }

    [[ nodiscard ]] std::unordered_map<equa_box<K>, V> to_equa_box_map() const
    {
        std::unordered_map<equa_box<K>, V> result;
        for ( auto const & [ key, value ] : *this )
            result.emplace( equa_box<K>{ key, policy_ }, value );
        return result;
    }

    [[ nodiscard ]] std::string to_string() const
    {
        std::ostringstream out;
        out << string_prefix() << '(';
        bool first{ true };
        for ( auto const & [ key, value ] : *this )
        {
            if ( !first )
                out << ", ";
            print_element( out, key );
            out << " -> ";
            print_element( out, value );
            first = false;
        }
        out << ')';
        return std::move( out ).str();
    }

    friend std::ostream & operator<<( std::ostream & out, Derived const & map ) { return out << map.to_string(); }

    //--------------------------------------------------------------------------
    // Equality
    //--------------------------------------------------------------------------

    template <typename Other>
    [[ nodiscard ]] bool can_equal( Other const & other ) const noexcept
    {
        if constexpr ( equa_map_collection<Other> )
            return static_cast<void const *>( other.path_id() ) == static_cast<void const *>( path_id() );
        else
            return false;
    }

    [[ nodiscard ]] std::size_t hash_code() const
    {
        std::size_t hash{ 0 };
        for ( auto const & [ key, value ] : *this )
        {
            auto entry_hash{ policy_->hash_code( key ) };
            boost::hash_combine( entry_hash, value );
            hash += entry_hash;
        }
        return hash;
    }

    template <equa_map_collection Other> requires std::same_as<typename Other::key_type, K> && std::same_as<typename Other::mapped_type, V>
    [[ nodiscard ]] friend bool operator==( Derived const & left, Other const & right )
    {
        if ( !left.can_equal( right ) || ( left.size() != right.size() ) )
            return false;
        for ( auto const & [ key, value ] : left )
        {
            auto const theirs{ right.get_option( key ) };
            if ( !theirs || !( *theirs == value ) )
                return false;
        }
        return true;
    }

    friend std::size_t hash_value( Derived const & map ) { return map.hash_code(); }

protected:
    explicit equa_map_impl( policy_ptr_type policy )
        : policy_{ std::move( policy ) }, storage_{ Derived::make_storage( *policy_ ) }
    {}

    template <typename Range>
    [[ nodiscard ]] static Derived build( policy_ptr_type policy, Range && entries )
    {
        BOOST_ASSERT( policy );
        Derived result{ std::move( policy ) };
        for ( auto const & [ key, value ] : entries )
            Derived::storage_upsert( result.storage_, key, value );
        return result;
    }

private:
    [[ nodiscard ]] Derived const & self() const noexcept { return static_cast<Derived const &>( *this ); }

    template <typename Other>
    void require_same_path( Other const & other, char const * const operation ) const
    {
        if ( static_cast<void const *>( other.path_id() ) != static_cast<void const *>( path_id() ) )
            throw_incompatible_paths( operation );
    }

    policy_ptr_type policy_;
    Storage         storage_;
}; // class equa_map_impl


namespace bmi = boost::multi_index;

template <typename K, typename V>
using insertion_ordered_map_storage = bmi::multi_index_container
<
    std::pair<K, V>,
    bmi::indexed_by
    <
        bmi::sequenced<>,
        bmi::hashed_unique<bmi::member<std::pair<K, V>, K, &std::pair<K, V>::first>, policy_hasher<K>, policy_equal<K>>
    >
>;

template <typename K, typename V>
using tree_map_storage = boost::container::map<K, V, policy_less<K>>;

//------------------------------------------------------------------------------
} // namespace detail


template <typename K, typename V>
class equa_map
    :
    public detail::equa_map_impl<equa_map<K, V>, K, V, hashing_equality<K>, detail::insertion_ordered_map_storage<K, V>>
{
private:
    using base = detail::equa_map_impl<equa_map<K, V>, K, V, hashing_equality<K>, detail::insertion_ordered_map_storage<K, V>>;

public:
    using storage_type = typename base::storage_type;

    static constexpr std::string_view prefix{ "EquaMap" };

private:
    friend base;
    friend class collections<K>;

    explicit equa_map( typename base::policy_ptr_type policy ) : base{ std::move( policy ) } {}

    [[ nodiscard ]] static storage_type make_storage( hashing_equality<K> const & policy )
    {
        using args_list   = typename storage_type::ctor_args_list;
        using hashed_args = typename storage_type::template nth_index<1>::type::ctor_args;
        using key_of      = detail::bmi::member<std::pair<K, V>, K, &std::pair<K, V>::first>;
        args_list const args
        (
            boost::tuples::null_type(),
            typename args_list::tail_type
            (
                hashed_args( std::size_t{ 0 }, key_of(), detail::policy_hasher<K>{ &policy }, detail::policy_equal<K>{ &policy } )
            )
        );
        return storage_type( args );
    }

    [[ nodiscard ]] static V const * storage_find( storage_type const & storage, K const & key )
    {
        auto const & hashed{ storage.template get<1>() };
        auto const pos{ hashed.find( key ) };
        return ( pos != hashed.end() ) ? &pos->second : nullptr;
    }

    static void storage_upsert( storage_type & storage, K const & key, V const & value )
    {
        auto & hashed{ storage.template get<1>() };
        auto const pos{ hashed.find( key ) };
        if ( pos == hashed.end() )
            storage.push_back( std::pair<K, V>{ key, value } );
        else
            hashed.modify( pos, [ & ]( std::pair<K, V> & entry ) { entry.second = value; } );
    }

    static void storage_erase( storage_type & storage, K const & key ) { storage.template get<1>().erase( key ); }
}; // class equa_map


template <typename K, typename V>
class tree_equa_map
    :
    public detail::equa_map_impl<tree_equa_map<K, V>, K, V, ordering_equality<K>, detail::tree_map_storage<K, V>>
{
private:
    using base = detail::equa_map_impl<tree_equa_map<K, V>, K, V, ordering_equality<K>, detail::tree_map_storage<K, V>>;

public:
    using storage_type = typename base::storage_type;

    static constexpr std::string_view prefix{ "TreeEquaMap" };

private:
    friend base;
    friend class sorted_collections<K>;

    explicit tree_equa_map( typename base::policy_ptr_type policy ) : base{ std::move( policy ) } {}

    [[ nodiscard ]] static storage_type make_storage( ordering_equality<K> const & policy ) { return storage_type( detail::policy_less<K>{ &policy } ); }

    [[ nodiscard ]] static V const * storage_find( storage_type const & storage, K const & key )
    {
        auto const pos{ storage.find( key ) };
        return ( pos != storage.end() ) ? &pos->second : nullptr;
    }

    static void storage_upsert( storage_type & storage, K const & key, V const & value )
    {
        auto const pos{ storage.find( key ) };
        if ( pos == storage.end() )
            storage.emplace( key, value );
        else
            pos->second = value;
    }

    static void storage_erase( storage_type & storage, K const & key ) { storage.erase( key ); }
}; // class tree_equa_map

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
