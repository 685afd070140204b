////////////////////////////////////////////////////////////////////////////////
/// psi::equa::detail::equa_set_impl - CRTP base shared by the four set
/// variants (equa_set, fast_equa_set, sorted_equa_set, tree_equa_set).
///
/// Holds the policy (which doubles as the path identity) and the Boost
/// storage, and implements the entire algebra and traversal surface in terms
/// of the storage hooks each Derived provides:
///   static storage_type make_storage  ( Policy const & );
///   static bool         storage_insert( storage_type &, T const & | T && );  // first-wins
///   static bool         storage_find  ( storage_type const &, T const & );
///   static void         storage_erase ( storage_type &, T const & );
///   static constexpr std::string_view prefix;
///   using view_type = lazy_bag<T> | lazy_seq<T>;
///
/// Every operation returns a new collection sharing the receiver's policy.
/// Binary operations on two collections require both to carry the same
/// policy object and throw incompatible_paths otherwise; can_equal() and
/// operator== never throw.
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

#include <psi/equa/equa_box.hpp>
#include <psi/equa/equality.hpp>
#include <psi/equa/error.hpp>
#include <psi/equa/fwd.hpp>
#include <psi/equa/subsets.hpp>
#include <psi/equa/detail/print.hpp>

#include <boost/assert.hpp>
#include <boost/unordered_map.hpp>

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <limits>
#include <list>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::equa::detail
{
//------------------------------------------------------------------------------

template <typename R, typename T>
concept element_range = std::ranges::input_range<R> && !equa_collection<std::remove_cvref_t<R>> && std::convertible_to<std::ranges::range_reference_t<R>, T>;

template <typename Derived, typename T, typename Policy, typename Storage>
class equa_set_impl
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using policy_type     = Policy;
    using policy_ptr_type = std::shared_ptr<Policy const>;
    using storage_type    = Storage;
    using const_reference = T const &;
    using reference       = const_reference;
    using const_iterator  = typename Storage::const_iterator;
    using iterator        = const_iterator;

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------

    [[ nodiscard ]] Policy              const & policy    () const noexcept { return *policy_; }
    [[ nodiscard ]] policy_ptr_type     const & policy_ptr() const noexcept { return  policy_; }
    [[ nodiscard ]] hashing_equality<T> const * path_id   () const noexcept { return  policy_.get(); }

    [[ nodiscard ]] static constexpr std::string_view string_prefix() noexcept { return Derived::prefix; }

    //--------------------------------------------------------------------------
    // Iteration & capacity
    //--------------------------------------------------------------------------

    [[ nodiscard ]] const_iterator begin () const noexcept { return storage_.begin(); }
    [[ nodiscard ]] const_iterator end   () const noexcept { return storage_.end  (); }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end  (); }

    [[ nodiscard ]] size_type size     () const noexcept { return static_cast<size_type>( storage_.size() ); }
    [[ nodiscard ]] bool      empty    () const noexcept { return storage_.empty(); }
    [[ nodiscard ]] bool      non_empty() const noexcept { return !empty(); }

    //--------------------------------------------------------------------------
    // Membership
    //--------------------------------------------------------------------------

    [[ nodiscard ]] bool contains  ( T const & value ) const { return Derived::storage_find( storage_, value ); }
    [[ nodiscard ]] bool operator()( T const & value ) const { return contains( value ); }

    //--------------------------------------------------------------------------
    // Element algebra
    //--------------------------------------------------------------------------

    [[ nodiscard ]] Derived plus( T const & value ) const
    {
        Derived result{ self() };
        result.insert_element( value );
        return result;
    }
    template <typename... Rest>
    [[ nodiscard ]] Derived plus( T const & first, T const & second, Rest const &... rest ) const
    {
        Derived result{ self() };
        result.insert_element( first  );
        result.insert_element( second );
        ( result.insert_element( T( rest ) ), ... );
        return result;
    }

    [[ nodiscard ]] Derived minus( T const & value ) const
    {
        Derived result{ self() };
        result.erase_element( value );
        return result;
    }
    template <typename... Rest>
    [[ nodiscard ]] Derived minus( T const & first, T const & second, Rest const &... rest ) const
    {
        Derived result{ self() };
        result.erase_element( first  );
        result.erase_element( second );
        ( result.erase_element( T( rest ) ), ... );
        return result;
    }

    [[ nodiscard ]] Derived operator+( T const & value ) const { return plus ( value ); }
    [[ nodiscard ]] Derived operator-( T const & value ) const { return minus( value ); }

    template <element_range<T> Range>
    [[ nodiscard ]] Derived concat( Range && elements ) const
    {
        Derived result{ self() };
        for ( auto && element : elements )
            result.insert_element( T( element ) );
        return result;
    }
    template <equa_collection_of<T> Other>
    [[ nodiscard ]] Derived concat( Other const & other ) const
    {
        require_same_path( other, "concat" );
        Derived result{ self() };
        for ( auto const & element : other )
            result.insert_element( element );
        return result;
    }

    template <element_range<T> Range>
    [[ nodiscard ]] Derived remove_all( Range && elements ) const
    {
        Derived result{ self() };
        for ( auto && element : elements )
            result.erase_element( T( element ) );
        return result;
    }
    template <equa_collection_of<T> Other>
    [[ nodiscard ]] Derived remove_all( Other const & other ) const
    {
        require_same_path( other, "remove_all" );
        Derived result{ self() };
        for ( auto const & element : other )
            result.erase_element( element );
        return result;
    }

    //--------------------------------------------------------------------------
    // Set algebra (same path only)
    //--------------------------------------------------------------------------

    template <equa_collection_of<T> Other>
    [[ nodiscard ]] Derived union_with( Other const & other ) const
    {
        require_same_path( other, "union" );
        Derived result{ self() };
        for ( auto const & element : other )
            result.insert_element( element );
        return result;
    }

    template <equa_collection_of<T> Other>
    [[ nodiscard ]] Derived intersect( Other const & other ) const
    {
        require_same_path( other, "intersect" );
        return filter( [ & ]( T const & element ) { return other.contains( element ); } );
    }

    template <equa_collection_of<T> Other>
    [[ nodiscard ]] Derived diff( Other const & other ) const
    {
        require_same_path( other, "diff" );
        return filter_not( [ & ]( T const & element ) { return other.contains( element ); } );
    }

    template <equa_collection_of<T> Other>
    [[ nodiscard ]] bool subset_of( Other const & other ) const
    {
        require_same_path( other, "subset_of" );
        return forall( [ & ]( T const & element ) { return other.contains( element ); } );
    }

    template <equa_collection_of<T> Other> [[ nodiscard ]] Derived operator|( Other const & other ) const { return union_with( other ); }
    template <equa_collection_of<T> Other> [[ nodiscard ]] Derived operator&( Other const & other ) const { return intersect ( other ); }
    template <equa_collection_of<T> Other> [[ nodiscard ]] Derived operator-( Other const & other ) const { return diff      ( other ); }

    //--------------------------------------------------------------------------
    // Predicates & selection
    //--------------------------------------------------------------------------

    template <typename Pred> [[ nodiscard ]] size_type count ( Pred pred ) const { return static_cast<size_type>( std::count_if( begin(), end(), pred ) ); }
    template <typename Pred> [[ nodiscard ]] bool      exists( Pred pred ) const { return std::any_of( begin(), end(), pred ); }
    template <typename Pred> [[ nodiscard ]] bool      forall( Pred pred ) const { return std::all_of( begin(), end(), pred ); }

    template <typename Pred>
    [[ nodiscard ]] std::optional<T> find( Pred pred ) const
    {
        auto const pos{ std::find_if( begin(), end(), pred ) };
        if ( pos == end() )
            return std::nullopt;
        return *pos;
    }

    template <typename Pred>
    [[ nodiscard ]] Derived filter( Pred pred ) const
    {
        auto result{ make_empty() };
        for ( auto const & element : *this )
            if ( pred( element ) )
                result.insert_element( element );
        return result;
    }

    template <typename Pred>
    [[ nodiscard ]] Derived filter_not( Pred pred ) const { return filter( [ & ]( T const & element ) { return !pred( element ); } ); }

    template <typename Pred>
    [[ nodiscard ]] std::pair<Derived, Derived> partition( Pred pred ) const
    {
        std::pair<Derived, Derived> result{ make_empty(), make_empty() };
        for ( auto const & element : *this )
            ( pred( element ) ? result.first : result.second ).insert_element( element );
        return result;
    }

    /// partial returns std::optional<T>; engaged results are re-deduplicated
    /// under this path.
    template <typename F>
    [[ nodiscard ]] Derived collect( F partial ) const
    {
        auto result{ make_empty() };
        for ( auto const & element : *this )
            if ( std::optional<T> collected{ partial( element ) } )
                result.insert_element( std::move( *collected ) );
        return result;
    }

    //--------------------------------------------------------------------------
    // Positional operations (in iteration order)
    //--------------------------------------------------------------------------

    [[ nodiscard ]] Derived slice( difference_type const from, difference_type const until ) const
    {
        auto const lo{ clamp_position( from ) };
        auto const hi{ std::max( lo, clamp_position( until ) ) };
        auto result{ make_empty() };
        difference_type position{ 0 };
        for ( auto const & element : *this )
        {
            if ( position >= hi )
                break;
            if ( position >= lo )
                result.insert_element( element );
            ++position;
        }
        return result;
    }

    [[ nodiscard ]] Derived take      ( difference_type const n ) const { return slice( 0, n ); }
    [[ nodiscard ]] Derived drop      ( difference_type const n ) const { return slice( n, ssize() ); }
    [[ nodiscard ]] Derived take_right( difference_type const n ) const { return drop( ssize() - clamp_position( n ) ); }
    [[ nodiscard ]] Derived drop_right( difference_type const n ) const { return take( ssize() - clamp_position( n ) ); }

    [[ nodiscard ]] std::pair<Derived, Derived> split_at( difference_type const n ) const { return { take( n ), drop( n ) }; }

    template <typename Pred>
    [[ nodiscard ]] Derived take_while( Pred pred ) const { return take( prefix_length( pred ) ); }
    template <typename Pred>
    [[ nodiscard ]] Derived drop_while( Pred pred ) const { return drop( prefix_length( pred ) ); }
    template <typename Pred>
    [[ nodiscard ]] std::pair<Derived, Derived> span( Pred pred ) const { return split_at( prefix_length( pred ) ); }

    [[ nodiscard ]] T const & head() const
    {
        if ( empty() )
            throw_out_of_range( "equa::head: empty collection" );
        return *begin();
    }
    [[ nodiscard ]] T const & last() const
    {
        if ( empty() )
            throw_out_of_range( "equa::last: empty collection" );
        return *element_pointers().back();
    }
    [[ nodiscard ]] std::optional<T> head_option() const { if ( empty() ) return std::nullopt; return head(); }
    [[ nodiscard ]] std::optional<T> last_option() const { if ( empty() ) return std::nullopt; return last(); }

    [[ nodiscard ]] Derived tail() const
    {
        if ( empty() )
            throw_out_of_range( "equa::tail: empty collection" );
        return drop( 1 );
    }
    [[ nodiscard ]] Derived init() const
    {
        if ( empty() )
            throw_out_of_range( "equa::init: empty collection" );
        return drop_right( 1 );
    }

    /// this, tail, tail.tail ... empty
    [[ nodiscard ]] std::vector<Derived> tails() const
    {
        std::vector<Derived> result;
        for ( difference_type n{ 0 }; n <= ssize(); ++n )
            result.push_back( drop( n ) );
        return result;
    }
    /// this, init, init.init ... empty
    [[ nodiscard ]] std::vector<Derived> inits() const
    {
        std::vector<Derived> result;
        for ( auto n{ ssize() }; n >= 0; --n )
            result.push_back( take( n ) );
        return result;
    }

    /// Consecutive windows of (at most) window_size elements, each starting
    /// step positions after the previous one. The first window is always
    /// produced for a non-empty collection; production stops once a window
    /// reaches the last element.
    [[ nodiscard ]] std::vector<Derived> sliding( difference_type const window_size, difference_type const step = 1 ) const
    {
        if ( window_size <= 0 )
            throw_invalid_argument( "equa::sliding: window size must be positive" );
        if ( step <= 0 )
            throw_invalid_argument( "equa::sliding: step must be positive" );

        std::vector<Derived> windows;
        auto const elements{ element_pointers() };
        auto const n{ static_cast<difference_type>( elements.size() ) };
        for ( difference_type start{ 0 }; start < n; start += step )
        {
            auto const stop{ std::min( start + window_size, n ) };
            auto window{ make_empty() };
            for ( auto i{ start }; i < stop; ++i )
                window.insert_element( *elements[ static_cast<std::size_t>( i ) ] );
            windows.push_back( std::move( window ) );
            if ( stop == n )
                break;
        }
        return windows;
    }

    [[ nodiscard ]] std::vector<Derived> grouped( difference_type const group_size ) const
    {
        if ( group_size <= 0 )
            throw_invalid_argument( "equa::grouped: group size must be positive" );
        return sliding( group_size, group_size );
    }

    //--------------------------------------------------------------------------
    // Folds & reductions
    //--------------------------------------------------------------------------

    template <typename A, typename Op>
    [[ nodiscard ]] A fold_left( A accumulator, Op op ) const
    {
        for ( auto const & element : *this )
            accumulator = op( std::move( accumulator ), element );
        return accumulator;
    }

    template <typename A, typename Op>
    [[ nodiscard ]] A fold_right( A accumulator, Op op ) const
    {
        auto const elements{ element_pointers() };
        for ( auto pos{ elements.rbegin() }; pos != elements.rend(); ++pos )
            accumulator = op( **pos, std::move( accumulator ) );
        return accumulator;
    }

    template <typename Op>
    [[ nodiscard ]] T fold( T const & zero, Op op ) const { return fold_left( zero, op ); }

    /// Sequential: combine is never needed (but must be consistent with seq).
    template <typename A, typename SeqOp, typename CombOp>
    [[ nodiscard ]] A aggregate( A zero, SeqOp seq, CombOp /*combine*/ ) const { return fold_left( std::move( zero ), seq ); }

    template <typename Op>
    [[ nodiscard ]] T reduce_left( Op op ) const
    {
        if ( empty() )
            throw_out_of_range( "equa::reduce_left: empty collection" );
        auto pos{ begin() };
        T accumulator{ *pos };
        for ( ++pos; pos != end(); ++pos )
            accumulator = op( std::move( accumulator ), *pos );
        return accumulator;
    }

    template <typename Op>
    [[ nodiscard ]] T reduce_right( Op op ) const
    {
        if ( empty() )
            throw_out_of_range( "equa::reduce_right: empty collection" );
        auto const elements{ element_pointers() };
        auto pos{ elements.rbegin() };
        T accumulator{ **pos };
        for ( ++pos; pos != elements.rend(); ++pos )
            accumulator = op( **pos, std::move( accumulator ) );
        return accumulator;
    }

    template <typename Op> [[ nodiscard ]] T reduce( Op op ) const { return reduce_left( op ); }

    template <typename Op> [[ nodiscard ]] std::optional<T> reduce_option      ( Op op ) const { if ( empty() ) return std::nullopt; return reduce      ( op ); }
    template <typename Op> [[ nodiscard ]] std::optional<T> reduce_left_option ( Op op ) const { if ( empty() ) return std::nullopt; return reduce_left ( op ); }
    template <typename Op> [[ nodiscard ]] std::optional<T> reduce_right_option( Op op ) const { if ( empty() ) return std::nullopt; return reduce_right( op ); }

    template <typename Compare = std::less<>>
    [[ nodiscard ]] T const & min( Compare comp = {} ) const
    {
        if ( empty() )
            throw_out_of_range( "equa::min: empty collection" );
        return *std::min_element( begin(), end(), comp );
    }
    template <typename Compare = std::less<>>
    [[ nodiscard ]] T const & max( Compare comp = {} ) const
    {
        if ( empty() )
            throw_out_of_range( "equa::max: empty collection" );
        return *std::max_element( begin(), end(), comp );
    }

    template <typename F>
    [[ nodiscard ]] T const & min_by( F key ) const { return min( [ & ]( T const & left, T const & right ) { return key( left ) < key( right ); } ); }
    template <typename F>
    [[ nodiscard ]] T const & max_by( F key ) const { return max( [ & ]( T const & left, T const & right ) { return key( left ) < key( right ); } ); }

    [[ nodiscard ]] T sum    () const { return fold_left( T{}   , std::plus      <>{} ); }
    [[ nodiscard ]] T product() const { return fold_left( T( 1 ), std::multiplies<>{} ); }

    //--------------------------------------------------------------------------
    // Grouping & combinatorics
    //--------------------------------------------------------------------------

    template <typename F, typename K = result_t<F, T const &>>
    [[ nodiscard ]] boost::unordered_map<K, Derived> group_by( F discriminator ) const
    {
        boost::unordered_map<K, Derived> groups;
        for ( auto const & element : *this )
        {
            auto key{ discriminator( element ) };
            auto group{ groups.find( key ) };
            if ( group == groups.end() )
                group = groups.emplace( std::move( key ), make_empty() ).first;
            group->second.insert_element( element );
        }
        return groups;
    }

    /// For elements that are themselves sequences of equal length: the set of
    /// columns (the i-th column holds the i-th item of every element, in
    /// iteration order).
    template <typename Element = T> requires std::ranges::input_range<Element>
    [[ nodiscard ]] Derived transpose() const
    {
        using item = std::ranges::range_value_t<Element>;
        std::vector<std::vector<item>> columns;
        bool first{ true };
        for ( auto const & row : *this )
        {
            std::size_t column{ 0 };
            for ( auto const & value : row )
            {
                if ( first )
                    columns.emplace_back();
                else
                if ( column == columns.size() )
                    throw_invalid_argument( "equa::transpose: elements differ in length" );
                columns[ column++ ].push_back( value );
            }
            if ( !first && column != columns.size() )
                throw_invalid_argument( "equa::transpose: elements differ in length" );
            first = false;
        }
        auto result{ make_empty() };
        for ( auto & column : columns )
            result.insert_element( T( std::make_move_iterator( column.begin() ), std::make_move_iterator( column.end() ) ) );
        return result;
    }

    /// Splits pair elements into hash sets minted by the two target paths.
    template <typename FirstPath, typename SecondPath, typename Element = T> requires pair_like<Element>
    [[ nodiscard ]] auto unzip( FirstPath const & first, SecondPath const & second ) const
    {
        std::vector<typename FirstPath ::value_type> firsts;
        std::vector<typename SecondPath::value_type> seconds;
        for ( auto const & [ a, b ] : *this )
        {
            firsts .push_back( a );
            seconds.push_back( b );
        }
        return std::make_pair( first.equa_set_from( firsts ), second.equa_set_from( seconds ) );
    }

    template <typename FirstPath, typename SecondPath, typename ThirdPath, typename Element = T> requires triple_like<Element>
    [[ nodiscard ]] auto unzip3( FirstPath const & first, SecondPath const & second, ThirdPath const & third ) const
    {
        std::vector<typename FirstPath ::value_type> firsts;
        std::vector<typename SecondPath::value_type> seconds;
        std::vector<typename ThirdPath ::value_type> thirds;
        for ( auto const & [ a, b, c ] : *this )
        {
            firsts .push_back( a );
            seconds.push_back( b );
            thirds .push_back( c );
        }
        return std::make_tuple( first.equa_set_from( firsts ), second.equa_set_from( seconds ), third.equa_set_from( thirds ) );
    }

    [[ nodiscard ]] subsets_range<Derived> subsets(                    ) const { return { self(), std::nullopt }; }
    [[ nodiscard ]] subsets_range<Derived> subsets( size_type const n ) const { return { self(), n            }; }

    /// Same elements in the same iteration order, compared by the policy.
    template <element_range<T> Range>
    [[ nodiscard ]] bool same_elements( Range const & other ) const
    {
        auto       mine  { begin() };
        auto       theirs{ std::ranges::begin( other ) };
        auto const stop  { std::ranges::end  ( other ) };
        for ( ; mine != end() && theirs != stop; ++mine, ++theirs )
            if ( !policy_->are_equal( *mine, *theirs ) )
                return false;
        return ( mine == end() ) && ( theirs == stop );
    }
    template <equa_collection_of<T> Other>
    [[ nodiscard ]] bool same_elements( Other const & other ) const
    {
        return same_elements( other.to_vector() );
    }

    template <typename F>
    void for_each( F && f ) const { for ( auto const & element : *this ) f( element ); }

    //--------------------------------------------------------------------------
    // Printing
    //--------------------------------------------------------------------------

    [[ nodiscard ]] std::string mk_string( std::string_view const start, std::string_view const separator, std::string_view const stop ) const
    {
        return join( *this, start, separator, stop );
    }
    [[ nodiscard ]] std::string mk_string( std::string_view const separator ) const { return mk_string( {}, separator, {} ); }
    [[ nodiscard ]] std::string mk_string(                                  ) const { return mk_string( {}, {}       , {} ); }

    [[ nodiscard ]] std::string to_string() const { return mk_string( std::string{ string_prefix() } + '(', ", ", ")" ); }

    friend std::ostream & operator<<( std::ostream & out, Derived const & set ) { return out << set.to_string(); }

    /// Appends to builder and returns it.
    std::string & add_string( std::string & builder                                                                                                     ) const { return builder += mk_string(); }
    std::string & add_string( std::string & builder,                                    std::string_view const separator                                 ) const { return builder += mk_string( separator ); }
    std::string & add_string( std::string & builder, std::string_view const start, std::string_view const separator, std::string_view const stop ) const { return builder += mk_string( start, separator, stop ); }

    //--------------------------------------------------------------------------
    // Conversions
    //--------------------------------------------------------------------------

    [[ nodiscard ]] std::vector<T> to_vector() const { return { begin(), end() }; }
    [[ nodiscard ]] std::list  <T> to_list  () const { return { begin(), end() }; }
    [[ nodiscard ]] std::deque <T> to_deque () const { return { begin(), end() }; }

    /// Native (policy-less) set: may collapse or keep elements differently!
    [[ nodiscard ]] std::unordered_set<T, boost::hash<T>> to_set() const { return { begin(), end() }; }

    template <typename Element = T> requires pair_like<Element>
    [[ nodiscard ]] auto to_map() const
    {
        using key_t    = typename Element::first_type;
        using mapped_t = typename Element::second_type;
        std::unordered_map<key_t, mapped_t, boost::hash<key_t>> result;
        for ( auto const & [ key, value ] : *this )
            result.insert_or_assign( key, value );
        return result;
    }

    [[ nodiscard ]] std::vector<equa_box<T>> to_equa_box_vector() const { return to_boxes<std::vector<equa_box<T>>>(); }
    [[ nodiscard ]] std::list  <equa_box<T>> to_equa_box_list  () const { return to_boxes<std::list  <equa_box<T>>>(); }
    [[ nodiscard ]] std::unordered_set<equa_box<T>> to_equa_box_set() const
    {
        std::unordered_set<equa_box<T>> result;
        for ( auto const & element : *this )
            result.emplace( element, policy_ );
        return result;
    }

    /// Boxes at most length elements into target[ start... ], bounded by the
    /// target's extent. Returns the number of boxes written.
    size_type copy_to_array( std::span<equa_box<T>> const target, size_type const start = 0, size_type const length = std::numeric_limits<size_type>::max() ) const
    {
        if ( start >= target.size() )
            return 0;
        auto const count{ std::min( { length, size(), target.size() - start } ) };
        auto       pos  { begin() };
        for ( size_type i{ 0 }; i < count; ++i, ++pos )
            target[ start + i ] = equa_box<T>{ *pos, policy_ };
        return count;
    }

    /// Appends a box for every element.
    template <typename Buffer>
    void copy_to_buffer( Buffer & buffer ) const
    {
        for ( auto const & element : *this )
            buffer.emplace_back( element, policy_ );
    }

    /// Lazy view over a snapshot of the elements.
    [[ nodiscard ]] auto view   () const { return Derived::view_type::from_vector( to_vector() ); }
    [[ nodiscard ]] auto to_lazy() const { return view(); }

    /// Transforming bridge into a (possibly differently typed) target path.
    template <typename TargetPath>
    [[ nodiscard ]] equa_bridge<Derived, TargetPath> into( TargetPath const & target ) const { return { self(), target }; }

    //--------------------------------------------------------------------------
    // Equality
    //--------------------------------------------------------------------------

    template <typename Other>
    [[ nodiscard ]] bool can_equal( Other const & other ) const noexcept
    {
        if constexpr ( equa_collection_of<Other, T> )
            return other.path_id() == path_id();
        else
            return false;
    }

    /// Order independent (consistent with operator== across variants).
    [[ nodiscard ]] std::size_t hash_code() const
    {
        std::size_t hash{ 0 };
        for ( auto const & element : *this )
            hash += policy_->hash_code( element );
        return hash;
    }

    template <equa_collection_of<T> Other>
    [[ nodiscard ]] friend bool operator==( Derived const & left, Other const & right )
    {
        return left.can_equal( right ) && ( left.size() == right.size() ) && left.forall( [ & ]( T const & element ) { return right.contains( element ); } );
    }

    friend std::size_t hash_value( Derived const & set ) { return set.hash_code(); }

protected:
    explicit equa_set_impl( policy_ptr_type policy )
        : policy_{ std::move( policy ) }, storage_{ Derived::make_storage( *policy_ ) }
    {}

    template <typename Range>
    [[ nodiscard ]] static Derived build( policy_ptr_type policy, Range && elements )
    {
        BOOST_ASSERT( policy );
        Derived result{ std::move( policy ) };
        for ( auto && element : elements )
            result.insert_element( T( element ) );
        return result;
    }

    [[ nodiscard ]] Derived make_empty() const { return Derived{ policy_ }; }

    [[ nodiscard ]] Storage const & storage_view() const noexcept { return storage_; }

    bool insert_element( T const & value ) { return Derived::storage_insert( storage_, value ); }
    bool insert_element( T &&      value ) { return Derived::storage_insert( storage_, std::move( value ) ); }
    void erase_element ( T const & value ) { Derived::storage_erase( storage_, value ); }

private:
    [[ nodiscard ]] Derived const & self() const noexcept { return static_cast<Derived const &>( *this ); }

    [[ nodiscard ]] difference_type ssize() const noexcept { return static_cast<difference_type>( size() ); }
    [[ nodiscard ]] difference_type clamp_position( difference_type const n ) const noexcept { return std::clamp<difference_type>( n, 0, ssize() ); }

    template <typename Pred>
    [[ nodiscard ]] difference_type prefix_length( Pred & pred ) const
    {
        return static_cast<difference_type>( std::distance( begin(), std::find_if_not( begin(), end(), pred ) ) );
    }

    [[ nodiscard ]] std::vector<T const *> element_pointers() const
    {
        std::vector<T const *> pointers;
        pointers.reserve( size() );
        for ( auto const & element : *this )
            pointers.push_back( &element );
        return pointers;
    }

    template <typename Container>
    [[ nodiscard ]] Container to_boxes() const
    {
        Container result;
        for ( auto const & element : *this )
            result.emplace_back( element, policy_ );
        return result;
    }

    template <typename Other>
    void require_same_path( Other const & other, char const * const operation ) const
    {
        if ( !can_equal( other ) )
            throw_incompatible_paths( operation );
    }

    policy_ptr_type policy_;
    Storage         storage_;
}; // class equa_set_impl

//------------------------------------------------------------------------------
} // namespace psi::equa::detail
//------------------------------------------------------------------------------
