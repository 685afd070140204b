////////////////////////////////////////////////////////////////////////////////
/// psi::equa equa_set / fast_equa_set (hash variants) test suite
////////////////////////////////////////////////////////////////////////////////

#include "string_normalizations.hpp"

#include <psi/equa/collections.hpp>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

namespace
{
    collections<std::string> const & lower() { static collections<std::string> const path{ test::case_insensitive() }; return path; }
    collections<std::string> const & trim () { static collections<std::string> const path{ test::trimming        () }; return path; }
    collections<int>         const & ints () { static collections<int>         const path{ collections<int>::native() }; return path; }

    /// Parses "Prefix(a, b, c)" back into its elements.
    std::multiset<std::string> printed_elements( std::string_view const printed, std::string_view const prefix )
    {
        EXPECT_TRUE( printed.starts_with( prefix ) );
        EXPECT_TRUE( printed.ends_with  ( ")"    ) );
        std::string const body{ printed.substr( prefix.size() + 1, printed.size() - prefix.size() - 2 ) };
        std::multiset<std::string> elements;
        if ( body.empty() )
            return elements;
        std::vector<std::string> parts;
        boost::algorithm::split( parts, body, boost::algorithm::is_any_of( "," ) );
        for ( auto & part : parts )
            elements.insert( test::trimmed()( part ) );
        return elements;
    }
} // anonymous namespace

//==============================================================================
// Construction & membership
//==============================================================================

TEST( equa_set, construction_dedups_under_the_policy )
{
    auto const words{ lower().equa_set_of( "one", "two", "two", "three", "Three" ) };
    EXPECT_EQ( words.size(), 3 );
    EXPECT_TRUE( words.contains( "THREE" ) );
    EXPECT_TRUE( words( "One" ) );
    EXPECT_FALSE( words.contains( "four" ) );

    auto const native{ collections<std::string>::native().equa_set_of( "one", "two", "two", "three", "Three" ) };
    EXPECT_EQ( native.size(), 4 );
}

TEST( equa_set, membership_respects_the_policy )
{
    auto const set{ lower().equa_set_of( "Hi", "there" ) };
    for ( auto const & [ x, y ] : std::vector<std::pair<std::string, std::string>>{ { "hi", "HI" }, { "THERE", "tHeRe" }, { "no", "NO" } } )
        EXPECT_EQ( set.contains( x ), set.contains( y ) );
}

TEST( equa_set, empty_and_from_range )
{
    auto const empty{ lower().empty_equa_set() };
    EXPECT_TRUE ( empty.empty() );
    EXPECT_FALSE( empty.non_empty() );
    EXPECT_EQ   ( empty.size(), 0 );

    std::vector<std::string> const source{ "a", "A", "b" };
    auto const set{ lower().equa_set_from( source ) };
    EXPECT_EQ( set.size(), 2 );
    EXPECT_EQ( set, lower().equa_set_of( "a", "b" ) );
}

TEST( fast_equa_set, keeps_insertion_order_and_first_wins )
{
    auto const set{ lower().fast_equa_set_of( "Hi", "there", "hi", "HI", "you" ) };
    EXPECT_EQ( set.to_vector(), ( std::vector<std::string>{ "Hi", "there", "you" } ) );

    auto const plussed{ set.plus( "THERE" ).plus( "now" ) };
    EXPECT_EQ( plussed.to_vector(), ( std::vector<std::string>{ "Hi", "there", "you", "now" } ) );
}

TEST( equa_set, first_wins_on_construction_and_plus )
{
    auto const set{ lower().equa_set_of( "Hi", "hI" ) };
    ASSERT_EQ( set.size(), 1 );
    EXPECT_EQ( set.head(), "Hi" );
    EXPECT_EQ( set.plus( "HI" ).head(), "Hi" );
}

//==============================================================================
// Element algebra
//==============================================================================

TEST( equa_set, plus_and_minus )
{
    auto const set{ lower().equa_set_of( "a", "b" ) };
    EXPECT_EQ( set.plus( "C" ), lower().equa_set_of( "a", "b", "c" ) );
    EXPECT_EQ( set + "B", set );
    EXPECT_EQ( set.plus( "c", "d", std::string{ "E" } ).size(), 5 );

    EXPECT_EQ( set.minus( "A" ), lower().equa_set_of( "b" ) );
    EXPECT_EQ( set - "z", set );
    EXPECT_TRUE( set.minus( "A", "B" ).empty() );
}

TEST( equa_set, concat_and_remove_all )
{
    auto const set{ lower().fast_equa_set_of( "a" ) };
    std::vector<std::string> const more{ "B", "c", "A" };
    EXPECT_EQ( set.concat( more ).to_vector(), ( std::vector<std::string>{ "a", "B", "c" } ) );
    EXPECT_EQ( set.concat( lower().equa_set_of( "x" ) ).size(), 2 );

    auto const full{ set.concat( more ) };
    EXPECT_EQ( full.remove_all( std::vector<std::string>{ "b", "C" } ).to_vector(), std::vector<std::string>{ "a" } );
    EXPECT_TRUE( full.remove_all( lower().equa_set_of( "A", "b", "c" ) ).empty() );
}

//==============================================================================
// Set algebra
//==============================================================================

TEST( equa_set, diff_of_case_variants_is_empty )
{
    auto const result{ lower().equa_set_of( "hi", "ho" ).diff( lower().equa_set_of( "HI", "HO" ) ) };
    static_assert( std::is_same_v<decltype( result ), equa_set<std::string> const> );
    EXPECT_TRUE( result.empty() );
    EXPECT_EQ  ( result.path_id(), lower().path_id() );
    EXPECT_EQ  ( result, lower().empty_equa_set() );
}

TEST( equa_set, diff_keeps_elements_missing_from_the_other_set )
{
    auto const left { lower().equa_set_of( "hi", "ho", "let's", "go" ) };
    auto const right{ lower().equa_set_of( "bo", "no", "go", "ho" ) };
    EXPECT_EQ( left.diff( right ), lower().equa_set_of( "hi", "let's" ) );
    EXPECT_EQ( left - right      , lower().equa_set_of( "hi", "let's" ) );

    for ( std::string const x : { "hi", "HO", "go", "bo", "zzz" } )
        EXPECT_EQ( ( left - right ).contains( x ), left.contains( x ) && !right.contains( x ) );
}

TEST( equa_set, union_and_intersect )
{
    auto const a{ lower().equa_set_of( "a", "b", "c" ) };
    auto const b{ lower().fast_equa_set_of( "B", "C", "d" ) };

    EXPECT_EQ( a.union_with( b ), b.union_with( a ) );
    EXPECT_EQ( ( a | b ).size(), 4 );

    auto const common{ a & b };
    EXPECT_EQ( common, lower().equa_set_of( "b", "c" ) );
    EXPECT_TRUE( common.subset_of( a ) );
    EXPECT_TRUE( common.subset_of( b ) );
    EXPECT_FALSE( a.subset_of( b ) );
}

TEST( equa_set, algebra_across_paths_throws )
{
    collections<std::string> const other{ test::lower_cased().to_hashing_equality() };
    auto const mine  { lower().equa_set_of( "hi" ) };
    auto const theirs{ other  .equa_set_of( "hi" ) };

    EXPECT_THROW( std::ignore = mine.diff      ( theirs ), incompatible_paths );
    EXPECT_THROW( std::ignore = mine.union_with( theirs ), incompatible_paths );
    EXPECT_THROW( std::ignore = mine.intersect ( theirs ), incompatible_paths );
    EXPECT_THROW( std::ignore = mine.concat    ( theirs ), incompatible_paths );
    EXPECT_THROW( std::ignore = mine.remove_all( theirs ), incompatible_paths );
    EXPECT_THROW( std::ignore = mine.subset_of ( theirs ), incompatible_paths );

    // comparisons never throw
    EXPECT_FALSE( mine.can_equal( theirs ) );
    EXPECT_FALSE( theirs.can_equal( mine ) );
    EXPECT_FALSE( mine == theirs );
    EXPECT_TRUE ( mine != theirs );
}

TEST( equa_set, can_equal_is_symmetric_across_variants )
{
    auto const hashed{ lower().equa_set_of( "x" ) };
    auto const fast  { lower().fast_equa_set_of( "x" ) };
    EXPECT_TRUE( hashed.can_equal( fast ) );
    EXPECT_TRUE( fast.can_equal( hashed ) );
    EXPECT_EQ  ( hashed, fast );

    EXPECT_FALSE( hashed.can_equal( 3 ) );
    EXPECT_FALSE( hashed.can_equal( ints().equa_set_of( 1 ) ) );
}

TEST( equa_set, equality_ignores_iteration_order )
{
    auto const forward { lower().fast_equa_set_of( "a", "b", "c" ) };
    auto const backward{ lower().fast_equa_set_of( "C", "B", "A" ) };
    EXPECT_EQ( forward, backward );
    EXPECT_EQ( forward.hash_code(), backward.hash_code() );
    EXPECT_EQ( forward.hash_code(), lower().equa_set_of( "b", "a", "c" ).hash_code() );
    EXPECT_NE( forward, lower().fast_equa_set_of( "a", "b" ) );
}

//==============================================================================
// Selection
//==============================================================================

TEST( equa_set, predicates_and_filters )
{
    auto const numbers{ ints().fast_equa_set_of( 1, 2, 3, 4, 5, 6 ) };
    auto const even{ []( int const x ) { return x % 2 == 0; } };

    EXPECT_EQ  ( numbers.count( even ), 3 );
    EXPECT_TRUE( numbers.exists( []( int const x ) { return x > 5; } ) );
    EXPECT_TRUE( numbers.forall( []( int const x ) { return x > 0; } ) );
    EXPECT_EQ  ( numbers.find( even ), 2 );
    EXPECT_EQ  ( numbers.find( []( int const x ) { return x > 6; } ), std::nullopt );

    EXPECT_EQ( numbers.filter    ( even ).to_vector(), ( std::vector<int>{ 2, 4, 6 } ) );
    EXPECT_EQ( numbers.filter_not( even ).to_vector(), ( std::vector<int>{ 1, 3, 5 } ) );

    auto const [ evens, odds ]{ numbers.partition( even ) };
    EXPECT_EQ( evens, ints().equa_set_of( 2, 4, 6 ) );
    EXPECT_EQ( odds , ints().equa_set_of( 1, 3, 5 ) );
}

TEST( fast_equa_set, positional_operations )
{
    auto const numbers{ ints().fast_equa_set_of( 1, 2, 5, 3, 4 ) };
    using v = std::vector<int>;

    EXPECT_EQ( numbers.take      ( 2 ).to_vector(), ( v{ 1, 2 } ) );
    EXPECT_EQ( numbers.drop      ( 2 ).to_vector(), ( v{ 5, 3, 4 } ) );
    EXPECT_EQ( numbers.take_right( 2 ).to_vector(), ( v{ 3, 4 } ) );
    EXPECT_EQ( numbers.drop_right( 2 ).to_vector(), ( v{ 1, 2, 5 } ) );
    EXPECT_EQ( numbers.slice( 1, 3 ).to_vector(), ( v{ 2, 5 } ) );
    EXPECT_EQ( numbers.take( 10 ), numbers );
    EXPECT_TRUE( numbers.drop( 10 ).empty() );
    EXPECT_EQ( numbers.drop( -1 ), numbers );
    EXPECT_TRUE( numbers.slice( 3, 1 ).empty() );

    auto const [ front, back ]{ numbers.split_at( 3 ) };
    EXPECT_EQ( front.to_vector(), ( v{ 1, 2, 5 } ) );
    EXPECT_EQ( back .to_vector(), ( v{ 3, 4 } ) );

    auto const small{ []( int const x ) { return x < 3; } };
    EXPECT_EQ( numbers.take_while( small ).to_vector(), ( v{ 1, 2 } ) );
    EXPECT_EQ( numbers.drop_while( small ).to_vector(), ( v{ 5, 3, 4 } ) );
    auto const [ prefix, rest ]{ numbers.span( small ) };
    EXPECT_EQ( prefix.size(), 2 );
    EXPECT_EQ( rest  .size(), 3 );

    EXPECT_EQ( numbers.head(), 1 );
    EXPECT_EQ( numbers.last(), 4 );
    EXPECT_EQ( numbers.head_option(), 1 );
    EXPECT_EQ( numbers.last_option(), 4 );
    EXPECT_EQ( numbers.tail().to_vector(), ( v{ 2, 5, 3, 4 } ) );
    EXPECT_EQ( numbers.init().to_vector(), ( v{ 1, 2, 5, 3 } ) );
}

TEST( fast_equa_set, inits_and_tails )
{
    auto const pair{ ints().fast_equa_set_of( 1, 2 ) };

    auto const tails{ pair.tails() };
    ASSERT_EQ( tails.size(), 3 );
    EXPECT_EQ( tails[ 0 ], pair );
    EXPECT_EQ( tails[ 1 ], ints().equa_set_of( 2 ) );
    EXPECT_TRUE( tails[ 2 ].empty() );

    auto const inits{ pair.inits() };
    ASSERT_EQ( inits.size(), 3 );
    EXPECT_EQ( inits[ 0 ], pair );
    EXPECT_EQ( inits[ 1 ], ints().equa_set_of( 1 ) );
    EXPECT_TRUE( inits[ 2 ].empty() );
}

TEST( equa_set, element_access_on_empty_throws )
{
    auto const empty{ ints().empty_equa_set() };
    EXPECT_THROW( std::ignore = empty.head(), std::out_of_range );
    EXPECT_THROW( std::ignore = empty.last(), std::out_of_range );
    EXPECT_THROW( std::ignore = empty.tail(), std::out_of_range );
    EXPECT_THROW( std::ignore = empty.init(), std::out_of_range );
    EXPECT_THROW( std::ignore = empty.min (), std::out_of_range );
    EXPECT_THROW( std::ignore = empty.max (), std::out_of_range );
    EXPECT_THROW( std::ignore = empty.reduce( std::plus<>{} ), std::out_of_range );
    EXPECT_EQ( empty.head_option(), std::nullopt );
    EXPECT_EQ( empty.reduce_option( std::plus<>{} ), std::nullopt );
}

//==============================================================================
// Windows
//==============================================================================

TEST( equa_set, grouped_yields_ceil_n_over_size_groups )
{
    auto const three{ lower().fast_equa_set_of( "a", "b", "c" ) };
    auto const groups{ three.grouped( 2 ) };
    ASSERT_EQ( groups.size(), 2 );
    EXPECT_EQ( groups[ 0 ].size(), 2 );
    EXPECT_EQ( groups[ 1 ].size(), 1 );
    EXPECT_EQ( groups[ 1 ], lower().equa_set_of( "C" ) );

    EXPECT_EQ( lower().equa_set_of( "a", "b", "c" ).grouped( 2 ).size(), 2 );
    EXPECT_EQ( three.grouped( 3 ).size(), 1 );
    EXPECT_EQ( three.grouped( 5 ).size(), 1 );
    EXPECT_TRUE( lower().empty_equa_set().grouped( 2 ).empty() );
}

TEST( equa_set, non_positive_window_size_is_rejected )
{
    auto const three{ lower().equa_set_of( "a", "b", "c" ) };
    EXPECT_THROW( std::ignore = three.grouped(  0 ), std::invalid_argument );
    EXPECT_THROW( std::ignore = three.grouped( -1 ), std::invalid_argument );
    EXPECT_THROW( std::ignore = three.sliding(  0 ), std::invalid_argument );
    EXPECT_THROW( std::ignore = three.sliding( 2, 0 ), std::invalid_argument );
}

TEST( fast_equa_set, sliding_windows )
{
    auto const numbers{ ints().fast_equa_set_of( 1, 2, 3, 4, 5 ) };
    using v = std::vector<int>;

    auto const pairs{ numbers.sliding( 2 ) };
    ASSERT_EQ( pairs.size(), 4 );
    EXPECT_EQ( pairs[ 0 ].to_vector(), ( v{ 1, 2 } ) );
    EXPECT_EQ( pairs[ 3 ].to_vector(), ( v{ 4, 5 } ) );

    auto const strided{ numbers.sliding( 2, 3 ) };
    ASSERT_EQ( strided.size(), 2 );
    EXPECT_EQ( strided[ 0 ].to_vector(), ( v{ 1, 2 } ) );
    EXPECT_EQ( strided[ 1 ].to_vector(), ( v{ 4, 5 } ) );

    auto const sparse{ numbers.sliding( 1, 3 ) };
    ASSERT_EQ( sparse.size(), 2 );
    EXPECT_EQ( sparse[ 1 ].to_vector(), v{ 4 } );

    auto const wide{ ints().fast_equa_set_of( 1, 2 ).sliding( 3 ) };
    ASSERT_EQ( wide.size(), 1 );
    EXPECT_EQ( wide[ 0 ].to_vector(), ( v{ 1, 2 } ) );
}

//==============================================================================
// Folds
//==============================================================================

TEST( fast_equa_set, folds_and_reductions )
{
    auto const numbers{ ints().fast_equa_set_of( 1, 2, 3 ) };

    EXPECT_EQ( numbers.fold_left ( std::string{}, []( std::string acc, int const x ) { return acc + std::to_string( x ); } ), "123" );
    EXPECT_EQ( numbers.fold_right( std::string{}, []( int const x, std::string acc ) { return acc + std::to_string( x ); } ), "321" );
    EXPECT_EQ( numbers.fold( 10, std::plus<>{} ), 16 );
    EXPECT_EQ( numbers.aggregate( 0, std::plus<>{}, std::plus<>{} ), 6 );

    EXPECT_EQ( numbers.reduce_left ( std::minus<>{} ), -4 );
    EXPECT_EQ( numbers.reduce_right( std::minus<>{} ),  2 );
    EXPECT_EQ( numbers.reduce( std::plus<>{} ), 6 );
    EXPECT_EQ( numbers.reduce_left_option ( std::minus<>{} ), -4 );
    EXPECT_EQ( numbers.reduce_right_option( std::minus<>{} ),  2 );

    EXPECT_EQ( numbers.sum    (), 6 );
    EXPECT_EQ( numbers.product(), 6 );
    EXPECT_EQ( numbers.min    (), 1 );
    EXPECT_EQ( numbers.max    (), 3 );
    EXPECT_EQ( numbers.max( std::greater<>{} ), 1 );
}

TEST( equa_set, min_by_and_max_by )
{
    auto const words{ lower().equa_set_of( "aaa", "b", "cc" ) };
    auto const length{ []( std::string const & s ) { return s.size(); } };
    EXPECT_EQ( words.min_by( length ), "b"   );
    EXPECT_EQ( words.max_by( length ), "aaa" );
}

//==============================================================================
// Grouping & combinatorics
//==============================================================================

TEST( equa_set, group_by_keeps_the_path )
{
    auto const words{ lower().equa_set_of( "a", "bb", "CC", "dd", "e" ) };
    auto const by_length{ words.group_by( []( std::string const & s ) { return s.size(); } ) };
    ASSERT_EQ( by_length.size(), 2 );
    EXPECT_EQ( by_length.at( 1 ), lower().equa_set_of( "A", "E" ) );
    EXPECT_EQ( by_length.at( 2 ).size(), 3 );
    EXPECT_EQ( by_length.at( 2 ).path_id(), lower().path_id() );
}

TEST( equa_set, subsets_of_three_elements )
{
    auto const three{ lower().equa_set_of( "a", "b", "c" ) };

    auto all{ three.subsets().to_vector() };
    ASSERT_EQ( all.size(), 8 );
    std::set<std::size_t> sizes;
    for ( std::size_t i{ 0 }; i < all.size(); ++i )
    {
        sizes.insert( all[ i ].size() );
        for ( std::size_t j{ i + 1 }; j < all.size(); ++j )
            EXPECT_NE( all[ i ], all[ j ] );
        EXPECT_TRUE( all[ i ].subset_of( three ) );
    }
    EXPECT_EQ( sizes, ( std::set<std::size_t>{ 0, 1, 2, 3 } ) );

    auto pairs{ three.subsets( 2 ).to_vector() };
    ASSERT_EQ( pairs.size(), 3 );
    for ( auto const & pair : pairs )
        EXPECT_EQ( pair.size(), 2 );

    EXPECT_TRUE( three.subsets( 4 ).to_vector().empty() );
}

TEST( equa_set, each_subsets_call_is_an_independent_sequence )
{
    auto const three{ ints().fast_equa_set_of( 1, 2, 3 ) };
    auto first { three.subsets() };
    auto second{ three.subsets() };

    ASSERT_TRUE( first.has_next() );
    EXPECT_TRUE( first.next()->empty() );
    EXPECT_EQ  ( first.next(), ints().equa_set_of( 1 ) );

    std::size_t count{ 0 };
    for ( auto const & subset : second )
    {
        EXPECT_LE( subset.size(), 3 );
        ++count;
    }
    EXPECT_EQ( count, 8 );
    EXPECT_EQ( first.to_vector().size(), 6 );
}

//==============================================================================
// Printing & conversions
//==============================================================================

TEST( equa_set, string_forms )
{
    EXPECT_EQ( lower().fast_equa_set_of( "hi", "ho" ).to_string(), "FastEquaSet(hi, ho)" );
    EXPECT_EQ( lower().equa_set_of( "hi" ).to_string(), "EquaSet(hi)" );
    EXPECT_EQ( lower().empty_equa_set().to_string(), "EquaSet()" );
    EXPECT_EQ( equa_set<int>::string_prefix(), "EquaSet" );

    auto const set{ lower().equa_set_of( "hi", "ho", "Hi" ) };
    EXPECT_EQ( printed_elements( set.to_string(), "EquaSet" ), ( std::multiset<std::string>{ "hi", "ho" } ) );

    auto const numbers{ ints().fast_equa_set_of( 1, 2, 3 ) };
    EXPECT_EQ( numbers.mk_string(), "123" );
    EXPECT_EQ( numbers.mk_string( "-" ), "1-2-3" );
    EXPECT_EQ( numbers.mk_string( "<", ",", ">" ), "<1,2,3>" );

    std::ostringstream out;
    out << numbers;
    EXPECT_EQ( out.str(), "FastEquaSet(1, 2, 3)" );
}

TEST( equa_set, conversions )
{
    auto const set{ trim().fast_equa_set_of( "a", " a", "b " ) };
    ASSERT_EQ( set.size(), 2 );

    EXPECT_EQ( set.to_vector(), ( std::vector<std::string>{ "a", "b " } ) );
    EXPECT_EQ( set.to_list  ().size(), 2 );
    EXPECT_EQ( set.to_deque ().back(), "b " );
    EXPECT_EQ( set.to_set   (), ( std::unordered_set<std::string, boost::hash<std::string>>{ "a", "b " } ) );

    auto const entries{ collections<std::pair<int, std::string>>::native().fast_equa_set_of( std::pair{ 1, std::string{ "one" } }, std::pair{ 2, std::string{ "two" } } ) };
    auto const map{ entries.to_map() };
    EXPECT_EQ( map.size(), 2 );
    EXPECT_EQ( map.at( 2 ), "two" );
}

TEST( equa_set, boxed_conversions_round_trip )
{
    auto const set{ lower().equa_set_of( "Hi", "there", "HI" ) };

    auto const boxes{ set.to_equa_box_vector() };
    ASSERT_EQ( boxes.size(), set.size() );
    std::unordered_set<std::string, boost::hash<std::string>> values;
    for ( auto const & box : boxes )
    {
        EXPECT_EQ( box.path_id(), set.path_id() );
        values.insert( box.value() );
    }
    EXPECT_EQ( values, set.to_set() );

    EXPECT_EQ( set.to_equa_box_list().size(), 2 );
    auto const box_set{ set.to_equa_box_set() };
    EXPECT_EQ( box_set.size(), 2 );
    EXPECT_TRUE( box_set.contains( lower().box( "THERE" ) ) );

    std::vector<std::string> unboxed;
    for ( auto const & box : boxes )
        unboxed.push_back( box.value() );
    EXPECT_EQ( lower().equa_set_from( unboxed ), set );
}

TEST( fast_equa_set, add_string_appends_to_the_builder )
{
    auto const numbers{ ints().fast_equa_set_of( 1, 2, 3 ) };

    std::string builder{ "> " };
    EXPECT_EQ( &numbers.add_string( builder ), &builder );
    EXPECT_EQ( builder, "> 123" );

    builder.clear();
    EXPECT_EQ( numbers.add_string( builder, "#" ), "1#2#3" );
    builder.clear();
    EXPECT_EQ( numbers.add_string( builder, "<", "#", ">" ), "<1#2#3>" );
    EXPECT_EQ( lower().equa_set_of( "hi" ).add_string( builder, "#" ), "<1#2#3>hi" );
}

TEST( fast_equa_set, copy_to_array_is_bounded_by_the_target )
{
    auto const set{ ints().fast_equa_set_of( 1, 2, 3, 4, 5 ) };
    auto const values
    {
        []( std::vector<equa_box<int>> const & boxes )
        {
            std::vector<int> result;
            for ( auto const & box : boxes )
                result.push_back( box.value() );
            return result;
        }
    };

    std::vector<equa_box<int>> three( 3, ints().box( -1 ) );
    EXPECT_EQ( set.copy_to_array( three ), 3 );
    EXPECT_EQ( values( three ), ( std::vector<int>{ 1, 2, 3 } ) );
    EXPECT_EQ( three.front().path_id(), set.path_id() );

    std::vector<equa_box<int>> five( 5, ints().box( -1 ) );
    EXPECT_EQ( set.copy_to_array( five, 3 ), 2 );
    EXPECT_EQ( values( five ), ( std::vector<int>{ -1, -1, -1, 1, 2 } ) );

    std::vector<equa_box<int>> window( 5, ints().box( -1 ) );
    EXPECT_EQ( set.copy_to_array( window, 1, 2 ), 2 );
    EXPECT_EQ( values( window ), ( std::vector<int>{ -1, 1, 2, -1, -1 } ) );

    EXPECT_EQ( set.copy_to_array( window, 5 ), 0 );
    EXPECT_EQ( set.copy_to_array( window, 9, 1 ), 0 );
    EXPECT_EQ( values( window ), ( std::vector<int>{ -1, 1, 2, -1, -1 } ) );

    std::vector<equa_box<int>> buffer( 3, ints().box( -1 ) );
    set.copy_to_buffer( buffer );
    EXPECT_EQ( values( buffer ), ( std::vector<int>{ -1, -1, -1, 1, 2, 3, 4, 5 } ) );
}

TEST( fast_equa_set, collect_stays_on_the_path )
{
    auto const letters{ lower().fast_equa_set_of( "a", "b", "c" ) };
    auto const collected
    {
        letters.collect
        (
            []( std::string const & s ) -> std::optional<std::string>
            {
                if ( s == "b" )
                    return std::nullopt;
                return s == "a" ? std::string{ "C" } : s;
            }
        )
    };
    static_assert( std::is_same_v<decltype( collected ), fast_equa_set<std::string> const> );
    ASSERT_EQ( collected.size(), 1 );
    EXPECT_EQ( collected.head(), "C" );
    EXPECT_EQ( collected.path_id(), letters.path_id() );
}

TEST( fast_equa_set, transpose )
{
    static collections<std::vector<int>> const rows_path{ collections<std::vector<int>>::native() };
    auto const rows{ rows_path.fast_equa_set_of( std::vector{ 1, 2, 3 }, std::vector{ 4, 5, 6 }, std::vector{ 7, 8, 9 } ) };
    auto const columns{ rows.transpose() };
    static_assert( std::is_same_v<decltype( columns ), fast_equa_set<std::vector<int>> const> );
    EXPECT_EQ( columns.to_vector(), ( std::vector<std::vector<int>>{ { 1, 4, 7 }, { 2, 5, 8 }, { 3, 6, 9 } } ) );
    EXPECT_EQ( columns.path_id(), rows_path.path_id() );
    EXPECT_TRUE( columns.transpose() == rows );

    EXPECT_TRUE( rows_path.empty_equa_set().transpose().empty() );
    EXPECT_THROW( std::ignore = rows_path.equa_set_of( std::vector{ 1, 2 }, std::vector{ 3 } ).transpose(), std::invalid_argument );
}

TEST( equa_set, unzip_into_target_paths )
{
    auto const entries
    {
        collections<std::pair<int, std::string>>::native().fast_equa_set_of
        (
            std::pair{ 1, std::string{ "one" } }, std::pair{ 2, std::string{ "ONE" } }, std::pair{ 3, std::string{ "two" } }
        )
    };
    auto const [ keys, names ] = entries.unzip( ints(), lower() );
    static_assert( std::is_same_v<std::remove_const_t<decltype( names )>, equa_set<std::string>> );
    EXPECT_EQ( keys, ints().equa_set_of( 1, 2, 3 ) );
    EXPECT_EQ( names.path_id(), lower().path_id() );
    EXPECT_EQ( names, lower().equa_set_of( "one", "TWO" ) );
}

TEST( equa_set, same_elements_and_for_each )
{
    auto const numbers{ ints().fast_equa_set_of( 3, 1, 2 ) };
    EXPECT_TRUE ( numbers.same_elements( std::vector<int>{ 3, 1, 2 } ) );
    EXPECT_FALSE( numbers.same_elements( std::vector<int>{ 1, 2, 3 } ) );
    EXPECT_FALSE( numbers.same_elements( std::vector<int>{ 3, 1 } ) );
    EXPECT_TRUE ( numbers.same_elements( ints().fast_equa_set_of( 3, 1, 2 ) ) );

    int total{ 0 };
    numbers.for_each( [ & ]( int const x ) { total += x; } );
    EXPECT_EQ( total, 6 );
}

TEST( equa_set, sets_nest_through_the_natural_policy )
{
    auto const inner_a{ ints().equa_set_of( 1, 2 ) };
    auto const inner_b{ ints().fast_equa_set_of( 2, 1 ).to_vector() };
    auto const nested{ collections<equa_set<int>>::native().equa_set_of( inner_a, ints().equa_set_from( inner_b ), ints().equa_set_of( 3 ) ) };
    EXPECT_EQ( nested.size(), 2 );
    EXPECT_TRUE( nested.contains( ints().equa_set_of( 2, 1 ) ) );
}

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
