////////////////////////////////////////////////////////////////////////////////
/// psi::equa equality policy test suite
////////////////////////////////////////////////////////////////////////////////

#include "string_normalizations.hpp"

#include <psi/equa/equality.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <initializer_list>
#include <limits>
#include <memory>
#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

namespace
{
    /// Integers compared modulo 10.
    class last_digit final : public ordering_equality<int>
    {
    public:
        bool               are_equal( int const & a, int const & b ) const override { return a % 10 == b % 10; }
        std::size_t        hash_code( int const & a                ) const override { return static_cast<std::size_t>( a % 10 ); }
        std::weak_ordering compare  ( int const & a, int const & b ) const override { return ( a % 10 ) <=> ( b % 10 ); }
    };
} // anonymous namespace

TEST( natural_equality, uses_native_operators )
{
    auto const & policy{ *natural_hashing_equality<std::string>::instance() };
    EXPECT_TRUE ( policy.are_equal( "a", "a" ) );
    EXPECT_FALSE( policy.are_equal( "a", "A" ) );
    EXPECT_EQ   ( policy.hash_code( "abc" ), boost::hash<std::string>{}( "abc" ) );
}

TEST( natural_equality, instance_is_process_wide )
{
    EXPECT_EQ( natural_hashing_equality <int>::instance().get(), natural_hashing_equality <int>::instance().get() );
    EXPECT_EQ( natural_ordering_equality<int>::instance().get(), natural_ordering_equality<int>::instance().get() );
}

TEST( natural_equality, orders_with_spaceship_or_less )
{
    auto const & ints{ *natural_ordering_equality<int>::instance() };
    EXPECT_TRUE( ints.compare( 1, 2 ) < 0 );
    EXPECT_TRUE( ints.compare( 2, 2 ) == 0 );
    EXPECT_TRUE( ints.compare( 3, 2 ) > 0 );

    auto const & pairs{ *natural_ordering_equality<std::pair<int, std::string>>::instance() };
    EXPECT_TRUE( pairs.compare( { 1, "b" }, { 2, "a" } ) < 0 );
    EXPECT_TRUE( pairs.compare( { 1, "b" }, { 1, "a" } ) > 0 );
    EXPECT_TRUE( pairs.are_equal( { 1, "b" }, { 1, "b" } ) );
}

TEST( natural_equality, floating_point_ordering_agrees_with_compare )
{
    auto const nan{ std::numeric_limits<double>::quiet_NaN() };

    auto const & ordered{ *natural_ordering_equality<double>::instance() };
    EXPECT_TRUE( ordered.compare( nan, nan ) == 0 );
    EXPECT_TRUE( ordered.are_equal( nan, nan ) );
    EXPECT_TRUE( ordered.compare( 1.0, nan ) < 0 );
    EXPECT_TRUE( ordered.are_equal( 0.0, -0.0 ) );
    EXPECT_FALSE( ordered.are_equal( 1.0, 2.0 ) );

    auto const & hashed{ *natural_hashing_equality<double>::instance() };
    EXPECT_FALSE( hashed.are_equal( nan, nan ) );
    EXPECT_TRUE ( hashed.are_equal( 0.0, -0.0 ) );
}

TEST( custom_equality, contract_holds_for_user_policy )
{
    last_digit const policy;
    EXPECT_TRUE( policy.are_equal( 13, 23 ) );
    EXPECT_EQ  ( policy.hash_code( 13 ), policy.hash_code( 23 ) );
    EXPECT_TRUE( policy.compare( 13, 23 ) == 0 );
    EXPECT_TRUE( policy.compare( 19, 21 ) > 0 );
}

TEST( custom_equality, normalizing_wrappers_stay_consistent )
{
    auto const policy{ test::trimmed().to_ordering_equality() };
    std::initializer_list<std::pair<std::string, std::string>> const equivalent{ { " a", "a " }, { "b", "  b" }, { "x", "x" } };
    for ( auto const & [ a, b ] : equivalent )
    {
        EXPECT_TRUE( policy->are_equal( a, b ) );
        EXPECT_EQ  ( policy->hash_code( a ), policy->hash_code( b ) );
        EXPECT_TRUE( policy->compare( a, b ) == 0 );
    }
    EXPECT_FALSE( policy->are_equal( "a", "b" ) );
    EXPECT_TRUE ( policy->compare( " a", "b" ) < 0 );
}

TEST( custom_equality, usable_through_base_pointers )
{
    std::shared_ptr<hashing_equality<int> const> const hashing{ std::make_shared<last_digit const>() };
    equality_ptr<int> const plain{ hashing };
    EXPECT_TRUE( plain->are_equal( 5, 105 ) );
    EXPECT_EQ  ( hashing->hash_code( 5 ), hashing->hash_code( 105 ) );
}

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
