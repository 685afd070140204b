////////////////////////////////////////////////////////////////////////////////
/// Element printing for the textual forms of collections and views:
/// pairs and tuples print as "(a,b)", everything else through operator<<.
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

#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::equa::detail
{
//------------------------------------------------------------------------------

template <typename    T      > void print_element( std::ostream &, T                 const & );
template <typename A, typename B> void print_element( std::ostream &, std::pair<A, B>   const & );
template <typename... Ts       > void print_element( std::ostream &, std::tuple<Ts...> const & );

template <typename T>
void print_element( std::ostream & out, T const & value ) { out << value; }

template <typename A, typename B>
void print_element( std::ostream & out, std::pair<A, B> const & value )
{
    out << '(';
    print_element( out, value.first );
    out << ',';
    print_element( out, value.second );
    out << ')';
}

template <typename... Ts>
void print_element( std::ostream & out, std::tuple<Ts...> const & value )
{
    out << '(';
    std::apply
    (
        [ &out ]( auto const &... members )
        {
            std::size_t index{ 0 };
            ( ( out << ( index++ ? "," : "" ), print_element( out, members ) ), ... );
        },
        value
    );
    out << ')';
}

/// start + elements joined by separator + stop
template <typename Range>
[[ nodiscard ]] std::string join( Range const & elements, std::string_view const start, std::string_view const separator, std::string_view const stop )
{
    std::ostringstream out;
    out << start;
    bool first{ true };
    for ( auto const & element : elements )
    {
        if ( !first )
            out << separator;
        print_element( out, element );
        first = false;
    }
    out << stop;
    return std::move( out ).str();
}

//------------------------------------------------------------------------------
} // namespace psi::equa::detail
//------------------------------------------------------------------------------
