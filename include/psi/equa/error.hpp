////////////////////////////////////////////////////////////////////////////////
/// Error reporting for psi::equa collections.
///
/// All throwing paths funnel through the cold, out-of-line helpers declared
/// here (defined in src/error.cpp) so that the (heavily inlined) collection
/// templates carry no exception construction code.
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

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

/// Raised by binary algebra (union, diff, concat...) between collections that
/// were minted by paths carrying different equality policy objects.
class incompatible_paths : public std::logic_error
{
public:
    using std::logic_error::logic_error;
}; // class incompatible_paths

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range     ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_invalid_argument ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_incompatible_paths( char const * operation );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
