////////////////////////////////////////////////////////////////////////////////
/// psi::equa::equa_bridge - element-transforming operations from a set into
/// another path.
///
/// Sets deliberately lack map/flat_map: a transform may merge elements that
/// the source policy kept apart (or vice versa), so its result must be
/// deduplicated under a policy named by the caller:
///   source.into( target_path ).map( f )
/// The result is a set of the source's variant family (hash sources give
/// hash sets, sorted sources sorted sets) minted by the target path.
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
#include "lazy_view.hpp"

#include <optional>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

template <typename Source, typename TargetPath>
class equa_bridge
{
public:
    using source_value_type = typename Source    ::value_type;
    using target_value_type = typename TargetPath::value_type;
    using result_type       = typename Source::template rebind<target_value_type>;

    equa_bridge( Source source, TargetPath target ) : source_{ std::move( source ) }, target_{ std::move( target ) } {}

    template <typename F>
    [[ nodiscard ]] result_type map( F transform ) const
    {
        std::vector<target_value_type> mapped;
        mapped.reserve( source_.size() );
        for ( auto const & element : source_ )
            mapped.emplace_back( transform( element ) );
        return mint( mapped );
    }

    /// transform may return a view, an equa collection or any range.
    template <typename F>
    [[ nodiscard ]] result_type flat_map( F transform ) const
    {
        std::vector<target_value_type> flattened;
        for ( auto const & element : source_ )
            append( flattened, transform( element ) );
        return mint( flattened );
    }

    /// partial returns std::optional; disengaged results are skipped.
    template <typename F>
    [[ nodiscard ]] result_type collect( F partial ) const
    {
        std::vector<target_value_type> collected;
        for ( auto const & element : source_ )
            if ( auto value{ partial( element ) } )
                collected.emplace_back( std::move( *value ) );
        return mint( collected );
    }

    /// Narrows the source; the returned bridge still targets the same path.
    template <typename Pred>
    [[ nodiscard ]] equa_bridge filter     ( Pred pred ) const { return { source_.filter( std::move( pred ) ), target_ }; }
    template <typename Pred>
    [[ nodiscard ]] equa_bridge with_filter( Pred pred ) const { return filter( std::move( pred ) ); }

    template <typename Op>
    [[ nodiscard ]] result_type scan_left( target_value_type zero, Op op ) const
    {
        std::vector<target_value_type> scanned{ std::move( zero ) };
        for ( auto const & element : source_ )
            scanned.push_back( op( scanned.back(), element ) );
        return mint( scanned );
    }

    template <typename Op>
    [[ nodiscard ]] result_type scan_right( target_value_type zero, Op op ) const
    {
        auto const elements{ source_.to_vector() };
        std::vector<target_value_type> scanned{ std::move( zero ) };
        for ( auto pos{ elements.rbegin() }; pos != elements.rend(); ++pos )
            scanned.push_back( op( *pos, scanned.back() ) );
        return mint( std::vector<target_value_type>( scanned.rbegin(), scanned.rend() ) );
    }

    /// For sources whose elements are themselves collections of the target
    /// element type.
    [[ nodiscard ]] result_type flatten() const
    {
        std::vector<target_value_type> flattened;
        for ( auto const & element : source_ )
            append( flattened, element );
        return mint( flattened );
    }

private:
    template <typename Produced>
    static void append( std::vector<target_value_type> & out, Produced const & produced )
    {
        for ( auto & element : detail::produced_elements<target_value_type>( produced ) )
            out.push_back( std::move( element ) );
    }

    [[ nodiscard ]] result_type mint( std::vector<target_value_type> const & elements ) const { return result_type::mint( target_, elements ); }

    Source     source_;
    TargetPath target_;
}; // class equa_bridge

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
