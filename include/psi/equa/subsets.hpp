////////////////////////////////////////////////////////////////////////////////
/// psi::equa::subsets_range - lazy power-set / fixed-size combination
/// generator over a snapshot of a set's elements.
///
/// Subsets are produced by increasing size, and within one size as
/// lexicographic combinations of element positions (in the source set's
/// iteration order). Each subset is materialized only when dereferenced.
/// The range is a single-pass generator: iterators share the range's cursor,
/// and every subsets() call on a set creates a new, independent range.
/// The power set has 2^n elements: the cost is exponential by nature.
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

#include <boost/assert.hpp>

#include <cstddef>
#include <iterator>
#include <numeric>
#include <optional>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::equa
{
//------------------------------------------------------------------------------

template <typename Set>
class subsets_range
{
public:
    using value_type = Set;
    using element    = typename Set::value_type;

    class iterator
    {
    public:
        using value_type       = Set;
        using difference_type  = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        iterator() noexcept = default;
        explicit iterator( subsets_range * const range ) noexcept : range_{ range } {}

        [[ nodiscard ]] Set operator*() const { BOOST_ASSERT( range_ && !range_->done_ ); return range_->current(); }

        iterator & operator++() { range_->advance(); return *this; }
        void       operator++( int ) { range_->advance(); }

        [[ nodiscard ]] friend bool operator==( iterator const & it, std::default_sentinel_t ) noexcept { return !it.range_ || !it.range_->has_next(); }

    private:
        subsets_range * range_{ nullptr };
    }; // class iterator

    subsets_range( Set const & source, std::optional<std::size_t> const fixed_size )
        : elements_( source.begin(), source.end() ), empty_{ source.take( 0 ) }
    {
        auto const n{ elements_.size() };
        if ( fixed_size )
        {
            size_     = *fixed_size;
            max_size_ = *fixed_size;
        }
        else
        {
            size_     = 0;
            max_size_ = n;
        }
        done_ = size_ > n;
        reset_positions();
    }

    [[ nodiscard ]] iterator                begin() noexcept { return iterator{ this }; }
    [[ nodiscard ]] std::default_sentinel_t end  () const noexcept { return {}; }

    /// Pulls the next subset (if any).
    [[ nodiscard ]] std::optional<Set> next()
    {
        if ( done_ )
            return std::nullopt;
        std::optional<Set> result{ current() };
        advance();
        return result;
    }

    [[ nodiscard ]] bool has_next() const noexcept { return !done_; }

    /// Drains the remaining subsets.
    [[ nodiscard ]] std::vector<Set> to_vector()
    {
        std::vector<Set> result;
        while ( auto subset{ next() } )
            result.push_back( std::move( *subset ) );
        return result;
    }

private:
    [[ nodiscard ]] Set current() const
    {
        std::vector<element> picked;
        picked.reserve( positions_.size() );
        for ( auto const position : positions_ )
            picked.push_back( elements_[ position ] );
        return empty_.concat( picked );
    }

    void reset_positions()
    {
        positions_.resize( size_ );
        std::iota( positions_.begin(), positions_.end(), std::size_t{ 0 } );
    }

    // lexicographic successor of the current combination
    void advance()
    {
        BOOST_ASSERT( !done_ );
        auto const n{ elements_.size() };
        auto const k{ positions_.size() };
        for ( auto i{ k }; i-- > 0; )
        {
            if ( positions_[ i ] != i + n - k )
            {
                ++positions_[ i ];
                for ( auto j{ i + 1 }; j < k; ++j )
                    positions_[ j ] = positions_[ j - 1 ] + 1;
                return;
            }
        }
        // combinations of the current size exhausted
        if ( size_ == max_size_ )
        {
            done_ = true;
            return;
        }
        ++size_;
        reset_positions();
    }

    std::vector<element>     elements_;
    Set                      empty_;
    std::vector<std::size_t> positions_;
    std::size_t              size_    { 0 };
    std::size_t              max_size_{ 0 };
    bool                     done_    { false };
}; // class subsets_range

//------------------------------------------------------------------------------
} // namespace psi::equa
//------------------------------------------------------------------------------
