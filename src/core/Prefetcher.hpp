#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include <core/common.hpp>


namespace quizpager::FetchingStrategy
{
class FetchingStrategy
{
public:
    virtual
    ~FetchingStrategy() = default;

    /**
     * Overriding methods must call this base method!
     */
    virtual void
    fetch( size_t index )
    {
        m_lastFetched = index;
    }

    [[nodiscard]] std::optional<size_t>
    lastFetched() const
    {
        return m_lastFetched;
    }

    /**
     * @param indexCount The number of existing indexes. Returned indexes are always smaller than this.
     * @return Indexes to prefetch ordered by descending priority. May contain the last fetched index itself.
     */
    [[nodiscard]] virtual std::vector<size_t>
    prefetch( size_t indexCount ) const = 0;

private:
    std::optional<size_t> m_lastFetched;
};


/**
 * Prefetches all indexes in [center - radius, center + radius] clamped to [0, indexCount).
 * Indexes nearer to the last access come first, the following one before the preceding one.
 */
class SymmetricWindow :
    public FetchingStrategy
{
public:
    explicit
    SymmetricWindow( size_t radius ) :
        m_radius( radius )
    {}

    [[nodiscard]] size_t
    radius() const noexcept
    {
        return m_radius;
    }

    /**
     * @return Inclusive bounds of the window or nothing if the window lies completely outside of [0, indexCount).
     */
    [[nodiscard]] static std::optional<std::pair<size_t, size_t> >
    bounds( size_t center,
            size_t radius,
            size_t indexCount ) noexcept
    {
        if ( indexCount == 0 ) {
            return std::nullopt;
        }
        const auto first = saturatingSubtraction( center, radius );
        const auto last = std::min( indexCount - 1, saturatingAddition( center, radius ) );
        if ( first > last ) {
            return std::nullopt;
        }
        return std::make_pair( first, last );
    }

    [[nodiscard]] static std::vector<size_t>
    window( size_t center,
            size_t radius,
            size_t indexCount )
    {
        const auto windowBounds = bounds( center, radius, indexCount );
        if ( !windowBounds ) {
            return {};
        }

        const auto [first, last] = *windowBounds;
        std::vector<size_t> result;
        result.reserve( last - first + 1 );
        if ( ( center >= first ) && ( center <= last ) ) {
            result.push_back( center );
        }
        for ( size_t distance = 1; distance <= std::min( radius, indexCount ); ++distance ) {
            const auto following = saturatingAddition( center, distance );
            if ( ( following >= first ) && ( following <= last ) ) {
                result.push_back( following );
            }
            if ( ( center >= distance ) && ( center - distance >= first ) && ( center - distance <= last ) ) {
                result.push_back( center - distance );
            }
        }
        return result;
    }

    [[nodiscard]] std::vector<size_t>
    prefetch( size_t indexCount ) const override
    {
        if ( !lastFetched() ) {
            return {};
        }
        return window( *lastFetched(), m_radius, indexCount );
    }

private:
    const size_t m_radius;
};
}  // namespace quizpager::FetchingStrategy
