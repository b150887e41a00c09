#pragma once

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <stdexcept>

#include <core/common.hpp>


namespace quizpager
{
struct PagingConfiguration
{
    /** Used only if the metadata resource does not specify a chunk size itself. */
    size_t chunkSize{ 50 };
    /** Chunks on each side of the accessed chunk that are fetched in the background. */
    size_t prefetchRadius{ 1 };
    /** Chunks on each side of the accessed chunk that survive eviction. */
    size_t keepRadius{ 2 };
    /** Worker threads for fetching. 0 means as many as there are cores. */
    size_t parallelization{ 0 };
    /** Seconds during which prefetching skips a chunk whose last fetch failed. */
    double failureCooldown{ 1.0 };
    /** Hard bound for the number of cached chunks on top of the keep window. 0 means unbounded. */
    size_t maxCachedChunks{ 0 };
    bool enableLazyLoading{ true };
    bool verbose{ false };

    [[nodiscard]] size_t
    threadCount() const
    {
        return parallelization == 0 ? availableCores() : parallelization;
    }

    void
    validate() const
    {
        if ( chunkSize == 0 ) {
            throw std::invalid_argument( "The chunk size must be larger than zero!" );
        }
        if ( !( failureCooldown >= 0 ) ) {
            throw std::invalid_argument( "The failure cool-down must not be negative!" );
        }
        const auto windowSize = 2 * std::max( keepRadius, prefetchRadius ) + 1;
        if ( ( maxCachedChunks > 0 ) && ( maxCachedChunks < windowSize ) ) {
            throw std::invalid_argument( "The maximum number of cached chunks must be able to hold the keep "
                                         "and prefetch windows!" );
        }
    }
};


inline std::ostream&
operator<<( std::ostream&              out,
            const PagingConfiguration& configuration )
{
    out << "chunk size: " << configuration.chunkSize
        << ", prefetch radius: " << configuration.prefetchRadius
        << ", keep radius: " << configuration.keepRadius
        << ", threads: " << configuration.threadCount()
        << ", failure cool-down: " << configuration.failureCooldown << " s"
        << ", max cached chunks: ";
    if ( configuration.maxCachedChunks == 0 ) {
        out << "unbounded";
    } else {
        out << configuration.maxCachedChunks;
    }
    return out;
}
}  // namespace quizpager
