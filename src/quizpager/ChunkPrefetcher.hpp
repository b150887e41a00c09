#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <core/Error.hpp>
#include <core/Prefetcher.hpp>
#include <quizpager/ChunkFetcher.hpp>


namespace quizpager
{
/**
 * Launches concurrent fetches for the chunks around an accessed chunk. Failures of single fetches
 * are only reported in the summary. They neither abort the other fetches nor propagate.
 */
class ChunkPrefetcher
{
public:
    using FetchFuture = std::shared_future<ChunkFetcher::Result>;
    /** Starts a fetch without waiting for it. */
    using LaunchFetch = std::function<FetchFuture( size_t )>;
    /** Returns true for chunks that should not be fetched, e.g., because they are already cached. */
    using SkipChunk = std::function<bool( size_t )>;
    using LaunchedFetches = std::vector<std::pair<size_t, FetchFuture> >;

    struct Summary
    {
        size_t scheduled{ 0 };
        size_t succeeded{ 0 };
        std::vector<size_t> failedChunks;
    };

public:
    explicit
    ChunkPrefetcher( std::unique_ptr<FetchingStrategy::FetchingStrategy> strategy ) :
        m_strategy( std::move( strategy ) )
    {
        if ( !m_strategy ) {
            throw std::invalid_argument( "A fetching strategy must be specified!" );
        }
    }

    explicit
    ChunkPrefetcher( size_t radius ) :
        ChunkPrefetcher( std::make_unique<FetchingStrategy::SymmetricWindow>( radius ) )
    {}

    /**
     * Returns immediately after starting the fetches in the order given by the fetching strategy.
     */
    [[nodiscard]] LaunchedFetches
    launch( size_t             centerChunk,
            size_t             totalChunks,
            const SkipChunk&   skip,
            const LaunchFetch& launchFetch )
    {
        m_strategy->fetch( centerChunk );

        LaunchedFetches result;
        for ( const auto chunkId : m_strategy->prefetch( totalChunks ) ) {
            if ( ( chunkId < totalChunks ) && !skip( chunkId ) ) {
                result.emplace_back( chunkId, launchFetch( chunkId ) );
            }
        }
        return result;
    }

    /**
     * Waits for all given fetches. A broken promise, e.g., because the worker pool was stopped,
     * counts as failure.
     */
    [[nodiscard]] static Summary
    settle( const LaunchedFetches& fetches )
    {
        Summary summary;
        summary.scheduled = fetches.size();
        for ( const auto& [chunkId, fetch] : fetches ) {
            auto error = Error::NETWORK_ERROR;
            try {
                error = fetch.get().second;
            } catch ( const std::future_error& ) {
                error = Error::CHUNK_UNAVAILABLE;
            }

            if ( error == Error::NONE ) {
                ++summary.succeeded;
            } else {
                summary.failedChunks.push_back( chunkId );
            }
        }
        return summary;
    }

    /**
     * Launches and settles all fetches, i.e., returns only after all of them have finished.
     */
    [[nodiscard]] Summary
    prefetch( size_t             centerChunk,
              size_t             totalChunks,
              const SkipChunk&   skip,
              const LaunchFetch& launchFetch )
    {
        return settle( launch( centerChunk, totalChunks, skip, launchFetch ) );
    }

    [[nodiscard]] const FetchingStrategy::FetchingStrategy&
    strategy() const noexcept
    {
        return *m_strategy;
    }

private:
    const std::unique_ptr<FetchingStrategy::FetchingStrategy> m_strategy;
};
}  // namespace quizpager
