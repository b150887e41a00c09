#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/Statistics.hpp>
#include <core/ThreadPool.hpp>
#include <quizpager/AssembledView.hpp>
#include <quizpager/ChunkCache.hpp>
#include <quizpager/ChunkFetcher.hpp>
#include <quizpager/ChunkPrefetcher.hpp>
#include <quizpager/DatasetMetadata.hpp>
#include <quizpager/Evictor.hpp>
#include <quizpager/MetadataProbe.hpp>
#include <quizpager/PagingConfiguration.hpp>
#include <quizpager/resource/ResourceReader.hpp>


namespace quizpager
{
/**
 * Owns the chunk cache of the currently open dataset and is its only writer.
 * Navigation calls @ref ensureLoaded before showing an item and reads @ref view afterwards.
 *
 * All fetches run on an internal thread pool. On-demand fetches are prioritized over prefetches.
 * There is at most one fetch per chunk in flight. Further requests for the same chunk wait for that one.
 * Each open or reset starts a new generation and results of fetches from older generations are discarded.
 */
class AccessCoordinator
{
public:
    using FetchFuture = ChunkPrefetcher::FetchFuture;
    using TimePoint = std::chrono::time_point<std::chrono::steady_clock>;

    struct Statistics
    {
    public:
        [[nodiscard]] double
        cacheHitRate() const
        {
            return accesses == 0 ? 0.0 : static_cast<double>( cacheHits ) / static_cast<double>( accesses );
        }

        [[nodiscard]] std::string
        print() const
        {
            std::stringstream out;
            out << "\n    Parallelization                   : " << parallelization
                << "\n    Cache"
                << "\n        Hits                          : " << cacheHits
                << "\n        Misses                        : " << cacheMisses
                << "\n        Unused Entries                : " << cache.unusedEntries
                << "\n        Maximum Fill Size             : " << cache.maxSize
                << "\n        Capacity                      : " << ( cache.capacity == ChunkCache::BaseCache::UNBOUNDED
                                                                     ? std::string( "unbounded" )
                                                                     : std::to_string( cache.capacity ) )
                << "\n    Cache Hit Rate                    : " << cacheHitRate() * 100 << " %"
                << "\n    Accesses"
                << "\n        Total                         : " << accesses
                << "\n        Out of Range                  : " << outOfRangeAccesses
                << "\n        Waits on Running Fetch        : " << deduplicatedWaits
                << "\n        Promoted Queued Prefetches    : " << promotedPrefetches
                << "\n    Chunks"
                << "\n        Total Fetched                 : " << prefetchCount + onDemandFetchCount
                << "\n        Prefetched                    : " << prefetchCount
                << "\n        Fetched On-demand             : " << onDemandFetchCount
                << "\n        Failed Fetches                : " << failedFetches
                << "\n        Skipped During Cool-down      : " << cooldownSkips
                << "\n        Skipped Missing Chunks        : " << missingSkips
                << "\n        Discarded Stale Results       : " << staleDiscards
                << "\n        Dropped Queued Prefetches     : " << droppedPrefetches
                << "\n        Evicted                       : " << evictions
                << "\n    Views Assembled                   : " << viewAssemblies
                << "\n    Time spent in:"
                << "\n        fetch [ms]                    : " << fetchDurations.format( 1e3 )
                << "\n        ensureLoaded wait [ms]        : " << waitDurations.format( 1e3 )
                << "\n        fetch total                   : " << fetchDurations.sum << " s";
            return out.str();
        }

    public:
        size_t parallelization{ 0 };
        ChunkCache::BaseCache::Statistics cache;

        size_t accesses{ 0 };
        size_t outOfRangeAccesses{ 0 };
        size_t cacheHits{ 0 };
        size_t cacheMisses{ 0 };
        size_t deduplicatedWaits{ 0 };
        size_t promotedPrefetches{ 0 };

        size_t onDemandFetchCount{ 0 };
        size_t prefetchCount{ 0 };
        size_t failedFetches{ 0 };
        size_t cooldownSkips{ 0 };
        size_t missingSkips{ 0 };
        size_t staleDiscards{ 0 };
        size_t droppedPrefetches{ 0 };
        size_t evictions{ 0 };
        size_t viewAssemblies{ 0 };

        quizpager::Statistics<double> fetchDurations;
        quizpager::Statistics<double> waitDurations;
    };

    struct MemoryStatistics
    {
        [[nodiscard]] std::string
        print() const
        {
            std::stringstream out;
            out << "\n    Chunked                           : " << ( chunked ? "yes" : "no" );
            if ( chunked ) {
                out << "\n    Chunk Size                        : " << chunkSize
                    << "\n    Loaded Chunks                     : " << loadedChunks << " / " << totalChunks
                    << "\n    Loaded Items                      : " << loadedItems << " / " << totalItems
                    << "\n    Memory Usage                      : " << memoryUsagePercent << " %";
            }
            return out.str();
        }

    public:
        bool chunked{ false };
        size_t totalChunks{ 0 };
        size_t loadedChunks{ 0 };
        size_t totalItems{ 0 };
        size_t loadedItems{ 0 };
        /** Loaded items relative to all items. 0 if nothing is open. */
        double memoryUsagePercent{ 0 };
        size_t chunkSize{ 0 };
    };

public:
    explicit
    AccessCoordinator( SharedResourceReader resourceReader,
                       PagingConfiguration  configuration = {} ) :
        m_resourceReader( std::move( resourceReader ) ),
        m_configuration( std::move( configuration ) ),
        m_probe( m_resourceReader, m_configuration ),
        m_threadPool( m_configuration.threadCount() )
    {
        m_statistics.parallelization = m_threadPool.capacity();
    }

    ~AccessCoordinator()
    {
        /* Join the workers first because they call back into this object. */
        m_threadPool.stop();

        if ( m_showProfileOnDestruction ) {
            std::cerr << ( ThreadSafeOutput() << "[AccessCoordinator::~AccessCoordinator]"
                           << statistics().print() );
        }
    }

    AccessCoordinator( const AccessCoordinator& ) = delete;

    AccessCoordinator&
    operator=( const AccessCoordinator& ) = delete;

    /**
     * Probes the dataset and starts a new session for it. Chunks of the previous dataset are dropped
     * and fetches still running for it will be discarded on completion.
     * @return Error::NONE if the dataset is chunked and Error::NOT_CHUNKED if the caller has to load
     *         the dataset as a whole.
     */
    Error
    open( const std::string& datasetId )
    {
        /* Probe without holding the lock because it involves a transfer. */
        auto metadata = m_probe.probe( datasetId );

        const std::scoped_lock lock( m_mutex );
        clearSessionLocked();
        m_datasetId = datasetId;
        if ( !metadata ) {
            return Error::NOT_CHUNKED;
        }

        m_fetcher = std::make_shared<const ChunkFetcher>( m_resourceReader, datasetId, *metadata );
        m_cache = std::make_unique<ChunkCache>( *metadata, m_configuration.maxCachedChunks );
        m_metadata = std::move( metadata );
        rebuildViewLocked();
        return Error::NONE;
    }

    /**
     * Forgets the open dataset with everything cached for it.
     */
    void
    reset()
    {
        const std::scoped_lock lock( m_mutex );
        clearSessionLocked();
    }

    /**
     * Opens @p datasetId if it is not the currently open dataset and then ensures that the chunk
     * containing @p index is cached.
     */
    [[nodiscard]] Error
    ensureLoaded( const std::string& datasetId,
                  size_t             index )
    {
        bool isOpen{ false };
        {
            const std::scoped_lock lock( m_mutex );
            isOpen = m_datasetId == datasetId;
        }

        if ( !isOpen ) {
            if ( const auto error = open( datasetId ); error != Error::NONE ) {
                return error;
            }
        }
        return ensureLoaded( index );
    }

    /**
     * Blocks only until the chunk containing @p index is cached, never for the prefetches which
     * are started in the background after a successful load.
     * @return Error::NONE, Error::INDEX_OUT_OF_RANGE, Error::CHUNK_UNAVAILABLE if the fetch failed,
     *         or Error::NOT_CHUNKED if there is no chunked dataset open.
     */
    [[nodiscard]] Error
    ensureLoaded( size_t index )
    {
        FetchFuture fetch;
        size_t chunkId{ 0 };
        uint64_t generation{ 0 };
        {
            const std::scoped_lock lock( m_mutex );
            if ( !m_metadata ) {
                return Error::NOT_CHUNKED;
            }

            ++m_statistics.accesses;
            if ( !m_metadata->contains( index ) ) {
                ++m_statistics.outOfRangeAccesses;
                return Error::INDEX_OUT_OF_RANGE;
            }

            chunkId = m_metadata->chunkIdForIndex( index );
            if ( m_cache->get( chunkId ) ) {
                ++m_statistics.cacheHits;
                return Error::NONE;
            }

            ++m_statistics.cacheMisses;
            generation = m_generation;
            fetch = launchFetchLocked( chunkId, /* onDemand */ true );
        }

        const auto waitStart = now();
        ChunkFetcher::Result result{ {}, Error::CHUNK_UNAVAILABLE };
        bool abandoned{ false };
        try {
            result = fetch.get();
        } catch ( const std::future_error& ) {
            abandoned = true;
        }

        const std::scoped_lock lock( m_mutex );
        m_statistics.waitDurations.merge( duration( waitStart ) );

        if ( generation != m_generation ) {
            return Error::CHUNK_UNAVAILABLE;
        }

        if ( abandoned ) {
            std::cerr << ( ThreadSafeOutput() << "[Warning] Fetch of chunk" << chunkId << "was abandoned." );
            return Error::CHUNK_UNAVAILABLE;
        }

        const auto& [chunk, error] = result;
        if ( ( error != Error::NONE ) || !chunk ) {
            return Error::CHUNK_UNAVAILABLE;
        }

        /* A concurrent access to a distant chunk might have evicted it again in the meantime. */
        if ( !m_cache->has( chunkId ) ) {
            insertLocked( chunk );
        }

        launchPrefetchLocked( chunkId, m_configuration.prefetchRadius );
        evictLocked( chunkId, m_configuration.keepRadius );
        rebuildViewLocked();
        return Error::NONE;
    }

    /**
     * Fetches all uncached chunks in [centerChunk - radius, centerChunk + radius] concurrently and
     * returns after all of them have finished. Chunks whose fetch failed recently are skipped.
     */
    ChunkPrefetcher::Summary
    prefetch( size_t centerChunk,
              size_t radius )
    {
        ChunkPrefetcher::LaunchedFetches fetches;
        {
            const std::scoped_lock lock( m_mutex );
            if ( !m_metadata ) {
                return {};
            }
            fetches = launchPrefetchLocked( centerChunk, radius );
        }

        const auto summary = ChunkPrefetcher::settle( fetches );
        if ( m_configuration.verbose || !summary.failedChunks.empty() ) {
            std::cerr << ( ThreadSafeOutput() << "[AccessCoordinator::prefetch] Prefetched" << summary.succeeded
                           << "of" << summary.scheduled << "chunks around chunk" << centerChunk
                           << ( summary.failedChunks.empty() ? "" : "Failed chunks:" ) << summary.failedChunks );
        }
        return summary;
    }

    /**
     * Same as @ref prefetch but returns without waiting for the fetches.
     * @return The IDs of the chunks for which fetches were started or joined.
     */
    std::vector<size_t>
    prefetchInBackground( size_t centerChunk,
                          size_t radius )
    {
        const std::scoped_lock lock( m_mutex );
        if ( !m_metadata ) {
            return {};
        }

        std::vector<size_t> result;
        for ( const auto& [chunkId, fetch] : launchPrefetchLocked( centerChunk, radius ) ) {
            result.push_back( chunkId );
        }
        return result;
    }

    /**
     * Removes all cached chunks outside [currentChunk - keepRadius, currentChunk + keepRadius].
     * @return The evicted chunk IDs in ascending order.
     */
    std::vector<size_t>
    evict( size_t currentChunk,
           size_t keepRadius )
    {
        const std::scoped_lock lock( m_mutex );
        if ( !m_cache ) {
            return {};
        }

        auto evicted = evictLocked( currentChunk, keepRadius );
        if ( !evicted.empty() ) {
            rebuildViewLocked();
        }
        return evicted;
    }

    /**
     * Blocks until no fetch of the current session is running anymore, including prefetches.
     */
    void
    waitForPendingFetches()
    {
        while ( true ) {
            std::vector<FetchFuture> pending;
            {
                const std::scoped_lock lock( m_mutex );
                for ( const auto& [chunkId, fetch] : m_inFlight ) {
                    pending.push_back( fetch );
                }
            }

            if ( pending.empty() ) {
                break;
            }

            for ( const auto& fetch : pending ) {
                fetch.wait();
            }
        }
    }

    /**
     * @return A snapshot of all items of the open dataset. Never null. Empty if no chunked dataset is open.
     */
    [[nodiscard]] SharedAssembledView
    view() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_view;
    }

    [[nodiscard]] std::optional<size_t>
    chunkIdForIndex( size_t index ) const
    {
        const std::scoped_lock lock( m_mutex );
        if ( !m_metadata || !m_metadata->contains( index ) ) {
            return std::nullopt;
        }
        return m_metadata->chunkIdForIndex( index );
    }

    /**
     * @return The inclusive item index range of the given chunk or nothing if it does not exist.
     */
    [[nodiscard]] std::optional<std::pair<size_t, size_t> >
    chunkRange( size_t chunkId ) const
    {
        const std::scoped_lock lock( m_mutex );
        if ( !m_metadata || ( chunkId >= m_metadata->totalChunks() ) ) {
            return std::nullopt;
        }
        return m_metadata->chunkRange( chunkId );
    }

    [[nodiscard]] std::vector<size_t>
    cachedChunks() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_cache ? m_cache->keys() : std::vector<size_t>{};
    }

    [[nodiscard]] bool
    isCached( size_t chunkId ) const
    {
        const std::scoped_lock lock( m_mutex );
        return m_cache && m_cache->has( chunkId );
    }

    [[nodiscard]] bool
    isLoading( size_t chunkId ) const
    {
        const std::scoped_lock lock( m_mutex );
        return m_inFlight.find( chunkId ) != m_inFlight.end();
    }

    [[nodiscard]] std::optional<DatasetMetadata>
    metadata() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_metadata;
    }

    [[nodiscard]] std::optional<std::string>
    datasetId() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_datasetId;
    }

    [[nodiscard]] bool
    isChunked() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_metadata.has_value();
    }

    [[nodiscard]] uint64_t
    generation() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_generation;
    }

    [[nodiscard]] MemoryStatistics
    memoryStatistics() const
    {
        const std::scoped_lock lock( m_mutex );

        MemoryStatistics result;
        if ( !m_metadata ) {
            return result;
        }

        result.chunked = true;
        result.totalChunks = m_metadata->totalChunks();
        result.loadedChunks = m_cache->size();
        result.totalItems = m_metadata->totalItems();
        result.loadedItems = m_cache->itemCount();
        result.memoryUsagePercent = static_cast<double>( result.loadedItems )
                                    / static_cast<double>( result.totalItems ) * 100;
        result.chunkSize = m_metadata->chunkSize();
        return result;
    }

    [[nodiscard]] Statistics
    statistics() const
    {
        const std::scoped_lock lock( m_mutex );
        auto result = m_statistics;
        if ( m_cache ) {
            result.cache = m_cache->statistics();
        }
        return result;
    }

    void
    setShowProfileOnDestruction( bool showProfileOnDestruction ) noexcept
    {
        m_showProfileOnDestruction = showProfileOnDestruction;
    }

    [[nodiscard]] const PagingConfiguration&
    configuration() const noexcept
    {
        return m_configuration;
    }

private:
    void
    clearSessionLocked()
    {
        ++m_generation;
        m_datasetId.reset();
        m_metadata.reset();
        m_fetcher.reset();
        m_cache.reset();
        m_inFlight.clear();
        m_failedAt.clear();
        m_missingChunks.clear();
        /* Queued prefetches for the previous session are of no use anymore. */
        m_statistics.droppedPrefetches += m_threadPool.discardQueuedTasks( ThreadPool::NORMAL );
        m_view = std::make_shared<const AssembledView>();
    }

    /**
     * Joins the running fetch for @p chunkId if there is one, else submits a new one.
     * On-demand requests lift a joined prefetch that has not started yet to the on-demand priority.
     */
    [[nodiscard]] FetchFuture
    launchFetchLocked( size_t chunkId,
                       bool   onDemand )
    {
        if ( const auto match = m_inFlight.find( chunkId ); match != m_inFlight.end() ) {
            if ( onDemand ) {
                ++m_statistics.deduplicatedWaits;
                if ( m_threadPool.promote( chunkId, ThreadPool::HIGH ) ) {
                    ++m_statistics.promotedPrefetches;
                }
            }
            return match->second;
        }

        auto fetch = m_threadPool.submit(
            [this, fetcher = m_fetcher, generation = m_generation, chunkId, onDemand] () {
                const auto fetchStart = now();
                auto result = fetcher->fetch( chunkId );
                const auto status = completeFetch( generation, chunkId, result, duration( fetchStart ), onDemand );
                if ( status == Error::STALE_GENERATION ) {
                    return ChunkFetcher::Result{ {}, status };
                }
                return result;
            }, onDemand ? ThreadPool::HIGH : ThreadPool::NORMAL, /* tag */ chunkId ).share();

        m_inFlight.emplace( chunkId, fetch );
        return fetch;
    }

    /**
     * Called by the worker threads after each transfer.
     */
    Error
    completeFetch( uint64_t                    generation,
                   size_t                      chunkId,
                   const ChunkFetcher::Result& result,
                   double                      fetchDuration,
                   bool                        onDemand )
    {
        const std::scoped_lock lock( m_mutex );

        if ( generation != m_generation ) {
            ++m_statistics.staleDiscards;
            std::cerr << ( ThreadSafeOutput() << "[Warning] Discarding chunk" << chunkId
                           << "fetched for a dataset that is no longer open." );
            return Error::STALE_GENERATION;
        }

        m_inFlight.erase( chunkId );
        m_statistics.fetchDurations.merge( fetchDuration );
        if ( onDemand ) {
            ++m_statistics.onDemandFetchCount;
        } else {
            ++m_statistics.prefetchCount;
        }

        const auto& [chunk, error] = result;
        if ( error != Error::NONE ) {
            ++m_statistics.failedFetches;
            std::cerr << ( ThreadSafeOutput() << "[Warning] Failed to" << ( onDemand ? "fetch" : "prefetch" )
                           << "chunk" << chunkId << "of" << ( m_datasetId ? *m_datasetId : std::string() )
                           << "from" << m_resourceReader->describe() << ":" << error );
            if ( isRetryable( error ) ) {
                m_failedAt[chunkId] = now();
            } else {
                m_missingChunks.insert( chunkId );
                std::cerr << ( ThreadSafeOutput() << "[Warning] The metadata announces chunk" << chunkId
                               << "but it does not exist. It will not be prefetched again." );
            }
            return error;
        }

        m_failedAt.erase( chunkId );
        m_missingChunks.erase( chunkId );
        insertLocked( chunk );
        rebuildViewLocked();

        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[AccessCoordinator] Loaded chunk" << chunkId << "with"
                           << chunk->items.size() << "items in" << fetchDuration * 1e3 << "ms"
                           << ( onDemand ? "on demand" : "by prefetching" ) );
        }
        return Error::NONE;
    }

    void
    insertLocked( const SharedChunk& chunk )
    {
        const auto evicted = m_cache->put( chunk );
        m_statistics.evictions += evicted.size();
        if ( m_configuration.verbose && !evicted.empty() ) {
            std::cerr << ( ThreadSafeOutput() << "[AccessCoordinator] Evicted least recently used chunks" << evicted );
        }
    }

    [[nodiscard]] bool
    isCoolingDownLocked( size_t chunkId ) const
    {
        const auto match = m_failedAt.find( chunkId );
        return ( match != m_failedAt.end() ) && ( duration( match->second ) < m_configuration.failureCooldown );
    }

    ChunkPrefetcher::LaunchedFetches
    launchPrefetchLocked( size_t centerChunk,
                          size_t radius )
    {
        ChunkPrefetcher prefetcher( radius );
        return prefetcher.launch(
            centerChunk, m_metadata->totalChunks(),
            [this] ( size_t chunkId ) {
                if ( m_cache->has( chunkId ) ) {
                    return true;
                }
                if ( m_missingChunks.find( chunkId ) != m_missingChunks.end() ) {
                    ++m_statistics.missingSkips;
                    return true;
                }
                if ( isCoolingDownLocked( chunkId ) ) {
                    ++m_statistics.cooldownSkips;
                    return true;
                }
                return false;
            },
            [this] ( size_t chunkId ) { return launchFetchLocked( chunkId, /* onDemand */ false ); } );
    }

    std::vector<size_t>
    evictLocked( size_t currentChunk,
                 size_t keepRadius )
    {
        auto evicted = evictOutsideWindow( *m_cache, currentChunk, keepRadius );
        m_statistics.evictions += evicted.size();
        if ( m_configuration.verbose && !evicted.empty() ) {
            std::cerr << ( ThreadSafeOutput() << "[AccessCoordinator] Evicted chunks" << evicted
                           << "outside of" << keepRadius << "chunks around chunk" << currentChunk );
        }
        return evicted;
    }

    void
    rebuildViewLocked()
    {
        if ( !m_metadata ) {
            m_view = std::make_shared<const AssembledView>();
            return;
        }
        m_view = std::make_shared<const AssembledView>( AssembledView::assemble( *m_metadata, *m_cache ) );
        ++m_statistics.viewAssemblies;
    }

private:
    const SharedResourceReader m_resourceReader;
    const PagingConfiguration m_configuration;
    const MetadataProbe m_probe;
    bool m_showProfileOnDestruction{ false };

    mutable std::mutex m_mutex;
    uint64_t m_generation{ 0 };
    std::optional<std::string> m_datasetId;
    std::optional<DatasetMetadata> m_metadata;
    std::shared_ptr<const ChunkFetcher> m_fetcher;
    std::unique_ptr<ChunkCache> m_cache;
    SharedAssembledView m_view{ std::make_shared<const AssembledView>() };

    /** Fetches of the current generation that have not completed yet. */
    std::map<size_t, FetchFuture> m_inFlight;
    /** Time of the last retryable fetch failure per chunk for the prefetch cool-down. */
    std::map<size_t, TimePoint> m_failedAt;
    /** Chunks that failed with a non-retryable error. Only on-demand accesses still try them. */
    std::set<size_t> m_missingChunks;

    Statistics m_statistics;

    /**
     * Should come last because its workers access the other members.
     */
    ThreadPool m_threadPool;
};
}  // namespace quizpager
