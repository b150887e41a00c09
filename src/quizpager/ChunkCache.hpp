#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/Cache.hpp>
#include <quizpager/Chunk.hpp>
#include <quizpager/DatasetMetadata.hpp>


namespace quizpager
{
/**
 * Loaded chunks of one dataset session keyed by chunk ID. Rejects anything that is not a complete
 * chunk of the dataset.
 * Not thread-safe. The access coordinator owns it and serializes all accesses.
 */
class ChunkCache
{
public:
    using BaseCache = Cache<size_t, SharedChunk>;

public:
    /**
     * @param maxChunks Hard bound for the number of chunks. Least recently used chunks are evicted
     *        when it would be exceeded. 0 means unbounded.
     */
    explicit
    ChunkCache( DatasetMetadata metadata,
                size_t          maxChunks = 0 ) :
        m_metadata( std::move( metadata ) ),
        m_cache( maxChunks == 0 ? BaseCache::UNBOUNDED : maxChunks )
    {}

    /**
     * Counts as an access for the eviction order and the statistics.
     */
    [[nodiscard]] SharedChunk
    get( size_t chunkId )
    {
        return m_cache.get( chunkId ).value_or( nullptr );
    }

    [[nodiscard]] SharedChunk
    peek( size_t chunkId ) const
    {
        return m_cache.peek( chunkId ).value_or( nullptr );
    }

    /**
     * Inserts or replaces the chunk with the same ID.
     * @return IDs of chunks that had to be evicted to stay inside the capacity.
     * @throws std::invalid_argument if @p chunk is not a complete chunk of this dataset.
     */
    std::vector<size_t>
    put( SharedChunk chunk )
    {
        if ( !chunk ) {
            throw std::invalid_argument( "Cannot insert a null chunk!" );
        }
        if ( chunk->id >= m_metadata.totalChunks() ) {
            throw std::invalid_argument( "Chunk ID " + std::to_string( chunk->id ) + " does not exist in dataset "
                                         "with " + std::to_string( m_metadata.totalChunks() ) + " chunks!" );
        }
        if ( chunk->items.size() != m_metadata.chunkItemCount( chunk->id ) ) {
            throw std::invalid_argument( "Chunk " + std::to_string( chunk->id ) + " contains "
                                         + std::to_string( chunk->items.size() ) + " items instead of "
                                         + std::to_string( m_metadata.chunkItemCount( chunk->id ) ) + "!" );
        }

        const auto chunkId = chunk->id;
        return m_cache.insert( chunkId, std::move( chunk ) );
    }

    [[nodiscard]] bool
    has( size_t chunkId ) const
    {
        return m_cache.test( chunkId );
    }

    /**
     * @return true if the chunk was cached.
     */
    bool
    evict( size_t chunkId )
    {
        return m_cache.evict( chunkId );
    }

    /**
     * @return The evicted chunk IDs in ascending order.
     */
    std::vector<size_t>
    evictOutside( size_t first,
                  size_t last )
    {
        auto evicted = m_cache.evictIf( [first, last] ( const size_t chunkId ) {
            return ( chunkId < first ) || ( chunkId > last );
        } );
        std::sort( evicted.begin(), evicted.end() );
        return evicted;
    }

    /**
     * @return Cached chunk IDs in ascending order.
     */
    [[nodiscard]] std::vector<size_t>
    keys() const
    {
        return m_cache.keys();
    }

    void
    clear()
    {
        m_cache.clear();
    }

    [[nodiscard]] size_t
    size() const
    {
        return m_cache.size();
    }

    [[nodiscard]] bool
    empty() const
    {
        return m_cache.empty();
    }

    /**
     * @return The number of real items held by all cached chunks.
     */
    [[nodiscard]] size_t
    itemCount() const
    {
        size_t result{ 0 };
        for ( const auto& [chunkId, chunk] : m_cache.contents() ) {
            result += chunk->items.size();
        }
        return result;
    }

    [[nodiscard]] BaseCache::Statistics
    statistics() const
    {
        return m_cache.statistics();
    }

    [[nodiscard]] const DatasetMetadata&
    metadata() const noexcept
    {
        return m_metadata;
    }

private:
    const DatasetMetadata m_metadata;
    BaseCache m_cache;
};
}  // namespace quizpager
