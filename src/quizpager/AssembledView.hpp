#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <quizpager/Chunk.hpp>
#include <quizpager/ChunkCache.hpp>
#include <quizpager/DatasetMetadata.hpp>


namespace quizpager
{
/**
 * @return The stand-in record for an item whose chunk is not loaded yet in the shape consumers
 *         expect from real items, so that it can be rendered as a "loading" entry.
 */
[[nodiscard]] inline Json::Value
placeholderRecord( size_t index,
                   size_t chunkId )
{
    const auto questionNumber = std::to_string( index + 1 );
    Json::Value result( Json::objectValue );
    result["question_number"] = questionNumber;
    result["question"] = "Question " + questionNumber;
    result["answers"] = Json::Value( Json::arrayValue );
    result["isPlaceholder"] = true;
    result["chunkId"] = static_cast<Json::UInt64>( chunkId );
    return result;
}


/**
 * Read-only sequence of all items of a dataset in order. Positions whose chunk is not cached hold
 * placeholders. Views are snapshots: they keep their chunks alive and are unaffected by later cache changes.
 * Consumers must fetch a new view after each successful load.
 */
class AssembledView
{
public:
    class Entry
    {
    public:
        Entry( size_t      index,
               size_t      chunkId,
               const Item* item ) :
            m_index( index ),
            m_chunkId( chunkId ),
            m_item( item )
        {}

        [[nodiscard]] size_t
        index() const noexcept
        {
            return m_index;
        }

        [[nodiscard]] size_t
        chunkId() const noexcept
        {
            return m_chunkId;
        }

        [[nodiscard]] bool
        isPlaceholder() const noexcept
        {
            return m_item == nullptr;
        }

        /**
         * @throws std::logic_error for placeholders.
         */
        [[nodiscard]] const Item&
        item() const
        {
            if ( m_item == nullptr ) {
                throw std::logic_error( "Item " + std::to_string( m_index ) + " is a placeholder!" );
            }
            return *m_item;
        }

        [[nodiscard]] Json::Value
        toJson() const
        {
            return m_item == nullptr ? placeholderRecord( m_index, m_chunkId ) : *m_item;
        }

    private:
        size_t m_index;
        size_t m_chunkId;
        const Item* m_item;
    };

    using const_iterator = std::vector<Entry>::const_iterator;

public:
    /** An empty view for when no chunked dataset is open. */
    AssembledView() = default;

    /**
     * Walks all chunks in order and fills the positions of uncached chunks with placeholders.
     * Does not change the eviction order of @p cache.
     */
    [[nodiscard]] static AssembledView
    assemble( const DatasetMetadata& metadata,
              const ChunkCache&      cache )
    {
        AssembledView view;
        view.m_metadata = metadata;
        view.m_chunks.resize( metadata.totalChunks() );
        view.m_entries.reserve( metadata.totalItems() );

        for ( size_t chunkId = 0; chunkId < metadata.totalChunks(); ++chunkId ) {
            const auto begin = metadata.chunkBegin( chunkId );
            const auto end = metadata.chunkEnd( chunkId );

            auto chunk = cache.peek( chunkId );
            if ( chunk && ( chunk->items.size() != end - begin ) ) {
                throw std::logic_error( "Cached chunk " + std::to_string( chunkId ) + " is incomplete!" );
            }

            for ( auto index = begin; index < end; ++index ) {
                view.m_entries.emplace_back( index, chunkId, chunk ? &chunk->items[index - begin] : nullptr );
            }

            if ( chunk ) {
                ++view.m_loadedChunkCount;
            } else {
                view.m_placeholderCount += end - begin;
            }
            view.m_chunks[chunkId] = std::move( chunk );
        }

        return view;
    }

    [[nodiscard]] size_t
    size() const noexcept
    {
        return m_entries.size();
    }

    [[nodiscard]] bool
    empty() const noexcept
    {
        return m_entries.empty();
    }

    [[nodiscard]] const Entry&
    at( size_t index ) const
    {
        if ( index >= m_entries.size() ) {
            throw std::out_of_range( "Index " + std::to_string( index ) + " is out of range for a view of size "
                                     + std::to_string( m_entries.size() ) + "!" );
        }
        return m_entries[index];
    }

    [[nodiscard]] const Entry&
    operator[]( size_t index ) const
    {
        return m_entries[index];
    }

    [[nodiscard]] const_iterator
    begin() const noexcept
    {
        return m_entries.begin();
    }

    [[nodiscard]] const_iterator
    end() const noexcept
    {
        return m_entries.end();
    }

    [[nodiscard]] size_t
    placeholderCount() const noexcept
    {
        return m_placeholderCount;
    }

    [[nodiscard]] size_t
    loadedChunkCount() const noexcept
    {
        return m_loadedChunkCount;
    }

    [[nodiscard]] bool
    isChunkLoaded( size_t chunkId ) const
    {
        return ( chunkId < m_chunks.size() ) && static_cast<bool>( m_chunks[chunkId] );
    }

    [[nodiscard]] const std::optional<DatasetMetadata>&
    metadata() const noexcept
    {
        return m_metadata;
    }

private:
    std::optional<DatasetMetadata> m_metadata;
    /** Keeps the items referenced by the entries alive. Null for chunks that are not loaded. */
    std::vector<SharedChunk> m_chunks;
    std::vector<Entry> m_entries;
    size_t m_placeholderCount{ 0 };
    size_t m_loadedChunkCount{ 0 };
};


using SharedAssembledView = std::shared_ptr<const AssembledView>;
}  // namespace quizpager
