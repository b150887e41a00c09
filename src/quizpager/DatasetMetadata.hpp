#pragma once

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <core/common.hpp>


namespace quizpager
{
/**
 * Chunk layout of one dataset. Immutable after construction.
 */
class DatasetMetadata
{
public:
    DatasetMetadata( size_t      totalItems,
                     size_t      chunkSize,
                     std::string datasetTitle = {} ) :
        m_totalItems( totalItems ),
        m_chunkSize( chunkSize ),
        m_totalChunks( chunkSize == 0 ? 0 : ceilDiv( totalItems, chunkSize ) ),
        m_datasetTitle( std::move( datasetTitle ) )
    {
        if ( m_chunkSize == 0 ) {
            throw std::invalid_argument( "The chunk size must be larger than zero!" );
        }
    }

    [[nodiscard]] size_t
    totalItems() const noexcept
    {
        return m_totalItems;
    }

    [[nodiscard]] size_t
    chunkSize() const noexcept
    {
        return m_chunkSize;
    }

    [[nodiscard]] size_t
    totalChunks() const noexcept
    {
        return m_totalChunks;
    }

    [[nodiscard]] const std::string&
    datasetTitle() const noexcept
    {
        return m_datasetTitle;
    }

    /**
     * Does not check @p index against the item count. Use @ref contains for that.
     */
    [[nodiscard]] size_t
    chunkIdForIndex( size_t index ) const noexcept
    {
        return index / m_chunkSize;
    }

    [[nodiscard]] bool
    contains( size_t index ) const noexcept
    {
        return index < m_totalItems;
    }

    [[nodiscard]] size_t
    chunkBegin( size_t chunkId ) const
    {
        checkChunkId( chunkId );
        return chunkId * m_chunkSize;
    }

    /**
     * @return One past the last item index of the chunk. Only differs from the next chunk's begin
     *         for the last chunk, which may be shorter.
     */
    [[nodiscard]] size_t
    chunkEnd( size_t chunkId ) const
    {
        checkChunkId( chunkId );
        return std::min( m_totalItems, ( chunkId + 1 ) * m_chunkSize );
    }

    [[nodiscard]] size_t
    chunkItemCount( size_t chunkId ) const
    {
        return chunkEnd( chunkId ) - chunkBegin( chunkId );
    }

    /**
     * @return The inclusive item index range [first, last] of the given chunk.
     */
    [[nodiscard]] std::pair<size_t, size_t>
    chunkRange( size_t chunkId ) const
    {
        return { chunkBegin( chunkId ), chunkEnd( chunkId ) - 1 };
    }

    [[nodiscard]] bool
    operator==( const DatasetMetadata& other ) const noexcept
    {
        return ( m_totalItems == other.m_totalItems )
               && ( m_chunkSize == other.m_chunkSize )
               && ( m_datasetTitle == other.m_datasetTitle );
    }

    [[nodiscard]] bool
    operator!=( const DatasetMetadata& other ) const noexcept
    {
        return !( *this == other );
    }

private:
    void
    checkChunkId( size_t chunkId ) const
    {
        if ( chunkId >= m_totalChunks ) {
            throw std::out_of_range( "Chunk ID " + std::to_string( chunkId ) + " is out of range for "
                                     + std::to_string( m_totalChunks ) + " chunks!" );
        }
    }

private:
    size_t m_totalItems;
    size_t m_chunkSize;
    size_t m_totalChunks;
    std::string m_datasetTitle;
};


inline std::ostream&
operator<<( std::ostream&          out,
            const DatasetMetadata& metadata )
{
    out << "DatasetMetadata{ title: \"" << metadata.datasetTitle() << "\", items: " << metadata.totalItems()
        << ", chunk size: " << metadata.chunkSize() << ", chunks: " << metadata.totalChunks() << " }";
    return out;
}
}  // namespace quizpager
