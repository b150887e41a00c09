#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <core/Error.hpp>
#include <quizpager/Chunk.hpp>
#include <quizpager/DatasetMetadata.hpp>
#include <quizpager/Json.hpp>
#include <quizpager/resource/ResourceReader.hpp>


namespace quizpager
{
/**
 * Transfers and validates single chunks. Neither caches nor retries. Both are left to the caller.
 * Safe to call concurrently as long as the resource reader is.
 */
class ChunkFetcher
{
public:
    using Result = std::pair<SharedChunk, Error>;

public:
    ChunkFetcher( SharedResourceReader resourceReader,
                  std::string          datasetId,
                  DatasetMetadata      metadata ) :
        m_resourceReader( std::move( resourceReader ) ),
        m_datasetId( std::move( datasetId ) ),
        m_metadata( std::move( metadata ) )
    {
        if ( !m_resourceReader ) {
            throw std::invalid_argument( "A resource reader must be specified!" );
        }
    }

    /**
     * @return The complete chunk or a null pointer together with CHUNK_NOT_FOUND, NETWORK_ERROR,
     *         or MALFORMED_CHUNK.
     */
    [[nodiscard]] Result
    fetch( size_t chunkId ) const
    {
        /* The resource for such an ID might exist but it would not fit into the metadata layout. */
        if ( chunkId >= m_metadata.totalChunks() ) {
            return { {}, Error::CHUNK_NOT_FOUND };
        }

        const auto [contents, error] = m_resourceReader->read( chunkPath( m_datasetId, chunkId ) );
        if ( error != Error::NONE ) {
            return { {}, error };
        }

        auto json = parseJson( contents );
        if ( !json ) {
            return { {}, Error::MALFORMED_CHUNK };
        }
        return parse( std::move( *json ), m_metadata, chunkId );
    }

    /**
     * Checks a chunk resource like { "start_question": 51, "end_question": 100, "questions": [ ... ] }
     * against the expected layout. The 1-based question numbers are optional.
     */
    [[nodiscard]] static Result
    parse( Json::Value            json,
           const DatasetMetadata& metadata,
           size_t                 chunkId )
    {
        if ( !json.isObject() || ( chunkId >= metadata.totalChunks() ) ) {
            return { {}, Error::MALFORMED_CHUNK };
        }

        const auto [first, last] = metadata.chunkRange( chunkId );
        if ( json.isMember( "start_question" ) && ( getUnsigned( json, "start_question" ) != first + 1 ) ) {
            return { {}, Error::MALFORMED_CHUNK };
        }
        if ( json.isMember( "end_question" ) && ( getUnsigned( json, "end_question" ) != last + 1 ) ) {
            return { {}, Error::MALFORMED_CHUNK };
        }

        auto& questions = json["questions"];
        if ( !questions.isArray() || ( questions.size() != metadata.chunkItemCount( chunkId ) ) ) {
            return { {}, Error::MALFORMED_CHUNK };
        }

        auto chunk = std::make_shared<Chunk>();
        chunk->id = chunkId;
        chunk->items.reserve( questions.size() );
        for ( auto& question : questions ) {
            chunk->items.emplace_back( std::move( question ) );
        }
        return { std::move( chunk ), Error::NONE };
    }

    [[nodiscard]] const std::string&
    datasetId() const noexcept
    {
        return m_datasetId;
    }

    [[nodiscard]] const DatasetMetadata&
    metadata() const noexcept
    {
        return m_metadata;
    }

private:
    const SharedResourceReader m_resourceReader;
    const std::string m_datasetId;
    const DatasetMetadata m_metadata;
};
}  // namespace quizpager
