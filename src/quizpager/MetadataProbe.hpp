#pragma once

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <quizpager/DatasetMetadata.hpp>
#include <quizpager/Json.hpp>
#include <quizpager/PagingConfiguration.hpp>
#include <quizpager/resource/ResourceReader.hpp>


namespace quizpager
{
/**
 * Decides whether a dataset is served in chunks. Every failure, be it a missing or broken metadata
 * resource or a transfer error, results in "not chunked".
 */
class MetadataProbe
{
public:
    /**
     * NOT_CHUNKED for valid metadata that does not describe a chunked dataset,
     * METADATA_UNAVAILABLE for everything that is invalid.
     */
    using ParseResult = std::pair<std::optional<DatasetMetadata>, Error>;

public:
    MetadataProbe( SharedResourceReader resourceReader,
                   PagingConfiguration  configuration ) :
        m_resourceReader( std::move( resourceReader ) ),
        m_configuration( std::move( configuration ) )
    {
        if ( !m_resourceReader ) {
            throw std::invalid_argument( "A resource reader must be specified!" );
        }
        m_configuration.validate();
    }

    [[nodiscard]] std::optional<DatasetMetadata>
    probe( const std::string& datasetId ) const
    {
        if ( !m_configuration.enableLazyLoading ) {
            if ( m_configuration.verbose ) {
                std::cerr << ( ThreadSafeOutput() << "[MetadataProbe] Lazy loading is disabled. Loading"
                               << datasetId << "as a whole." );
            }
            return std::nullopt;
        }

        const auto path = metadataPath( datasetId );
        const auto [contents, readError] = m_resourceReader->read( path );
        if ( readError != Error::NONE ) {
            /* A missing metadata file is the normal case for small datasets. Only transfer errors are noteworthy. */
            if ( readError != Error::CHUNK_NOT_FOUND ) {
                std::cerr << ( ThreadSafeOutput() << "[Warning] Failed to read" << path << "from"
                               << m_resourceReader->describe() << ":" << readError
                               << "Falling back to loading the whole dataset." );
            } else if ( m_configuration.verbose ) {
                std::cerr << ( ThreadSafeOutput() << "[MetadataProbe] No chunk metadata found for" << datasetId );
            }
            return std::nullopt;
        }

        std::string parseErrors;
        const auto json = parseJson( contents, &parseErrors );
        if ( !json ) {
            std::cerr << ( ThreadSafeOutput() << "[Warning] Metadata" << path << "is not valid JSON:" << parseErrors );
            return std::nullopt;
        }

        auto [metadata, error] = parse( *json, datasetId, m_configuration.chunkSize );
        if ( error == Error::METADATA_UNAVAILABLE ) {
            std::cerr << ( ThreadSafeOutput() << "[Warning] Metadata" << path
                           << "does not describe a valid chunk layout. Falling back to loading the whole dataset." );
        } else if ( m_configuration.verbose ) {
            if ( metadata ) {
                std::cerr << ( ThreadSafeOutput() << "[MetadataProbe] Found" << *metadata );
            } else {
                std::cerr << ( ThreadSafeOutput() << "[MetadataProbe] Dataset" << datasetId << "is not chunked." );
            }
        }
        return std::move( metadata );
    }

    /**
     * Expects an object like { "chunked": true, "total_questions": 120, "total_chunks": 3, "exam_name": "..." }.
     * The optional "chunk_size" member takes precedence over @p defaultChunkSize.
     */
    [[nodiscard]] static ParseResult
    parse( const Json::Value& json,
           const std::string& datasetId,
           size_t             defaultChunkSize )
    {
        if ( !json.isObject() ) {
            return { std::nullopt, Error::METADATA_UNAVAILABLE };
        }

        const auto& chunked = json["chunked"];
        if ( !chunked.isNull() && !chunked.isBool() ) {
            return { std::nullopt, Error::METADATA_UNAVAILABLE };
        }
        if ( !chunked.isBool() || !chunked.asBool() ) {
            return { std::nullopt, Error::NOT_CHUNKED };
        }

        const auto totalItems = getUnsigned( json, "total_questions" );
        if ( !totalItems ) {
            return { std::nullopt, Error::METADATA_UNAVAILABLE };
        }

        auto chunkSize = defaultChunkSize;
        if ( json.isMember( "chunk_size" ) ) {
            const auto specifiedChunkSize = getUnsigned( json, "chunk_size" );
            if ( !specifiedChunkSize || ( *specifiedChunkSize == 0 ) ) {
                return { std::nullopt, Error::METADATA_UNAVAILABLE };
            }
            chunkSize = *specifiedChunkSize;
        }

        /* A single chunk would only add a round trip. */
        if ( *totalItems <= chunkSize ) {
            return { std::nullopt, Error::NOT_CHUNKED };
        }

        std::string title = datasetId;
        if ( const auto& examName = json["exam_name"]; examName.isString() && !examName.asString().empty() ) {
            title = examName.asString();
        }

        DatasetMetadata metadata( *totalItems, chunkSize, std::move( title ) );

        if ( json.isMember( "total_chunks" ) ) {
            const auto totalChunks = getUnsigned( json, "total_chunks" );
            if ( !totalChunks || ( *totalChunks != metadata.totalChunks() ) ) {
                return { std::nullopt, Error::METADATA_UNAVAILABLE };
            }
        }

        return { std::move( metadata ), Error::NONE };
    }

    [[nodiscard]] const PagingConfiguration&
    configuration() const noexcept
    {
        return m_configuration;
    }

private:
    const SharedResourceReader m_resourceReader;
    PagingConfiguration m_configuration;
};
}  // namespace quizpager
