#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/FileUtils.hpp>
#include <quizpager/DatasetMetadata.hpp>
#include <quizpager/Json.hpp>
#include <quizpager/resource/ResourceReader.hpp>
#include <quizpager/resource/zlib.hpp>


namespace quizpager
{
enum class [[nodiscard]] ChunkingStatus
{
    CREATED,
    SOURCE_MISSING,
    INVALID_SOURCE,
    TOO_FEW_ITEMS,
    CHUNKS_EXIST,
};


[[nodiscard]] inline std::string
toString( ChunkingStatus status )
{
    switch ( status )
    {
    case ChunkingStatus::CREATED:
        return "Chunks created.";
    case ChunkingStatus::SOURCE_MISSING:
        return "Dataset file not found!";
    case ChunkingStatus::INVALID_SOURCE:
        return "Dataset file does not contain a question array!";
    case ChunkingStatus::TOO_FEW_ITEMS:
        return "Dataset fits into a single chunk. Chunking not needed.";
    case ChunkingStatus::CHUNKS_EXIST:
        return "Chunks already exist. Use --force to overwrite them.";
    }
    return "Unknown status!";
}


inline std::ostream&
operator<<( std::ostream&  out,
            ChunkingStatus status )
{
    out << toString( status );
    return out;
}


struct ChunkingOptions
{
    size_t chunkSize{ 50 };
    /** Overwrite existing chunks. */
    bool force{ false };
    /** Write chunk_<id>.json.gz instead of chunk_<id>.json. */
    bool gzip{ false };
    bool verbose{ false };
};


/**
 * Splits <dataFolder>/<datasetId>/exam.json into chunk resources and writes the metadata resource
 * that announces them, i.e., creates the layout that @ref MetadataProbe and @ref ChunkFetcher read.
 * @throws std::invalid_argument for a zero chunk size.
 * @throws std::runtime_error if a file cannot be written.
 */
inline ChunkingStatus
createChunks( const std::filesystem::path& dataFolder,
              const std::string&           datasetId,
              const ChunkingOptions&       options = {} )
{
    if ( options.chunkSize == 0 ) {
        throw std::invalid_argument( "The chunk size must be larger than zero!" );
    }

    const auto sourcePath = dataFolder / datasetPath( datasetId );
    if ( !fileExists( sourcePath ) ) {
        return ChunkingStatus::SOURCE_MISSING;
    }

    auto dataset = parseJson( readFile( sourcePath ) );
    if ( !dataset || !dataset->isObject() || !( *dataset )["questions"].isArray() ) {
        return ChunkingStatus::INVALID_SOURCE;
    }

    auto& questions = ( *dataset )["questions"];
    const auto totalItems = static_cast<size_t>( questions.size() );
    if ( totalItems <= options.chunkSize ) {
        return ChunkingStatus::TOO_FEW_ITEMS;
    }

    const DatasetMetadata metadata( totalItems, options.chunkSize );
    const auto chunkFile =
        [&] ( size_t chunkId, bool compressed ) {
            auto path = dataFolder / chunkPath( datasetId, chunkId );
            if ( compressed ) {
                path += ".gz";
            }
            return path;
        };

    if ( !options.force ) {
        for ( size_t chunkId = 0; chunkId < metadata.totalChunks(); ++chunkId ) {
            if ( fileExists( chunkFile( chunkId, false ) ) || fileExists( chunkFile( chunkId, true ) ) ) {
                return ChunkingStatus::CHUNKS_EXIST;
            }
        }
    }

    std::filesystem::create_directories( chunkFile( 0, false ).parent_path() );

    Json::Value createdChunks( Json::arrayValue );
    for ( size_t chunkId = 0; chunkId < metadata.totalChunks(); ++chunkId ) {
        const auto [first, last] = metadata.chunkRange( chunkId );

        Json::Value chunk( Json::objectValue );
        chunk["chunk_id"] = static_cast<Json::UInt64>( chunkId );
        chunk["start_question"] = static_cast<Json::UInt64>( first + 1 );
        chunk["end_question"] = static_cast<Json::UInt64>( last + 1 );
        chunk["questions_count"] = static_cast<Json::UInt64>( last - first + 1 );
        auto& chunkQuestions = chunk["questions"] = Json::Value( Json::arrayValue );
        for ( auto index = first; index <= last; ++index ) {
            chunkQuestions.append( std::move( questions[static_cast<Json::ArrayIndex>( index )] ) );
        }

        const auto serialized = toJsonString( chunk );
        writeFile( chunkFile( chunkId, options.gzip ),
                   options.gzip ? compressWithZlib( serialized ) : serialized );

        /* The file reader prefers the uncompressed variant, so a stale one must not survive. */
        std::error_code errorCode;
        std::filesystem::remove( chunkFile( chunkId, !options.gzip ), errorCode );

        createdChunks.append( static_cast<Json::UInt64>( chunkId ) );
        if ( options.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[createChunks] Created chunk" << chunkId << "with questions"
                           << first + 1 << "-" << last + 1 );
        }
    }

    const auto& examName = ( *dataset )["exam_name"];

    Json::Value metadataJson( Json::objectValue );
    metadataJson["exam_code"] = datasetId;
    metadataJson["exam_name"] = examName.isString() ? examName.asString() : datasetId;
    metadataJson["chunked"] = true;
    metadataJson["chunk_size"] = static_cast<Json::UInt64>( metadata.chunkSize() );
    metadataJson["total_chunks"] = static_cast<Json::UInt64>( metadata.totalChunks() );
    metadataJson["total_questions"] = static_cast<Json::UInt64>( metadata.totalItems() );
    metadataJson["created_chunks"] = createdChunks;
    metadataJson["created_at"] = currentDate();
    writeFile( dataFolder / metadataPath( datasetId ), toJsonString( metadataJson ) );

    return ChunkingStatus::CREATED;
}


/**
 * Removes the chunk folder and the metadata resource so that the dataset is loaded as a whole again.
 * @return The number of removed top-level entries, i.e., at most 2.
 */
inline size_t
cleanupChunks( const std::filesystem::path& dataFolder,
               const std::string&           datasetId )
{
    size_t removed{ 0 };

    const auto chunkFolder = dataFolder / datasetId / "chunks";
    std::error_code errorCode;
    if ( std::filesystem::is_directory( chunkFolder, errorCode ) ) {
        std::filesystem::remove_all( chunkFolder );
        ++removed;
    }

    const auto metadataFile = dataFolder / metadataPath( datasetId );
    if ( std::filesystem::remove( metadataFile, errorCode ) ) {
        ++removed;
    }

    return removed;
}


/**
 * Calls @ref createChunks for every sub folder of @p dataFolder containing an exam.json with at least
 * @p minItems questions.
 * @return Result per dataset. Datasets that were skipped because of their size are reported as TOO_FEW_ITEMS.
 */
inline std::map<std::string, ChunkingStatus>
createChunksForAll( const std::filesystem::path& dataFolder,
                    size_t                       minItems,
                    const ChunkingOptions&       options = {} )
{
    std::vector<std::string> datasetIds;
    for ( const auto& entry : std::filesystem::directory_iterator( dataFolder ) ) {
        const auto datasetId = entry.path().filename().string();
        if ( entry.is_directory() && fileExists( dataFolder / datasetPath( datasetId ) ) ) {
            datasetIds.push_back( datasetId );
        }
    }
    std::sort( datasetIds.begin(), datasetIds.end() );

    std::map<std::string, ChunkingStatus> results;
    for ( const auto& datasetId : datasetIds ) {
        const auto dataset = parseJson( readFile( dataFolder / datasetPath( datasetId ) ) );
        if ( !dataset || !dataset->isObject() || !( *dataset )["questions"].isArray() ) {
            results.emplace( datasetId, ChunkingStatus::INVALID_SOURCE );
            continue;
        }

        if ( ( *dataset )["questions"].size() < minItems ) {
            results.emplace( datasetId, ChunkingStatus::TOO_FEW_ITEMS );
            continue;
        }

        results.emplace( datasetId, createChunks( dataFolder, datasetId, options ) );
    }
    return results;
}
}  // namespace quizpager
