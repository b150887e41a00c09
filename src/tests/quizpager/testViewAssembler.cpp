#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/TestHelpers.hpp>
#include <quizpager/AssembledView.hpp>
#include <quizpager/ChunkCache.hpp>
#include <quizpager/ChunkPrefetcher.hpp>
#include <quizpager/Evictor.hpp>

#include "DatasetFixtures.hpp"


using namespace quizpager;


[[nodiscard]] SharedChunk
makeChunk( const DatasetMetadata& metadata,
           size_t                 chunkId )
{
    auto chunk = std::make_shared<Chunk>();
    chunk->id = chunkId;
    const auto [first, last] = metadata.chunkRange( chunkId );
    for ( auto index = first; index <= last; ++index ) {
        chunk->items.emplace_back( makeQuestion( index ) );
    }
    return chunk;
}


/**
 * Checks that the view has the full length and that every position holds the real item exactly
 * if its chunk is cached.
 */
void
checkView( const AssembledView&   view,
           const DatasetMetadata& metadata,
           const ChunkCache&      cache )
{
    REQUIRE_EQUAL( view.size(), metadata.totalItems() );

    size_t wrongEntries{ 0 };
    size_t placeholders{ 0 };
    for ( size_t index = 0; index < view.size(); ++index ) {
        const auto& entry = view[index];
        const auto chunkId = metadata.chunkIdForIndex( index );
        if ( ( entry.index() != index ) || ( entry.chunkId() != chunkId ) ) {
            ++wrongEntries;
        }
        if ( entry.isPlaceholder() ) {
            ++placeholders;
            if ( cache.has( chunkId ) ) {
                ++wrongEntries;
            }
        } else if ( !cache.has( chunkId ) || !isQuestion( entry.item(), index ) ) {
            ++wrongEntries;
        }
    }

    REQUIRE_EQUAL( wrongEntries, 0U );
    REQUIRE_EQUAL( placeholders, view.placeholderCount() );
    REQUIRE_EQUAL( view.loadedChunkCount(), cache.size() );
}


void
testLengthInvariant()
{
    for ( const auto totalItems : { 101U, 120U, 150U, 249U } ) {
        const DatasetMetadata metadata( totalItems, 50 );
        const auto chunkCount = metadata.totalChunks();

        /* Every subset of cached chunks. */
        for ( size_t subset = 0; subset < ( size_t( 1 ) << chunkCount ); ++subset ) {
            ChunkCache cache( metadata );
            for ( size_t chunkId = 0; chunkId < chunkCount; ++chunkId ) {
                if ( ( subset & ( size_t( 1 ) << chunkId ) ) != 0 ) {
                    cache.put( makeChunk( metadata, chunkId ) );
                }
            }
            checkView( AssembledView::assemble( metadata, cache ), metadata, cache );
        }
    }
}


void
testPlaceholderRecords()
{
    const DatasetMetadata metadata( 120, 50 );
    ChunkCache cache( metadata );
    cache.put( makeChunk( metadata, 1 ) );

    const auto view = AssembledView::assemble( metadata, cache );
    REQUIRE( view.at( 75 ).isPlaceholder() == false );
    REQUIRE( view.at( 10 ).isPlaceholder() );
    REQUIRE_EQUAL( view.at( 10 ).chunkId(), 0U );
    REQUIRE_EQUAL( view.placeholderCount(), 70U );
    REQUIRE( view.isChunkLoaded( 1 ) );
    REQUIRE( !view.isChunkLoaded( 2 ) );
    REQUIRE_THROWS( view.at( 120 ) );
    REQUIRE_THROWS( view.at( 10 ).item() );

    const auto record = view.at( 10 ).toJson();
    REQUIRE_EQUAL( record["question_number"].asString(), "11" );
    REQUIRE_EQUAL( record["question"].asString(), "Question 11" );
    REQUIRE( record["answers"].isArray() && record["answers"].empty() );
    REQUIRE( record["isPlaceholder"].asBool() );
    REQUIRE_EQUAL( record["chunkId"].asUInt64(), 0U );

    const auto item = view.at( 75 ).toJson();
    REQUIRE( isQuestion( item, 75 ) );
    REQUIRE( !item.isMember( "isPlaceholder" ) );

    const AssembledView empty;
    REQUIRE( empty.empty() );
    REQUIRE( !empty.metadata().has_value() );
}


void
testViewIsSnapshot()
{
    const DatasetMetadata metadata( 120, 50 );
    ChunkCache cache( metadata );
    cache.put( makeChunk( metadata, 0 ) );

    const auto view = AssembledView::assemble( metadata, cache );
    cache.clear();

    /* The view keeps the chunk alive. */
    REQUIRE( !view.at( 3 ).isPlaceholder() );
    REQUIRE( isQuestion( view.at( 3 ).item(), 3 ) );
}


void
testCacheRejectsPartialChunks()
{
    const DatasetMetadata metadata( 120, 50 );
    ChunkCache cache( metadata );

    auto partial = std::make_shared<Chunk>( *makeChunk( metadata, 0 ) );
    partial->items.pop_back();
    REQUIRE_THROWS( cache.put( partial ) );

    /* The last chunk must not be padded to the full chunk size. */
    auto padded = std::make_shared<Chunk>( *makeChunk( metadata, 2 ) );
    padded->items.emplace_back( makeQuestion( 120 ) );
    REQUIRE_THROWS( cache.put( padded ) );

    auto unknown = std::make_shared<Chunk>( *makeChunk( metadata, 2 ) );
    unknown->id = 3;
    REQUIRE_THROWS( cache.put( unknown ) );
    REQUIRE_THROWS( cache.put( nullptr ) );

    REQUIRE( cache.empty() );
    REQUIRE( cache.keys().empty() );

    /* Replacing never merges. */
    cache.put( makeChunk( metadata, 0 ) );
    const auto replacement = makeChunk( metadata, 0 );
    cache.put( replacement );
    REQUIRE_EQUAL( cache.size(), 1U );
    REQUIRE( cache.peek( 0 ) == replacement );
    REQUIRE_EQUAL( cache.itemCount(), 50U );
}


void
testEviction()
{
    const DatasetMetadata metadata( 120, 50 );
    ChunkCache cache( metadata );
    for ( size_t chunkId = 0; chunkId < 3; ++chunkId ) {
        cache.put( makeChunk( metadata, chunkId ) );
    }

    /* All chunks are inside the window. */
    REQUIRE( evictOutsideWindow( cache, 1, 1 ).empty() );
    REQUIRE_EQUAL( cache.keys(), std::vector<size_t>( { 0, 1, 2 } ) );

    REQUIRE_EQUAL( evictOutsideWindow( cache, 0, 0 ), std::vector<size_t>( { 1, 2 } ) );
    REQUIRE_EQUAL( cache.keys(), std::vector<size_t>( { 0 } ) );
    REQUIRE_EQUAL( cache.itemCount(), 50U );

    /* Bound property for larger datasets. */
    const DatasetMetadata large( 1000, 10 );
    ChunkCache largeCache( large );
    for ( size_t chunkId = 0; chunkId < large.totalChunks(); ++chunkId ) {
        largeCache.put( makeChunk( large, chunkId ) );
    }
    for ( const auto& [center, radius] : std::vector<std::pair<size_t, size_t> >{ { 50, 3 }, { 52, 2 }, { 99, 5 },
                                                                                    { 0, 0 } } ) {
        evictOutsideWindow( largeCache, center, radius );
        for ( const auto chunkId : largeCache.keys() ) {
            REQUIRE( ( chunkId + radius >= center ) && ( chunkId <= center + radius ) );
        }
    }
    REQUIRE( largeCache.empty() );
    REQUIRE_EQUAL( largeCache.statistics().evictions, large.totalChunks() );
}


void
testBoundedCache()
{
    const DatasetMetadata metadata( 500, 50 );
    ChunkCache cache( metadata, /* maxChunks */ 3 );

    for ( size_t chunkId = 0; chunkId < 3; ++chunkId ) {
        REQUIRE( cache.put( makeChunk( metadata, chunkId ) ).empty() );
    }
    REQUIRE( static_cast<bool>( cache.get( 0 ) ) );

    REQUIRE_EQUAL( cache.put( makeChunk( metadata, 3 ) ), std::vector<size_t>( { 1 } ) );
    REQUIRE_EQUAL( cache.keys(), std::vector<size_t>( { 0, 2, 3 } ) );
}


void
testPrefetcherToleratesFailures()
{
    std::vector<size_t> launched;
    const auto launchFetch =
        [&launched] ( size_t chunkId ) {
            launched.push_back( chunkId );
            std::promise<ChunkFetcher::Result> promise;
            if ( chunkId == 2 ) {
                promise.set_value( ChunkFetcher::Result{ {}, Error::NETWORK_ERROR } );
            } else {
                auto chunk = std::make_shared<Chunk>();
                chunk->id = chunkId;
                promise.set_value( ChunkFetcher::Result{ std::move( chunk ), Error::NONE } );
            }
            return promise.get_future().share();
        };

    ChunkPrefetcher prefetcher( /* radius */ 1 );
    const auto summary = prefetcher.prefetch( 1, 3, [] ( size_t ) { return false; }, launchFetch );
    REQUIRE_EQUAL( summary.scheduled, 3U );
    REQUIRE_EQUAL( summary.succeeded, 2U );
    REQUIRE_EQUAL( summary.failedChunks, std::vector<size_t>( { 2 } ) );
    REQUIRE_EQUAL( launched, std::vector<size_t>( { 1, 2, 0 } ) );

    /* Skipped chunks are not launched. */
    launched.clear();
    const auto skipping = prefetcher.prefetch( 1, 3, [] ( size_t chunkId ) { return chunkId == 1; }, launchFetch );
    REQUIRE_EQUAL( skipping.scheduled, 2U );
    REQUIRE_EQUAL( launched, std::vector<size_t>( { 2, 0 } ) );

    /* Abandoned fetches count as failures instead of throwing. */
    ChunkPrefetcher::LaunchedFetches abandoned;
    {
        std::promise<ChunkFetcher::Result> promise;
        abandoned.emplace_back( 0, promise.get_future().share() );
    }
    REQUIRE_EQUAL( ChunkPrefetcher::settle( abandoned ).failedChunks, std::vector<size_t>( { 0 } ) );

    REQUIRE_THROWS( ChunkPrefetcher( nullptr ) );
}


int
main()
{
    testLengthInvariant();
    testPlaceholderRecords();
    testViewIsSnapshot();
    testCacheRejectsPartialChunks();
    testEviction();
    testBoundedCache();
    testPrefetcherToleratesFailures();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
