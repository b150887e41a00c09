#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <core/TestHelpers.hpp>
#include <quizpager/DatasetMetadata.hpp>
#include <quizpager/PagingConfiguration.hpp>


using namespace quizpager;


void
testChunkLayout()
{
    const DatasetMetadata metadata( /* totalItems */ 120, /* chunkSize */ 50, "CAD" );
    REQUIRE_EQUAL( metadata.totalItems(), 120U );
    REQUIRE_EQUAL( metadata.chunkSize(), 50U );
    REQUIRE_EQUAL( metadata.totalChunks(), 3U );
    REQUIRE_EQUAL( metadata.datasetTitle(), "CAD" );

    REQUIRE( metadata.chunkRange( 0 ) == std::make_pair( size_t( 0 ), size_t( 49 ) ) );
    REQUIRE( metadata.chunkRange( 1 ) == std::make_pair( size_t( 50 ), size_t( 99 ) ) );
    REQUIRE( metadata.chunkRange( 2 ) == std::make_pair( size_t( 100 ), size_t( 119 ) ) );

    /* The last chunk only holds the remainder. */
    REQUIRE_EQUAL( metadata.chunkItemCount( 0 ), 50U );
    REQUIRE_EQUAL( metadata.chunkItemCount( 2 ), 20U );
    REQUIRE_EQUAL( metadata.chunkBegin( 2 ), 100U );
    REQUIRE_EQUAL( metadata.chunkEnd( 2 ), 120U );

    REQUIRE_THROWS( metadata.chunkBegin( 3 ) );
    REQUIRE_THROWS( metadata.chunkRange( 3 ) );
}


void
testChunkResolution()
{
    const std::vector<std::pair<size_t, size_t> > layouts = { { 120, 50 }, { 100, 50 }, { 101, 50 }, { 7, 1 },
                                                              { 1000, 33 } };
    for ( const auto& [totalItems, chunkSize] : layouts ) {
        const DatasetMetadata metadata( totalItems, chunkSize );
        REQUIRE_EQUAL( metadata.totalChunks(), ( totalItems + chunkSize - 1 ) / chunkSize );

        size_t itemsInChunks{ 0 };
        size_t wronglyResolved{ 0 };
        for ( size_t chunkId = 0; chunkId < metadata.totalChunks(); ++chunkId ) {
            itemsInChunks += metadata.chunkItemCount( chunkId );
            const auto [first, last] = metadata.chunkRange( chunkId );
            for ( auto index = first; index <= last; ++index ) {
                if ( ( metadata.chunkIdForIndex( index ) != chunkId )
                     || ( metadata.chunkIdForIndex( index ) != index / chunkSize ) ) {
                    ++wronglyResolved;
                }
            }
        }
        REQUIRE_EQUAL( wronglyResolved, 0U );
        REQUIRE_EQUAL( itemsInChunks, metadata.totalItems() );

        REQUIRE( metadata.contains( metadata.totalItems() - 1 ) );
        REQUIRE( !metadata.contains( metadata.totalItems() ) );
    }
}


void
testInvalidMetadata()
{
    REQUIRE_THROWS( DatasetMetadata( 100, 0 ) );

    const DatasetMetadata empty( 0, 10 );
    REQUIRE_EQUAL( empty.totalChunks(), 0U );
    REQUIRE( !empty.contains( 0 ) );

    REQUIRE( DatasetMetadata( 120, 50, "A" ) == DatasetMetadata( 120, 50, "A" ) );
    REQUIRE( DatasetMetadata( 120, 50, "A" ) != DatasetMetadata( 120, 40, "A" ) );
}


void
testConfigurationValidation()
{
    PagingConfiguration configuration;
    configuration.validate();
    REQUIRE( configuration.threadCount() >= 1 );

    configuration.parallelization = 3;
    REQUIRE_EQUAL( configuration.threadCount(), 3U );

    auto invalid = configuration;
    invalid.chunkSize = 0;
    REQUIRE_THROWS( invalid.validate() );

    invalid = configuration;
    invalid.failureCooldown = -1;
    REQUIRE_THROWS( invalid.validate() );

    /* Cannot even hold the keep window of 2 * 2 + 1 chunks. */
    invalid = configuration;
    invalid.maxCachedChunks = 4;
    REQUIRE_THROWS( invalid.validate() );

    auto valid = configuration;
    valid.maxCachedChunks = 5;
    valid.validate();
}


int
main()
{
    testChunkLayout();
    testChunkResolution();
    testInvalidMetadata();
    testConfigurationValidation();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
