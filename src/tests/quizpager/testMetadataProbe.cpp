#include <iostream>
#include <memory>
#include <string>

#include <core/TestHelpers.hpp>
#include <quizpager/MetadataProbe.hpp>
#include <quizpager/resource/Memory.hpp>

#include "DatasetFixtures.hpp"


using namespace quizpager;


[[nodiscard]] std::optional<DatasetMetadata>
probeMetadata( const std::string&         metadataJson,
               const PagingConfiguration& configuration = {} )
{
    auto reader = std::make_shared<MemoryResourceReader>();
    reader->insert( metadataPath( "EXAM" ), metadataJson );
    return MetadataProbe( reader, configuration ).probe( "EXAM" );
}


void
testChunkedDataset()
{
    const auto metadata = probeMetadata( makeMetadataResource( 120, 50, "Certified Administrator" ) );
    REQUIRE( metadata.has_value() );
    if ( metadata ) {
        REQUIRE_EQUAL( metadata->totalItems(), 120U );
        REQUIRE_EQUAL( metadata->chunkSize(), 50U );
        REQUIRE_EQUAL( metadata->totalChunks(), 3U );
        REQUIRE_EQUAL( metadata->datasetTitle(), "Certified Administrator" );
    }

    /* Only the mandatory members. The chunk size comes from the configuration and the title from the ID. */
    PagingConfiguration configuration;
    configuration.chunkSize = 40;
    const auto minimal = probeMetadata( R"({ "chunked": true, "total_questions": 120 })", configuration );
    REQUIRE( minimal.has_value() );
    if ( minimal ) {
        REQUIRE_EQUAL( minimal->chunkSize(), 40U );
        REQUIRE_EQUAL( minimal->totalChunks(), 3U );
        REQUIRE_EQUAL( minimal->datasetTitle(), "EXAM" );
    }

    /* The chunk size in the metadata takes precedence. */
    const auto overridden = probeMetadata( R"({ "chunked": true, "total_questions": 120, "chunk_size": 25,
                                                "total_chunks": 5 })", configuration );
    REQUIRE( overridden.has_value() );
    if ( overridden ) {
        REQUIRE_EQUAL( overridden->chunkSize(), 25U );
        REQUIRE_EQUAL( overridden->totalChunks(), 5U );
    }
}


void
testNotChunked()
{
    /* Valid metadata saying that there are no chunks. */
    REQUIRE( !probeMetadata( R"({ "chunked": false, "total_questions": 500 })" ) );
    REQUIRE( !probeMetadata( R"({ "total_questions": 500 })" ) );

    /* A single chunk is not worth it. */
    REQUIRE( !probeMetadata( makeMetadataResource( 50, 50, "Small" ) ) );
    REQUIRE( !probeMetadata( makeMetadataResource( 10, 50, "Small" ) ) );
    REQUIRE( probeMetadata( makeMetadataResource( 51, 50, "Just Large Enough" ) ).has_value() );

    /* Lazy loading disabled does not even look at the metadata. */
    auto reader = makeChunkedDataset( "EXAM", 120, 50 );
    PagingConfiguration configuration;
    configuration.enableLazyLoading = false;
    REQUIRE( !MetadataProbe( reader, configuration ).probe( "EXAM" ) );
    REQUIRE_EQUAL( reader->totalReadCount(), 0U );
}


void
testMalformedMetadata()
{
    StreamInterceptor interceptor( std::cerr );

    REQUIRE( !probeMetadata( "{ this is not JSON" ) );
    REQUIRE( !probeMetadata( "[ 1, 2, 3 ]" ) );
    REQUIRE( !probeMetadata( R"({ "chunked": "yes", "total_questions": 120 })" ) );
    REQUIRE( !probeMetadata( R"({ "chunked": true })" ) );
    REQUIRE( !probeMetadata( R"({ "chunked": true, "total_questions": -5 })" ) );
    REQUIRE( !probeMetadata( R"({ "chunked": true, "total_questions": 120, "chunk_size": 0 })" ) );
    /* Inconsistent chunk count. */
    REQUIRE( !probeMetadata( R"({ "chunked": true, "total_questions": 120, "chunk_size": 50, "total_chunks": 4 })" ) );

    interceptor.close();
    REQUIRE( interceptor.contents().find( "[Warning]" ) != std::string::npos );
}


void
testUnavailableMetadata()
{
    auto reader = std::make_shared<MemoryResourceReader>();
    const MetadataProbe probe( reader, PagingConfiguration{} );

    /* Missing metadata is the normal case for small datasets and therefore silent. */
    {
        StreamInterceptor interceptor( std::cerr );
        REQUIRE( !probe.probe( "EXAM" ) );
        interceptor.close();
        REQUIRE( interceptor.contents().empty() );
    }

    /* Transfer errors also fall back to loading the whole dataset instead of failing. */
    reader->insert( metadataPath( "EXAM" ), makeMetadataResource( 120, 50, "EXAM" ) );
    reader->setFailure( metadataPath( "EXAM" ), Error::NETWORK_ERROR );
    {
        StreamInterceptor interceptor( std::cerr );
        REQUIRE( !probe.probe( "EXAM" ) );
        interceptor.close();
        REQUIRE( interceptor.contents().find( "[Warning]" ) != std::string::npos );
    }

    reader->clearFailure( metadataPath( "EXAM" ) );
    REQUIRE( probe.probe( "EXAM" ).has_value() );
    REQUIRE_EQUAL( reader->readCount( metadataPath( "EXAM" ) ), 3U );
}


void
testInvalidArguments()
{
    REQUIRE_THROWS( MetadataProbe( nullptr, PagingConfiguration{} ) );

    PagingConfiguration configuration;
    configuration.chunkSize = 0;
    REQUIRE_THROWS( MetadataProbe( std::make_shared<MemoryResourceReader>(), configuration ) );
}


int
main()
{
    testChunkedDataset();
    testNotChunked();
    testMalformedMetadata();
    testUnavailableMetadata();
    testInvalidArguments();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
