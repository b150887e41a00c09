#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <core/common.hpp>
#include <core/Statistics.hpp>
#include <core/TestHelpers.hpp>


using namespace quizpager;


void
testCeilDiv()
{
    REQUIRE_EQUAL( ceilDiv( 0U, 50U ), 0U );
    REQUIRE_EQUAL( ceilDiv( 1U, 50U ), 1U );
    REQUIRE_EQUAL( ceilDiv( 50U, 50U ), 1U );
    REQUIRE_EQUAL( ceilDiv( 51U, 50U ), 2U );
    REQUIRE_EQUAL( ceilDiv( 120U, 50U ), 3U );
    REQUIRE_EQUAL( ceilDiv( uint64_t( 1000 ), 10U ), uint64_t( 100 ) );
}


void
testUnsignedSaturatingAddition()
{
    REQUIRE_EQUAL( saturatingAddition( 0U, 0U ), 0U );
    REQUIRE_EQUAL( saturatingAddition( 0U, 1U ), 1U );
    REQUIRE_EQUAL( saturatingAddition( 1U, 0U ), 1U );
    REQUIRE_EQUAL( saturatingAddition( 1U, 1U ), 2U );

    constexpr auto MAX = std::numeric_limits<uint64_t>::max();
    REQUIRE_EQUAL( saturatingAddition( MAX, uint64_t( 0 ) ), MAX );
    REQUIRE_EQUAL( saturatingAddition( uint64_t( 0 ), MAX ), MAX );

    REQUIRE_EQUAL( saturatingAddition( MAX, uint64_t( 1 ) ), MAX );
    REQUIRE_EQUAL( saturatingAddition( uint64_t( 1 ), MAX ), MAX );

    REQUIRE_EQUAL( saturatingAddition( MAX - 1U, uint64_t( 2 ) ), MAX );
    REQUIRE_EQUAL( saturatingAddition( uint64_t( 2 ), MAX - 1U ), MAX );

    REQUIRE_EQUAL( saturatingAddition( MAX - 3U, uint64_t( 2 ) ), MAX - 1U );
    REQUIRE_EQUAL( saturatingAddition( MAX, MAX ), MAX );
}


void
testUnsignedSaturatingSubtraction()
{
    REQUIRE_EQUAL( saturatingSubtraction( 0U, 0U ), 0U );
    REQUIRE_EQUAL( saturatingSubtraction( 0U, 1U ), 0U );
    REQUIRE_EQUAL( saturatingSubtraction( 1U, 0U ), 1U );
    REQUIRE_EQUAL( saturatingSubtraction( 1U, 1U ), 0U );
    REQUIRE_EQUAL( saturatingSubtraction( 5U, 2U ), 3U );

    constexpr auto MAX = std::numeric_limits<uint64_t>::max();
    REQUIRE_EQUAL( saturatingSubtraction( uint64_t( 0 ), MAX ), uint64_t( 0 ) );
    REQUIRE_EQUAL( saturatingSubtraction( MAX, MAX ), uint64_t( 0 ) );
    REQUIRE_EQUAL( saturatingSubtraction( MAX, uint64_t( 1 ) ), MAX - 1U );
}


void
testStringAffixes()
{
    using namespace std::literals;

    REQUIRE( startsWith( "chunk_0.json"sv, "chunk_"sv ) );
    REQUIRE( startsWith( "chunk_0.json"sv, ""sv ) );
    REQUIRE( !startsWith( "chunk_0.json"sv, "metadata"sv ) );
    REQUIRE( !startsWith( "c"sv, "chunk_"sv ) );

    REQUIRE( endsWith( "chunk_0.json.gz"s, ".gz"s ) );
    REQUIRE( endsWith( "http://localhost/"s, "/"s ) );
    REQUIRE( !endsWith( "chunk_0.json"s, ".gz"s ) );
    REQUIRE( !endsWith( "gz"s, ".gz"s ) );
}


void
testStatistics()
{
    Statistics<double> statistics;
    REQUIRE( statistics.empty() );
    REQUIRE_EQUAL( statistics.average(), 0.0 );
    REQUIRE( statistics.format() == "n/a" );

    statistics.merge( 2.0 );
    REQUIRE_EQUAL( statistics.variance(), 0.0 );

    statistics.merge( 4.0 );
    REQUIRE_EQUAL( statistics.count, uint64_t( 2 ) );
    REQUIRE_EQUAL( statistics.min, 2.0 );
    REQUIRE_EQUAL( statistics.max, 4.0 );
    REQUIRE_EQUAL( statistics.average(), 3.0 );
    REQUIRE_EQUAL( statistics.variance(), 2.0 );

    const Statistics<double> other( std::vector<int>{ 0, 6 } );
    statistics.merge( other );
    REQUIRE_EQUAL( statistics.count, uint64_t( 4 ) );
    REQUIRE_EQUAL( statistics.min, 0.0 );
    REQUIRE_EQUAL( statistics.max, 6.0 );
    REQUIRE_EQUAL( statistics.average(), 3.0 );

    REQUIRE( statistics.format( 1e3, 0 ).find( "0 <= 3000 +- " ) == 0 );
    REQUIRE( endsWith( statistics.format( 1e3, 0 ), std::string( "<= 6000" ) ) );

    statistics.merge( Statistics<double>() );
    REQUIRE_EQUAL( statistics.count, uint64_t( 4 ) );
}


void
testThreadSafeOutput()
{
    const std::vector<size_t> chunkIds = { 1, 2 };
    const auto line = ( ThreadSafeOutput() << "[Test]" << "Evicted chunks" << chunkIds ).str();
    REQUIRE( startsWith( line, std::string( "[" ) ) );
    REQUIRE( endsWith( line, std::string( "[Test] Evicted chunks { 1, 2 }\n" ) ) );
}


int
main()
{
    testCeilDiv();
    testUnsignedSaturatingAddition();
    testUnsignedSaturatingSubtraction();
    testStringAffixes();
    testStatistics();
    testThreadSafeOutput();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
