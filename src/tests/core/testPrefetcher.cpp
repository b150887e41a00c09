#include <iostream>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Prefetcher.hpp>
#include <core/TestHelpers.hpp>


using namespace quizpager;
using namespace quizpager::FetchingStrategy;


void
testWindowBounds()
{
    using Bounds = std::optional<std::pair<size_t, size_t> >;

    REQUIRE( SymmetricWindow::bounds( 0, 1, 0 ) == Bounds() );
    REQUIRE( SymmetricWindow::bounds( 1, 1, 3 ) == Bounds( std::make_pair( 0, 2 ) ) );
    REQUIRE( SymmetricWindow::bounds( 0, 1, 3 ) == Bounds( std::make_pair( 0, 1 ) ) );
    REQUIRE( SymmetricWindow::bounds( 2, 1, 3 ) == Bounds( std::make_pair( 1, 2 ) ) );
    REQUIRE( SymmetricWindow::bounds( 5, 0, 10 ) == Bounds( std::make_pair( 5, 5 ) ) );
    REQUIRE( SymmetricWindow::bounds( 5, 100, 10 ) == Bounds( std::make_pair( 0, 9 ) ) );
    /* Windows beyond the last index are empty instead of being clamped onto it. */
    REQUIRE( SymmetricWindow::bounds( 10, 1, 3 ) == Bounds() );
    REQUIRE( SymmetricWindow::bounds( 3, 0, 3 ) == Bounds() );
    REQUIRE( SymmetricWindow::bounds( 3, 1, 3 ) == Bounds( std::make_pair( 2, 2 ) ) );
    REQUIRE( SymmetricWindow::window( 10, 1, 3 ).empty() );

    constexpr auto MAX = std::numeric_limits<size_t>::max();
    REQUIRE( SymmetricWindow::bounds( MAX - 1, MAX, MAX ) == Bounds( std::make_pair( 0, MAX - 1 ) ) );
}


void
testWindowOrder()
{
    REQUIRE_EQUAL( SymmetricWindow::window( 1, 1, 3 ), std::vector<size_t>( { 1, 2, 0 } ) );
    REQUIRE_EQUAL( SymmetricWindow::window( 5, 2, 10 ), std::vector<size_t>( { 5, 6, 4, 7, 3 } ) );
    REQUIRE_EQUAL( SymmetricWindow::window( 0, 2, 10 ), std::vector<size_t>( { 0, 1, 2 } ) );
    REQUIRE_EQUAL( SymmetricWindow::window( 9, 2, 10 ), std::vector<size_t>( { 9, 8, 7 } ) );
    REQUIRE_EQUAL( SymmetricWindow::window( 4, 0, 10 ), std::vector<size_t>( { 4 } ) );
    REQUIRE_EQUAL( SymmetricWindow::window( 0, 3, 1 ), std::vector<size_t>( { 0 } ) );
    REQUIRE( SymmetricWindow::window( 0, 3, 0 ).empty() );
}


void
testFetchingStrategy()
{
    SymmetricWindow strategy( 1 );
    REQUIRE_EQUAL( strategy.radius(), 1U );
    REQUIRE( !strategy.lastFetched().has_value() );
    REQUIRE( strategy.prefetch( 10 ).empty() );

    strategy.fetch( 3 );
    REQUIRE_EQUAL( strategy.lastFetched().value_or( 0 ), 3U );
    REQUIRE_EQUAL( strategy.prefetch( 10 ), std::vector<size_t>( { 3, 4, 2 } ) );

    /* Going to the end of the dataset. */
    strategy.fetch( 9 );
    REQUIRE_EQUAL( strategy.prefetch( 10 ), std::vector<size_t>( { 9, 8 } ) );
}


int
main()
{
    testWindowBounds();
    testWindowOrder();
    testFetchingStrategy();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
