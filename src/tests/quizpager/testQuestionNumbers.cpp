#include <iostream>
#include <string>
#include <vector>

#include <core/common.hpp>
#include <core/TestHelpers.hpp>
#include <tools/QuestionNumbers.hpp>


using namespace quizpager;


void
testValidLists()
{
    REQUIRE_EQUAL( parseQuestionNumbers( "1" ), std::vector<size_t>( { 0 } ) );
    REQUIRE_EQUAL( parseQuestionNumbers( "1,75,101-105" ), std::vector<size_t>( { 0, 74, 100, 101, 102, 103, 104 } ) );
    /* The given order and duplicates are kept. */
    REQUIRE_EQUAL( parseQuestionNumbers( "5,3,5" ), std::vector<size_t>( { 4, 2, 4 } ) );
    REQUIRE_EQUAL( parseQuestionNumbers( "7-7" ), std::vector<size_t>( { 6 } ) );

    REQUIRE_EQUAL( parseQuestionNumbers( "9-10", 10 ), std::vector<size_t>( { 8, 9 } ) );
    REQUIRE_EQUAL( parseQuestionNumbers( std::to_string( MAX_QUESTION_NUMBER ) ),
                   std::vector<size_t>( { MAX_QUESTION_NUMBER - 1 } ) );
}


void
testInvalidLists()
{
    REQUIRE_THROWS( parseQuestionNumbers( "" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "0" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "1," ) );
    REQUIRE_THROWS( parseQuestionNumbers( ",1" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "abc" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "12abc" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "-5" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "5-" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "5-3" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "1-2-3" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "99999999999999999999999" ) );
}


void
testHugeRanges()
{
    /* Ranges reaching the largest representable number must neither wrap around nor exhaust the memory. */
    REQUIRE_THROWS( parseQuestionNumbers( "1-18446744073709551615" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "18446744073709551614-18446744073709551615" ) );
    REQUIRE_THROWS( parseQuestionNumbers( "1-" + std::to_string( MAX_QUESTION_NUMBER + 1 ) ) );
    REQUIRE_THROWS( parseQuestionNumbers( "1-11", 10 ) );
}


int
main()
{
    testValidLists();
    testInvalidLists();
    testHugeRanges();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
