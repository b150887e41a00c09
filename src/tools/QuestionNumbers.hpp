#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>


/** Upper bound for question numbers given on the command line. */
static constexpr size_t MAX_QUESTION_NUMBER{ 10'000'000 };


/**
 * Parses a list of 1-based question numbers like "1,5,10-12" into 0-based item indexes
 * in the given order, i.e., "10-12" yields 9, 10, 11.
 * @throws std::invalid_argument for anything else and for numbers larger than @p maxQuestionNumber.
 */
[[nodiscard]] inline std::vector<size_t>
parseQuestionNumbers( const std::string& list,
                      size_t             maxQuestionNumber = MAX_QUESTION_NUMBER )
{
    const auto parseNumber =
        [&list, maxQuestionNumber] ( const std::string& token ) -> size_t
        {
            size_t parsedLength{ 0 };
            unsigned long long number{ 0 };
            try {
                number = std::stoull( token, &parsedLength );
            } catch ( const std::logic_error& ) {
                parsedLength = 0;
            }
            if ( token.empty() || ( parsedLength != token.size() ) || ( number == 0 ) ) {
                throw std::invalid_argument( "Invalid question number '" + token + "' in: " + list );
            }
            if ( number > maxQuestionNumber ) {
                throw std::invalid_argument( "Question number " + token + " exceeds the maximum of "
                                             + std::to_string( maxQuestionNumber ) + "!" );
            }
            return static_cast<size_t>( number );
        };

    std::vector<size_t> result;
    size_t tokenBegin{ 0 };
    while ( tokenBegin <= list.size() ) {
        auto tokenEnd = list.find( ',', tokenBegin );
        if ( tokenEnd == std::string::npos ) {
            tokenEnd = list.size();
        }
        const auto token = list.substr( tokenBegin, tokenEnd - tokenBegin );
        tokenBegin = tokenEnd + 1;

        if ( const auto dash = token.find( '-' ); dash != std::string::npos ) {
            const auto first = parseNumber( token.substr( 0, dash ) );
            const auto last = parseNumber( token.substr( dash + 1 ) );
            if ( first > last ) {
                throw std::invalid_argument( "Invalid question range '" + token + "' in: " + list );
            }
            for ( auto number = first; number <= last; ++number ) {
                result.push_back( number - 1 );
            }
        } else {
            result.push_back( parseNumber( token ) - 1 );
        }
    }
    return result;
}
