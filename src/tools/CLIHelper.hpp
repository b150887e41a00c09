#pragma once

#include <iostream>
#include <string>

#include <cxxopts.hpp>

#include "QuestionNumbers.hpp"


[[nodiscard]] inline std::string
getOptionalString( cxxopts::ParseResult const& parsedArgs,
                   std::string          const& argument )
{
    if ( parsedArgs.count( argument ) > 1 ) {
        std::cerr << "[Warning] Option --" << argument << " specified multiple times. Will only use the last one: "
                  << parsedArgs[argument].as<std::string>() << "!\n";
    }
    if ( parsedArgs.count( argument ) > 0 ) {
        return parsedArgs[argument].as<std::string>();
    }
    return {};
}
