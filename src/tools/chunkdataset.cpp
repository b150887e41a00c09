#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>

#include <cxxopts.hpp>

#include <quizpager/ChunkWriter.hpp>

#include "CLIHelper.hpp"
#include "thirdparty.hpp"


using namespace quizpager;


void
printChunkDatasetHelp( const cxxopts::Options& options )
{
    std::cout
    << options.help()
    << "\n"
    << "Splits <data>/<dataset>/exam.json into <data>/<dataset>/chunks/chunk_<id>.json and writes\n"
    << "<data>/<dataset>/metadata.json, which enables chunked loading for that dataset.\n"
    << "\n"
    << "Examples:\n"
    << "\n"
    << "Chunk the dataset in data/CAD into chunks of 50 questions:\n"
    << "  quizpager-chunk --exam CAD\n"
    << "\n"
    << "Chunk all datasets with at least 200 questions and compress the chunks:\n"
    << "  quizpager-chunk --all --min-questions 200 --gzip\n"
    << "\n"
    << "Revert a dataset to unchunked loading:\n"
    << "  quizpager-chunk --cleanup CAD\n"
    << std::endl;
}


int
chunkDatasetCLI( int                  argc,
                 char const * const * argv )
{
    ChunkingOptions chunkingOptions;

    cxxopts::Options options( "quizpager-chunk", "Creates chunked versions of large question banks." );

    options.add_options( "Actions" )
        ( "e,exam"   , "Chunk the dataset with the given ID.", cxxopts::value<std::string>() )
        ( "all"      , "Chunk all datasets in the data folder with enough questions." )
        ( "cleanup"  , "Remove the chunks and the metadata of the dataset with the given ID.",
          cxxopts::value<std::string>() );

    options.add_options( "Chunking Options" )
        ( "d,data"   , "Folder containing one sub folder per dataset.",
          cxxopts::value<std::string>()->default_value( "data" ) )
        ( "c,chunk-size", "Questions per chunk.",
          cxxopts::value( chunkingOptions.chunkSize )->default_value( "50" ) )
        ( "min-questions", "Minimum number of questions for a dataset to be chunked with --all.",
          cxxopts::value<size_t>()->default_value( "100" ) )
        ( "f,force"  , "Overwrite existing chunks." )
        ( "z,gzip"   , "Write gzip-compressed chunks." );

    options.add_options( "Output Options" )
        ( "h,help"   , "Print this help message." )
        ( "v,verbose", "Print every created chunk." )
        ( "V,version", "Display software version." )
        ( "oss-attributions", "Display open-source software licenses." );

    const auto parsedArgs = options.parse( argc, argv );

    chunkingOptions.force = parsedArgs.count( "force" ) > 0;
    chunkingOptions.gzip = parsedArgs.count( "gzip" ) > 0;
    chunkingOptions.verbose = parsedArgs.count( "verbose" ) > 0;

    if ( parsedArgs.count( "help" ) > 0 ) {
        printChunkDatasetHelp( options );
        return 0;
    }

    if ( parsedArgs.count( "version" ) > 0 ) {
        std::cout << "quizpager-chunk, creates chunked question banks for quizpager version 0.1.0.\n";
        return 0;
    }

    if ( parsedArgs.count( "oss-attributions" ) > 0 ) {
        thirdparty::printAttributions( std::cout );
        return 0;
    }

    const std::filesystem::path dataFolder = parsedArgs["data"].as<std::string>();
    if ( !std::filesystem::is_directory( dataFolder ) ) {
        std::cerr << "Data folder " << dataFolder << " not found!\n";
        return 1;
    }

    if ( const auto datasetId = getOptionalString( parsedArgs, "cleanup" ); !datasetId.empty() ) {
        std::cout << "Removed " << cleanupChunks( dataFolder, datasetId ) << " items\n";
        return 0;
    }

    if ( const auto datasetId = getOptionalString( parsedArgs, "exam" ); !datasetId.empty() ) {
        const auto status = createChunks( dataFolder, datasetId, chunkingOptions );
        std::cout << datasetId << ": " << status << "\n";
        return status == ChunkingStatus::CREATED ? 0 : 1;
    }

    if ( parsedArgs.count( "all" ) > 0 ) {
        const auto results = createChunksForAll( dataFolder, parsedArgs["min-questions"].as<size_t>(),
                                                 chunkingOptions );
        size_t processed{ 0 };
        for ( const auto& [datasetId, status] : results ) {
            std::cout << datasetId << ": " << status << "\n";
            if ( status == ChunkingStatus::CREATED ) {
                ++processed;
            }
        }
        std::cout << "Processed " << processed << " of " << results.size() << " datasets\n";
        return 0;
    }

    std::cerr << "No suitable arguments were given. Please refer to the help!\n\n";
    printChunkDatasetHelp( options );
    return 1;
}


int
main( int argc, char** argv )
{
    try
    {
        return chunkDatasetCLI( argc, argv );
    }
    catch ( const std::exception& exception )
    {
        const std::string_view message{ exception.what() };
        if ( message.empty() ) {
            std::cerr << "Caught exception with typeid: " << typeid( exception ).name() << "\n";
        } else {
            std::cerr << "Caught exception: " << message << "\n";
        }
        return 1;
    }

    return 1;
}
