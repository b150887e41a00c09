#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>

#include <cxxopts.hpp>

#include <core/common.hpp>
#include <quizpager/quizpager.hpp>

#include "CLIHelper.hpp"
#include "thirdparty.hpp"


using namespace quizpager;


void
printQuizpagerHelp( const cxxopts::Options& options )
{
    std::cout
    << options.help()
    << "\n"
    << "Opens a question bank from a data folder or web server and prints the requested questions.\n"
    << "Chunked datasets are loaded chunk by chunk as described by <dataset>/metadata.json.\n"
    << "Other datasets are loaded as a whole from <dataset>/exam.json.\n"
    << "\n"
    << "Examples:\n"
    << "\n"
    << "Print questions 1, 75, and 101 to 105 of the dataset in data/CAD:\n"
    << "  quizpager --data data CAD -q 1,75,101-105\n"
    << "\n"
    << "Show how much of a dataset served by a web server stays in memory while paging through it:\n"
    << "  quizpager --url https://example.com/data CAD -q 1-500 --stats --keep-radius 1\n"
    << std::endl;
}


void
printEntry( const AssembledView::Entry& entry,
            bool                        asJson )
{
    if ( asJson ) {
        std::cout << toJsonString( entry.toJson(), /* indentation */ "" ) << "\n";
        return;
    }

    std::cout << "[" << entry.index() + 1 << "] ";
    if ( entry.isPlaceholder() ) {
        std::cout << "<loading chunk " << entry.chunkId() << ">\n";
        return;
    }

    const auto& question = entry.item()["question"];
    std::cout << ( question.isString() ? question.asString() : toJsonString( entry.item(), "" ) ) << "\n";
}


/**
 * Serves datasets without chunk metadata by loading all questions at once.
 */
int
printWholeDataset( const ResourceReader&      reader,
                   const std::string&         datasetId,
                   const std::vector<size_t>& indexes,
                   bool                       asJson )
{
    const auto [contents, error] = reader.read( datasetPath( datasetId ) );
    if ( error != Error::NONE ) {
        std::cerr << "Failed to read " << datasetPath( datasetId ) << " from " << reader.describe() << ": "
                  << error << "\n";
        return 1;
    }

    const auto dataset = parseJson( contents );
    if ( !dataset || !( *dataset )["questions"].isArray() ) {
        std::cerr << "Dataset " << datasetId << " does not contain a question array!\n";
        return 1;
    }

    const auto& questions = ( *dataset )["questions"];
    std::cerr << "Loaded " << questions.size() << " questions of " << datasetId << " as a whole.\n";

    for ( const auto index : indexes ) {
        if ( index >= questions.size() ) {
            std::cerr << "[Warning] Question " << index + 1 << " does not exist.\n";
            continue;
        }
        printEntry( AssembledView::Entry( index, 0, &questions[static_cast<Json::ArrayIndex>( index )] ), asJson );
    }
    return 0;
}


int
quizpagerCLI( int                  argc,
              char const * const * argv )
{
    PagingConfiguration configuration;

    cxxopts::Options options( "quizpager", "Pages through large question banks chunk by chunk." );

    options.add_options( "Input Options" )
        ( "d,data"   , "Local folder containing one sub folder per dataset.",
          cxxopts::value<std::string>()->default_value( "data" ) )
        ( "u,url"    , "Base URL of a web server serving the same layout as the data folder. "
                       "Takes precedence over --data.", cxxopts::value<std::string>() )
        ( "timeout"  , "Timeout in seconds for each HTTP request.",
          cxxopts::value<unsigned int>()->default_value( "30" ) )
        ( "dataset"  , "Dataset ID, i.e., the name of the sub folder.", cxxopts::value<std::string>() );

    options.add_options( "Paging Options" )
        ( "c,chunk-size", "Questions per chunk if the metadata does not specify it.",
          cxxopts::value( configuration.chunkSize )->default_value( "50" ) )
        ( "p,prefetch-radius", "Chunks to prefetch on each side of the accessed chunk.",
          cxxopts::value( configuration.prefetchRadius )->default_value( "1" ) )
        ( "k,keep-radius", "Chunks to keep cached on each side of the accessed chunk.",
          cxxopts::value( configuration.keepRadius )->default_value( "2" ) )
        ( "P,parallelization", "Number of threads fetching chunks. 0 uses as many as there are cores.",
          cxxopts::value( configuration.parallelization )->default_value( "0" ) )
        ( "cooldown", "Seconds during which prefetching skips a chunk that failed to load.",
          cxxopts::value( configuration.failureCooldown )->default_value( "1" ) )
        ( "max-cached-chunks", "Hard limit for cached chunks. 0 means no limit.",
          cxxopts::value( configuration.maxCachedChunks )->default_value( "0" ) )
        ( "no-lazy-loading", "Always load datasets as a whole." );

    options.add_options( "Output Options" )
        ( "q,questions", "Comma-separated 1-based question numbers or ranges to print, e.g., 1,75,101-105.",
          cxxopts::value<std::string>() )
        ( "json"     , "Print each question as one line of JSON." )
        ( "s,stats"  , "Print the memory statistics after printing the questions." )
        ( "h,help"   , "Print this help message." )
        ( "v,verbose", "Print debug output and profiling statistics." )
        ( "V,version", "Display software version." )
        ( "oss-attributions", "Display open-source software licenses." );

    options.parse_positional( { "dataset" } );

    const auto parsedArgs = options.parse( argc, argv );

    configuration.verbose = parsedArgs.count( "verbose" ) > 0;
    configuration.enableLazyLoading = parsedArgs.count( "no-lazy-loading" ) == 0;

    /* Check against simple commands like help and version. */

    if ( parsedArgs.count( "help" ) > 0 ) {
        printQuizpagerHelp( options );
        return 0;
    }

    if ( parsedArgs.count( "version" ) > 0 ) {
        std::cout << "quizpager, CLI to the chunked lazy-loading question bank pager version 0.1.0.\n";
        return 0;
    }

    if ( parsedArgs.count( "oss-attributions" ) > 0 ) {
        thirdparty::printAttributions( std::cout );
        return 0;
    }

    const auto datasetId = getOptionalString( parsedArgs, "dataset" );
    if ( datasetId.empty() ) {
        std::cerr << "A dataset must be specified!\n";
        return 1;
    }

    const auto questions = getOptionalString( parsedArgs, "questions" );
    const auto indexes = questions.empty() ? std::vector<size_t>{} : parseQuestionNumbers( questions );
    const auto asJson = parsedArgs.count( "json" ) > 0;

    SharedResourceReader reader;
    if ( const auto url = getOptionalString( parsedArgs, "url" ); !url.empty() ) {
        const std::chrono::seconds timeout( parsedArgs["timeout"].as<unsigned int>() );
        reader = std::make_shared<const HttpResourceReader>( url, timeout );
    } else {
        reader = std::make_shared<const FileResourceReader>( parsedArgs["data"].as<std::string>() );
    }

    if ( configuration.verbose ) {
        std::cerr << "Reading " << datasetId << " from " << reader->describe() << " with " << configuration << "\n";
    }

    AccessCoordinator coordinator( reader, configuration );
    coordinator.setShowProfileOnDestruction( configuration.verbose );

    if ( coordinator.open( datasetId ) == Error::NOT_CHUNKED ) {
        return printWholeDataset( *reader, datasetId, indexes, asJson );
    }

    if ( const auto metadata = coordinator.metadata(); metadata ) {
        std::cerr << "Opened " << *metadata << "\n";
    }

    const auto t0 = now();
    size_t failedLoads{ 0 };
    for ( const auto index : indexes ) {
        const auto error = coordinator.ensureLoaded( index );
        if ( error == Error::INDEX_OUT_OF_RANGE ) {
            std::cerr << "[Warning] Question " << index + 1 << " does not exist.\n";
            continue;
        }
        if ( error != Error::NONE ) {
            ++failedLoads;
        }

        /* Even on failure, the view has the placeholder to show. */
        printEntry( coordinator.view()->at( index ), asJson );
    }

    if ( configuration.verbose ) {
        std::cerr << "Printed " << indexes.size() << " questions in " << duration( t0 ) << " s\n";
    }

    if ( parsedArgs.count( "stats" ) > 0 ) {
        coordinator.waitForPendingFetches();
        std::cerr << "[Memory Statistics]" << coordinator.memoryStatistics().print() << "\n";
    }

    return failedLoads == 0 ? 0 : 2;
}


int
main( int argc, char** argv )
{
    try
    {
        return quizpagerCLI( argc, argv );
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
