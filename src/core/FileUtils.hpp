#pragma once

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>


namespace quizpager
{
inline bool
fileExists( const std::filesystem::path& filePath )
{
    std::error_code errorCode;
    return std::filesystem::is_regular_file( filePath, errorCode );
}


using unique_file_ptr = std::unique_ptr<std::FILE, std::function<void ( std::FILE* )> >;

inline unique_file_ptr
make_unique_file_ptr( std::FILE* file )
{
    return {
        file,
        [] ( auto* ownedFile ) {
            if ( ownedFile != nullptr ) {
                std::fclose( ownedFile );  // NOLINT
            }
        }
    };
}


inline unique_file_ptr
make_unique_file_ptr( char const* const filePath,
                      char const* const mode )
{
    if ( ( filePath == nullptr ) || ( mode == nullptr ) || ( std::strlen( filePath ) == 0 ) ) {
        return {};
    }
    return make_unique_file_ptr( std::fopen( filePath, mode ) );  // NOLINT
}


inline unique_file_ptr
throwingOpen( const std::filesystem::path& filePath,
              const char*                  mode )
{
    if ( mode == nullptr ) {
        throw std::invalid_argument( "Mode must be a C-String and not null!" );
    }

    auto file = make_unique_file_ptr( filePath.string().c_str(), mode );
    if ( file == nullptr ) {
        std::stringstream msg;
        msg << "Opening file '" << filePath.string() << "' with mode '" << mode << "' failed!";
        throw std::invalid_argument( std::move( msg ).str() );
    }

    return file;
}


template<typename Container = std::string>
[[nodiscard]] Container
readFile( const std::filesystem::path& filePath )
{
    Container contents( std::filesystem::file_size( filePath ), '\0' );
    const auto file = throwingOpen( filePath, "rb" );
    const auto nBytesRead = std::fread( contents.data(), sizeof( contents[0] ), contents.size(), file.get() );

    if ( nBytesRead != contents.size() ) {
        throw std::runtime_error( "Did read less bytes than file is large: " + filePath.string() );
    }

    return contents;
}


inline void
writeFile( const std::filesystem::path& filePath,
           std::string_view             contents )
{
    const auto file = throwingOpen( filePath, "wb" );
    if ( std::fwrite( contents.data(), 1, contents.size(), file.get() ) != contents.size() ) {
        throw std::runtime_error( "Failed to write data to " + filePath.string() + "!" );
    }
}
}  // namespace quizpager
