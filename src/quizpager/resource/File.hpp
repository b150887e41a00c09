#pragma once

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

#include <core/common.hpp>
#include <core/FileUtils.hpp>

#include "ResourceReader.hpp"
#include "zlib.hpp"


namespace quizpager
{
/**
 * Serves resources from a local data folder laid out like the web site, e.g., data/CAD/chunks/chunk_0.json.
 * If a resource does not exist but the same path with an additional ".gz" suffix does, then
 * that file is decompressed on the fly.
 */
class FileResourceReader :
    public ResourceReader
{
public:
    explicit
    FileResourceReader( std::filesystem::path rootFolder ) :
        m_rootFolder( std::move( rootFolder ) )
    {
        std::error_code errorCode;
        if ( !std::filesystem::is_directory( m_rootFolder, errorCode ) ) {
            throw std::invalid_argument( "Data folder does not exist: " + m_rootFolder.string() );
        }
    }

    [[nodiscard]] Result
    read( const std::string& path ) const override
    {
        const auto filePath = m_rootFolder / path;
        auto compressedPath = filePath;
        compressedPath += ".gz";

        try {
            if ( fileExists( filePath ) ) {
                return { readFile( filePath ), Error::NONE };
            }
            if ( fileExists( compressedPath ) ) {
                return { decompressWithZlib( readFile( compressedPath ) ), Error::NONE };
            }
        } catch ( const std::exception& exception ) {
            std::cerr << ( ThreadSafeOutput() << "[FileResourceReader::read] Failed to read" << path << ":"
                           << exception.what() );
            return { {}, Error::NETWORK_ERROR };
        }

        return { {}, Error::CHUNK_NOT_FOUND };
    }

    [[nodiscard]] std::string
    describe() const override
    {
        return m_rootFolder.string();
    }

    [[nodiscard]] const std::filesystem::path&
    rootFolder() const noexcept
    {
        return m_rootFolder;
    }

private:
    const std::filesystem::path m_rootFolder;
};
}  // namespace quizpager
