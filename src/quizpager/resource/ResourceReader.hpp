#pragma once

#include <memory>
#include <string>
#include <utility>

#include <core/Error.hpp>


namespace quizpager
{
class ResourceReader;

using SharedResourceReader = std::shared_ptr<const ResourceReader>;


/**
 * Read-only access to the resources of all datasets addressed by a relative path like
 * "CAD/metadata.json" or "CAD/chunks/chunk_3.json".
 * Implementations must be safe to call concurrently because fetches run on worker threads.
 */
class ResourceReader
{
public:
    /**
     * The error is one of Error::NONE, Error::CHUNK_NOT_FOUND if the resource does not exist,
     * or Error::NETWORK_ERROR for any failure that might go away on retrying.
     */
    using Result = std::pair<std::string, Error>;

public:
    ResourceReader() = default;

    virtual
    ~ResourceReader() = default;

    /* Delete copy constructors and assignments to avoid slicing. */

    ResourceReader( const ResourceReader& ) = delete;

    ResourceReader( ResourceReader&& ) = delete;

    ResourceReader&
    operator=( const ResourceReader& ) = delete;

    ResourceReader&
    operator=( ResourceReader&& ) = delete;

    [[nodiscard]] virtual Result
    read( const std::string& path ) const = 0;

    /**
     * @return Human readable location of the resources for log messages.
     */
    [[nodiscard]] virtual std::string
    describe() const = 0;
};


[[nodiscard]] inline std::string
metadataPath( const std::string& datasetId )
{
    return datasetId + "/metadata.json";
}


[[nodiscard]] inline std::string
chunkPath( const std::string& datasetId,
           size_t             chunkId )
{
    return datasetId + "/chunks/chunk_" + std::to_string( chunkId ) + ".json";
}


/** Resource holding the whole dataset for callers that fall back to unchunked loading. */
[[nodiscard]] inline std::string
datasetPath( const std::string& datasetId )
{
    return datasetId + "/exam.json";
}
}  // namespace quizpager
