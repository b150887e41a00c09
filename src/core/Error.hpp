#pragma once

#include <ostream>
#include <string>


namespace quizpager
{
enum class [[nodiscard]] Error
{
    NONE                    = 0x00,
    /* Not a failure. The dataset has no chunk layout and should be loaded as a whole. */
    NOT_CHUNKED             = 0x01,

    METADATA_UNAVAILABLE    = 0x10,

    /* Transport and chunk level errors. */
    CHUNK_NOT_FOUND         = 0x20,
    NETWORK_ERROR           = 0x21,
    MALFORMED_CHUNK         = 0x22,

    /* Errors returned to the navigation layer. */
    INDEX_OUT_OF_RANGE      = 0x30,
    CHUNK_UNAVAILABLE       = 0x31,

    /* The fetch completed for a session that has since been reset or switched. */
    STALE_GENERATION        = 0x40,
};


[[nodiscard]] inline std::string
toString( Error error )
{
    switch ( error )
    {
    case Error::NONE:
        return "No error.";
    case Error::NOT_CHUNKED:
        return "The dataset is not split into chunks.";
    case Error::METADATA_UNAVAILABLE:
        return "Dataset metadata is missing or could not be parsed!";
    case Error::CHUNK_NOT_FOUND:
        return "Requested chunk does not exist!";
    case Error::NETWORK_ERROR:
        return "Failed to transfer the resource!";
    case Error::MALFORMED_CHUNK:
        return "Chunk resource does not contain the expected item array!";
    case Error::INDEX_OUT_OF_RANGE:
        return "Item index lies outside of the dataset!";
    case Error::CHUNK_UNAVAILABLE:
        return "Chunk containing the requested item could not be loaded!";
    case Error::STALE_GENERATION:
        return "Result belongs to a dataset session that is no longer active.";
    }
    return "Unknown error code!";
}


/**
 * Transient errors are worth trying again on a later access. Malformed chunks are included because
 * the resource might get fixed server-side during the session.
 */
[[nodiscard]] constexpr bool
isRetryable( Error error ) noexcept
{
    return ( error == Error::NETWORK_ERROR ) || ( error == Error::MALFORMED_CHUNK );
}


inline std::ostream&
operator<<( std::ostream&    out,
            quizpager::Error error )
{
    out << toString( error );
    return out;
}
}  // namespace quizpager
