#pragma once

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <zlib.h>


namespace quizpager
{
/* > Add 16 to windowBits to write a simple gzip header and trailer around the
 * > compressed data instead of a zlib wrapper. */
static constexpr int GZIP_WINDOW_BITS = MAX_WBITS + 16;


[[nodiscard]] inline std::string
compressWithZlib( const std::string_view toCompress )
{
    std::string output;
    output.reserve( toCompress.size() / 2 );

    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.avail_in = static_cast<uInt>( toCompress.size() );
    stream.next_in = const_cast<Bytef*>( reinterpret_cast<const Bytef*>( toCompress.data() ) );

    if ( deflateInit2( &stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS,
                       /* memLevel */ 8, Z_DEFAULT_STRATEGY ) != Z_OK ) {
        throw std::runtime_error( "Failed to initialize zlib deflate stream!" );
    }

    auto status = Z_OK;
    constexpr size_t CHUNK_SIZE = 64U * 1024U;
    while ( status == Z_OK ) {
        output.resize( output.size() + CHUNK_SIZE );
        stream.next_out = reinterpret_cast<Bytef*>( output.data() + output.size() - CHUNK_SIZE );
        stream.avail_out = CHUNK_SIZE;
        status = ::deflate( &stream, Z_FINISH );
    }

    deflateEnd( &stream );

    if ( status != Z_STREAM_END ) {
        std::stringstream message;
        message << "Compression with zlib failed with error code " << status << "!";
        throw std::runtime_error( std::move( message ).str() );
    }

    output.resize( stream.total_out );
    return output;
}


/**
 * Decompresses a whole gzip stream into memory.
 * @throws std::runtime_error for corrupt or truncated input.
 */
[[nodiscard]] inline std::string
decompressWithZlib( const std::string_view toDecompress )
{
    std::string output;

    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.avail_in = static_cast<uInt>( toDecompress.size() );
    stream.next_in = const_cast<Bytef*>( reinterpret_cast<const Bytef*>( toDecompress.data() ) );

    if ( inflateInit2( &stream, GZIP_WINDOW_BITS ) != Z_OK ) {
        throw std::runtime_error( "Failed to initialize zlib inflate stream!" );
    }

    /* There always is fresh output space, so Z_BUF_ERROR means that the input ended prematurely. */
    auto status = Z_OK;
    constexpr size_t CHUNK_SIZE = 64U * 1024U;
    while ( status == Z_OK ) {
        output.resize( output.size() + CHUNK_SIZE );
        stream.next_out = reinterpret_cast<Bytef*>( output.data() + output.size() - CHUNK_SIZE );
        stream.avail_out = CHUNK_SIZE;
        status = ::inflate( &stream, Z_NO_FLUSH );
    }

    const auto totalOut = stream.total_out;
    inflateEnd( &stream );

    if ( status != Z_STREAM_END ) {
        std::stringstream message;
        message << "Decompression with zlib failed with error code " << status << "!";
        throw std::runtime_error( std::move( message ).str() );
    }

    output.resize( totalOut );
    return output;
}
}  // namespace quizpager
