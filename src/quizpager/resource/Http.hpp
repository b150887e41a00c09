#pragma once

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>

#include <core/common.hpp>

#include "ResourceReader.hpp"


namespace quizpager
{
/**
 * Fetches resources with one HTTP GET request each. Supports every URL scheme that libcurl supports,
 * e.g., also file:// URLs.
 */
class HttpResourceReader :
    public ResourceReader
{
public:
    explicit
    HttpResourceReader( std::string               baseUrl,
                        std::chrono::milliseconds timeout = std::chrono::seconds( 30 ) ) :
        m_baseUrl( std::move( baseUrl ) ),
        m_timeout( timeout )
    {
        while ( endsWith( m_baseUrl, std::string_view( "/" ) ) ) {
            m_baseUrl.pop_back();
        }
        if ( m_baseUrl.empty() ) {
            throw std::invalid_argument( "Base URL must not be empty!" );
        }

        static std::once_flag curlInitialized;
        std::call_once( curlInitialized, [] () {
            if ( curl_global_init( CURL_GLOBAL_DEFAULT ) != CURLE_OK ) {
                throw std::runtime_error( "Failed to initialize libcurl!" );
            }
        } );
    }

    [[nodiscard]] Result
    read( const std::string& path ) const override
    {
        const auto url = m_baseUrl + "/" + path;

        const std::unique_ptr<CURL, decltype( &curl_easy_cleanup )> handle( curl_easy_init(), &curl_easy_cleanup );
        if ( !handle ) {
            std::cerr << ( ThreadSafeOutput() << "[HttpResourceReader::read] Failed to create curl handle for" << url );
            return { {}, Error::NETWORK_ERROR };
        }

        std::string body;
        char errorBuffer[CURL_ERROR_SIZE] = {};
        curl_easy_setopt( handle.get(), CURLOPT_URL, url.c_str() );
        curl_easy_setopt( handle.get(), CURLOPT_WRITEFUNCTION, &HttpResourceReader::appendToString );
        curl_easy_setopt( handle.get(), CURLOPT_WRITEDATA, &body );
        curl_easy_setopt( handle.get(), CURLOPT_ERRORBUFFER, errorBuffer );
        curl_easy_setopt( handle.get(), CURLOPT_FOLLOWLOCATION, 1L );
        curl_easy_setopt( handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>( m_timeout.count() ) );
        /* Signals cannot be used for timeouts in multi-threaded programs. */
        curl_easy_setopt( handle.get(), CURLOPT_NOSIGNAL, 1L );
        /* An empty string enables all encodings supported by the linked libcurl, e.g., gzip. */
        curl_easy_setopt( handle.get(), CURLOPT_ACCEPT_ENCODING, "" );

        const auto result = curl_easy_perform( handle.get() );
        if ( ( result == CURLE_FILE_COULDNT_READ_FILE ) || ( result == CURLE_REMOTE_FILE_NOT_FOUND ) ) {
            return { {}, Error::CHUNK_NOT_FOUND };
        }
        if ( result != CURLE_OK ) {
            std::cerr << ( ThreadSafeOutput() << "[HttpResourceReader::read] Request to" << url << "failed:"
                           << ( errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror( result ) ) );
            return { {}, Error::NETWORK_ERROR };
        }

        long responseCode{ 0 };
        curl_easy_getinfo( handle.get(), CURLINFO_RESPONSE_CODE, &responseCode );

        /* Protocols without status codes, e.g., file://, report 0. */
        if ( ( responseCode == 0 ) || ( ( responseCode >= 200 ) && ( responseCode < 300 ) ) ) {
            return { std::move( body ), Error::NONE };
        }
        if ( ( responseCode == 404 ) || ( responseCode == 410 ) ) {
            return { {}, Error::CHUNK_NOT_FOUND };
        }

        std::cerr << ( ThreadSafeOutput() << "[HttpResourceReader::read] Request to" << url
                       << "returned HTTP status" << responseCode );
        return { {}, Error::NETWORK_ERROR };
    }

    [[nodiscard]] std::string
    describe() const override
    {
        return m_baseUrl;
    }

private:
    static size_t
    appendToString( char*  data,
                    size_t size,
                    size_t count,
                    void*  userData )
    {
        auto* const body = static_cast<std::string*>( userData );
        body->append( data, size * count );
        return size * count;
    }

private:
    std::string m_baseUrl;
    const std::chrono::milliseconds m_timeout;
};
}  // namespace quizpager
