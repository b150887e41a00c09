#pragma once

#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "common.hpp"


namespace quizpager
{
int gnTests = 0;  // NOLINT
int gnTestErrors = 0;  // NOLINT


template<typename A,
         typename B>
void
requireEqual( const A&  a,
              const B&  b,
              const int line )
{
    ++gnTests;
    if ( a != b ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << a << " != " << b << "\n";
    }
}


void
require( bool               condition,
         std::string const& conditionString,
         int                line )
{
    ++gnTests;
    if ( !condition ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << conditionString << "\n";
    }
}


#define REQUIRE_EQUAL( a, b ) requireEqual( a, b, __LINE__ )  // NOLINT
#define REQUIRE( condition ) require( condition, #condition, __LINE__ )  // NOLINT
#define REQUIRE_THROWS( condition ) require( [&] () { \
    try { \
        (void)condition; \
    } catch ( const std::exception& ) { \
        return true; \
    } \
    return false; \
} (), #condition, __LINE__ )  // NOLINT


/**
 * Redirects everything written to the given stream into an internal buffer until destruction or @ref close.
 * Writes are serialized so that worker threads may log concurrently.
 */
class StreamInterceptor :
    public std::stringbuf
{
public:
    explicit
    StreamInterceptor( std::ostream& out ) :
        m_out( out ),
        m_rdbuf( m_out.rdbuf( this ) )
    {}

    ~StreamInterceptor()
    {
        close();
    }

    void
    close()
    {
        if ( m_rdbuf.has_value() ) {
            m_out.rdbuf( *m_rdbuf );
            m_rdbuf.reset();
        }
    }

    [[nodiscard]] std::string
    contents()
    {
        const std::scoped_lock lock( m_mutex );
        return str();
    }

    StreamInterceptor( const StreamInterceptor& ) = delete;
    StreamInterceptor( StreamInterceptor&& ) = delete;
    StreamInterceptor& operator=( const StreamInterceptor& ) = delete;
    StreamInterceptor& operator=( StreamInterceptor&& ) = delete;

protected:
    std::streamsize
    xsputn( char_type const* s,
            std::streamsize  count ) override
    {
        const std::scoped_lock lock( m_mutex );
        return std::stringbuf::xsputn( s, count );
    }

    int_type
    overflow( int_type c ) override
    {
        const std::scoped_lock lock( m_mutex );
        return std::stringbuf::overflow( c );
    }

private:
    std::recursive_mutex m_mutex;
    std::ostream& m_out;
    std::optional<std::streambuf*> m_rdbuf;
};


class TemporaryDirectory
{
public:
    explicit
    TemporaryDirectory( std::filesystem::path path ) :
        m_path( std::move( path ) )
    {}

    TemporaryDirectory( TemporaryDirectory&& other ) :
        m_path( std::exchange( other.m_path, {} ) )
    {}

    TemporaryDirectory( const TemporaryDirectory& ) = delete;

    TemporaryDirectory&
    operator=( TemporaryDirectory&& ) = delete;

    TemporaryDirectory&
    operator=( const TemporaryDirectory& ) = delete;

    ~TemporaryDirectory()
    {
        if ( !m_path.empty() ) {
            std::error_code errorCode;
            std::filesystem::remove_all( m_path, errorCode );
        }
    }

    [[nodiscard]] operator std::filesystem::path() const
    {
        return m_path;
    }

    [[nodiscard]] const std::filesystem::path&
    path() const
    {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};


[[nodiscard]] inline TemporaryDirectory
createTemporaryDirectory( const std::string& title = "tmpTest" )
{
    const auto tmpFolder = std::filesystem::temp_directory_path()
                           / ( title + "." + std::to_string( unixTimeInNanoseconds() ) );
    std::filesystem::create_directories( tmpFolder );
    return TemporaryDirectory( tmpFolder );
}
}  // namespace quizpager
