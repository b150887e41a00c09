#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <core/common.hpp>

#include "ResourceReader.hpp"


namespace quizpager
{
/**
 * Serves resources from memory. Besides embedding, this is used for testing: failures can be injected
 * per path, reads can be delayed or held back until @ref resume, and every read is counted.
 */
class MemoryResourceReader :
    public ResourceReader
{
public:
    MemoryResourceReader() = default;

    explicit
    MemoryResourceReader( std::map<std::string, std::string> resources ) :
        m_resources( std::move( resources ) )
    {}

    [[nodiscard]] Result
    read( const std::string& path ) const override
    {
        std::chrono::milliseconds latency{ 0 };
        {
            std::unique_lock lock( m_mutex );
            ++m_readCounts[path];
            ++m_waitingReads;
            m_changed.notify_all();
            m_changed.wait( lock, [this] () { return !m_paused; } );
            --m_waitingReads;
            latency = m_latency;
        }

        if ( latency.count() > 0 ) {
            std::this_thread::sleep_for( latency );
        }

        const std::scoped_lock lock( m_mutex );
        if ( const auto failure = m_failures.find( path ); failure != m_failures.end() ) {
            return { {}, failure->second };
        }
        if ( const auto match = m_resources.find( path ); match != m_resources.end() ) {
            return { match->second, Error::NONE };
        }
        return { {}, Error::CHUNK_NOT_FOUND };
    }

    [[nodiscard]] std::string
    describe() const override
    {
        return "<memory>";
    }

    void
    insert( const std::string& path,
            std::string        contents )
    {
        const std::scoped_lock lock( m_mutex );
        m_resources[path] = std::move( contents );
    }

    void
    erase( const std::string& path )
    {
        const std::scoped_lock lock( m_mutex );
        m_resources.erase( path );
    }

    /**
     * All subsequent reads of @p path fail with @p error until @ref clearFailure is called.
     */
    void
    setFailure( const std::string& path,
                Error              error )
    {
        const std::scoped_lock lock( m_mutex );
        m_failures[path] = error;
    }

    void
    clearFailure( const std::string& path )
    {
        const std::scoped_lock lock( m_mutex );
        m_failures.erase( path );
    }

    void
    setLatency( std::chrono::milliseconds latency )
    {
        const std::scoped_lock lock( m_mutex );
        m_latency = latency;
    }

    /**
     * Reads started after this call block until @ref resume is called.
     */
    void
    pause()
    {
        const std::scoped_lock lock( m_mutex );
        m_paused = true;
    }

    void
    resume()
    {
        const std::scoped_lock lock( m_mutex );
        m_paused = false;
        m_changed.notify_all();
    }

    /**
     * Blocks until at least @p count reads are held back by @ref pause.
     * @return false if the timeout was reached first.
     */
    [[nodiscard]] bool
    waitForWaitingReads( size_t                    count,
                         std::chrono::milliseconds timeout = std::chrono::seconds( 10 ) ) const
    {
        std::unique_lock lock( m_mutex );
        return m_changed.wait_for( lock, timeout, [this, count] () { return m_waitingReads >= count; } );
    }

    [[nodiscard]] size_t
    readCount( const std::string& path ) const
    {
        const std::scoped_lock lock( m_mutex );
        const auto match = m_readCounts.find( path );
        return match == m_readCounts.end() ? 0 : match->second;
    }

    [[nodiscard]] size_t
    totalReadCount() const
    {
        const std::scoped_lock lock( m_mutex );
        size_t result{ 0 };
        for ( const auto& [path, count] : m_readCounts ) {
            result += count;
        }
        return result;
    }

    void
    resetReadCounts()
    {
        const std::scoped_lock lock( m_mutex );
        m_readCounts.clear();
    }

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_changed;

    std::map<std::string, std::string> m_resources;
    std::map<std::string, Error> m_failures;
    std::chrono::milliseconds m_latency{ 0 };
    bool m_paused{ false };

    mutable std::map<std::string, size_t> m_readCounts;
    mutable size_t m_waitingReads{ 0 };
};
}  // namespace quizpager
