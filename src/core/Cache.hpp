#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace quizpager
{
namespace CacheStrategy
{
template<typename Index>
class CacheStrategy
{
public:
    virtual
    ~CacheStrategy() = default;

    virtual void
    touch( Index index ) = 0;

    /**
     * @return The next eviction no matter whether the cache is currently full. Only returns nothing if the cache
     *         is empty, i.e., there is nothing to evict.
     */
    [[nodiscard]] virtual std::optional<Index>
    nextEviction() const = 0;

    /**
     * @param indexToEvict If an index is given, that index will be removed if it exists instead of using
     *                     the cache strategy.
     */
    virtual std::optional<Index>
    evict( std::optional<Index> indexToEvict = {} ) = 0;

    virtual void
    clear() = 0;
};


template<typename Index>
class LeastRecentlyUsed :
    public CacheStrategy<Index>
{
public:
    using Nonce = uint64_t;

public:
    LeastRecentlyUsed() = default;

    void
    touch( Index index ) override
    {
        ++m_usageNonce;
        auto [match, wasInserted] = m_lastUsage.try_emplace( index, m_usageNonce );
        if ( !wasInserted ) {
            m_sortedIndexes.erase( match->second );
            match->second = m_usageNonce;
        }
        m_sortedIndexes.emplace( m_usageNonce, std::move( index ) );
    }

    [[nodiscard]] std::optional<Index>
    nextEviction() const override
    {
        return m_sortedIndexes.empty() ? std::nullopt : std::make_optional( m_sortedIndexes.begin()->second );
    }

    std::optional<Index>
    evict( std::optional<Index> indexToEvict = {} ) override
    {
        auto evictedIndex = indexToEvict ? indexToEvict : nextEviction();
        if ( evictedIndex ) {
            const auto existingEntry = m_lastUsage.find( *evictedIndex );
            if ( existingEntry != m_lastUsage.end() ) {
                m_sortedIndexes.erase( existingEntry->second );
                m_lastUsage.erase( existingEntry );
            }
        }
        return evictedIndex;
    }

    void
    clear() override
    {
        m_lastUsage.clear();
        m_sortedIndexes.clear();
    }

private:
    std::unordered_map<Index, Nonce> m_lastUsage;

    /** Sorted by nonce, i.e., by time of last usage. m_sortedIndexes.begin holds the least recent index. */
    std::map<Nonce, Index> m_sortedIndexes;

    Nonce m_usageNonce{ 0 };
};
}


/**
 * Keyed store with an optional hard capacity enforced by the given strategy.
 * @ref get and @ref insert should be sufficient for simple cache usages.
 * For advanced control, there are also @ref clear, @ref evict, @ref evictIf, and @ref test available.
 * Calls are not thread-safe!
 */
template<
    typename Key,
    typename Value,
    typename CacheStrategy = CacheStrategy::LeastRecentlyUsed<Key>
>
class Cache
{
public:
    struct Statistics
    {
        size_t hits{ 0 };
        size_t misses{ 0 };
        size_t insertions{ 0 };
        size_t evictions{ 0 };
        /** Entries that got evicted without having been accessed with @ref get even once. */
        size_t unusedEntries{ 0 };
        size_t capacity{ 0 };
        size_t maxSize{ 0 };
    };

    static constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

public:
    explicit
    Cache( size_t maxCacheSize = UNBOUNDED ) :
        m_maxCacheSize( maxCacheSize )
    {
        if ( m_maxCacheSize == 0 ) {
            throw std::invalid_argument( "Cache capacity must be larger than zero!" );
        }
    }

    [[nodiscard]] std::optional<Value>
    get( const Key& key )
    {
        if ( const auto match = m_cache.find( key ); match != m_cache.end() ) {
            ++m_statistics.hits;
            ++m_accesses[key];
            m_cacheStrategy.touch( key );
            return match->second;
        }

        ++m_statistics.misses;
        return std::nullopt;
    }

    /**
     * Same as @ref get but does neither update the statistics nor the eviction order.
     */
    [[nodiscard]] std::optional<Value>
    peek( const Key& key ) const
    {
        if ( const auto match = m_cache.find( key ); match != m_cache.end() ) {
            return match->second;
        }
        return std::nullopt;
    }

    /**
     * Inserts or replaces. Replacing an existing key never triggers an eviction.
     * @return Keys that had to be evicted to stay inside the capacity.
     */
    std::vector<Key>
    insert( Key   key,
            Value value )
    {
        std::vector<Key> evicted;

        /* Do not use try_emplace here because that could temporarily exceed the allotted capacity. */
        if ( const auto existingEntry = m_cache.find( key ); existingEntry == m_cache.end() ) {
            evicted = shrinkTo( capacity() - 1 );
            m_cache.emplace( key, std::move( value ) );
            m_statistics.maxSize = std::max( m_statistics.maxSize, m_cache.size() );
        } else {
            existingEntry->second = std::move( value );
        }

        ++m_statistics.insertions;
        m_accesses.try_emplace( key, 0 );
        m_cacheStrategy.touch( std::move( key ) );
        return evicted;
    }

    [[nodiscard]] bool
    test( const Key& key ) const
    {
        return m_cache.find( key ) != m_cache.end();
    }

    void
    clear()
    {
        m_cache.clear();
        m_cacheStrategy.clear();
        m_accesses.clear();
    }

    /**
     * @return true if the key existed and was removed.
     */
    bool
    evict( const Key& key )
    {
        const auto match = m_cache.find( key );
        if ( match == m_cache.end() ) {
            return false;
        }

        m_cacheStrategy.evict( key );
        m_cache.erase( match );
        recordEviction( key );
        return true;
    }

    /**
     * Evicts all entries whose key satisfies @p predicate.
     * @return The evicted keys in no particular order.
     */
    std::vector<Key>
    evictIf( const std::function<bool( const Key& )>& predicate )
    {
        std::vector<Key> toEvict;
        for ( const auto& [key, value] : m_cache ) {
            if ( predicate( key ) ) {
                toEvict.emplace_back( key );
            }
        }

        for ( const auto& key : toEvict ) {
            evict( key );
        }
        return toEvict;
    }

    std::vector<Key>
    shrinkTo( size_t newSize )
    {
        std::vector<Key> evicted;
        while ( m_cache.size() > newSize ) {
            const auto toEvict = m_cacheStrategy.evict();
            const auto keyToEvict = toEvict ? *toEvict : m_cache.begin()->first;
            m_cache.erase( keyToEvict );
            recordEviction( keyToEvict );
            evicted.emplace_back( keyToEvict );
        }
        return evicted;
    }

    /**
     * @return All keys in ascending order.
     */
    [[nodiscard]] std::vector<Key>
    keys() const
    {
        std::vector<Key> result;
        result.reserve( m_cache.size() );
        for ( const auto& [key, value] : m_cache ) {
            result.emplace_back( key );
        }
        std::sort( result.begin(), result.end() );
        return result;
    }

    /* Analytics */

    [[nodiscard]] Statistics
    statistics() const
    {
        auto result = m_statistics;
        result.capacity = capacity();
        return result;
    }

    [[nodiscard]] size_t
    capacity() const
    {
        return m_maxCacheSize;
    }

    [[nodiscard]] size_t
    size() const
    {
        return m_cache.size();
    }

    [[nodiscard]] bool
    empty() const
    {
        return m_cache.empty();
    }

    [[nodiscard]] const auto&
    contents() const noexcept
    {
        return m_cache;
    }

private:
    void
    recordEviction( const Key& key )
    {
        ++m_statistics.evictions;
        if ( const auto match = m_accesses.find( key ); match != m_accesses.end() ) {
            if ( match->second == 0 ) {
                m_statistics.unusedEntries++;
            }
            m_accesses.erase( match );
        }
    }

private:
    CacheStrategy m_cacheStrategy;
    size_t const m_maxCacheSize;
    std::unordered_map<Key, Value> m_cache;

    /* Analytics */
    Statistics m_statistics;
    std::unordered_map<Key, size_t> m_accesses;
};
}  // namespace quizpager
