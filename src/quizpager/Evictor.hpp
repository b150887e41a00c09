#pragma once

#include <cstddef>
#include <vector>

#include <core/common.hpp>
#include <quizpager/ChunkCache.hpp>


namespace quizpager
{
/**
 * Removes every cached chunk outside [currentChunk - keepRadius, currentChunk + keepRadius].
 * Chunks still being fetched are not in the cache yet and therefore are never affected.
 * @return The evicted chunk IDs in ascending order.
 */
inline std::vector<size_t>
evictOutsideWindow( ChunkCache& cache,
                    size_t      currentChunk,
                    size_t      keepRadius )
{
    return cache.evictOutside( saturatingSubtraction( currentChunk, keepRadius ),
                               saturatingAddition( currentChunk, keepRadius ) );
}
}  // namespace quizpager
