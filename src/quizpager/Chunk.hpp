#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <json/json.h>


namespace quizpager
{
/** The paging cache never looks inside items. They are kept as parsed JSON for the consumers. */
using Item = Json::Value;


/**
 * A contiguous slice of a dataset. Chunks are only created complete and never mutated afterwards.
 */
struct Chunk
{
    size_t id{ 0 };
    std::vector<Item> items;
};


using SharedChunk = std::shared_ptr<const Chunk>;
}  // namespace quizpager
