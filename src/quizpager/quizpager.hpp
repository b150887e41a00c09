#pragma once

#include "AccessCoordinator.hpp"
#include "AssembledView.hpp"
#include "Chunk.hpp"
#include "ChunkCache.hpp"
#include "ChunkFetcher.hpp"
#include "ChunkPrefetcher.hpp"
#include "ChunkWriter.hpp"
#include "DatasetMetadata.hpp"
#include "Evictor.hpp"
#include "Json.hpp"
#include "MetadataProbe.hpp"
#include "PagingConfiguration.hpp"
#include "resource/File.hpp"
#include "resource/Http.hpp"
#include "resource/Memory.hpp"
#include "resource/ResourceReader.hpp"
