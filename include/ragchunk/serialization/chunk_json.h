#pragma once

#include <nlohmann/json.hpp>
#include <ragchunk/chunking/chunk.h>
#include <ragchunk/chunking/chunk_balancer.h>
#include <ragchunk/chunking/chunk_options.h>
#include <ragchunk/core/types.h>

#include <string>
#include <vector>

// nlohmann::json conversions, found by ADL. Field names are snake_case; unset optional
// fields are omitted on output and optional on input.
namespace ragchunk::chunking {

void to_json(nlohmann::json& j, const ChunkLocation& location);
void from_json(const nlohmann::json& j, ChunkLocation& location);

void to_json(nlohmann::json& j, const ChunkMetadata& metadata);
void from_json(const nlohmann::json& j, ChunkMetadata& metadata);

void to_json(nlohmann::json& j, const Chunk& chunk);
void from_json(const nlohmann::json& j, Chunk& chunk);

void to_json(nlohmann::json& j, const ChunkOptions& options);
void from_json(const nlohmann::json& j, ChunkOptions& options);

void to_json(nlohmann::json& j, const ChunkBalanceStats& stats);

} // namespace ragchunk::chunking

namespace ragchunk::serialization {

std::string chunksToJson(const std::vector<chunking::Chunk>& chunks, int indent = -1);

// Parse errors and type mismatches come back as InvalidData.
Result<std::vector<chunking::Chunk>> chunksFromJson(const std::string& text);

} // namespace ragchunk::serialization
