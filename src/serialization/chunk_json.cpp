#include <fmt/format.h>
#include <ragchunk/serialization/chunk_json.h>

#include <stdexcept>

namespace ragchunk::chunking {

using nlohmann::json;

namespace {

ChunkingStrategy strategyFromJson(const json& j) {
    auto name = j.get<std::string>();
    auto strategy = parseChunkingStrategy(name);
    if (!strategy) {
        throw std::invalid_argument(fmt::format("unknown chunking strategy '{}'", name));
    }
    return *strategy;
}

template <typename T> void readOptional(const json& j, const char* key, std::optional<T>& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = it->get<T>();
    } else {
        out.reset();
    }
}

} // namespace

void to_json(json& j, const ChunkLocation& location) {
    j = json{{"start_position", location.start_position},
             {"end_position", location.end_position},
             {"start_line", location.start_line},
             {"end_line", location.end_line},
             {"section_path", location.section_path}};
}

void from_json(const json& j, ChunkLocation& location) {
    j.at("start_position").get_to(location.start_position);
    j.at("end_position").get_to(location.end_position);
    location.start_line = j.value("start_line", size_t{1});
    location.end_line = j.value("end_line", size_t{1});
    location.section_path = j.value("section_path", std::string{});
}

void to_json(json& j, const ChunkMetadata& metadata) {
    j = json{{"estimated_token_count", metadata.estimated_token_count},
             {"strategy", toString(metadata.strategy)},
             {"language_code", metadata.language_code},
             {"starts_at_sentence_boundary", metadata.starts_at_sentence_boundary},
             {"ends_at_sentence_boundary", metadata.ends_at_sentence_boundary},
             {"contains_section_header", metadata.contains_section_header},
             {"overlap_from_previous", metadata.overlap_from_previous},
             {"quality_score", metadata.quality_score}};
    if (metadata.hierarchy_level) {
        j["hierarchy_level"] = *metadata.hierarchy_level;
    }
    if (metadata.parent_id) {
        j["parent_id"] = *metadata.parent_id;
    }
    if (metadata.section_title) {
        j["section_title"] = *metadata.section_title;
    }
}

void from_json(const json& j, ChunkMetadata& metadata) {
    metadata.estimated_token_count = j.value("estimated_token_count", size_t{0});
    metadata.strategy = strategyFromJson(j.at("strategy"));
    metadata.language_code = j.value("language_code", std::string{});
    metadata.starts_at_sentence_boundary = j.value("starts_at_sentence_boundary", false);
    metadata.ends_at_sentence_boundary = j.value("ends_at_sentence_boundary", false);
    metadata.contains_section_header = j.value("contains_section_header", false);
    metadata.overlap_from_previous = j.value("overlap_from_previous", std::string{});
    metadata.quality_score = j.value("quality_score", 1.0);
    readOptional(j, "hierarchy_level", metadata.hierarchy_level);
    readOptional(j, "parent_id", metadata.parent_id);
    readOptional(j, "section_title", metadata.section_title);
}

void to_json(json& j, const Chunk& chunk) {
    j = json{{"id", chunk.id},
             {"index", chunk.index},
             {"total_chunks", chunk.total_chunks},
             {"content", chunk.content},
             {"location", chunk.location},
             {"metadata", chunk.metadata}};
}

void from_json(const json& j, Chunk& chunk) {
    j.at("id").get_to(chunk.id);
    j.at("index").get_to(chunk.index);
    j.at("total_chunks").get_to(chunk.total_chunks);
    j.at("content").get_to(chunk.content);
    j.at("location").get_to(chunk.location);
    j.at("metadata").get_to(chunk.metadata);
}

void to_json(json& j, const ChunkOptions& options) {
    j = json{{"strategy", toString(options.strategy)},
             {"target_chunk_size", options.target_chunk_size},
             {"min_chunk_size", options.min_chunk_size},
             {"max_chunk_size", options.max_chunk_size},
             {"overlap_size", options.overlap_size},
             {"preserve_sentences", options.preserve_sentences},
             {"preserve_paragraphs", options.preserve_paragraphs},
             {"semantic_similarity_threshold", options.semantic_similarity_threshold},
             {"enable_chunk_balancing", options.enable_chunk_balancing},
             {"trim_whitespace", options.trim_whitespace},
             {"normalize_whitespace", options.normalize_whitespace}};
    if (options.language_code) {
        j["language_code"] = *options.language_code;
    }
}

void from_json(const json& j, ChunkOptions& options) {
    const ChunkOptions defaults;
    options.strategy = j.contains("strategy") ? strategyFromJson(j.at("strategy"))
                                              : defaults.strategy;
    options.target_chunk_size = j.value("target_chunk_size", defaults.target_chunk_size);
    options.min_chunk_size = j.value("min_chunk_size", defaults.min_chunk_size);
    options.max_chunk_size = j.value("max_chunk_size", defaults.max_chunk_size);
    options.overlap_size = j.value("overlap_size", defaults.overlap_size);
    readOptional(j, "language_code", options.language_code);
    options.preserve_sentences = j.value("preserve_sentences", defaults.preserve_sentences);
    options.preserve_paragraphs = j.value("preserve_paragraphs", defaults.preserve_paragraphs);
    options.semantic_similarity_threshold =
        j.value("semantic_similarity_threshold", defaults.semantic_similarity_threshold);
    options.enable_chunk_balancing =
        j.value("enable_chunk_balancing", defaults.enable_chunk_balancing);
    options.trim_whitespace = j.value("trim_whitespace", defaults.trim_whitespace);
    options.normalize_whitespace = j.value("normalize_whitespace", defaults.normalize_whitespace);
}

void to_json(json& j, const ChunkBalanceStats& stats) {
    j = json{{"chunk_count", stats.chunk_count},
             {"min_token_count", stats.min_token_count},
             {"max_token_count", stats.max_token_count},
             {"average_token_count", stats.average_token_count},
             {"standard_deviation", stats.standard_deviation},
             {"variance_ratio", stats.variance_ratio},
             {"undersized_chunk_count", stats.undersized_chunk_count},
             {"oversized_chunk_count", stats.oversized_chunk_count},
             {"is_balanced", stats.isBalanced()}};
}

} // namespace ragchunk::chunking

namespace ragchunk::serialization {

std::string chunksToJson(const std::vector<chunking::Chunk>& chunks, int indent) {
    return nlohmann::json(chunks).dump(indent);
}

Result<std::vector<chunking::Chunk>> chunksFromJson(const std::string& text) {
    try {
        auto parsed = nlohmann::json::parse(text);
        return parsed.get<std::vector<chunking::Chunk>>();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, fmt::format("Invalid chunk JSON: {}", e.what())};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::InvalidData, fmt::format("Invalid chunk JSON: {}", e.what())};
    }
}

} // namespace ragchunk::serialization
