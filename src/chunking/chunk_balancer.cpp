#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <ragchunk/chunking/chunk_balancer.h>
#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/utf8.h>
#include "unit_packer.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <unordered_map>

namespace ragchunk::chunking {

namespace {

constexpr std::string_view kMergeSeparator = "\n\n";

size_t countNewlines(std::string_view text) {
    return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
}

// Content of a chunk without the text it repeats from its predecessor.
std::string_view withoutOverlap(const Chunk& chunk) {
    std::string_view content = chunk.content;
    const auto& overlap = chunk.metadata.overlap_from_previous;
    if (!overlap.empty() && content.substr(0, overlap.size()) == overlap) {
        content.remove_prefix(overlap.size());
    }
    return utf8::trim(content);
}

void mergeInto(Chunk& target, const Chunk& next, const language::LanguageProfile& profile) {
    auto tail = withoutOverlap(next);
    if (!tail.empty()) {
        target.content.append(kMergeSeparator);
        target.content.append(tail);
    }
    target.location.end_position = std::max(target.location.end_position, next.location.end_position);
    target.location.end_line = std::max(target.location.end_line, next.location.end_line);
    target.metadata.estimated_token_count = profile.estimateTokenCount(target.content);
    target.metadata.ends_at_sentence_boundary = next.metadata.ends_at_sentence_boundary;
    target.metadata.contains_section_header =
        target.metadata.contains_section_header || next.metadata.contains_section_header;
}

size_t lineAt(std::string_view text, size_t offset) {
    return 1 + countNewlines(text.substr(0, offset));
}

// True when childPath names a section nested below parentPath.
bool extendsPath(std::string_view childPath, std::string_view parentPath) {
    return !parentPath.empty() && childPath.size() > parentPath.size() &&
           childPath.substr(0, parentPath.size()) == parentPath &&
           childPath[parentPath.size()] == '/';
}

// Sentence units of text[begin, end); sentences above the maximum are cut into word runs.
Result<std::vector<detail::TextUnit>> splitUnits(std::string_view text, size_t begin, size_t end,
                                                 const ChunkOptions& options,
                                                 const language::LanguageProfile& profile,
                                                 const std::stop_token& stop) {
    ChunkOptions wordOptions = options;
    wordOptions.target_chunk_size = options.max_chunk_size;
    wordOptions.overlap_size = 0;
    wordOptions.preserve_sentences = false;

    std::vector<detail::TextUnit> units;
    for (const auto& unit : detail::sentenceUnits(text, begin, end, profile)) {
        if (unit.tokens <= options.max_chunk_size) {
            units.push_back(unit);
            continue;
        }
        auto pieces =
            TokenChunker::planRange(text, unit.start, unit.end, wordOptions, profile, stop);
        if (!pieces) {
            return pieces.error();
        }
        for (const auto& piece : pieces.value()) {
            units.push_back({piece.start, piece.end,
                             profile.estimateTokenCount(
                                 text.substr(piece.start, piece.end - piece.start)),
                             false});
        }
    }
    return units;
}

// Re-split the source range a chunk covers. Merged chunks cover the whole range from
// their first to their last part, so fragments are always slices of the source.
Result<std::vector<Chunk>> splitChunk(std::string_view text, const Chunk& chunk,
                                      const ChunkOptions& options,
                                      const language::LanguageProfile& profile,
                                      const std::stop_token& stop) {
    const size_t begin = chunk.location.start_position;
    const size_t end = chunk.location.end_position;
    auto split = splitUnits(text, begin, end, options, profile, stop);
    if (!split) {
        return split.error();
    }
    const auto& units = split.value();

    size_t totalTokens = 0;
    for (const auto& unit : units) {
        totalTokens += unit.tokens;
    }
    // Aim for equal parts so the tail is not left undersized.
    const size_t maxTokens = std::max<size_t>(1, options.max_chunk_size);
    const size_t parts = std::max<size_t>(1, (totalTokens + maxTokens - 1) / maxTokens);

    detail::PackLimits limits;
    limits.max_tokens = std::max<size_t>(1, (totalTokens + parts - 1) / parts);
    limits.overlap_tokens = 0;

    auto packed = detail::packUnits(units, limits, nullptr, stop);
    if (!packed) {
        return packed.error();
    }
    auto spans = detail::mergeSmallSpans(std::move(packed).value(), text,
                                         options.min_chunk_size, maxTokens, profile);

    std::vector<Chunk> fragments;
    fragments.reserve(spans.size());
    for (size_t k = 0; k < spans.size(); ++k) {
        const auto& span = spans[k];
        auto raw = text.substr(span.start, span.end - span.start);

        Chunk fragment = chunk;
        fragment.id = fmt::format("{}_{}", chunk.id, k + 1);
        fragment.content =
            options.trim_whitespace ? std::string(utf8::trim(raw)) : std::string(raw);
        if (options.normalize_whitespace) {
            fragment.content = utf8::normalizeWhitespace(fragment.content);
        }
        fragment.location.start_position = span.start;
        fragment.location.end_position = span.end;
        fragment.location.start_line = lineAt(text, span.start);
        fragment.location.end_line = lineAt(text, span.end > span.start ? span.end - 1 : span.end);

        auto& meta = fragment.metadata;
        meta.estimated_token_count = profile.estimateTokenCount(fragment.content);
        if (k > 0) {
            meta.overlap_from_previous.clear();
            meta.starts_at_sentence_boundary = true;
            meta.contains_section_header = false;
        }
        if (k + 1 < spans.size()) {
            meta.ends_at_sentence_boundary = true;
        }
        fragments.push_back(std::move(fragment));
    }
    return fragments;
}

} // namespace

Result<std::vector<Chunk>> ChunkBalancer::balance(std::vector<Chunk> chunks,
                                                  std::string_view text,
                                                  const ChunkOptions& options,
                                                  const language::LanguageProfile& profile,
                                                  std::stop_token stop) const {
    if (chunks.empty()) {
        return chunks;
    }

    // Parent of every chunk as produced, used to walk past merged-away sections.
    std::unordered_map<std::string, std::optional<std::string>> producedParents;
    for (const auto& chunk : chunks) {
        if (chunk.location.start_position > chunk.location.end_position ||
            chunk.location.end_position > text.size()) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Chunk {} [{}, {}) lies outside the {} byte source text",
                                     chunk.id, chunk.location.start_position,
                                     chunk.location.end_position, text.size())};
        }
        producedParents[chunk.id] = chunk.metadata.parent_id;
    }

    // Old id -> id of the chunk that now holds its text.
    std::unordered_map<std::string, std::string> redirects;

    // Pass 1: merge
    std::vector<Chunk> merged;
    merged.reserve(chunks.size());
    for (auto& chunk : chunks) {
        if (!merged.empty() &&
            merged.back().metadata.estimated_token_count < options.min_chunk_size) {
            redirects[chunk.id] = merged.back().id;
            mergeInto(merged.back(), chunk, profile);
            continue;
        }
        merged.push_back(std::move(chunk));
    }
    if (merged.size() > 1 &&
        merged.back().metadata.estimated_token_count < options.min_chunk_size) {
        auto last = std::move(merged.back());
        merged.pop_back();
        redirects[last.id] = merged.back().id;
        mergeInto(merged.back(), last, profile);
    }

    // Pass 2: split
    std::vector<Chunk> result;
    result.reserve(merged.size());
    for (auto& chunk : merged) {
        if (chunk.metadata.estimated_token_count <= options.max_chunk_size) {
            result.push_back(std::move(chunk));
            continue;
        }
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Chunk balancing cancelled"};
        }

        auto fragments = splitChunk(text, chunk, options, profile, stop);
        if (!fragments) {
            return fragments.error();
        }
        auto& parts = fragments.value();
        if (parts.empty()) {
            result.push_back(std::move(chunk));
            continue;
        }
        redirects[chunk.id] = parts.front().id;
        for (auto& part : parts) {
            result.push_back(std::move(part));
        }
    }

    auto resolve = [&redirects](std::string id) {
        for (size_t hops = 0; hops <= redirects.size(); ++hops) {
            auto it = redirects.find(id);
            if (it == redirects.end()) {
                break;
            }
            id = it->second;
        }
        return id;
    };

    std::unordered_map<std::string, size_t> positions;
    for (size_t i = 0; i < result.size(); ++i) {
        positions.emplace(result[i].id, i);
    }

    // Surviving chunk that can stand in for the parent of chunk i. A section chunk only
    // accepts a parent whose path its own path extends; when the parent section was
    // merged into an unrelated one, the search moves up to the grandparent.
    auto findParent = [&](size_t i) -> std::optional<std::string> {
        const auto& chunk = result[i];
        const auto& path = chunk.location.section_path;
        auto ancestor = chunk.metadata.parent_id;
        for (size_t hops = 0; ancestor && hops <= producedParents.size(); ++hops) {
            auto candidate = resolve(*ancestor);
            auto found = positions.find(candidate);
            if (candidate != chunk.id && found != positions.end() &&
                (path.empty() ||
                 extendsPath(path, result[found->second].location.section_path))) {
                return candidate;
            }
            auto up = producedParents.find(*ancestor);
            if (up == producedParents.end()) {
                break;
            }
            ancestor = up->second;
        }
        return std::nullopt;
    };

    for (size_t i = 0; i < result.size(); ++i) {
        result[i].index = i;
        result[i].total_chunks = result.size();
        if (result[i].metadata.parent_id) {
            result[i].metadata.parent_id = findParent(i);
        }
    }

    spdlog::debug("Balanced {} chunks into {} (min {}, max {})", chunks.size(), result.size(),
                  options.min_chunk_size, options.max_chunk_size);
    return result;
}

ChunkBalanceStats ChunkBalancer::calculateStats(const std::vector<Chunk>& chunks,
                                                const ChunkOptions& options) {
    ChunkBalanceStats stats;
    stats.chunk_count = chunks.size();
    if (chunks.empty()) {
        return stats;
    }

    stats.min_token_count = chunks.front().metadata.estimated_token_count;
    stats.max_token_count = stats.min_token_count;
    double sum = 0.0;
    for (const auto& chunk : chunks) {
        const size_t tokens = chunk.metadata.estimated_token_count;
        stats.min_token_count = std::min(stats.min_token_count, tokens);
        stats.max_token_count = std::max(stats.max_token_count, tokens);
        sum += static_cast<double>(tokens);
        if (tokens < options.min_chunk_size) {
            ++stats.undersized_chunk_count;
        }
        if (tokens > options.max_chunk_size) {
            ++stats.oversized_chunk_count;
        }
    }

    stats.average_token_count = sum / static_cast<double>(chunks.size());
    double squares = 0.0;
    for (const auto& chunk : chunks) {
        const double diff =
            static_cast<double>(chunk.metadata.estimated_token_count) - stats.average_token_count;
        squares += diff * diff;
    }
    stats.standard_deviation = std::sqrt(squares / static_cast<double>(chunks.size()));
    stats.variance_ratio = stats.min_token_count == 0
                               ? 0.0
                               : static_cast<double>(stats.max_token_count) /
                                     static_cast<double>(stats.min_token_count);
    return stats;
}

} // namespace ragchunk::chunking
