#include <spdlog/spdlog.h>
#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/utf8.h>
#include "unit_packer.h"

#include <algorithm>

namespace ragchunk::chunking {

namespace {

// Arena node; parent and children are indices into the same vector.
struct SectionNode {
    size_t start = 0; // Header line start (or 0 for the preamble)
    size_t end = 0;   // Start of the next header of any level
    int level = 0;
    std::optional<std::string> title;
    std::string path;
    std::optional<size_t> parent;
    std::vector<size_t> children;
    bool absorbed = false; // Merged into the preceding sibling
};

std::vector<SectionNode> buildTree(std::string_view text,
                                   const std::vector<language::SectionHeader>& headers) {
    std::vector<SectionNode> nodes;

    const size_t firstHeader = headers.empty() ? text.size() : headers.front().start;
    if (!utf8::isBlank(text.substr(0, firstHeader))) {
        SectionNode preamble;
        preamble.start = 0;
        preamble.end = firstHeader;
        nodes.push_back(std::move(preamble));
    }

    std::vector<size_t> stack;
    for (size_t h = 0; h < headers.size(); ++h) {
        const auto& header = headers[h];
        while (!stack.empty() && nodes[stack.back()].level >= header.level) {
            stack.pop_back();
        }

        SectionNode node;
        node.start = header.start;
        node.end = h + 1 < headers.size() ? headers[h + 1].start : text.size();
        node.level = header.level;
        node.title = header.title;
        if (!stack.empty()) {
            node.parent = stack.back();
            node.path = nodes[stack.back()].path + "/" + header.title;
        } else {
            node.path = header.title;
        }

        const size_t index = nodes.size();
        if (node.parent) {
            nodes[*node.parent].children.push_back(index);
        }
        nodes.push_back(std::move(node));
        stack.push_back(index);
    }
    return nodes;
}

size_t nodeTokens(std::string_view text, const SectionNode& node,
                  const language::LanguageProfile& profile) {
    return profile.estimateTokenCount(text.substr(node.start, node.end - node.start));
}

// An undersized leaf absorbs the following leaf sibling while the result fits.
void mergeSmallLeaves(std::string_view text, std::vector<SectionNode>& nodes,
                      const ChunkOptions& options, const language::LanguageProfile& profile) {
    for (size_t i = 0; i < nodes.size(); ++i) {
        auto& node = nodes[i];
        if (node.absorbed || !node.children.empty()) {
            continue;
        }
        size_t next = i + 1;
        while (next < nodes.size() && nodeTokens(text, node, profile) < options.min_chunk_size) {
            auto& sibling = nodes[next];
            if (!sibling.children.empty() || sibling.level != node.level ||
                sibling.parent != node.parent) {
                break;
            }
            const size_t combined = profile.estimateTokenCount(
                text.substr(node.start, sibling.end - node.start));
            if (combined > options.max_chunk_size) {
                break;
            }
            node.end = sibling.end;
            sibling.absorbed = true;
            ++next;
        }
    }
}

} // namespace

Result<ChunkPlan> HierarchicalChunker::plan(std::string_view text, const ChunkOptions& options,
                                            const language::LanguageProfile& profile,
                                            std::stop_token stop) const {
    ChunkPlan result;
    result.strategy = strategy();
    if (utf8::isBlank(text)) {
        return result;
    }

    auto nodes = buildTree(text, profile.findSectionHeaders(text));
    mergeSmallLeaves(text, nodes, options, profile);

    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Chunking cancelled"};
    }

    std::vector<std::optional<size_t>> firstSpan(nodes.size());

    for (size_t i = 0; i < nodes.size(); ++i) {
        const auto& node = nodes[i];
        if (node.absorbed) {
            continue;
        }
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Chunking cancelled"};
        }

        std::vector<ChunkSpan> spans;
        if (nodeTokens(text, node, profile) <= options.max_chunk_size) {
            auto [s, e] = utf8::trimRange(text, node.start, node.end);
            if (s < e) {
                spans.push_back(detail::makeSpan(s, s, e));
            }
        } else {
            auto fragments =
                SentenceChunker::planRange(text, node.start, node.end, options, profile, stop);
            if (!fragments) {
                return fragments.error();
            }
            spans = std::move(fragments).value();
        }
        if (spans.empty()) {
            continue;
        }

        std::optional<size_t> parentSpan;
        if (node.parent) {
            parentSpan = firstSpan[*node.parent];
        }

        firstSpan[i] = result.spans.size();
        for (size_t k = 0; k < spans.size(); ++k) {
            auto& span = spans[k];
            span.hierarchy_level = node.level;
            span.parent_span = parentSpan;
            span.section_title = node.title;
            span.section_path = node.path;
            span.contains_section_header = k == 0 && node.title.has_value();
            span.quality_score = std::max(0.5, 1.0 - 0.1 * node.level);
            result.spans.push_back(std::move(span));
        }
    }

    spdlog::debug("Hierarchical chunker built {} sections into {} chunks", nodes.size(),
                  result.spans.size());
    return result;
}

size_t HierarchicalChunker::estimateChunkCount(std::string_view text, const ChunkOptions& options,
                                               const language::LanguageProfile& profile) const {
    if (utf8::isBlank(text)) {
        return 0;
    }

    const size_t effectiveSize =
        std::max<size_t>(1, options.target_chunk_size > options.effectiveOverlap()
                                ? options.target_chunk_size - options.effectiveOverlap()
                                : options.target_chunk_size / 2);

    size_t estimated = 0;
    for (const auto& node : buildTree(text, profile.findSectionHeaders(text))) {
        const size_t tokens = nodeTokens(text, node, profile);
        if (tokens <= options.max_chunk_size) {
            ++estimated;
        } else {
            estimated += (tokens + effectiveSize - 1) / effectiveSize;
        }
    }
    return std::max<size_t>(1, estimated);
}

} // namespace ragchunk::chunking
