#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/utf8.h>
#include "unit_packer.h"

#include <algorithm>
#include <cmath>

namespace ragchunk::chunking {

namespace {

struct Word {
    size_t start = 0;
    size_t end = 0;
    size_t tokens = 0;
};

// Cut a word that alone exceeds maxTokens into code point aligned pieces.
void hardSplit(std::string_view text, size_t start, size_t end, size_t maxTokens,
               const language::LanguageProfile& profile, std::vector<Word>& out) {
    const size_t step = std::max<size_t>(
        1, static_cast<size_t>(static_cast<double>(maxTokens) * profile.charsPerToken()));

    size_t pieceStart = start;
    while (pieceStart < end) {
        size_t pieceEnd = std::min(end, utf8::advanceCodePoints(text, pieceStart, step));
        const size_t minimalEnd = pieceStart + utf8::decodeAt(text, pieceStart).length;
        while (pieceEnd > minimalEnd &&
               profile.estimateTokenCount(text.substr(pieceStart, pieceEnd - pieceStart)) >
                   maxTokens) {
            pieceEnd = utf8::previousCodePointStart(text, pieceEnd);
        }
        pieceEnd = std::max(pieceEnd, std::min(minimalEnd, end));
        out.push_back({pieceStart, pieceEnd,
                       profile.estimateTokenCount(text.substr(pieceStart, pieceEnd - pieceStart))});
        pieceStart = pieceEnd;
    }
}

std::vector<Word> splitWords(std::string_view text, size_t begin, size_t end, size_t maxTokens,
                             const language::LanguageProfile& profile) {
    std::vector<Word> words;
    size_t pos = begin;
    while (pos < end) {
        auto cp = utf8::decodeAt(text, pos);
        if (utf8::isWhitespace(cp.value)) {
            pos += cp.length;
            continue;
        }

        const size_t wordStart = pos;
        while (pos < end) {
            auto next = utf8::decodeAt(text, pos);
            if (utf8::isWhitespace(next.value)) {
                break;
            }
            pos += next.length;
        }
        pos = std::min(pos, end);

        const size_t tokens = profile.estimateTokenCount(text.substr(wordStart, pos - wordStart));
        if (tokens > maxTokens) {
            hardSplit(text, wordStart, pos, maxTokens, profile, words);
        } else {
            words.push_back({wordStart, pos, tokens});
        }
    }
    return words;
}

} // namespace

Result<std::vector<ChunkSpan>> TokenChunker::planRange(std::string_view text, size_t begin,
                                                       size_t end, const ChunkOptions& options,
                                                       const language::LanguageProfile& profile,
                                                       std::stop_token stop) {
    std::vector<ChunkSpan> spans;
    const size_t maxTokens = std::max<size_t>(1, options.max_chunk_size);
    const size_t target = std::clamp<size_t>(options.target_chunk_size, 1, maxTokens);
    const size_t overlap = options.effectiveOverlap();

    auto words = splitWords(text, begin, end, maxTokens, profile);
    if (words.empty()) {
        return spans;
    }

    std::vector<size_t> prefix(words.size() + 1, 0);
    for (size_t k = 0; k < words.size(); ++k) {
        prefix[k + 1] = prefix[k] + words[k].tokens;
    }

    std::vector<bool> endsSentence(words.size(), false);
    if (options.preserve_sentences) {
        auto boundaries = profile.findSentenceBoundaries(text.substr(begin, end - begin));
        for (auto& boundary : boundaries) {
            boundary += begin;
        }
        for (size_t k = 0; k < words.size(); ++k) {
            const size_t nextStart = k + 1 < words.size() ? words[k + 1].start : end;
            auto it = std::lower_bound(boundaries.begin(), boundaries.end(), words[k].end);
            endsSentence[k] = it != boundaries.end() && *it <= nextStart;
        }
    }

    size_t first = 0;
    size_t fresh = 0;
    size_t tokens = 0;
    size_t i = 0;

    auto emit = [&](size_t endWord) {
        const size_t overlapEnd = first < fresh ? words[fresh].start : words[first].start;
        spans.push_back(detail::makeSpan(words[first].start, overlapEnd, words[endWord - 1].end));
    };

    while (i < words.size()) {
        const auto& word = words[i];
        if (i > fresh && (tokens >= target || tokens + word.tokens > maxTokens)) {
            if (stop.stop_requested()) {
                return Error{ErrorCode::OperationCancelled, "Chunking cancelled"};
            }

            size_t cut = i;
            if (options.preserve_sentences) {
                // Nearest sentence end inside the chunk, unless the chunk would get too small.
                for (size_t j = i; j > fresh; --j) {
                    if (endsSentence[j - 1]) {
                        if (prefix[j] - prefix[first] >= options.min_chunk_size) {
                            cut = j;
                        }
                        break;
                    }
                }
            }
            emit(cut);

            size_t overlapStart = cut;
            size_t overlapTokens = 0;
            while (overlapStart - 1 > first &&
                   overlapTokens + words[overlapStart - 1].tokens <= overlap) {
                --overlapStart;
                overlapTokens += words[overlapStart].tokens;
            }
            while (overlapStart < cut && overlapTokens + words[cut].tokens > maxTokens) {
                overlapTokens -= words[overlapStart].tokens;
                ++overlapStart;
            }

            first = overlapStart;
            fresh = cut;
            tokens = overlapTokens;
            i = cut;
            continue;
        }
        tokens += word.tokens;
        ++i;
    }

    if (fresh < words.size()) {
        emit(words.size());
    }
    return spans;
}

Result<ChunkPlan> TokenChunker::plan(std::string_view text, const ChunkOptions& options,
                                     const language::LanguageProfile& profile,
                                     std::stop_token stop) const {
    ChunkPlan result;
    result.strategy = strategy();
    if (utf8::isBlank(text)) {
        return result;
    }

    auto spans = planRange(text, 0, text.size(), options, profile, stop);
    if (!spans) {
        return spans.error();
    }
    result.spans = std::move(spans).value();
    return result;
}

} // namespace ragchunk::chunking
