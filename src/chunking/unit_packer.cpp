#include <ragchunk/core/utf8.h>
#include "unit_packer.h"

namespace ragchunk::chunking::detail {

std::vector<TextUnit> unitsFromBoundaries(std::string_view text, size_t begin, size_t end,
                                          const std::vector<size_t>& boundaries,
                                          const language::LanguageProfile& profile) {
    std::vector<TextUnit> units;
    size_t previous = begin;

    auto addUnit = [&](size_t from, size_t to) {
        auto [s, e] = utf8::trimRange(text, from, to);
        if (s < e) {
            units.push_back({s, e, profile.estimateTokenCount(text.substr(s, e - s)), false});
        }
    };

    for (size_t boundary : boundaries) {
        if (boundary <= previous) {
            continue;
        }
        if (boundary >= end) {
            break;
        }
        addUnit(previous, boundary);
        previous = boundary;
    }
    if (previous < end) {
        addUnit(previous, end);
    }
    return units;
}

std::vector<TextUnit> sentenceUnits(std::string_view text, size_t begin, size_t end,
                                    const language::LanguageProfile& profile) {
    auto slice = text.substr(begin, end - begin);
    auto local = profile.findSentenceBoundaries(slice);
    for (auto& boundary : local) {
        boundary += begin;
    }
    return unitsFromBoundaries(text, begin, end, local, profile);
}

ChunkSpan makeSpan(size_t start, size_t overlapEnd, size_t end) {
    ChunkSpan span;
    span.start = start;
    span.overlap_end = overlapEnd;
    span.end = end;
    return span;
}

Result<std::vector<ChunkSpan>> packUnits(const std::vector<TextUnit>& units,
                                         const PackLimits& limits, const BreakHint& hint,
                                         const std::stop_token& stop) {
    std::vector<ChunkSpan> spans;
    if (units.empty()) {
        return spans;
    }

    size_t first = 0;  // First unit in the buffer, overlap included
    size_t fresh = 0;  // First unit not carried over from the previous chunk
    size_t tokens = 0; // Sum over [first, i)

    auto emit = [&](size_t endUnit) {
        const size_t overlapEnd = first < fresh ? units[fresh].start : units[first].start;
        spans.push_back(makeSpan(units[first].start, overlapEnd, units[endUnit - 1].end));
    };

    for (size_t i = 0; i < units.size(); ++i) {
        const auto& unit = units[i];
        if (i > fresh) {
            const bool overMax = tokens + unit.tokens > limits.max_tokens;
            const bool hinted = !overMax && !unit.break_before && hint &&
                                hint(first, fresh, i, tokens);
            if (overMax || unit.break_before || hinted) {
                if (stop.stop_requested()) {
                    return Error{ErrorCode::OperationCancelled, "Chunking cancelled"};
                }
                emit(i);

                size_t overlapStart = i;
                size_t overlapTokens = 0;
                while (overlapStart - 1 > first &&
                       overlapTokens + units[overlapStart - 1].tokens <= limits.overlap_tokens) {
                    --overlapStart;
                    overlapTokens += units[overlapStart].tokens;
                }
                // The carried units must leave room for the unit that opens the chunk.
                while (overlapStart < i && overlapTokens + unit.tokens > limits.max_tokens) {
                    overlapTokens -= units[overlapStart].tokens;
                    ++overlapStart;
                }

                first = overlapStart;
                fresh = i;
                tokens = overlapTokens;
            }
        }
        tokens += unit.tokens;
    }

    if (fresh < units.size()) {
        emit(units.size());
    }
    return spans;
}

size_t spanTokens(std::string_view text, const ChunkSpan& span,
                  const language::LanguageProfile& profile) {
    return profile.estimateTokenCount(text.substr(span.start, span.end - span.start));
}

std::vector<ChunkSpan> mergeSmallSpans(std::vector<ChunkSpan> spans, std::string_view text,
                                       size_t minTokens, size_t maxTokens,
                                       const language::LanguageProfile& profile) {
    if (spans.size() <= 1 || minTokens == 0) {
        return spans;
    }

    std::vector<ChunkSpan> result;
    std::optional<ChunkSpan> pending;

    for (auto& span : spans) {
        if (!pending) {
            if (spanTokens(text, span, profile) < minTokens) {
                pending = std::move(span);
            } else {
                result.push_back(std::move(span));
            }
            continue;
        }

        auto merged = makeSpan(pending->start, pending->overlap_end, span.end);
        const size_t mergedTokens = spanTokens(text, merged, profile);
        if (mergedTokens <= maxTokens) {
            if (mergedTokens < minTokens) {
                pending = merged;
            } else {
                result.push_back(merged);
                pending.reset();
            }
        } else {
            result.push_back(std::move(*pending));
            pending.reset();
            if (spanTokens(text, span, profile) < minTokens) {
                pending = std::move(span);
            } else {
                result.push_back(std::move(span));
            }
        }
    }

    if (pending) {
        // A small tail joins its left neighbour when that still fits.
        if (!result.empty()) {
            auto merged = makeSpan(result.back().start, result.back().overlap_end, pending->end);
            if (spanTokens(text, merged, profile) <= maxTokens) {
                result.back() = merged;
                return result;
            }
        }
        result.push_back(std::move(*pending));
    }
    return result;
}

} // namespace ragchunk::chunking::detail
