#pragma once

#include <ragchunk/core/types.h>

#include <string>

namespace ragchunk::engine {

/**
 * Preprocessing step applied to text before chunking (masking, filtering, cleanup).
 */
class ITextProcessor {
public:
    virtual ~ITextProcessor() = default;

    virtual Result<std::string> process(const std::string& text) = 0;
    virtual std::string name() const = 0;
};

/**
 * Converts CRLF and lone CR line endings to LF.
 */
class LineEndingNormalizer : public ITextProcessor {
public:
    Result<std::string> process(const std::string& text) override;
    std::string name() const override { return "LineEndingNormalizer"; }
};

} // namespace ragchunk::engine
