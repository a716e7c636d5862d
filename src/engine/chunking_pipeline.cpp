#include <spdlog/spdlog.h>
#include <ragchunk/engine/chunking_pipeline.h>

namespace ragchunk::engine {

Result<std::string> LineEndingNormalizer::process(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

ChunkingPipeline::ChunkingPipeline(std::shared_ptr<const ChunkingEngine> engine)
    : engine_(std::move(engine)) {}

ChunkingPipeline& ChunkingPipeline::addProcessor(std::shared_ptr<ITextProcessor> processor) {
    if (processor) {
        processors_.push_back(std::move(processor));
    }
    return *this;
}

std::string ChunkingPipeline::preprocess(std::string text) const {
    for (const auto& processor : processors_) {
        auto processed = processor->process(text);
        if (!processed) {
            spdlog::warn("Text processor '{}' failed, skipping: {}", processor->name(),
                         processed.error().message);
            continue;
        }
        text = std::move(processed).value();
    }
    return text;
}

Result<std::vector<chunking::Chunk>> ChunkingPipeline::run(std::string text,
                                                           const chunking::ChunkOptions& options,
                                                           std::stop_token stop) const {
    if (!engine_) {
        return Error{ErrorCode::NotInitialized, "ChunkingPipeline has no chunking engine"};
    }
    auto prepared = preprocess(std::move(text));
    return engine_->chunk(prepared, options, std::move(stop));
}

} // namespace ragchunk::engine
