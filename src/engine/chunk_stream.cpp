#include <spdlog/spdlog.h>
#include <ragchunk/chunking/chunk_balancer.h>
#include <ragchunk/engine/chunk_stream.h>

namespace ragchunk::engine {

using chunking::Chunk;

ChunkStream::ChunkStream(std::shared_ptr<const std::string> text, chunking::ChunkOptions options,
                         const language::LanguageProfile& profile,
                         std::unique_ptr<chunking::IChunker> chunker, std::stop_token stop)
    : text_(std::move(text)), options_(std::move(options)), profile_(&profile),
      chunker_(std::move(chunker)), stop_(std::move(stop)) {}

Result<void> ChunkStream::start() {
    started_ = true;

    auto planned = chunker_->plan(*text_, options_, *profile_, stop_);
    if (!planned) {
        return planned.error();
    }
    plan_ = std::move(planned).value();
    materializer_ = std::make_unique<chunking::ChunkMaterializer>(*text_, options_, *profile_);

    if (options_.enable_chunk_balancing) {
        std::vector<Chunk> chunks;
        chunks.reserve(plan_.spans.size());
        for (size_t i = 0; i < plan_.spans.size(); ++i) {
            chunks.push_back(materializer_->materialize(plan_, i));
        }
        auto balanced = chunking::ChunkBalancer{}.balance(std::move(chunks), *text_, options_,
                                                          *profile_, stop_);
        if (!balanced) {
            return balanced.error();
        }
        buffered_ = std::move(balanced).value();
    }

    spdlog::debug("Chunk stream planned {} chunks with {} strategy", plan_.spans.size(),
                  chunker_->name());
    return {};
}

Result<std::optional<Chunk>> ChunkStream::next() {
    if (finished_) {
        return std::optional<Chunk>{};
    }
    if (stop_.stop_requested()) {
        finished_ = true;
        return Error{ErrorCode::OperationCancelled, "Chunk stream cancelled"};
    }

    if (!started_) {
        auto started = start();
        if (!started) {
            finished_ = true;
            return started.error();
        }
    }

    if (buffered_) {
        if (cursor_ < buffered_->size()) {
            return std::optional<Chunk>{(*buffered_)[cursor_++]};
        }
    } else if (cursor_ < plan_.spans.size()) {
        return std::optional<Chunk>{materializer_->materialize(plan_, cursor_++)};
    }

    finished_ = true;
    return std::optional<Chunk>{};
}

Result<std::vector<Chunk>> ChunkStream::collect() {
    std::vector<Chunk> chunks;
    while (true) {
        auto item = next();
        if (!item) {
            return item.error();
        }
        auto& chunk = item.value();
        if (!chunk) {
            break;
        }
        chunks.push_back(std::move(*chunk));
    }
    return chunks;
}

std::optional<size_t> ChunkStream::totalChunks() const {
    if (!started_) {
        return std::nullopt;
    }
    return buffered_ ? buffered_->size() : plan_.spans.size();
}

} // namespace ragchunk::engine
