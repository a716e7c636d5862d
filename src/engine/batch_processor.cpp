#include <fmt/format.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <ragchunk/core/utf8.h>
#include <ragchunk/engine/batch_processor.h>

#include <algorithm>
#include <optional>
#include <semaphore>
#include <thread>

namespace ragchunk::engine {

using chunking::Chunk;

namespace {

size_t clampConcurrency(size_t requested) {
    return std::clamp<size_t>(requested, 1, BatchProcessor::kMaxConcurrency);
}

} // namespace

BatchProcessor::BatchProcessor(std::shared_ptr<const ChunkingEngine> engine)
    : engine_(std::move(engine)),
      maxConcurrency_(clampConcurrency(std::thread::hardware_concurrency())) {}

BatchProcessor& BatchProcessor::addText(std::string text) {
    if (!utf8::isBlank(text)) {
        texts_.push_back(std::move(text));
    }
    return *this;
}

BatchProcessor& BatchProcessor::addTexts(const std::vector<std::string>& texts) {
    for (const auto& text : texts) {
        addText(text);
    }
    return *this;
}

BatchProcessor& BatchProcessor::withMaxConcurrency(size_t maxConcurrency) {
    maxConcurrency_ = clampConcurrency(maxConcurrency);
    return *this;
}

Result<std::vector<std::vector<Chunk>>>
BatchProcessor::process(const chunking::ChunkOptions& options, std::stop_token stop) const {
    if (!engine_) {
        return Error{ErrorCode::NotInitialized, "BatchProcessor has no chunking engine"};
    }
    auto valid = options.validate();
    if (!valid) {
        return valid.error();
    }
    if (texts_.empty()) {
        return std::vector<std::vector<Chunk>>{};
    }

    std::vector<std::optional<Result<std::vector<Chunk>>>> results(texts_.size());
    std::counting_semaphore<> slots(static_cast<std::ptrdiff_t>(maxConcurrency_));
    {
        boost::asio::thread_pool pool(std::min(maxConcurrency_, texts_.size()));
        for (size_t i = 0; i < texts_.size(); ++i) {
            slots.acquire();
            boost::asio::post(pool, [this, i, &options, &results, &slots, stop]() {
                // Releases the slot on any exit path
                struct SlotGuard {
                    std::counting_semaphore<>* sem;
                    ~SlotGuard() { sem->release(); }
                } guard{&slots};

                if (stop.stop_requested()) {
                    results[i].emplace(Error{ErrorCode::OperationCancelled, "Batch cancelled"});
                    return;
                }
                results[i].emplace(engine_->chunk(texts_[i], options, stop));
            });
        }
        pool.join();
    }

    std::vector<std::vector<Chunk>> output;
    output.reserve(results.size());
    for (size_t i = 0; i < results.size(); ++i) {
        if (!results[i]) {
            return Error{ErrorCode::InternalError, fmt::format("Batch item {} produced no result", i)};
        }
        auto& result = *results[i];
        if (!result) {
            spdlog::warn("Batch item {} of {} failed: {}", i, results.size(),
                         result.error().message);
            return result.error();
        }
        output.push_back(std::move(result).value());
    }

    spdlog::debug("Batch processed {} texts with concurrency {}", texts_.size(), maxConcurrency_);
    return output;
}

size_t BatchProcessor::totalEstimatedChunks(const chunking::ChunkOptions& options) const {
    if (!engine_) {
        return 0;
    }
    size_t total = 0;
    for (const auto& text : texts_) {
        auto estimate = engine_->estimateChunkCount(text, options);
        if (!estimate) {
            spdlog::warn("Chunk estimate failed: {}", estimate.error().message);
            continue;
        }
        total += estimate.value();
    }
    return total;
}

} // namespace ragchunk::engine
