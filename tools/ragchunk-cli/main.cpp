#include <ragchunk/config/chunking_config.h>
#include <ragchunk/engine/chunking_engine.h>
#include <ragchunk/language/language_registry.h>
#include <ragchunk/serialization/chunk_json.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stop_token>
#include <string>

using json = nlohmann::json;

namespace {

constexpr int kExitInterrupted = 130;

std::atomic<bool> g_interrupted{false};

void interrupt_handler(int) {
    g_interrupted.store(true);
}

ragchunk::Result<std::string> read_input(const std::string& path) {
    if (path == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ragchunk::Error{ragchunk::ErrorCode::FileNotFound,
                               "Cannot open input file: " + path};
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

struct ChunkFlags {
    std::string input = "-";
    std::string strategy;
    size_t target = 0;
    size_t minSize = 0;
    size_t maxSize = 0;
    size_t overlap = 0;
    std::string language;
    double threshold = 0.0;
    bool balance = false;
    bool mockOracle = false;
    bool asJson = false;

    CLI::Option* targetOpt = nullptr;
    CLI::Option* minOpt = nullptr;
    CLI::Option* maxOpt = nullptr;
    CLI::Option* overlapOpt = nullptr;
    CLI::Option* thresholdOpt = nullptr;
};

void add_chunk_flags(CLI::App* cmd, ChunkFlags& flags) {
    cmd->add_option("input", flags.input, "Input file, '-' for stdin")->default_val("-");
    cmd->add_option("-s,--strategy", flags.strategy,
                    "auto, sentence, paragraph, token, semantic or hierarchical");
    flags.targetOpt = cmd->add_option("--target", flags.target, "Target chunk size in tokens");
    flags.minOpt = cmd->add_option("--min", flags.minSize, "Minimum chunk size in tokens");
    flags.maxOpt = cmd->add_option("--max", flags.maxSize, "Maximum chunk size in tokens");
    flags.overlapOpt = cmd->add_option("--overlap", flags.overlap, "Overlap in tokens");
    cmd->add_option("-l,--language", flags.language, "Language code, detected when omitted");
    flags.thresholdOpt = cmd->add_option("--threshold", flags.threshold,
                                         "Semantic similarity threshold");
    cmd->add_flag("--balance", flags.balance, "Balance chunk sizes after chunking");
    cmd->add_flag("--mock-oracle", flags.mockOracle,
                  "Use the deterministic mock embedding oracle for semantic chunking");
}

ragchunk::Result<ragchunk::chunking::ChunkOptions>
resolve_options(const ragchunk::config::ChunkingConfig& config, const ChunkFlags& flags) {
    auto options = config.options;
    if (!flags.strategy.empty()) {
        auto strategy = ragchunk::chunking::parseChunkingStrategy(flags.strategy);
        if (!strategy) {
            return ragchunk::Error{ragchunk::ErrorCode::InvalidArgument,
                                   "Unknown strategy: " + flags.strategy};
        }
        options.strategy = *strategy;
    }
    if (flags.targetOpt->count() > 0) {
        options.target_chunk_size = flags.target;
    }
    if (flags.minOpt->count() > 0) {
        options.min_chunk_size = flags.minSize;
    }
    if (flags.maxOpt->count() > 0) {
        options.max_chunk_size = flags.maxSize;
    }
    if (flags.overlapOpt->count() > 0) {
        options.overlap_size = flags.overlap;
    }
    if (flags.thresholdOpt->count() > 0) {
        options.semantic_similarity_threshold = flags.threshold;
    }
    if (!flags.language.empty()) {
        options.language_code = flags.language;
    }
    if (flags.balance) {
        options.enable_chunk_balancing = true;
    }
    if (auto valid = options.validate(); !valid) {
        return valid.error();
    }
    return options;
}

int report(const ragchunk::Error& error) {
    if (error.code == ragchunk::ErrorCode::OperationCancelled) {
        spdlog::warn("Interrupted");
        return kExitInterrupted;
    }
    spdlog::error("{}: {}", error.code, error.message);
    return 1;
}

int run_chunk(const ragchunk::config::ChunkingConfig& config, const ChunkFlags& flags) {
    auto options = resolve_options(config, flags);
    if (!options) {
        return report(options.error());
    }
    auto text = read_input(flags.input);
    if (!text) {
        return report(text.error());
    }

    ragchunk::engine::ChunkingEngine engine(
        flags.mockOracle ? ragchunk::embedding::createMockOracle() : nullptr);

    const auto strategy = engine.resolveStrategy(text.value(), options.value());
    std::stop_source stopSource;
    auto stream = engine.chunkStream(std::move(text).value(), options.value(),
                                     stopSource.get_token());
    if (!stream) {
        return report(stream.error());
    }

    json out = json::array();
    size_t count = 0;
    while (true) {
        if (g_interrupted.load()) {
            stopSource.request_stop();
        }
        auto next = stream.value().next();
        if (!next) {
            return report(next.error());
        }
        if (!next.value()) {
            break;
        }
        const auto& chunk = *next.value();
        ++count;
        if (flags.asJson) {
            out.push_back(json(chunk));
            continue;
        }
        std::cout << "--- chunk " << chunk.index + 1 << "/" << chunk.total_chunks << " ["
                  << chunk.metadata.estimated_token_count << " tokens, "
                  << chunk.location.start_line << "-" << chunk.location.end_line << "]";
        if (!chunk.location.section_path.empty()) {
            std::cout << " " << chunk.location.section_path;
        }
        std::cout << "\n" << chunk.content << "\n";
    }
    if (flags.asJson) {
        std::cout << out.dump(2) << std::endl;
    }
    spdlog::info("Produced {} chunks using {} strategy", count, strategy);
    return 0;
}

int run_estimate(const ragchunk::config::ChunkingConfig& config, const ChunkFlags& flags) {
    auto options = resolve_options(config, flags);
    if (!options) {
        return report(options.error());
    }
    auto text = read_input(flags.input);
    if (!text) {
        return report(text.error());
    }
    ragchunk::engine::ChunkingEngine engine;
    auto estimate = engine.estimateChunkCount(text.value(), options.value());
    if (!estimate) {
        return report(estimate.error());
    }
    if (flags.asJson) {
        json j;
        j["estimated_chunks"] = estimate.value();
        j["strategy"] = ragchunk::chunking::toString(
            engine.resolveStrategy(text.value(), options.value()));
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cout << estimate.value() << std::endl;
    }
    return 0;
}

int run_stats(const ragchunk::config::ChunkingConfig& config, const ChunkFlags& flags) {
    auto options = resolve_options(config, flags);
    if (!options) {
        return report(options.error());
    }
    auto text = read_input(flags.input);
    if (!text) {
        return report(text.error());
    }
    ragchunk::engine::ChunkingEngine engine(
        flags.mockOracle ? ragchunk::embedding::createMockOracle() : nullptr);
    auto chunks = engine.chunk(text.value(), options.value());
    if (!chunks) {
        return report(chunks.error());
    }
    auto stats = ragchunk::engine::ChunkingEngine::balanceStats(chunks.value(), options.value());
    if (flags.asJson) {
        std::cout << json(stats).dump(2) << std::endl;
        return 0;
    }
    std::cout << "chunks:     " << stats.chunk_count << "\n"
              << "min tokens: " << stats.min_token_count << "\n"
              << "max tokens: " << stats.max_token_count << "\n"
              << "average:    " << stats.average_token_count << "\n"
              << "std dev:    " << stats.standard_deviation << "\n"
              << "undersized: " << stats.undersized_chunk_count << "\n"
              << "oversized:  " << stats.oversized_chunk_count << "\n"
              << "balanced:   " << (stats.isBalanced() ? "yes" : "no") << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto console = spdlog::stderr_color_mt("ragchunk");
    spdlog::set_default_logger(console);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::warn);

    CLI::App app{"ragchunk - text chunking for retrieval pipelines", "ragchunk"};
    app.require_subcommand(1);

    std::string configPath;
    bool debug = false;
    bool verbose = false;
    app.add_option("--config", configPath, "Configuration file path");
    app.add_flag("--debug", debug, "Enable debug logging");
    app.add_flag("-v,--verbose", verbose, "Enable info logging");

    ChunkFlags chunkFlags;
    auto* chunkCmd = app.add_subcommand("chunk", "Split a document into chunks");
    add_chunk_flags(chunkCmd, chunkFlags);
    chunkCmd->add_flag("--json", chunkFlags.asJson, "Print chunks as JSON");

    ChunkFlags estimateFlags;
    auto* estimateCmd = app.add_subcommand("estimate", "Estimate the number of chunks");
    add_chunk_flags(estimateCmd, estimateFlags);
    estimateCmd->add_flag("--json", estimateFlags.asJson, "Print the estimate as JSON");

    ChunkFlags statsFlags;
    auto* statsCmd = app.add_subcommand("stats", "Print chunk size statistics");
    add_chunk_flags(statsCmd, statsFlags);
    statsCmd->add_flag("--json", statsFlags.asJson, "Print statistics as JSON");

    std::string detectInput = "-";
    auto* detectCmd = app.add_subcommand("detect", "Detect the language of a document");
    detectCmd->add_option("input", detectInput, "Input file, '-' for stdin")->default_val("-");

    auto* languagesCmd = app.add_subcommand("languages", "List supported language codes");

    CLI11_PARSE(app, argc, argv);

    if (debug) {
        spdlog::set_level(spdlog::level::debug);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::info);
    }

    std::signal(SIGINT, interrupt_handler);

    const auto& registry = ragchunk::language::LanguageRegistry::instance();
    if (languagesCmd->parsed()) {
        for (const auto& code : registry.supportedLanguages()) {
            std::cout << code << "\n";
        }
        return 0;
    }
    if (detectCmd->parsed()) {
        auto text = read_input(detectInput);
        if (!text) {
            return report(text.error());
        }
        std::cout << registry.detectLanguage(text.value()) << std::endl;
        return 0;
    }

    auto config = ragchunk::config::loadChunkingConfig(configPath);
    if (!config) {
        return report(config.error());
    }
    if (!config.value().source.empty()) {
        spdlog::info("Loaded configuration from {}", config.value().source.string());
    }

    if (chunkCmd->parsed()) {
        return run_chunk(config.value(), chunkFlags);
    }
    if (estimateCmd->parsed()) {
        return run_estimate(config.value(), estimateFlags);
    }
    return run_stats(config.value(), statsFlags);
}
