#include <ragscope/config/engine_config.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <limits>
#include <vector>

namespace ragscope::config {

namespace {

const std::string* lookup(const ConfigSections& sections, const std::string& section,
                          const std::string& key) {
    auto s = sections.find(section);
    if (s == sections.end())
        return nullptr;
    auto k = s->second.find(key);
    return k == s->second.end() ? nullptr : &k->second;
}

Error badValue(const std::string& section, const std::string& key, const std::string& value,
               const std::string& expected) {
    return Error{ErrorCode::ValidationError, "Config " + section + "." + key + ": expected " +
                                                 expected + ", got '" + value + "'"};
}

template <typename T>
Result<void> readUnsigned(const ConfigSections& sections, const std::string& section,
                          const std::string& key, T& out,
                          uint64_t maxValue = std::numeric_limits<T>::max()) {
    const auto* raw = lookup(sections, section, key);
    if (!raw)
        return {};
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size())
        return badValue(section, key, *raw, "a non-negative integer");
    if (value > maxValue) {
        return badValue(section, key, *raw,
                        "an integer no greater than " + std::to_string(maxValue));
    }
    out = static_cast<T>(value);
    return {};
}

Result<void> readDouble(const ConfigSections& sections, const std::string& section,
                        const std::string& key, double& out) {
    const auto* raw = lookup(sections, section, key);
    if (!raw)
        return {};
    try {
        size_t consumed = 0;
        double value = std::stod(*raw, &consumed);
        if (consumed != raw->size())
            return badValue(section, key, *raw, "a number");
        out = value;
    } catch (const std::exception&) {
        return badValue(section, key, *raw, "a number");
    }
    return {};
}

Result<void> readBool(const ConfigSections& sections, const std::string& section,
                      const std::string& key, bool& out) {
    const auto* raw = lookup(sections, section, key);
    if (!raw)
        return {};
    if (*raw == "true" || *raw == "1" || *raw == "yes" || *raw == "on") {
        out = true;
    } else if (*raw == "false" || *raw == "0" || *raw == "no" || *raw == "off") {
        out = false;
    } else {
        return badValue(section, key, *raw, "a boolean");
    }
    return {};
}

void readString(const ConfigSections& sections, const std::string& section,
                const std::string& key, std::string& out) {
    if (const auto* raw = lookup(sections, section, key))
        out = *raw;
}

} // namespace

EngineConfig defaultEngineConfig() {
    EngineConfig config;
    config.storage.path = get_data_dir() / "ragscope.db";
    return config;
}

Result<EngineConfig> parseEngineConfig(const ConfigSections& sections) {
    EngineConfig config = defaultEngineConfig();
    std::vector<Result<void>> results;

    // [chunking]
    results.push_back(readUnsigned(sections, "chunking", "max_tokens", config.chunking.max_tokens));
    results.push_back(
        readUnsigned(sections, "chunking", "overlap_sentences", config.chunking.overlap_sentences));
    results.push_back(
        readUnsigned(sections, "chunking", "min_chunk_size", config.chunking.min_chunk_size));
    results.push_back(readBool(sections, "chunking", "drop_undersized_tail",
                               config.chunking.drop_undersized_tail));

    // [embedding]
    readString(sections, "embedding", "model", config.embedding.model);
    readString(sections, "embedding", "provider", config.embedding.provider);
    results.push_back(readUnsigned(sections, "embedding", "seed", config.embedding.seed));

    // [context]: preset first, explicit values on top
    readString(sections, "context", "model", config.context.model);
    if (!config.context.model.empty())
        config.context.limits = context::getModelLimits(config.context.model);
    results.push_back(
        readUnsigned(sections, "context", "max_tokens", config.context.limits.max_tokens));
    results.push_back(
        readUnsigned(sections, "context", "max_messages", config.context.limits.max_messages));
    results.push_back(
        readUnsigned(sections, "context", "reserve_tokens", config.context.limits.reserve_tokens));

    // [folder]
    results.push_back(readBool(sections, "folder", "include_rag", config.folder.include_rag_data));
    results.push_back(
        readUnsigned(sections, "folder", "max_rag_tokens", config.folder.max_rag_tokens));
    results.push_back(
        readDouble(sections, "folder", "similarity_threshold", config.folder.similarity_threshold));
    results.push_back(readUnsigned(sections, "folder", "max_conversation_tokens",
                                   config.folder.max_conversation_tokens));
    results.push_back(readUnsigned(sections, "folder", "retrieval_candidates",
                                   config.folder.retrieval_candidates,
                                   static_cast<uint64_t>(std::numeric_limits<int>::max())));

    // [storage]
    if (const auto* backend = lookup(sections, "storage", "backend")) {
        auto parsed = storage::storeBackendFromString(*backend);
        if (!parsed)
            return Error{ErrorCode::ValidationError, "Config storage.backend: " +
                                                         parsed.error().message};
        config.storage.backend = parsed.value();
    }
    if (const auto* path = lookup(sections, "storage", "path"))
        config.storage.path = expand_tilde(*path);

    // [ingest]
    results.push_back(readUnsigned(sections, "ingest", "worker_threads", config.worker_threads));

    // [logging]
    readString(sections, "logging", "level", config.logging.level);
    if (const auto* file = lookup(sections, "logging", "file"))
        config.logging.file = expand_tilde(*file);

    for (const auto& r : results) {
        if (!r)
            return r.error();
    }
    if (auto v = chunking::validateChunkingConfig(config.chunking); !v)
        return v.error();
    if (config.folder.similarity_threshold < -1.0 || config.folder.similarity_threshold > 1.0) {
        return Error{ErrorCode::ValidationError,
                     "Config folder.similarity_threshold must lie in [-1, 1]"};
    }
    return config;
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    auto sections = parse_config_file(path);
    if (!sections) {
        if (sections.error().code == ErrorCode::NotFound) {
            spdlog::debug("No config at {}, using defaults", path.string());
            return defaultEngineConfig();
        }
        return sections.error();
    }
    return parseEngineConfig(sections.value());
}

ingest::FolderRagServiceOptions toServiceOptions(const EngineConfig& config) {
    ingest::FolderRagServiceOptions options;
    options.chunking = config.chunking;
    options.folder = config.folder;
    options.worker_threads = config.worker_threads;
    return options;
}

Result<void> setupLogging(const LoggingSettings& settings, bool verbose) {
    std::string level = settings.level;
    if (const char* env = std::getenv("RAGSCOPE_LOG_LEVEL"); env && *env)
        level = env;
    if (verbose)
        level = "debug";

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        return Error{ErrorCode::ValidationError, "Unknown log level: " + level};
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!settings.file.empty()) {
        try {
            std::error_code ec;
            std::filesystem::create_directories(settings.file.parent_path(), ec);
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file.string(), max_size, max_files));
        } catch (const spdlog::spdlog_ex& e) {
            return Error{ErrorCode::InvalidArgument,
                         "Cannot open log file " + settings.file.string() + ": " + e.what()};
        }
    }

    auto logger = std::make_shared<spdlog::logger>("ragscope", sinks.begin(), sinks.end());
    logger->set_level(parsed);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parsed);
    return {};
}

} // namespace ragscope::config
