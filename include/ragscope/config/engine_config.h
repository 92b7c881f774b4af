#pragma once

#include <ragscope/chunking/document_chunker.h>
#include <ragscope/config/config_helpers.h>
#include <ragscope/context/context_assembler.h>
#include <ragscope/context/folder_context.h>
#include <ragscope/ingest/folder_rag_service.h>
#include <ragscope/storage/scoped_store.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace ragscope::config {

struct EmbeddingSettings {
    std::string model = "local-sentence-transformer";
    std::string provider = "hashing"; // "hashing" or "seeded"
    uint64_t seed = 0;
};

struct ContextSettings {
    std::string model; // Preset applied first; explicit limits below override it
    context::TokenLimits limits;
};

struct StorageSettings {
    storage::StoreBackend backend = storage::StoreBackend::Sqlite;
    std::filesystem::path path;
};

struct LoggingSettings {
    std::string level = "info";
    std::filesystem::path file; // Rotating file sink when non-empty
};

/**
 * Full engine configuration. Every field has a working default, so a missing
 * config file is not an error.
 */
struct EngineConfig {
    chunking::ChunkingConfig chunking;
    EmbeddingSettings embedding;
    ContextSettings context;
    context::FolderContextConfig folder;
    StorageSettings storage;
    std::size_t worker_threads = 2;
    LoggingSettings logging;
};

EngineConfig defaultEngineConfig();

/**
 * Applies parsed sections over the defaults. Malformed numbers or booleans
 * are a ValidationError naming the offending key.
 */
Result<EngineConfig> parseEngineConfig(const ConfigSections& sections);

// Missing file -> defaults
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path);

ingest::FolderRagServiceOptions toServiceOptions(const EngineConfig& config);

/**
 * Installs the default spdlog logger: stderr, plus a rotating file sink when
 * settings.file is set. RAGSCOPE_LOG_LEVEL overrides the configured level and
 * verbose forces debug.
 */
Result<void> setupLogging(const LoggingSettings& settings, bool verbose = false);

} // namespace ragscope::config
