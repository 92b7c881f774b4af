#include <ragscope/config/engine_config.h>
#include <ragscope/core/utf8.h>
#include <ragscope/ingest/folder_rag_service.h>
#include <ragscope/storage/entity_json.h>
#include <ragscope/vector/embedding_provider.h>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ragscope::cli {

namespace {

using json = nlohmann::json;

constexpr auto kIngestTimeout = std::chrono::minutes(10);

int fail(const Error& error) {
    std::cerr << "Error: " << error.message << std::endl;
    return 1;
}

Result<std::string> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Error{ErrorCode::NotFound, "Cannot open " + path};
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

class RagScopeCLI {
public:
    RagScopeCLI() : app_("ragscope", "Per-folder retrieval context engine") {
        setupApp();
        setupCommands();
    }

    int run(int argc, char** argv) {
        try {
            app_.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_.exit(e);
        }

        auto config = config::loadEngineConfig(config::get_config_path(configPath_));
        if (!config)
            return fail(config.error());
        config_ = std::move(config).value();
        if (!dbPath_.empty())
            config_.storage.path = config::expand_tilde(dbPath_);

        if (auto r = config::setupLogging(config_.logging, verbose_); !r)
            return fail(r.error());

        if (auto r = openService(); !r)
            return fail(r.error());

        for (const auto& [name, handler] : handlers_) {
            if (app_.got_subcommand(name))
                return handler();
        }
        std::cout << app_.help() << std::endl;
        return 0;
    }

private:
    void setupApp() {
        app_.set_version_flag("-V,--version", "0.1.0");
        app_.require_subcommand(0, 1);

        app_.add_option("--config", configPath_, "Config file (default: XDG config dir)");
        app_.add_option("--db", dbPath_, "Database path, overrides storage.path");
        app_.add_option("-f,--folder", scope_.folder_id, "Folder id")->required();
        app_.add_option("-o,--owner", scope_.owner_id, "Owner id")->required();
        app_.add_flag("-v,--verbose", verbose_, "Enable debug logging");
        app_.add_flag("--json", json_, "Emit JSON output");
    }

    void setupCommands() {
        auto* add = app_.add_subcommand("add", "Add documents to the folder");
        add->add_option("files", files_, "Files to ingest")->required()->check(CLI::ExistingFile);
        handlers_.emplace_back("add", [this] { return cmdAdd(); });

        app_.add_subcommand("list", "List documents in the folder");
        handlers_.emplace_back("list", [this] { return cmdList(); });

        auto* search = app_.add_subcommand("search", "Find chunks similar to a query");
        search->add_option("query", query_, "Query text")->required();
        search->add_option("-k,--limit", limit_, "Maximum results")->check(CLI::NonNegativeNumber);
        handlers_.emplace_back("search", [this] { return cmdSearch(); });

        auto* ctx = app_.add_subcommand("context", "Render retrieved context for a query");
        ctx->add_option("query", query_, "Query text")->required();
        ctx->add_option("--max-tokens", maxTokens_, "Token budget for retrieved chunks");
        handlers_.emplace_back("context", [this] { return cmdContext(); });

        auto* prompt = app_.add_subcommand("prompt", "Build the full folder prompt for a query");
        prompt->add_option("query", query_, "User message")->required();
        prompt->add_option("--system", basePrompt_, "Base system prompt");
        handlers_.emplace_back("prompt", [this] { return cmdPrompt(); });

        app_.add_subcommand("stats", "Show folder statistics");
        handlers_.emplace_back("stats", [this] { return cmdStats(); });

        app_.add_subcommand("graph", "Dump the folder knowledge graph");
        handlers_.emplace_back("graph", [this] { return cmdGraph(); });

        auto* del = app_.add_subcommand("delete", "Delete a document and its derived data");
        del->add_option("id", documentId_, "Document id")->required();
        handlers_.emplace_back("delete", [this] { return cmdDelete(); });

        app_.add_subcommand("cleanup", "Remove everything stored for the folder");
        handlers_.emplace_back("cleanup", [this] { return cmdCleanup(); });
    }

    Result<void> openService() {
        auto store = storage::createScopedStore(config_.storage.backend,
                                                config_.storage.path.string());
        if (!store)
            return store.error();

        vector::ModelRegistry registry;
        auto provider = vector::createEmbeddingProvider(
            config_.embedding.provider, config_.embedding.model, registry, config_.embedding.seed);
        if (!provider)
            return provider.error();

        service_ = std::make_unique<ingest::FolderRagService>(
            std::move(store).value(),
            std::shared_ptr<vector::IEmbeddingProvider>(std::move(provider).value()),
            config::toServiceOptions(config_));
        return {};
    }

    int cmdAdd() {
        std::vector<std::string> ids;
        for (const auto& file : files_) {
            auto content = readFile(file);
            if (!content)
                return fail(content.error());

            ingest::AddDocumentRequest request;
            request.scope = scope_;
            request.name = std::filesystem::path(file).filename().string();
            request.content = std::move(content).value();
            request.original_file = std::filesystem::absolute(file).string();
            auto doc = service_->addDocument(request);
            if (!doc)
                return fail(doc.error());
            ids.push_back(doc.value().id);
        }

        if (!service_->waitForIdle(kIngestTimeout)) {
            std::cerr << "Error: timed out waiting for ingestion" << std::endl;
            return 1;
        }

        int rc = 0;
        json out = json::array();
        for (size_t i = 0; i < ids.size(); ++i) {
            auto status = service_->getIngestStatus(ids[i]);
            if (!status)
                return fail(status.error());
            const auto& s = status.value();
            if (s.state == ingest::IngestState::Failed)
                rc = 1;
            if (json_) {
                out.push_back({{"id", ids[i]},
                               {"file", files_[i]},
                               {"state", ingest::ingestStateToString(s.state)},
                               {"chunks", s.chunks},
                               {"embeddings", s.embeddings},
                               {"failed_chunks", s.failed_chunks}});
            } else {
                std::cout << ids[i] << "  " << files_[i] << "  "
                          << ingest::ingestStateToString(s.state) << " (" << s.chunks
                          << " chunks, " << s.embeddings << " embeddings)";
                if (!s.error.empty())
                    std::cout << "  " << s.error;
                std::cout << std::endl;
            }
        }
        if (json_)
            std::cout << storage::dumpJson(out, 2) << std::endl;
        return rc;
    }

    int cmdList() {
        auto docs = service_->getDocuments(scope_);
        if (!docs)
            return fail(docs.error());

        if (json_) {
            json out = json::array();
            for (const auto& d : docs.value()) {
                out.push_back({{"id", d.id},
                               {"name", d.name},
                               {"type", storage::documentTypeToString(d.type)},
                               {"size", d.size},
                               {"created_at", storage::toEpochMillis(d.created_at)}});
            }
            std::cout << storage::dumpJson(out, 2) << std::endl;
            return 0;
        }
        for (const auto& d : docs.value()) {
            std::cout << d.id << "  " << d.name << "  " << storage::documentTypeToString(d.type)
                      << "  " << d.size << " bytes" << std::endl;
        }
        return 0;
    }

    int cmdSearch() {
        auto results = service_->searchSimilarContent(scope_, query_, limit_);
        if (!results)
            return fail(results.error());

        if (json_) {
            json out = json::array();
            for (const auto& r : results.value()) {
                out.push_back({{"chunk_id", r.chunk.id},
                               {"document_id", r.chunk.document_id},
                               {"document", r.chunk.metadata.document_name},
                               {"similarity", r.similarity},
                               {"content", r.chunk.content}});
            }
            std::cout << storage::dumpJson(out, 2) << std::endl;
            return 0;
        }
        for (const auto& r : results.value()) {
            std::cout << fmt::format("{:.4f}  {} #{}", r.similarity,
                                     r.chunk.metadata.document_name, r.chunk.chunk_index)
                      << std::endl;
            std::cout << "    " << core::utf8Prefix(r.chunk.content, 160) << std::endl;
        }
        return 0;
    }

    int cmdContext() {
        auto text = service_->buildContextForQuery(scope_, query_, maxTokens_);
        if (!text)
            return fail(text.error());
        std::cout << text.value() << std::endl;
        return 0;
    }

    int cmdPrompt() {
        std::vector<context::Message> history{{context::Role::User, query_}};
        auto ctx = service_->buildFolderContext(scope_, history, query_, basePrompt_,
                                                config_.context.limits);
        if (!ctx)
            return fail(ctx.error());

        if (json_) {
            json messages = json::array();
            for (const auto& m : ctx.value().messages)
                messages.push_back({{"role", context::roleToString(m.role)}, {"content", m.content}});
            json out = {{"messages", messages},
                        {"total_tokens", ctx.value().total_tokens},
                        {"truncated", ctx.value().truncated}};
            std::cout << storage::dumpJson(out, 2) << std::endl;
            return 0;
        }
        for (const auto& m : ctx.value().messages)
            std::cout << "[" << context::roleToString(m.role) << "]\n" << m.content << "\n\n";
        std::cout << "~" << ctx.value().total_tokens << " tokens"
                  << (ctx.value().truncated ? " (history truncated)" : "") << std::endl;
        return 0;
    }

    int cmdStats() {
        auto stats = service_->orchestrator().getFolderStats(scope_);
        json out = {{"folder_id", scope_.folder_id},
                    {"owner_id", scope_.owner_id},
                    {"documents", stats.document_count},
                    {"chunks", stats.total_chunks},
                    {"tokens", stats.total_tokens}};
        if (stats.last_updated)
            out["last_updated"] = storage::toEpochMillis(*stats.last_updated);
        if (json_) {
            std::cout << storage::dumpJson(out, 2) << std::endl;
        } else {
            std::cout << "Documents: " << stats.document_count << "\n"
                      << "Chunks:    " << stats.total_chunks << "\n"
                      << "Tokens:    " << stats.total_tokens << std::endl;
        }
        return 0;
    }

    int cmdGraph() {
        auto graph = service_->getKnowledgeGraph(scope_);
        if (!graph) {
            if (graph.error().code == ErrorCode::NotFound) {
                std::cout << (json_ ? "{}" : "No knowledge graph yet") << std::endl;
                return 0;
            }
            return fail(graph.error());
        }
        auto out = storage::graphBodyToJson(graph.value());
        out["document_count"] = graph.value().document_count;
        std::cout << storage::dumpJson(out, json_ ? 2 : -1) << std::endl;
        return 0;
    }

    int cmdDelete() {
        if (auto r = service_->deleteDocument(scope_, documentId_); !r)
            return fail(r.error());
        std::cout << "Deleted " << documentId_ << std::endl;
        return 0;
    }

    int cmdCleanup() {
        if (auto r = service_->cleanupScope(scope_); !r)
            return fail(r.error());
        std::cout << "Removed all data for folder " << scope_.folder_id << std::endl;
        return 0;
    }

    CLI::App app_;
    std::vector<std::pair<std::string, std::function<int()>>> handlers_;

    std::string configPath_;
    std::string dbPath_;
    Scope scope_;
    bool verbose_ = false;
    bool json_ = false;

    std::vector<std::string> files_;
    std::string query_;
    int limit_ = 5;
    size_t maxTokens_ = 2000;
    std::string basePrompt_ = "You are a helpful assistant.";
    std::string documentId_;

    config::EngineConfig config_;
    std::unique_ptr<ingest::FolderRagService> service_;
};

} // namespace ragscope::cli

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);
        ragscope::cli::RagScopeCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
