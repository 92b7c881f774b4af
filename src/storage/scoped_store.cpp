#include <ragscope/storage/memory_scoped_store.h>
#include <ragscope/storage/scoped_store.h>
#include <ragscope/storage/sqlite_scoped_store.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace ragscope::storage {

Result<StoreBackend> storeBackendFromString(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "sqlite")
        return StoreBackend::Sqlite;
    if (lower == "memory")
        return StoreBackend::Memory;
    return Error{ErrorCode::InvalidArgument, "Unknown storage backend: " + value};
}

Result<std::shared_ptr<IScopedStore>> createScopedStore(StoreBackend backend,
                                                        const std::string& path) {
    if (backend == StoreBackend::Memory) {
        spdlog::debug("createScopedStore: using in-memory backend");
        return std::shared_ptr<IScopedStore>(std::make_shared<MemoryScopedStore>());
    }

    if (path.empty())
        return Error{ErrorCode::InvalidArgument, "SQLite backend requires a database path"};

    if (path != ":memory:") {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return Error{ErrorCode::StorageError,
                             "Cannot create directory " + parent.string() + ": " + ec.message()};
            }
        }
    }

    auto store = std::make_shared<SqliteScopedStore>();
    if (auto r = store->open(path); !r)
        return r.error();
    return std::shared_ptr<IScopedStore>(std::move(store));
}

} // namespace ragscope::storage
