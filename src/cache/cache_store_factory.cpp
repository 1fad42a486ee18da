#include "cache/cache_store_factory.hpp"

#include "cache/backends/memory/cache_store.hpp"
#include "cache/backends/sqlite/cache_store.hpp"
#include "spdlog/spdlog.h"

namespace scout::cache {

std::unique_ptr<CacheStore> CreateCacheStore(CacheBackend backend,
                                             const std::filesystem::path &path,
                                             bool *degraded) {
    if (degraded) {
        *degraded = false;
    }

    if (backend == CacheBackend::Memory) {
        return std::make_unique<MemoryCacheStore>();
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        return std::make_unique<SqliteCacheStore>(path);
    } catch (const CacheError &ex) {
        spdlog::warn("CacheStore: Failed to open {}: {}; using in-memory cache", path.string(), ex.what());
    } catch (const std::filesystem::filesystem_error &ex) {
        spdlog::warn("CacheStore: Failed to prepare {}: {}; using in-memory cache", path.string(), ex.what());
    }

    if (degraded) {
        *degraded = true;
    }
    return std::make_unique<MemoryCacheStore>();
}

} // namespace scout::cache
