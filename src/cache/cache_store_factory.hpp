#pragma once

#include <filesystem>
#include <memory>

#include "cache/cache_store.hpp"

namespace scout::cache {

enum class CacheBackend {
    Sqlite,
    Memory
};

// Opens the requested backend. A persistent store that cannot be opened falls
// back to memory; degraded (when given) reports whether that happened.
std::unique_ptr<CacheStore> CreateCacheStore(CacheBackend backend,
                                             const std::filesystem::path &path,
                                             bool *degraded = nullptr);

} // namespace scout::cache
