#ifndef CACHESTORE_HPP
#define CACHESTORE_HPP

#include "cacheEntry.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

// Durable response cache: one file per fingerprint under a directory, with an
// in-memory index in front. No expiry; entries leave only through purgeAll().
class CacheStore{
private:
    std::string dir;

    // Entries already read or written by this process, bodies up to
    // MAX_INDEXED_BODY only. Larger ones are read from disk on every lookup.
    std::map<std::string, CacheEntry> data;

    // Protects data + generation
    std::shared_mutex cacheMutex;

    // Bumped by purgeAll(); a disk read that started before a purge must not
    // repopulate the index after it.
    uint64_t generation;

    std::atomic<uint64_t> tmpCounter;

    std::string entryPath(const std::string &key) const;
    // Caller holds cacheMutex exclusively.
    void remember(const CacheEntry &entry);
    std::optional<CacheEntry> readEntryFile(const std::string &key, const std::string &requestId);

public:
    static constexpr size_t MAX_INDEXED_BODY = 256 * 1024;

    // Creates the directory if needed. Throws std::runtime_error if it cannot.
    explicit CacheStore(const std::string &cacheDir);

    CacheStore(CacheStore const&) = delete;
    CacheStore& operator=(CacheStore const&) = delete;

    // Missing, unreadable and corrupt entries are all misses.
    std::optional<CacheEntry> lookup(const std::string &key, const std::string &requestId);
    // Last write wins. Disk failures are logged; the entry still serves this process.
    void store(const std::string &key, const ResponseArtifact &response, const std::string &requestId);
    // Throws std::runtime_error if an entry file could not be removed.
    void purgeAll();

    // Entry files currently on disk.
    size_t entryCount() const;
    // Entries held in memory.
    size_t indexedCount();
    const std::string &directory() const { return dir; }
};

#endif // CACHESTORE_HPP
