#include "cacheStore.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

static const char *ENTRY_SUFFIX = ".entry";
static const char *TMP_SUFFIX = ".tmp";

static bool hasSuffix(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

CacheStore::CacheStore(const std::string &cacheDir) : dir(cacheDir), generation(0), tmpCounter(0) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir)) {
        throw std::runtime_error("Cannot create cache directory " + dir + ": " + ec.message());
    }
}

std::string CacheStore::entryPath(const std::string &key) const {
    return (fs::path(dir) / (key + ENTRY_SUFFIX)).string();
}

void CacheStore::remember(const CacheEntry &entry) {
    if (entry.response.body.size() <= MAX_INDEXED_BODY) {
        data[entry.key] = entry;
    } else {
        data.erase(entry.key);
    }
}

std::optional<CacheEntry> CacheStore::readEntryFile(const std::string &key, const std::string &requestId) {
    std::ifstream in(entryPath(key), std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        Logger::getInstance().logError(requestId, "Cache read failed for " + key + ", treating as miss");
        return std::nullopt;
    }

    try {
        CacheEntry entry = CacheEntry::deserialize(raw);
        if (entry.key != key) {
            throw std::runtime_error("fingerprint mismatch");
        }
        return entry;
    } catch (const std::runtime_error &e) {
        Logger::getInstance().logError(requestId, "Corrupt cache entry " + key + " (" + e.what() + "), treating as miss");
        return std::nullopt;
    }
}

std::optional<CacheEntry> CacheStore::lookup(const std::string &key, const std::string &requestId) {
    // Phase 1: shared read of the index
    uint64_t seenGeneration;
    {
        std::shared_lock<std::shared_mutex> rlock(cacheMutex);
        auto it = data.find(key);
        if (it != data.end()) {
            return it->second;
        }
        seenGeneration = generation;
    }

    // Phase 2: disk, no lock held
    std::optional<CacheEntry> entry = readEntryFile(key, requestId);
    if (!entry) {
        return std::nullopt;
    }

    // Phase 3: remember it, unless a purge ran meanwhile
    {
        std::unique_lock<std::shared_mutex> wlock(cacheMutex);
        if (generation == seenGeneration) {
            remember(*entry);
        }
    }
    return entry;
}

void CacheStore::store(const std::string &key, const ResponseArtifact &response, const std::string &requestId) {
    CacheEntry entry(key, response);

    uint64_t seenGeneration;
    {
        std::shared_lock<std::shared_mutex> rlock(cacheMutex);
        seenGeneration = generation;
    }

    // Write to a private temp file, then rename over the entry: readers see
    // either the old file, the new one, or none.
    std::ostringstream tmpName;
    tmpName << key << "." << getpid() << "." << tmpCounter.fetch_add(1) << TMP_SUFFIX;
    fs::path tmpPath = fs::path(dir) / tmpName.str();

    bool onDisk = false;
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        std::string bytes = entry.serialize();
        out.write(bytes.data(), (std::streamsize)bytes.size());
        out.close();
        if (out) {
            std::error_code ec;
            fs::rename(tmpPath, entryPath(key), ec);
            onDisk = !ec;
            if (ec) {
                Logger::getInstance().logError(requestId, "Cache rename failed for " + key + ": " + ec.message());
            }
        } else {
            Logger::getInstance().logError(requestId, "Cache write failed for " + key);
        }
    }
    if (!onDisk) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
    }

    std::unique_lock<std::shared_mutex> wlock(cacheMutex);
    // A purge raced this store: the disk alone decides whether the entry survived.
    if (generation == seenGeneration) {
        remember(entry);
    }
}

void CacheStore::purgeAll() {
    std::unique_lock<std::shared_mutex> lock(cacheMutex);
    ++generation;
    data.clear();

    std::error_code ec;
    std::vector<std::string> failures;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!hasSuffix(name, ENTRY_SUFFIX) && !hasSuffix(name, TMP_SUFFIX)) {
            continue;
        }
        std::error_code rmEc;
        fs::remove(it->path(), rmEc);
        if (rmEc) {
            failures.push_back(name + ": " + rmEc.message());
        }
    }
    if (ec) {
        failures.push_back(dir + ": " + ec.message());
    }

    if (!failures.empty()) {
        std::string msg = "Cache purge incomplete";
        for (const auto &f : failures) msg += "; " + f;
        Logger::getInstance().logError(NO_REQUEST, msg);
        throw std::runtime_error(msg);
    }
    Logger::getInstance().logNote(NO_REQUEST, "cache purged: " + dir);
}

size_t CacheStore::indexedCount() {
    std::shared_lock<std::shared_mutex> rlock(cacheMutex);
    return data.size();
}

size_t CacheStore::entryCount() const {
    size_t count = 0;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (hasSuffix(it->path().filename().string(), ENTRY_SUFFIX)) {
            ++count;
        }
    }
    return count;
}
