#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include "eventModel.hpp"
#include <chrono>
#include <string>

class CacheEntry{
    public:
        std::string key;
        ResponseArtifact response;
        std::chrono::system_clock::time_point storedAt;

        CacheEntry();
        CacheEntry(std::string key, ResponseArtifact response,
                   std::chrono::system_clock::time_point storedAt = std::chrono::system_clock::now());

        std::string getStoredAtString() const;

        // On-disk form: a small preamble followed by the response in HTTP wire layout.
        std::string serialize() const;
        // Throws std::runtime_error on any malformed input.
        static CacheEntry deserialize(const std::string &data);
};

#endif // CACHEENTRY_HPP
