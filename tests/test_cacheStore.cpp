#include <catch2/catch.hpp>

#include "cacheStore.hpp"
#include "fingerprint.hpp"
#include "testHelpers.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

static ResponseArtifact sampleResponse() {
    ResponseArtifact res;
    res.status = 203;
    res.statusDescription = "Non-Authoritative Information";
    res.headers.add("Content-Type", "application/octet-stream");
    res.headers.add("Set-Cookie", "a=1");
    res.headers.add("Set-Cookie", "b=2; Path=/");
    res.headers.add("X-Empty", "");
    res.body = std::string("bin\0ary\r\n\r\nbody", 15);
    return res;
}

TEST_CASE("cache entry serialization is byte-exact", "[cache]") {
    ResponseArtifact res = sampleResponse();
    CacheEntry entry("abc123", res, std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)));

    CacheEntry back = CacheEntry::deserialize(entry.serialize());
    CHECK(back.key == "abc123");
    CHECK(back.response == res);
    CHECK(back.response.body.size() == 15);
    CHECK(back.storedAt == entry.storedAt);
    CHECK(back.serialize() == entry.serialize());
}

TEST_CASE("malformed cache entries are rejected", "[cache]") {
    CacheEntry entry("k", sampleResponse());
    std::string good = entry.serialize();

    CHECK_THROWS_AS(CacheEntry::deserialize(""), std::runtime_error);
    CHECK_THROWS_AS(CacheEntry::deserialize("NOT-A-CACHE 1\r\n\r\n"), std::runtime_error);
    CHECK_THROWS_AS(CacheEntry::deserialize(good.substr(0, good.size() - 3)), std::runtime_error);
    CHECK_THROWS_AS(CacheEntry::deserialize(good + "extra"), std::runtime_error);
}

TEST_CASE("store then lookup returns the identical response", "[cache]") {
    TempDir dir;
    CacheStore store(dir.path());
    ResponseArtifact res = sampleResponse();

    CHECK_FALSE(store.lookup("missing", "t"));

    store.store("key1", res, "t");
    auto hit = store.lookup("key1", "t");
    REQUIRE(hit);
    CHECK(hit->key == "key1");
    CHECK(hit->response == res);
    CHECK(store.entryCount() == 1);
}

TEST_CASE("last write wins for a key", "[cache]") {
    TempDir dir;
    CacheStore store(dir.path());
    store.store("k", CountingOrigin::okResponse("one"), "t");
    store.store("k", CountingOrigin::okResponse("two"), "t");

    auto hit = store.lookup("k", "t");
    REQUIRE(hit);
    CHECK(hit->response.body == "two");
    CHECK(store.entryCount() == 1);
}

TEST_CASE("entries survive a new store on the same directory", "[cache]") {
    TempDir dir;
    ResponseArtifact res = sampleResponse();
    {
        CacheStore first(dir.path());
        first.store("durable", res, "t");
    }

    CacheStore second(dir.path());
    auto hit = second.lookup("durable", "t");
    REQUIRE(hit);
    CHECK(hit->response == res);
}

TEST_CASE("purge makes every lookup miss", "[cache]") {
    TempDir dir;
    CacheStore store(dir.path());
    store.store("a", CountingOrigin::okResponse("A"), "t");
    store.store("b", CountingOrigin::okResponse("B"), "t");
    REQUIRE(store.entryCount() == 2);

    store.purgeAll();

    CHECK(store.entryCount() == 0);
    CHECK_FALSE(store.lookup("a", "t"));
    CHECK_FALSE(store.lookup("b", "t"));

    SECTION("another store on the directory sees the purge") {
        CacheStore other(dir.path());
        CHECK_FALSE(other.lookup("a", "t"));
    }
    SECTION("purging an empty cache is fine") {
        CHECK_NOTHROW(store.purgeAll());
    }
}

TEST_CASE("purge leaves unrelated files alone", "[cache]") {
    TempDir dir;
    dir.write("README", "not a cache entry");
    CacheStore store(dir.path());
    store.store("a", CountingOrigin::okResponse("A"), "t");

    store.purgeAll();

    CHECK(store.entryCount() == 0);
    CHECK(std::filesystem::exists(dir.file("README")));
}

TEST_CASE("corrupt entry files count as misses", "[cache]") {
    TempDir dir;
    dir.write("broken.entry", "garbage that is not an entry");
    CacheStore store(dir.path());
    CHECK_FALSE(store.lookup("broken", "t"));

    SECTION("an entry stored under another fingerprint is also a miss") {
        CacheEntry foreign("other", CountingOrigin::okResponse("x"));
        dir.write("renamed.entry", foreign.serialize());
        CHECK_FALSE(store.lookup("renamed", "t"));
    }
    SECTION("a later store repairs it") {
        store.store("broken", CountingOrigin::okResponse("fixed"), "t");
        auto hit = store.lookup("broken", "t");
        REQUIRE(hit);
        CHECK(hit->response.body == "fixed");
    }
}

TEST_CASE("large bodies are served from disk, not kept in memory", "[cache]") {
    TempDir dir;
    CacheStore store(dir.path());
    ResponseArtifact big = CountingOrigin::okResponse(std::string(CacheStore::MAX_INDEXED_BODY + 1, 'x'));
    ResponseArtifact small = CountingOrigin::okResponse("small");

    store.store("small", small, "t");
    store.store("big", big, "t");
    CHECK(store.indexedCount() == 1);

    auto hit = store.lookup("big", "t");
    REQUIRE(hit);
    CHECK(hit->response == big);
    CHECK(store.indexedCount() == 1);

    SECTION("the file stays authoritative for large entries") {
        dir.write("big.entry", "garbage that is not an entry");
        CHECK_FALSE(store.lookup("big", "t"));
    }
    SECTION("a large store replaces a small indexed one") {
        store.store("small", big, "t");
        CHECK(store.indexedCount() == 0);
        auto replaced = store.lookup("small", "t");
        REQUIRE(replaced);
        CHECK(replaced->response == big);
    }
}

TEST_CASE("purge racing lookups and stores never serves a wrong entry", "[cache]") {
    TempDir dir;
    CacheStore store(dir.path());

    std::vector<std::string> keys;
    for (int i = 0; i < 8; ++i) {
        keys.push_back("k" + std::to_string(i));
    }
    auto responseFor = [](const std::string &key) {
        return CountingOrigin::okResponse("body-" + key);
    };

    std::atomic<bool> stop(false);
    std::atomic<int> wrongHits(0);
    std::atomic<int> purges(0);
    std::atomic<int> purgeFailures(0);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t]() {
            for (int round = 0; round < 200; ++round) {
                const std::string &key = keys[(round + t) % keys.size()];
                if (round % 3 == 0) {
                    store.store(key, responseFor(key), "w" + std::to_string(t));
                }
                auto hit = store.lookup(key, "w" + std::to_string(t));
                if (hit) {
                    if (hit->key != key || !(hit->response == responseFor(key))) {
                        ++wrongHits;
                    }
                }
            }
        });
    }
    std::thread purger([&]() {
        do {
            try {
                store.purgeAll();
                ++purges;
            } catch (const std::runtime_error &) {
                ++purgeFailures;
            }
            std::this_thread::yield();
        } while (!stop.load());
    });

    for (auto &w : workers) {
        w.join();
    }
    stop = true;
    purger.join();

    CHECK(wrongHits.load() == 0);
    CHECK(purgeFailures.load() == 0);
    CHECK(purges.load() > 0);

    store.purgeAll();
    for (const auto &key : keys) {
        CHECK_FALSE(store.lookup(key, "t"));
    }
    CHECK(store.entryCount() == 0);
    CHECK(store.indexedCount() == 0);
}

TEST_CASE("fingerprints depend on method, path, query and declared headers", "[cache][fingerprint]") {
    std::vector<std::string> none;
    RequestEvent a = makeRequest("GET", "/x?q=1");

    CHECK(computeFingerprint(a, none).size() == 64);
    CHECK(computeFingerprint(a, none) == computeFingerprint(makeRequest("get", "/x?q=1"), none));
    CHECK(computeFingerprint(a, none) == computeFingerprint(makeRequest("GET", "/./x?q=1"), none));
    CHECK(computeFingerprint(a, none) != computeFingerprint(makeRequest("GET", "/x?q=2"), none));
    CHECK(computeFingerprint(a, none) != computeFingerprint(makeRequest("HEAD", "/x?q=1"), none));
    CHECK(computeFingerprint(a, none) != computeFingerprint(makeRequest("GET", "/x/?q=1"), none));

    RequestEvent en = makeRequest("GET", "/x");
    en.headers.add("Accept-Language", "en");
    RequestEvent fr = makeRequest("GET", "/x");
    fr.headers.add("Accept-Language", "fr");

    CHECK(computeFingerprint(en, none) == computeFingerprint(fr, none));
    std::vector<std::string> lang = {"accept-language"};
    CHECK(computeFingerprint(en, lang) != computeFingerprint(fr, lang));
    CHECK(fingerprintSource(en, {"Accept-Language", "accept-language"}) == "GET\n/x\n\naccept-language:en\n");
}

TEST_CASE("sha256 matches a known digest", "[fingerprint]") {
    CHECK(sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
