#include "cacheEntry.hpp"
#include <ctime>
#include <sstream>
#include <stdexcept>

static const char *CACHE_MAGIC = "EDGESIM-CACHE 1";

CacheEntry::CacheEntry(){
    storedAt = std::chrono::system_clock::now();
}

CacheEntry::CacheEntry(std::string key, ResponseArtifact response,
                       std::chrono::system_clock::time_point storedAt)
    : key(std::move(key)), response(std::move(response)), storedAt(storedAt) {}

std::string CacheEntry::getStoredAtString() const{
    std::time_t storedAt_t = std::chrono::system_clock::to_time_t(storedAt);
    char buf[32];
    std::string storedAtStr = ctime_r(&storedAt_t, buf) ? buf : "";
    if(!storedAtStr.empty() && storedAtStr.back() == '\n'){
        storedAtStr.pop_back();
    }
    return storedAtStr;
}

std::string CacheEntry::serialize() const{
    std::ostringstream oss;
    oss << CACHE_MAGIC << "\r\n";
    oss << "Stored-At: " << std::chrono::duration_cast<std::chrono::seconds>(storedAt.time_since_epoch()).count() << "\r\n";
    oss << "Fingerprint: " << key << "\r\n";
    oss << "Body-Length: " << response.body.size() << "\r\n";
    oss << "\r\n";

    oss << response.status << " " << response.statusDescription << "\r\n";
    for(const auto &h : response.headers.fields()){
        oss << h.first << ": " << h.second << "\r\n";
    }
    oss << "\r\n";
    oss.write(response.body.data(), (std::streamsize)response.body.size());
    return oss.str();
}

// Reads one CRLF-terminated line starting at pos; advances pos past the CRLF.
static std::string takeLine(const std::string &data, size_t &pos){
    size_t end = data.find("\r\n", pos);
    if(end == std::string::npos){
        throw std::runtime_error("Truncated cache entry");
    }
    std::string line = data.substr(pos, end - pos);
    pos = end + 2;
    return line;
}

static std::pair<std::string, std::string> splitField(const std::string &line){
    size_t colon = line.find(':');
    if(colon == std::string::npos || colon == 0){
        throw std::runtime_error("Malformed cache entry field: " + line);
    }
    std::string value = line.substr(colon + 1);
    // Written as "name: value", so exactly one space is dropped.
    if(!value.empty() && value.front() == ' ') value.erase(0, 1);
    return {line.substr(0, colon), value};
}

CacheEntry CacheEntry::deserialize(const std::string &data){
    size_t pos = 0;
    if(takeLine(data, pos) != CACHE_MAGIC){
        throw std::runtime_error("Not a cache entry");
    }

    CacheEntry entry;
    long long storedAtSec = -1;
    long long bodyLength = -1;
    bool haveKey = false;

    for(std::string line = takeLine(data, pos); !line.empty(); line = takeLine(data, pos)){
        auto field = splitField(line);
        try {
            if(field.first == "Stored-At"){
                storedAtSec = std::stoll(field.second);
            } else if(field.first == "Fingerprint"){
                entry.key = field.second;
                haveKey = true;
            } else if(field.first == "Body-Length"){
                bodyLength = std::stoll(field.second);
            }
        } catch (const std::logic_error &) {
            throw std::runtime_error("Malformed cache entry field: " + line);
        }
    }
    if(storedAtSec < 0 || bodyLength < 0 || !haveKey){
        throw std::runtime_error("Incomplete cache entry preamble");
    }
    entry.storedAt = std::chrono::system_clock::time_point(std::chrono::seconds(storedAtSec));

    std::string statusLine = takeLine(data, pos);
    size_t space = statusLine.find(' ');
    if(space == std::string::npos){
        throw std::runtime_error("Malformed cache entry status line");
    }
    try {
        size_t used = 0;
        entry.response.status = std::stoi(statusLine.substr(0, space), &used);
        if(used != space) throw std::invalid_argument("status");
    } catch (const std::logic_error &) {
        throw std::runtime_error("Malformed cache entry status: " + statusLine);
    }
    entry.response.statusDescription = statusLine.substr(space + 1);

    for(std::string line = takeLine(data, pos); !line.empty(); line = takeLine(data, pos)){
        auto field = splitField(line);
        entry.response.headers.add(field.first, field.second);
    }

    if(data.size() - pos != (size_t)bodyLength){
        throw std::runtime_error("Cache entry body length mismatch");
    }
    entry.response.body = data.substr(pos);
    return entry;
}
