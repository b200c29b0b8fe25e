#ifndef EVENTMODEL_HPP
#define EVENTMODEL_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Multi-valued header list. Lookups ignore case, insertion order is kept.
class HeaderMap{
public:
    typedef std::pair<std::string, std::string> Field;

    void add(const std::string &name, const std::string &value);
    // Replaces every existing value of name.
    void set(const std::string &name, const std::string &value);
    size_t remove(const std::string &name);

    bool has(const std::string &name) const;
    std::optional<std::string> get(const std::string &name) const;
    std::vector<std::string> getAll(const std::string &name) const;

    const std::vector<Field> &fields() const { return entries; }
    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    bool operator==(const HeaderMap &other) const { return entries == other.entries; }
    bool operator!=(const HeaderMap &other) const { return !(*this == other); }

private:
    std::vector<Field> entries;
};

bool headerNameEquals(const std::string &a, const std::string &b);
std::string toLowerCopy(std::string s);

struct RequestEvent{
    std::string method;
    std::string url;        // path with optional ?query
    HeaderMap headers;
    std::map<std::string, std::string> cookies;
    std::string body;
    std::string clientIp;

    std::string path() const;
    std::string query() const;
};

struct ResponseArtifact{
    int status = 200;
    std::string statusDescription;
    HeaderMap headers;
    std::string body;
};

bool operator==(const ResponseArtifact &a, const ResponseArtifact &b);

enum class Stage{
    ViewerRequest = 0,
    OriginRequest,
    OriginResponse,
    ViewerResponse
};

constexpr size_t STAGE_COUNT = 4;

const char *stageName(Stage stage);
// Throws std::invalid_argument for anything but the four stage names.
Stage parseStage(const std::string &name);
bool isRequestPhase(Stage stage);

struct EventContext{
    Stage stage = Stage::ViewerRequest;
    std::string requestId;
    std::string distributionDomainName;
    std::string distributionId;
};

// What a stage handler sees. response is only set in the response phase.
struct StageEvent{
    EventContext config;
    RequestEvent request;
    const ResponseArtifact *response = nullptr;
};

// A handler's answer: a request to continue with, a response, or nothing.
class StageResult{
public:
    enum class Kind{
        Empty,
        Request,
        Response
    };

    StageResult() : resultKind(Kind::Empty) {}

    static StageResult forward(RequestEvent request);
    static StageResult respond(ResponseArtifact response);

    Kind kind() const { return resultKind; }
    bool isRequest() const { return resultKind == Kind::Request; }
    bool isResponse() const { return resultKind == Kind::Response; }

    RequestEvent &request() { return *requestValue; }
    ResponseArtifact &response() { return *responseValue; }

private:
    Kind resultKind;
    std::optional<RequestEvent> requestValue;
    std::optional<ResponseArtifact> responseValue;
};

// Standard reason phrase for status, or "Unknown".
std::string reasonPhrase(int status);

#endif // EVENTMODEL_HPP
