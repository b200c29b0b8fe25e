#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <mutex>
#include <fstream>

class Logger {
private:
    std::mutex mtx;
    std::ofstream ofs;
    std::string path;
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimeUTC();

public:
    static Logger& getInstance();

    // Redirect output to a file (append). Empty path or failure -> stderr.
    bool open(const std::string &logPath);
    const std::string &currentPath() const { return path; }

    void logMessage(const std::string &requestID, const std::string &msg);
    void logNoteError(const std::string &requestID, const std::string &level, const std::string &msg);
    void logNewRequest(const std::string &requestID, const std::string &requestLine, const std::string &clientIP);

    void logBehavior(const std::string &requestID, const std::string &pattern);
    void logStage(const std::string &requestID, const std::string &stage, const std::string &outcome);

    void logCacheStatus(const std::string &requestID, const std::string &msg);
    void logCachedAt(const std::string &requestID, const std::string &storedAt);

    void logRequesting(const std::string &requestID, const std::string &reqLine, const std::string &originName);
    void logReceived(const std::string &requestID, const std::string &respLine, const std::string &originName);
    void logRespond(const std::string &requestID, const std::string &respLine);

    void logNote(const std::string &requestID, const std::string &msg);
    void logWarning(const std::string &requestID, const std::string &msg);
    void logError(const std::string &requestID, const std::string &msg);
};

// Request id used for lines not tied to a request.
extern const std::string NO_REQUEST;

#endif // LOGGER_HPP
