#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>

const std::string NO_REQUEST = "-";

Logger::Logger() {}

Logger::~Logger() {
    if (ofs.is_open()) {
        ofs.close();
    }
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool Logger::open(const std::string &logPath) {
    std::lock_guard<std::mutex> lock(mtx);
    if (ofs.is_open()) {
        ofs.close();
    }
    path.clear();
    if (logPath.empty()) {
        return true;
    }
    ofs.open(logPath, std::ios::app);
    if (!ofs.is_open()) {
        std::cerr << "Cannot open log file: " << logPath << std::endl;
        return false;
    }
    path = logPath;
    return true;
}

//get UTC time
std::string Logger::getTimeUTC() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);

    std::tm tm;
    gmtime_r(&now_time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
    return oss.str();
}

//general log method
void Logger::logMessage(const std::string &requestID, const std::string &msg) {
    std::lock_guard<std::mutex> lock(mtx);
    if (ofs.is_open()) {
        ofs << requestID << ": " << msg << std::endl;
    } else {
        std::cerr << requestID << ": " << msg << std::endl;
    }
}

//"GET /index.html HTTP/1.1" from 192.168.1.10 @ 2025-02-27 15:45:30 UTC
void Logger::logNewRequest(const std::string &requestID, const std::string &requestLine, const std::string &clientIP) {
    std::ostringstream oss;
    oss << "\"" << requestLine << "\" from " << clientIP << " @ " << getTimeUTC();
    logMessage(requestID, oss.str());
}

// 7: behavior /api/*
void Logger::logBehavior(const std::string &requestID, const std::string &pattern) {
    logMessage(requestID, "behavior " + pattern);
}

// 7: viewer-request => short-circuit
void Logger::logStage(const std::string &requestID, const std::string &stage, const std::string &outcome) {
    std::ostringstream oss;
    oss << stage << " => " << outcome;
    logMessage(requestID, oss.str());
}

//7: not in cache
//7: cached
void Logger::logCacheStatus(const std::string &requestID, const std::string &msg) {
    logMessage(requestID, msg);
}

//7: in cache, stored at Sun Feb 27 12:00:00 2025
void Logger::logCachedAt(const std::string &requestID, const std::string &storedAt) {
    logMessage(requestID, "in cache, stored at " + storedAt);
}

// 7: Requesting "GET /index.html" from http://localhost:3000
void Logger::logRequesting(const std::string &requestID, const std::string &reqLine, const std::string &originName) {
    std::ostringstream oss;
    oss << "Requesting \"" << reqLine << "\" from " << originName;
    logMessage(requestID, oss.str());
}

// 7: Received "HTTP/1.1 200 OK" from http://localhost:3000
void Logger::logReceived(const std::string &requestID, const std::string &respLine, const std::string &originName) {
    std::ostringstream oss;
    oss << "Received \"" << respLine << "\" from " << originName;
    logMessage(requestID, oss.str());
}

// 7: Responding "HTTP/1.1 200 OK"
void Logger::logRespond(const std::string &requestID, const std::string &respLine) {
    std::ostringstream oss;
    oss << "Responding \"" << respLine << "\"";
    logMessage(requestID, oss.str());
}

// NOTE / WARNING / ERROR
//7: NOTE cache directory file:///tmp/edge-lambda
//7: ERROR Origin unavailable: connection refused
void Logger::logNoteError(const std::string &requestID, const std::string &level, const std::string &msg) {
    std::ostringstream oss;
    oss << level << " " << msg;
    logMessage(requestID, oss.str());
}

void Logger::logNote(const std::string &requestID, const std::string &msg) {
    logNoteError(requestID, "NOTE", msg);
}

void Logger::logWarning(const std::string &requestID, const std::string &msg) {
    logNoteError(requestID, "WARNING", msg);
}

void Logger::logError(const std::string &requestID, const std::string &msg) {
    logNoteError(requestID, "ERROR", msg);
}
