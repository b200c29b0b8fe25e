#ifndef EDGEERRORS_HPP
#define EDGEERRORS_HPP

#include "eventModel.hpp"
#include <stdexcept>
#include <string>

enum class ErrorCode{
    InvalidPattern,
    InvalidHandlerResult,
    HandlerExecutionError,
    NoOriginConfigured,
    OriginUnavailable,
    IncompleteLifecycle,
    NoMatchingBehavior
};

const char *errorCodeName(ErrorCode code);

// {"code": status, "message": message} as compact JSON.
std::string errorPayload(int status, const std::string &message);

// Base of every pipeline failure. what() carries the detail message only.
class EdgeError : public std::runtime_error{
public:
    EdgeError(ErrorCode code, int httpStatus, const std::string &message);

    ErrorCode code() const { return errorCode; }
    int httpStatus() const { return status; }

    // {"code": <status>, "message": "<code name>: <what()>"}
    std::string responsePayload() const;

private:
    ErrorCode errorCode;
    int status;
};

// Startup-time only: the registry is never published when this is thrown.
class InvalidPattern : public EdgeError{
public:
    InvalidPattern(const std::string &pattern, const std::string &reason);
    const std::string &pattern() const { return badPattern; }
private:
    std::string badPattern;
};

class InvalidHandlerResult : public EdgeError{
public:
    InvalidHandlerResult(Stage stage, const std::string &detail);
    Stage stage() const { return failedStage; }
private:
    Stage failedStage;
};

class HandlerExecutionError : public EdgeError{
public:
    HandlerExecutionError(Stage stage, const std::string &cause);
    Stage stage() const { return failedStage; }
    const std::string &cause() const { return causeMsg; }
private:
    Stage failedStage;
    std::string causeMsg;
};

class NoOriginConfigured : public EdgeError{
public:
    explicit NoOriginConfigured(const std::string &pattern);
};

class OriginUnavailable : public EdgeError{
public:
    explicit OriginUnavailable(const std::string &cause);
    const std::string &cause() const { return causeMsg; }
private:
    std::string causeMsg;
};

class IncompleteLifecycle : public EdgeError{
public:
    IncompleteLifecycle();
};

class NoMatchingBehavior : public EdgeError{
public:
    explicit NoMatchingBehavior(const std::string &path);
};

// Configuration, plugin and handler-reference failures.
class ConfigError : public std::runtime_error{
public:
    explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

#endif // EDGEERRORS_HPP
