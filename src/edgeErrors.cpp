#include "edgeErrors.hpp"
#include <nlohmann/json.hpp>

const char *errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidPattern:        return "InvalidPattern";
        case ErrorCode::InvalidHandlerResult:  return "InvalidHandlerResult";
        case ErrorCode::HandlerExecutionError: return "HandlerExecutionError";
        case ErrorCode::NoOriginConfigured:    return "NoOriginConfigured";
        case ErrorCode::OriginUnavailable:     return "OriginUnavailable";
        case ErrorCode::IncompleteLifecycle:   return "IncompleteLifecycle";
        case ErrorCode::NoMatchingBehavior:    return "NoMatchingBehavior";
    }
    return "Unknown";
}

EdgeError::EdgeError(ErrorCode code, int httpStatus, const std::string &message)
    : std::runtime_error(message), errorCode(code), status(httpStatus) {}

std::string errorPayload(int status, const std::string &message) {
    nlohmann::json payload = {
        {"code", status},
        {"message", message}
    };
    // Handler messages are arbitrary bytes; never let bad UTF-8 throw here.
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string EdgeError::responsePayload() const {
    return errorPayload(status, std::string(errorCodeName(errorCode)) + ": " + what());
}

InvalidPattern::InvalidPattern(const std::string &pattern, const std::string &reason)
    : EdgeError(ErrorCode::InvalidPattern, 500, "Invalid path pattern '" + pattern + "': " + reason),
      badPattern(pattern) {}

InvalidHandlerResult::InvalidHandlerResult(Stage stage, const std::string &detail)
    : EdgeError(ErrorCode::InvalidHandlerResult, 500,
                std::string(stageName(stage)) + " handler " + detail),
      failedStage(stage) {}

HandlerExecutionError::HandlerExecutionError(Stage stage, const std::string &cause)
    : EdgeError(ErrorCode::HandlerExecutionError, 500,
                std::string(stageName(stage)) + " handler failed: " + cause),
      failedStage(stage), causeMsg(cause) {}

NoOriginConfigured::NoOriginConfigured(const std::string &pattern)
    : EdgeError(ErrorCode::NoOriginConfigured, 502,
                "No origin configured for path pattern '" + pattern + "'") {}

OriginUnavailable::OriginUnavailable(const std::string &cause)
    : EdgeError(ErrorCode::OriginUnavailable, 502, "Origin unavailable: " + cause),
      causeMsg(cause) {}

IncompleteLifecycle::IncompleteLifecycle()
    : EdgeError(ErrorCode::IncompleteLifecycle, 500,
                "No response set after full request lifecycle") {}

NoMatchingBehavior::NoMatchingBehavior(const std::string &path)
    : EdgeError(ErrorCode::NoMatchingBehavior, 404, "No behavior matches " + path) {}
