#pragma once

#include <string>
#include <string_view>

enum class ErrorCode {
    ProcessSpawn,
    SessionAlreadyActive,
    NoActiveSession,
    EmptyRecording,
    FileNotCreated,
    FileNotFound,
    FileRead,
    Base64Decode,
    FileWrite,
    MissingApiKey,
    HttpRequest,
    HttpStatus,
    JsonParse,
    Storage,
};

// Failure value carried by std::expected across the pipeline.
// http_status and body are only set for HttpStatus and JsonParse.
struct Error {
    ErrorCode code;
    std::string message;
    long http_status = 0;
    std::string body;
};

// snake_case name used in IPC replies, e.g. "no_active_session".
std::string_view error_code_name(ErrorCode code);

inline Error make_error(ErrorCode code, std::string message) {
    return Error{.code = code, .message = std::move(message)};
}
