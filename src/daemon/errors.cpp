#include "errors.hpp"

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ProcessSpawn: return "process_spawn";
        case ErrorCode::SessionAlreadyActive: return "session_already_active";
        case ErrorCode::NoActiveSession: return "no_active_session";
        case ErrorCode::EmptyRecording: return "empty_recording";
        case ErrorCode::FileNotCreated: return "file_not_created";
        case ErrorCode::FileNotFound: return "file_not_found";
        case ErrorCode::FileRead: return "file_read";
        case ErrorCode::Base64Decode: return "base64_decode";
        case ErrorCode::FileWrite: return "file_write";
        case ErrorCode::MissingApiKey: return "missing_api_key";
        case ErrorCode::HttpRequest: return "http_request";
        case ErrorCode::HttpStatus: return "http_status";
        case ErrorCode::JsonParse: return "json_parse";
        case ErrorCode::Storage: return "storage";
    }
    return "unknown";
}
