#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Text printed for an error reply. A recording kept despite the error is
// named so the user can retry `transcribe` on it.
inline std::string error_text(const nlohmann::json& reply) {
    std::string text = "Error: " + reply.value("message", std::string("unknown error"));
    if (reply.contains("path") && reply["path"].is_string()) {
        text += "\nRecording kept at " + reply["path"].get<std::string>();
    }
    return text;
}
