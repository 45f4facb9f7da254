#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct TranscriptionUsage {
    double prompt_audio_seconds = 0.0;
    uint64_t prompt_tokens = 0;
    uint64_t total_tokens = 0;
    uint64_t completion_tokens = 0;
};

// Body of a successful /v1/audio/transcriptions reply.
struct TranscriptionResponse {
    std::string model;
    std::string text;
    std::optional<std::string> language;
    std::optional<TranscriptionUsage> usage;
    std::vector<nlohmann::json> segments;
    std::optional<std::string> finish_reason;
};

// Fails with ErrorCode::JsonParse carrying the raw body when `raw` does not
// match the schema.
std::expected<TranscriptionResponse, Error> parse_transcription_response(const std::string& raw);
