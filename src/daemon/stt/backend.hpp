#pragma once

#include "errors.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

struct TranscriptResult {
    std::string text;
    std::string language;
    double duration_s = 0.0;    // billed audio seconds, 0 when not reported
    double processing_s = 0.0;
};

class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;
    virtual std::expected<TranscriptResult, Error>
        transcribe(const std::filesystem::path& audio_path, const std::string& api_key,
                   const std::optional<std::string>& language) = 0;
};
