#pragma once

#include "stt/backend.hpp"

#include <string>

// Uploads a finished recording to the Mistral (Voxtral) transcription API.
// One attempt per call; nothing is retried.
class MistralBackend : public TranscriptionBackend {
public:
    MistralBackend(std::string endpoint, std::string model,
                   long timeout_s = 120, long connect_timeout_s = 10);
    ~MistralBackend() override;

    MistralBackend(const MistralBackend&) = delete;
    MistralBackend& operator=(const MistralBackend&) = delete;

    std::expected<TranscriptResult, Error>
        transcribe(const std::filesystem::path& audio_path, const std::string& api_key,
                   const std::optional<std::string>& language) override;

private:
    std::string endpoint_;
    std::string model_;
    long timeout_s_;
    long connect_timeout_s_;
};
