#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Transcription {
        std::string endpoint = "https://api.mistral.ai/v1/audio/transcriptions";
        std::string model = "voxtral-mini-latest";
        long timeout_s = 120;
        long connect_timeout_s = 10;
    } transcription;

    struct Recorder {
        std::string program = "arecord";
        std::vector<std::string> args = {"-f", "S16_LE", "-r", "16000", "-c", "1"};
        std::string output_dir;  // empty: OS temp directory
        uint32_t stop_grace_ms = 3000;
    } recorder;

    struct Storage {
        std::string settings_db;  // empty: <data dir>/settings.db

        std::string settings_db_path() const;
    } storage;

    static Config load(const std::string& path);
    static Config load_default();
};
