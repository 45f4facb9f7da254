#pragma once

#include "errors.hpp"

#include <expected>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>

struct SttSettings {
    std::string provider = "mistral";
    std::optional<std::string> api_key;
    std::string model = "voxtral-mini-latest";
    std::optional<std::string> language;
};

// Key-value rows in the app_settings table.
class SettingsDb {
public:
    SettingsDb();
    ~SettingsDb();

    SettingsDb(const SettingsDb&) = delete;
    SettingsDb& operator=(const SettingsDb&) = delete;

    bool open(const std::string& path);
    void close();

    std::optional<std::string> get(const std::string& key);
    bool set(const std::string& key, const std::string& value);

    // Missing provider/model fall back to the SttSettings defaults.
    SttSettings load_stt_settings();

    // Provider and model are always written. API key and language are only
    // written when present; otherwise the stored values are kept.
    std::expected<void, Error> save_stt_settings(const SttSettings& settings);

private:
    bool create_tables();
    std::optional<std::string> get_locked(const std::string& key);
    bool set_locked(const std::string& key, const std::string& value);
    bool exec(const char* sql);

    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* get_stmt_ = nullptr;
    sqlite3_stmt* set_stmt_ = nullptr;
};
