#include "storage/settings_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* kProviderKey = "stt_provider";
constexpr const char* kApiKeyKey = "stt_api_key";
constexpr const char* kModelKey = "stt_model";
constexpr const char* kLanguageKey = "stt_language";

} // namespace

SettingsDb::SettingsDb() = default;

SettingsDb::~SettingsDb() {
    close();
}

bool SettingsDb::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* get_sql = "SELECT value FROM app_settings WHERE key = ?";
    const char* set_sql = "INSERT OR REPLACE INTO app_settings (key, value) VALUES (?, ?)";

    if (sqlite3_prepare_v2(db_, get_sql, -1, &get_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare get failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, set_sql, -1, &set_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare set failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void SettingsDb::close() {
    if (get_stmt_) { sqlite3_finalize(get_stmt_); get_stmt_ = nullptr; }
    if (set_stmt_) { sqlite3_finalize(set_stmt_); set_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

std::optional<std::string> SettingsDb::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    return get_locked(key);
}

bool SettingsDb::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    return set_locked(key, value);
}

SttSettings SettingsDb::load_stt_settings() {
    std::lock_guard lock(mutex_);

    SttSettings s;
    if (auto v = get_locked(kProviderKey)) s.provider = *v;
    s.api_key = get_locked(kApiKeyKey);
    if (auto v = get_locked(kModelKey)) s.model = *v;
    s.language = get_locked(kLanguageKey);
    return s;
}

std::expected<void, Error> SettingsDb::save_stt_settings(const SttSettings& settings) {
    std::lock_guard lock(mutex_);

    if (!set_stmt_) {
        return std::unexpected(make_error(ErrorCode::Storage, "settings database is not open"));
    }

    if (!exec("BEGIN")) {
        return std::unexpected(make_error(ErrorCode::Storage,
                                          std::string("begin failed: ") + sqlite3_errmsg(db_)));
    }

    bool ok = set_locked(kProviderKey, settings.provider);
    if (ok && settings.api_key) ok = set_locked(kApiKeyKey, *settings.api_key);
    ok = ok && set_locked(kModelKey, settings.model);
    if (ok && settings.language) ok = set_locked(kLanguageKey, *settings.language);

    if (!ok) {
        std::string msg = sqlite3_errmsg(db_);
        exec("ROLLBACK");
        return std::unexpected(make_error(ErrorCode::Storage, "failed to save settings: " + msg));
    }

    if (!exec("COMMIT")) {
        std::string msg = sqlite3_errmsg(db_);
        exec("ROLLBACK");
        return std::unexpected(make_error(ErrorCode::Storage, "commit failed: " + msg));
    }

    return {};
}

std::optional<std::string> SettingsDb::get_locked(const std::string& key) {
    if (!get_stmt_) return std::nullopt;

    sqlite3_reset(get_stmt_);
    sqlite3_bind_text(get_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> value;
    if (sqlite3_step(get_stmt_) == SQLITE_ROW) {
        auto* p = sqlite3_column_text(get_stmt_, 0);
        if (p) value = reinterpret_cast<const char*>(p);
    }
    sqlite3_reset(get_stmt_);
    return value;
}

bool SettingsDb::set_locked(const std::string& key, const std::string& value) {
    if (!set_stmt_) return false;

    sqlite3_reset(set_stmt_);
    sqlite3_bind_text(set_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(set_stmt_, 2, value.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(set_stmt_);
    sqlite3_reset(set_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: set {} failed: {}", key, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SettingsDb::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: {} failed: {}", sql, err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool SettingsDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS app_settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
