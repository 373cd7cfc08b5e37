#include "engine/analytics_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace focuslens {

namespace {

constexpr const char *kCreateDocumentsTable =
    "CREATE TABLE IF NOT EXISTS documents ("
    "    name TEXT PRIMARY KEY,"
    "    body TEXT NOT NULL,"
    "    updated_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("sqlite prepare failed: ")
                                   + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw PersistenceError(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

int64_t nowEpochSeconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

struct AnalyticsStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
    // The connection is opened FULLMUTEX; this additionally keeps
    // prepare/step/finalize sequences of one call together.
    mutable std::mutex mutex;
};

AnalyticsStore::AnalyticsStore(const std::string &dataDir)
    : impl(std::make_unique<Impl>())
{
    std::filesystem::path basePath = dataDir.empty() ? std::filesystem::path(".")
                                                     : std::filesystem::path(dataDir);
    std::error_code error;
    std::filesystem::create_directories(basePath, error);
    if (error) {
        throw PersistenceError("failed to create data directory " + basePath.string()
                               + ": " + error.message());
    }

    impl->path = (basePath / "focuslens.db").string();
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(impl->path.c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        if (impl->db) {
            sqlite3_close(impl->db);
            impl->db = nullptr;
        }
        throw PersistenceError("failed to open focuslens database: " + message);
    }

    execOrThrow(impl->db, kCreateDocumentsTable);
    execOrThrow(impl->db, kCreateMetaTable);
}

AnalyticsStore::~AnalyticsStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

void AnalyticsStore::saveDocument(const std::string &name, const nlohmann::json &body)
{
    const std::string text = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO documents (name, body, updated_at) "
                   "VALUES (?, ?, ?);");
    bindText(stmt.get(), 1, name);
    bindText(stmt.get(), 2, text);
    sqlite3_bind_int64(stmt.get(), 3, nowEpochSeconds());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw PersistenceError("failed to write document " + name + ": "
                               + sqlite3_errmsg(impl->db));
    }
}

std::optional<nlohmann::json> AnalyticsStore::loadDocument(const std::string &name) const
{
    std::string text;
    {
        std::lock_guard<std::mutex> lock(impl->mutex);
        Statement stmt(impl->db, "SELECT body FROM documents WHERE name = ?;");
        bindText(stmt.get(), 1, name);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return std::nullopt;
        }
        text = columnText(stmt.get(), 0);
    }

    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &ex) {
        FLOG_WARN("AnalyticsStore", "loadDocument", "document_corrupt",
                  (nlohmann::json{{"name", name}, {"error", ex.what()}}));
        return std::nullopt;
    }
}

void AnalyticsStore::deleteDocument(const std::string &name)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "DELETE FROM documents WHERE name = ?;");
    bindText(stmt.get(), 1, name);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw PersistenceError("failed to delete document " + name);
    }
}

std::vector<std::string> AnalyticsStore::listDocuments() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT name FROM documents ORDER BY name ASC;");
    std::vector<std::string> names;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        names.push_back(columnText(stmt.get(), 0));
    }
    return names;
}

std::optional<std::string> AnalyticsStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ?;");
    bindText(stmt.get(), 1, key);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return columnText(stmt.get(), 0);
    }
    return std::nullopt;
}

void AnalyticsStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw PersistenceError("failed to write meta " + key);
    }
}

bool AnalyticsStore::integrityCheck(std::string *message) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }
    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

std::string AnalyticsStore::databasePath() const
{
    return impl->path;
}

bool saveDocumentBestEffort(AnalyticsStore *store, const std::string &name,
                            const nlohmann::json &body)
{
    if (!store) {
        return false;
    }
    try {
        store->saveDocument(name, body);
        return true;
    } catch (const std::exception &ex) {
        FLOG_WARN("AnalyticsStore", "saveDocumentBestEffort", "snapshot_write_failed",
                  (nlohmann::json{{"document", name}, {"error", ex.what()}}));
    }
    return false;
}

} // namespace focuslens
