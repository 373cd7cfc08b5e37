#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace focuslens {

// AnalyticsStore is the SQLite access layer. Every engine component owns one
// named snapshot document that it rewrites in full on each mutation; the meta
// table holds small scalar state. Methods throw PersistenceError on failure.
class AnalyticsStore {
public:
    // Opens (or creates) <dataDir>/focuslens.db.
    explicit AnalyticsStore(const std::string &dataDir);
    ~AnalyticsStore();

    AnalyticsStore(const AnalyticsStore &) = delete;
    AnalyticsStore &operator=(const AnalyticsStore &) = delete;

    void saveDocument(const std::string &name, const nlohmann::json &body);
    // Returns nullopt when the document does not exist or cannot be parsed.
    std::optional<nlohmann::json> loadDocument(const std::string &name) const;
    void deleteDocument(const std::string &name);
    std::vector<std::string> listDocuments() const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

    std::string databasePath() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

// Snapshot writes are best effort: failures are logged and swallowed. A null
// store means the caller runs without persistence.
bool saveDocumentBestEffort(AnalyticsStore *store, const std::string &name,
                            const nlohmann::json &body);

} // namespace focuslens
