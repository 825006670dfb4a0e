#pragma once

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

struct sqlite3;

namespace nv {

class EmbeddingFunction;
class VectorTable;

// StoreConnection -- move-only owner of the vector store database handle.
// Tables opened through it borrow the handle and must not outlive it.
class StoreConnection {
public:
    ~StoreConnection();

    StoreConnection(StoreConnection&& other) noexcept : m_db(other.m_db), m_path(other.m_path)
    {
        other.m_db = nullptr;
    }
    StoreConnection& operator=(StoreConnection&& other) noexcept;
    StoreConnection(const StoreConnection&) = delete;
    StoreConnection& operator=(const StoreConnection&) = delete;

    // Open or create the database file (":memory:" for a private in-memory store).
    static std::optional<StoreConnection> open(const QString& dbPath, QString* errorOut = nullptr);

    // One table per notes directory: "notes_" + 16 hex chars of the
    // SHA-256 of the cleaned absolute directory path.
    static QString tableNameForDirectory(const QString& directory);

    std::unique_ptr<VectorTable> openOrCreateTable(const QString& tableName,
                                                   EmbeddingFunction& embedder,
                                                   QString* errorOut = nullptr);

    QStringList tableNames() const;
    const QString& path() const { return m_path; }

private:
    StoreConnection() = default;
    bool init(const QString& dbPath, QString* errorOut);

    sqlite3* m_db = nullptr;
    QString m_path;
};

} // namespace nv
