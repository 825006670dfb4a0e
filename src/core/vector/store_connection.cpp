#include "core/vector/store_connection.h"
#include "core/shared/logging.h"
#include "core/vector/sqlite_vector_table.h"

#include <sqlite3.h>

#include <QCryptographicHash>
#include <QDir>
#include <QFileInfo>

namespace nv {

namespace {

constexpr const char* kConnectionPragmas = R"(
    PRAGMA synchronous = NORMAL;
    PRAGMA temp_store = MEMORY;
)";

} // namespace

StoreConnection::~StoreConnection()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

StoreConnection& StoreConnection::operator=(StoreConnection&& other) noexcept
{
    if (this != &other) {
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = other.m_db;
        m_path = other.m_path;
        other.m_db = nullptr;
    }
    return *this;
}

std::optional<StoreConnection> StoreConnection::open(const QString& dbPath, QString* errorOut)
{
    StoreConnection connection;
    if (!connection.init(dbPath, errorOut)) {
        return std::nullopt;
    }
    return connection;
}

bool StoreConnection::init(const QString& dbPath, QString* errorOut)
{
    const auto fail = [errorOut](const QString& message) {
        LOG_ERROR(nvStore, "%s", qUtf8Printable(message));
        if (errorOut) {
            *errorOut = message;
        }
        return false;
    };

    if (dbPath.isEmpty()) {
        return fail(QStringLiteral("Vector store path is empty"));
    }

    const bool inMemory = dbPath == QLatin1String(":memory:");
    if (!inMemory) {
        const QString parentDir = QFileInfo(dbPath).absolutePath();
        if (!QDir().mkpath(parentDir)) {
            return fail(QStringLiteral("Failed to create store directory: %1").arg(parentDir));
        }
    }

    m_path = dbPath;
    if (sqlite3_open(dbPath.toUtf8().constData(), &m_db) != SQLITE_OK) {
        return fail(QStringLiteral("Failed to open vector store %1: %2")
                        .arg(dbPath, QString::fromUtf8(sqlite3_errmsg(m_db))));
    }

    sqlite3_busy_timeout(m_db, 30000);

    char* errMsg = nullptr;
    if (sqlite3_exec(m_db, kConnectionPragmas, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return fail(QStringLiteral("Failed to set connection pragmas: %1").arg(message));
    }

    if (!inMemory) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, "PRAGMA journal_mode = WAL", -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            const char* mode = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (mode && QString::fromUtf8(mode) != QLatin1String("wal")) {
                LOG_WARN(nvStore, "Expected WAL journal mode, got: %s", mode);
            }
        }
        sqlite3_finalize(stmt);
    }

    LOG_INFO(nvStore, "Vector store opened: %s", qUtf8Printable(dbPath));
    return true;
}

QString StoreConnection::tableNameForDirectory(const QString& directory)
{
    const QString cleaned = QDir::cleanPath(QFileInfo(directory).absoluteFilePath());
    const QByteArray digest = QCryptographicHash::hash(cleaned.toUtf8(), QCryptographicHash::Sha256);
    return QStringLiteral("notes_") + QString::fromLatin1(digest.toHex().left(16));
}

std::unique_ptr<VectorTable> StoreConnection::openOrCreateTable(const QString& tableName,
                                                                EmbeddingFunction& embedder,
                                                                QString* errorOut)
{
    return SqliteVectorTable::openOrCreate(m_db, tableName, embedder, errorOut);
}

QStringList StoreConnection::tableNames() const
{
    QStringList names;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT table_name FROM notevault_tables ORDER BY table_name",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        // No table has been created yet.
        sqlite3_finalize(stmt);
        return names;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (name) {
            names.append(QString::fromUtf8(name));
        }
    }
    sqlite3_finalize(stmt);
    return names;
}

} // namespace nv
