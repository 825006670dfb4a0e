#include "core/vector/sqlite_vector_table.h"
#include "core/embedding/embedding_function.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"

#include <sqlite3.h>

#include <QDateTime>
#include <QMetaType>
#include <QRegularExpression>

#include <algorithm>
#include <cstring>
#include <unordered_set>

namespace nv {

namespace {

constexpr const char* kCreateBindingTableSql = R"(
    CREATE TABLE IF NOT EXISTS notevault_tables (
        table_name TEXT PRIMARY KEY,
        model_id TEXT NOT NULL,
        source_field TEXT NOT NULL,
        dimensions INTEGER NOT NULL,
        created_at REAL NOT NULL
    )
)";

constexpr const char* kSelectBindingSql =
    "SELECT model_id, source_field, dimensions FROM notevault_tables WHERE table_name = ?1";

constexpr const char* kInsertBindingSql = R"(
    INSERT INTO notevault_tables (table_name, model_id, source_field, dimensions, created_at)
    VALUES (?1, ?2, ?3, ?4, ?5)
)";

constexpr const char* kRowColumns = "id, notepath, vector, content, subnoteindex, timeadded";

bool fail(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

void bindVariant(sqlite3_stmt* stmt, int index, const QVariant& value)
{
    if (value.metaType().id() == QMetaType::QString) {
        const QByteArray utf8 = value.toString().toUtf8();
        sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
        return;
    }
    sqlite3_bind_int64(stmt, index, value.toLongLong());
}

void bindFragment(sqlite3_stmt* stmt, const FilterExpression::SqlFragment& fragment, int firstIndex)
{
    for (int i = 0; i < static_cast<int>(fragment.bindings.size()); ++i) {
        bindVariant(stmt, firstIndex + i, fragment.bindings.at(i));
    }
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    const int bytes = sqlite3_column_bytes(stmt, column);
    return text ? QString::fromUtf8(text, bytes) : QString();
}

// Columns follow kRowColumns. A vector blob of the wrong size is left out
// of the row so that shape validation rejects it.
RawRow readRow(sqlite3_stmt* stmt, int dimensions)
{
    RawRow row;
    row.insert(noteFieldName(NoteField::NotePath), columnText(stmt, 1));

    const int bytes = sqlite3_column_bytes(stmt, 2);
    const void* blob = sqlite3_column_blob(stmt, 2);
    if (blob && bytes == dimensions * static_cast<int>(sizeof(float))) {
        QList<float> vector(dimensions);
        std::memcpy(vector.data(), blob, static_cast<size_t>(bytes));
        row.insert(noteFieldName(NoteField::Vector), QVariant::fromValue(vector));
    }

    row.insert(noteFieldName(NoteField::Content), columnText(stmt, 3));
    row.insert(noteFieldName(NoteField::SubNoteIndex), sqlite3_column_int(stmt, 4));
    row.insert(noteFieldName(NoteField::TimeAdded),
               QDateTime::fromMSecsSinceEpoch(sqlite3_column_int64(stmt, 5), Qt::UTC));
    return row;
}

} // namespace

std::unique_ptr<SqliteVectorTable> SqliteVectorTable::openOrCreate(sqlite3* db,
                                                                   const QString& tableName,
                                                                   EmbeddingFunction& embedder,
                                                                   QString* errorOut)
{
    if (!db) {
        fail(errorOut, QStringLiteral("no database connection"));
        return nullptr;
    }
    if (!isValidTableName(tableName)) {
        fail(errorOut, QStringLiteral("invalid table name: %1").arg(tableName));
        return nullptr;
    }
    if (embedder.dimensions() <= 0) {
        fail(errorOut, QStringLiteral("embedding function reports no dimensions"));
        return nullptr;
    }

    std::unique_ptr<SqliteVectorTable> table(new SqliteVectorTable(db, tableName, embedder));
    if (!table->ensureSchema(errorOut) || !table->checkBinding(errorOut)
        || !table->prepareStatements(errorOut) || !table->rebuildIndex(errorOut)) {
        return nullptr;
    }

    LOG_INFO(nvStore, "Opened table %s (%d dims, %d vectors indexed)",
             qUtf8Printable(tableName), table->m_dimensions, table->m_index->totalElements());
    return table;
}

SqliteVectorTable::SqliteVectorTable(sqlite3* db, const QString& tableName,
                                     EmbeddingFunction& embedder)
    : m_db(db)
    , m_tableName(tableName)
    , m_embedder(embedder)
    , m_dimensions(embedder.dimensions())
{
}

SqliteVectorTable::~SqliteVectorTable()
{
    sqlite3_finalize(m_insertStmt);
    sqlite3_finalize(m_rowByIdStmt);
    sqlite3_finalize(m_countStmt);
}

QString SqliteVectorTable::name() const
{
    return m_tableName;
}

int SqliteVectorTable::dimensions() const
{
    return m_dimensions;
}

bool SqliteVectorTable::isValidTableName(const QString& tableName)
{
    static const QRegularExpression identifier(QStringLiteral("^[A-Za-z_][A-Za-z0-9_]{0,127}$"));
    return identifier.match(tableName).hasMatch()
        && !tableName.startsWith(QStringLiteral("sqlite_"), Qt::CaseInsensitive)
        && tableName.compare(QStringLiteral("notevault_tables"), Qt::CaseInsensitive) != 0;
}

bool SqliteVectorTable::add(const std::vector<NoteRecord>& records, QString* errorOut)
{
    if (records.empty()) {
        return true;
    }

    std::vector<QString> texts;
    texts.reserve(records.size());
    for (const NoteRecord& record : records) {
        if (record.notePath.isEmpty() || record.subNoteIndex < 0) {
            return fail(errorOut, QStringLiteral("record with empty path or negative sub-note index"));
        }
        texts.push_back(record.content);
    }

    // Embed everything first so that no row is ever written without a vector.
    const std::vector<std::vector<float>> vectors = m_embedder.embedBatch(texts);
    if (vectors.size() != records.size()) {
        return fail(errorOut, QStringLiteral("embedding failed for %1 record(s)").arg(records.size()));
    }
    for (const std::vector<float>& vector : vectors) {
        if (static_cast<int>(vector.size()) != m_dimensions) {
            return fail(errorOut, QStringLiteral("embedding returned %1 dims, table expects %2")
                                      .arg(vector.size())
                                      .arg(m_dimensions));
        }
    }

    if (!execSql(QStringLiteral("BEGIN IMMEDIATE TRANSACTION;"), errorOut)) {
        return false;
    }

    std::vector<uint64_t> indexedLabels;
    indexedLabels.reserve(records.size());
    const auto abort = [&](const QString& message) {
        rollback();
        for (const uint64_t label : indexedLabels) {
            m_index->deleteVector(label);
        }
        return fail(errorOut, message);
    };

    for (size_t i = 0; i < records.size(); ++i) {
        const NoteRecord& record = records[i];
        const QDateTime timeAdded = record.timeAdded.isValid() ? record.timeAdded : stampTimeAdded();
        const QByteArray pathUtf8 = record.notePath.toUtf8();
        const QByteArray contentUtf8 = record.content.toUtf8();

        sqlite3_bind_text(m_insertStmt, 1, pathUtf8.constData(), pathUtf8.size(), SQLITE_TRANSIENT);
        sqlite3_bind_blob(m_insertStmt, 2, vectors[i].data(),
                          static_cast<int>(vectors[i].size() * sizeof(float)), SQLITE_TRANSIENT);
        sqlite3_bind_text(m_insertStmt, 3, contentUtf8.constData(), contentUtf8.size(),
                          SQLITE_TRANSIENT);
        sqlite3_bind_int(m_insertStmt, 4, record.subNoteIndex);
        sqlite3_bind_int64(m_insertStmt, 5, timeAdded.toMSecsSinceEpoch());

        const int rc = sqlite3_step(m_insertStmt);
        sqlite3_reset(m_insertStmt);
        sqlite3_clear_bindings(m_insertStmt);
        if (rc != SQLITE_DONE) {
            return abort(QStringLiteral("insert of %1 failed: %2")
                             .arg(record.notePath, lastSqliteError()));
        }

        const uint64_t label = static_cast<uint64_t>(sqlite3_last_insert_rowid(m_db));
        if (!m_index->addVector(label, vectors[i].data())) {
            return abort(QStringLiteral("vector index rejected %1").arg(record.notePath));
        }
        indexedLabels.push_back(label);
    }

    QString commitError;
    if (!execSql(QStringLiteral("COMMIT;"), &commitError)) {
        return abort(QStringLiteral("commit failed: %1").arg(commitError));
    }
    return true;
}

bool SqliteVectorTable::remove(const FilterExpression& filter, QString* errorOut)
{
    if (!filter.isValid()) {
        return fail(errorOut, QStringLiteral("invalid delete filter: %1").arg(filter.toString()));
    }

    if (!execSql(QStringLiteral("BEGIN IMMEDIATE TRANSACTION;"), errorOut)) {
        return false;
    }

    const std::optional<std::vector<int64_t>> ids = matchingIds(filter, errorOut);
    if (!ids) {
        rollback();
        return false;
    }

    const FilterExpression::SqlFragment fragment = filter.toSql();
    const QByteArray sql = QStringLiteral("DELETE FROM %1 WHERE %2")
                               .arg(m_tableName, fragment.sql)
                               .toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        const QString message = lastSqliteError();
        rollback();
        return fail(errorOut, QStringLiteral("delete prepare failed: %1").arg(message));
    }
    bindFragment(stmt, fragment, 1);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        const QString message = lastSqliteError();
        rollback();
        return fail(errorOut, QStringLiteral("delete failed: %1").arg(message));
    }

    if (!execSql(QStringLiteral("COMMIT;"), errorOut)) {
        rollback();
        return false;
    }

    for (const int64_t id : *ids) {
        m_index->deleteVector(static_cast<uint64_t>(id));
    }
    LOG_DEBUG(nvStore, "Deleted %d row(s) from %s where %s",
              static_cast<int>(ids->size()), qUtf8Printable(m_tableName),
              qUtf8Printable(filter.toString()));
    return true;
}

std::optional<std::vector<RawRow>> SqliteVectorTable::query(const QueryRequest& request,
                                                            QString* errorOut)
{
    if (request.limit <= 0) {
        return std::vector<RawRow>{};
    }
    if (request.filter && !request.filter->isValid()) {
        fail(errorOut, QStringLiteral("invalid query filter: %1").arg(request.filter->toString()));
        return std::nullopt;
    }
    if (request.queryText || request.queryVector) {
        return nearest(request, errorOut);
    }
    return scan(request, errorOut);
}

std::optional<int> SqliteVectorTable::countRows(QString* errorOut)
{
    const int rc = sqlite3_step(m_countStmt);
    if (rc != SQLITE_ROW) {
        const QString message = lastSqliteError();
        sqlite3_reset(m_countStmt);
        fail(errorOut, QStringLiteral("count failed: %1").arg(message));
        return std::nullopt;
    }
    const int count = sqlite3_column_int(m_countStmt, 0);
    sqlite3_reset(m_countStmt);
    return count;
}

std::optional<std::vector<RawRow>> SqliteVectorTable::scan(const QueryRequest& request,
                                                           QString* errorOut)
{
    FilterExpression::SqlFragment fragment;
    QString sql = QStringLiteral("SELECT %1 FROM %2").arg(QLatin1String(kRowColumns), m_tableName);
    if (request.filter) {
        fragment = request.filter->toSql();
        sql += QStringLiteral(" WHERE ") + fragment.sql;
    }
    sql += QStringLiteral(" ORDER BY id LIMIT ?");

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.toUtf8().constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, QStringLiteral("scan prepare failed: %1").arg(lastSqliteError()));
        return std::nullopt;
    }
    bindFragment(stmt, fragment, 1);
    sqlite3_bind_int(stmt, static_cast<int>(fragment.bindings.size()) + 1, request.limit);

    std::vector<RawRow> rows;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(readRow(stmt, m_dimensions));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail(errorOut, QStringLiteral("scan failed: %1").arg(lastSqliteError()));
        return std::nullopt;
    }
    return rows;
}

std::optional<std::vector<RawRow>> SqliteVectorTable::nearest(const QueryRequest& request,
                                                              QString* errorOut)
{
    std::vector<float> queryVector = request.queryVector
        ? *request.queryVector
        : m_embedder.embed(*request.queryText);
    if (static_cast<int>(queryVector.size()) != m_dimensions) {
        fail(errorOut, QStringLiteral("query vector has %1 dims, table expects %2")
                           .arg(queryVector.size())
                           .arg(m_dimensions));
        return std::nullopt;
    }

    std::unordered_set<uint64_t> allowed;
    if (request.filter) {
        const std::optional<std::vector<int64_t>> ids = matchingIds(*request.filter, errorOut);
        if (!ids) {
            return std::nullopt;
        }
        for (const int64_t id : *ids) {
            allowed.insert(static_cast<uint64_t>(id));
        }
    }

    const std::vector<VectorIndex::KnnResult> hits =
        m_index->search(queryVector.data(), request.limit, request.filter ? &allowed : nullptr);

    std::vector<RawRow> rows;
    rows.reserve(hits.size());
    for (const VectorIndex::KnnResult& hit : hits) {
        sqlite3_bind_int64(m_rowByIdStmt, 1, static_cast<sqlite3_int64>(hit.label));
        if (sqlite3_step(m_rowByIdStmt) == SQLITE_ROW) {
            RawRow row = readRow(m_rowByIdStmt, m_dimensions);
            row.insert(QStringLiteral("_distance"), static_cast<double>(hit.distance));
            rows.push_back(std::move(row));
        }
        sqlite3_reset(m_rowByIdStmt);
        sqlite3_clear_bindings(m_rowByIdStmt);
    }
    return rows;
}

std::optional<std::vector<int64_t>> SqliteVectorTable::matchingIds(const FilterExpression& filter,
                                                                   QString* errorOut)
{
    const FilterExpression::SqlFragment fragment = filter.toSql();
    const QByteArray sql = QStringLiteral("SELECT id FROM %1 WHERE %2")
                               .arg(m_tableName, fragment.sql)
                               .toUtf8();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, QStringLiteral("filter prepare failed: %1").arg(lastSqliteError()));
        return std::nullopt;
    }
    bindFragment(stmt, fragment, 1);

    std::vector<int64_t> ids;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail(errorOut, QStringLiteral("filter failed: %1").arg(lastSqliteError()));
        return std::nullopt;
    }
    return ids;
}

bool SqliteVectorTable::ensureSchema(QString* errorOut)
{
    if (!execSql(QString::fromLatin1(kCreateBindingTableSql), errorOut)) {
        return false;
    }

    const QString createTable = QStringLiteral(R"(
        CREATE TABLE IF NOT EXISTS %1 (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            notepath TEXT NOT NULL,
            vector BLOB NOT NULL,
            content TEXT NOT NULL,
            subnoteindex INTEGER NOT NULL DEFAULT 0,
            timeadded INTEGER NOT NULL,
            UNIQUE (notepath, subnoteindex)
        )
    )").arg(m_tableName);
    return execSql(createTable, errorOut);
}

bool SqliteVectorTable::checkBinding(QString* errorOut)
{
    const QByteArray nameUtf8 = m_tableName.toUtf8();
    const QByteArray modelUtf8 = m_embedder.modelId().toUtf8();
    const QByteArray fieldUtf8 = m_embedder.sourceField().toUtf8();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSelectBindingSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(errorOut, QStringLiteral("binding lookup failed: %1").arg(lastSqliteError()));
    }
    sqlite3_bind_text(stmt, 1, nameUtf8.constData(), nameUtf8.size(), SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const QString modelId = columnText(stmt, 0);
        const QString sourceField = columnText(stmt, 1);
        const int dimensions = sqlite3_column_int(stmt, 2);
        sqlite3_finalize(stmt);

        if (dimensions != m_dimensions || sourceField != m_embedder.sourceField()) {
            return fail(errorOut,
                        QStringLiteral("table %1 is bound to %2 (%3 dims on '%4')")
                            .arg(m_tableName, modelId)
                            .arg(dimensions)
                            .arg(sourceField));
        }
        if (modelId != m_embedder.modelId()) {
            LOG_WARN(nvStore, "Table %s was built with %s, opening with %s",
                     qUtf8Printable(m_tableName), qUtf8Printable(modelId),
                     qUtf8Printable(m_embedder.modelId()));
        }
        return true;
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(errorOut, QStringLiteral("binding lookup failed: %1").arg(lastSqliteError()));
    }

    if (sqlite3_prepare_v2(m_db, kInsertBindingSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(errorOut, QStringLiteral("binding insert failed: %1").arg(lastSqliteError()));
    }
    sqlite3_bind_text(stmt, 1, nameUtf8.constData(), nameUtf8.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, modelUtf8.constData(), modelUtf8.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, fieldUtf8.constData(), fieldUtf8.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, m_dimensions);
    sqlite3_bind_double(stmt, 5, static_cast<double>(QDateTime::currentSecsSinceEpoch()));
    const int insertRc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (insertRc != SQLITE_DONE) {
        return fail(errorOut, QStringLiteral("binding insert failed: %1").arg(lastSqliteError()));
    }
    return true;
}

bool SqliteVectorTable::prepareStatements(QString* errorOut)
{
    const QByteArray insertSql = QStringLiteral(
        "INSERT INTO %1 (notepath, vector, content, subnoteindex, timeadded) "
        "VALUES (?1, ?2, ?3, ?4, ?5)").arg(m_tableName).toUtf8();
    const QByteArray rowByIdSql = QStringLiteral("SELECT %1 FROM %2 WHERE id = ?1")
                                      .arg(QLatin1String(kRowColumns), m_tableName)
                                      .toUtf8();
    const QByteArray countSql = QStringLiteral("SELECT COUNT(*) FROM %1").arg(m_tableName).toUtf8();

    if (sqlite3_prepare_v2(m_db, insertSql.constData(), -1, &m_insertStmt, nullptr) != SQLITE_OK
        || sqlite3_prepare_v2(m_db, rowByIdSql.constData(), -1, &m_rowByIdStmt, nullptr) != SQLITE_OK
        || sqlite3_prepare_v2(m_db, countSql.constData(), -1, &m_countStmt, nullptr) != SQLITE_OK) {
        return fail(errorOut, QStringLiteral("statement prepare failed: %1").arg(lastSqliteError()));
    }
    return true;
}

bool SqliteVectorTable::rebuildIndex(QString* errorOut)
{
    const std::optional<int> rowCount = countRows(errorOut);
    if (!rowCount) {
        return false;
    }

    m_index = std::make_unique<VectorIndex>(m_dimensions);
    if (!m_index->create(std::max(*rowCount * 2, VectorIndex::kInitialCapacity))) {
        return fail(errorOut, QStringLiteral("vector index creation failed"));
    }

    const QByteArray sql = QStringLiteral("SELECT id, vector FROM %1").arg(m_tableName).toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(errorOut, QStringLiteral("index rebuild failed: %1").arg(lastSqliteError()));
    }

    const int expectedBytes = m_dimensions * static_cast<int>(sizeof(float));
    std::vector<float> vector(static_cast<size_t>(m_dimensions));
    int skipped = 0;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const int64_t id = sqlite3_column_int64(stmt, 0);
        const void* blob = sqlite3_column_blob(stmt, 1);
        if (!blob || sqlite3_column_bytes(stmt, 1) != expectedBytes) {
            ++skipped;
            continue;
        }
        std::memcpy(vector.data(), blob, static_cast<size_t>(expectedBytes));
        if (!m_index->addVector(static_cast<uint64_t>(id), vector.data())) {
            sqlite3_finalize(stmt);
            return fail(errorOut, QStringLiteral("index rebuild failed at row %1").arg(id));
        }
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(errorOut, QStringLiteral("index rebuild failed: %1").arg(lastSqliteError()));
    }

    if (skipped > 0) {
        LOG_WARN(nvStore, "Skipped %d row(s) with malformed vectors in %s",
                 skipped, qUtf8Printable(m_tableName));
    }
    return true;
}

bool SqliteVectorTable::execSql(const QString& sql, QString* errorOut)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql.toUtf8().constData(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return fail(errorOut, message);
    }
    return true;
}

void SqliteVectorTable::rollback()
{
    QString error;
    if (!execSql(QStringLiteral("ROLLBACK;"), &error)) {
        LOG_ERROR(nvStore, "Rollback on %s failed: %s",
                  qUtf8Printable(m_tableName), qUtf8Printable(error));
    }
}

QString SqliteVectorTable::lastSqliteError() const
{
    return QString::fromUtf8(sqlite3_errmsg(m_db));
}

} // namespace nv
