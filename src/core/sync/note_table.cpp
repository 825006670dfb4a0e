#include "core/sync/note_table.h"
#include "core/embedding/embedding_function.h"
#include "core/shared/logging.h"
#include "core/vector/store_connection.h"
#include "core/vector/vector_table.h"

#include <QDir>

namespace nv {

QString noteTableErrorName(NoteTable::Error error)
{
    switch (error) {
    case NoteTable::Error::None:                 return QStringLiteral("none");
    case NoteTable::Error::NotInitialized:       return QStringLiteral("not_initialized");
    case NoteTable::Error::AlreadyInitialized:   return QStringLiteral("already_initialized");
    case NoteTable::Error::EmbeddingUnavailable: return QStringLiteral("embedding_unavailable");
    case NoteTable::Error::StoreFailure:         return QStringLiteral("store_failure");
    }
    return QStringLiteral("unknown");
}

NoteTable::NoteTable() = default;

NoteTable::~NoteTable() = default;

void NoteTable::setError(Error error, const QString& message)
{
    m_lastError = error;
    m_lastErrorMessage = message;
}

void NoteTable::clearError()
{
    m_lastError = Error::None;
    m_lastErrorMessage.clear();
}

bool NoteTable::requireInitialized(const char* operation)
{
    if (m_table) {
        clearError();
        return true;
    }
    setError(Error::NotInitialized,
             QStringLiteral("%1 called before initialize()").arg(QLatin1String(operation)));
    LOG_WARN(nvSync, "NoteTable::%s: table not initialized", operation);
    return false;
}

bool NoteTable::beginInitialize(const QString& rootDirectory)
{
    if (m_table) {
        setError(Error::AlreadyInitialized,
                 QStringLiteral("table already initialized for %1").arg(m_rootDirectory));
        LOG_WARN(nvSync, "NoteTable already initialized for %s", qUtf8Printable(m_rootDirectory));
        return false;
    }
    clearError();
    m_rootDirectory = QDir::cleanPath(rootDirectory);
    return true;
}

bool NoteTable::initialize(StoreConnection& connection, const QString& rootDirectory,
                           const QString& modelsDir)
{
    if (m_table) {
        return beginInitialize(rootDirectory);
    }
    std::unique_ptr<EmbeddingFunction> embedder = createEmbeddingFunction(
        QString::fromLatin1(kDefaultModelId), QString::fromLatin1(kEmbeddedField), modelsDir);
    if (!embedder) {
        setError(Error::EmbeddingUnavailable,
                 QStringLiteral("embedding model %1 not available under %2")
                     .arg(QString::fromLatin1(kDefaultModelId), modelsDir));
        LOG_ERROR(nvSync, "%s", qUtf8Printable(m_lastErrorMessage));
        return false;
    }
    return initialize(connection, rootDirectory, std::move(embedder));
}

bool NoteTable::initialize(StoreConnection& connection, const QString& rootDirectory,
                           std::unique_ptr<EmbeddingFunction> embedder)
{
    if (!beginInitialize(rootDirectory)) {
        return false;
    }
    if (!embedder) {
        setError(Error::EmbeddingUnavailable, QStringLiteral("no embedding function"));
        return false;
    }

    const QString tableName = StoreConnection::tableNameForDirectory(m_rootDirectory);
    QString error;
    std::unique_ptr<VectorTable> table = connection.openOrCreateTable(tableName, *embedder, &error);
    if (!table) {
        setError(Error::StoreFailure, error);
        LOG_ERROR(nvSync, "Failed to open table %s for %s: %s",
                  qUtf8Printable(tableName), qUtf8Printable(m_rootDirectory),
                  qUtf8Printable(error));
        return false;
    }

    m_embedder = std::move(embedder);
    m_table = std::move(table);
    LOG_INFO(nvSync, "Note table %s bound to %s (model %s)",
             qUtf8Printable(tableName), qUtf8Printable(m_rootDirectory),
             qUtf8Printable(m_embedder->modelId()));
    return true;
}

bool NoteTable::initialize(std::unique_ptr<VectorTable> table, const QString& rootDirectory,
                           std::unique_ptr<EmbeddingFunction> embedder)
{
    if (!beginInitialize(rootDirectory)) {
        return false;
    }
    if (!table) {
        setError(Error::StoreFailure, QStringLiteral("no table"));
        return false;
    }
    m_embedder = std::move(embedder);
    m_table = std::move(table);
    return true;
}

std::optional<BatchWriteReport> NoteTable::add(const std::vector<NoteRecord>& records,
                                               const ProgressCallback& onProgress)
{
    if (!requireInitialized("add")) {
        return std::nullopt;
    }
    BatchWriter writer(*m_table);
    BatchWriteReport report = writer.write(records, onProgress);
    if (!report.allSucceeded()) {
        setError(Error::StoreFailure,
                 QStringLiteral("%1 of %2 chunk(s) failed")
                     .arg(report.failedChunks()).arg(report.totalChunks));
    }
    return report;
}

bool NoteTable::remove(const FilterExpression& filter)
{
    if (!requireInitialized("remove")) {
        return false;
    }
    QString error;
    if (!m_table->remove(filter, &error)) {
        setError(Error::StoreFailure, error);
        LOG_ERROR(nvSync, "Delete where %s failed: %s",
                  qUtf8Printable(filter.toString()), qUtf8Printable(error));
        return false;
    }
    return true;
}

std::optional<std::vector<NoteRecord>> NoteTable::search(const QString& queryText, int limit,
                                                         const std::optional<FilterExpression>& filter)
{
    if (!requireInitialized("search")) {
        return std::nullopt;
    }
    QueryRequest request;
    request.queryText = queryText;
    request.limit = limit;
    request.filter = filter;

    QString error;
    std::optional<std::vector<RawRow>> rows = m_table->query(request, &error);
    if (!rows) {
        setError(Error::StoreFailure, error);
        LOG_ERROR(nvSync, "Search failed: %s", qUtf8Printable(error));
        return std::nullopt;
    }
    return parseRows(*rows, "search");
}

std::optional<std::vector<NoteRecord>> NoteTable::filter(const FilterExpression& filter, int limit)
{
    if (!requireInitialized("filter")) {
        return std::nullopt;
    }
    QueryRequest request;
    request.limit = limit;
    request.filter = filter;

    QString error;
    std::optional<std::vector<RawRow>> rows = m_table->query(request, &error);
    if (!rows) {
        setError(Error::StoreFailure, error);
        LOG_ERROR(nvSync, "Filter %s failed: %s",
                  qUtf8Printable(filter.toString()), qUtf8Printable(error));
        return std::nullopt;
    }
    LOG_DEBUG(nvSync, "Filter %s matched %d row(s)",
              qUtf8Printable(filter.toString()), static_cast<int>(rows->size()));
    return parseRows(*rows, "filter");
}

std::optional<int> NoteTable::countRows()
{
    if (!requireInitialized("countRows")) {
        return std::nullopt;
    }
    QString error;
    std::optional<int> count = m_table->countRows(&error);
    if (!count) {
        setError(Error::StoreFailure, error);
        LOG_ERROR(nvSync, "Row count failed: %s", qUtf8Printable(error));
    }
    return count;
}

std::vector<NoteRecord> NoteTable::parseRows(const std::vector<RawRow>& rows, const char* operation)
{
    std::vector<NoteRecord> records;
    records.reserve(rows.size());
    m_lastDroppedRows = 0;
    for (const RawRow& row : rows) {
        RowParseResult parsed = parseNoteRow(row);
        if (!parsed.ok()) {
            ++m_lastDroppedRows;
            LOG_DEBUG(nvSync, "%s: dropping malformed row (%s: %s)", operation,
                      qUtf8Printable(noteFieldName(parsed.error->field)),
                      qUtf8Printable(parsed.error->reason));
            continue;
        }
        records.push_back(std::move(*parsed.record));
    }
    return records;
}

} // namespace nv
