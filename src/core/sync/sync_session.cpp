#include "core/sync/sync_session.h"
#include "core/embedding/embedding_function.h"
#include "core/shared/logging.h"
#include "core/sync/reconciler.h"
#include "core/sync/table_sync.h"

namespace nv {

SyncSession::SyncSession(const Settings& settings, StoreConnection connection)
    : m_settings(settings)
    , m_connection(std::move(connection))
{
}

SyncSession::~SyncSession() = default;

std::unique_ptr<SyncSession> SyncSession::open(const Settings& settings, QString* errorOut)
{
    std::unique_ptr<EmbeddingFunction> embedder = createEmbeddingFunction(
        settings.embeddingModelId, QString::fromLatin1(NoteTable::kEmbeddedField),
        settings.modelsDir);
    if (!embedder) {
        const QString error = QStringLiteral("embedding model %1 not available under %2")
                                  .arg(settings.embeddingModelId, settings.modelsDir);
        LOG_ERROR(nvCore, "%s", qUtf8Printable(error));
        if (errorOut) {
            *errorOut = error;
        }
        return nullptr;
    }
    return open(settings, std::move(embedder), errorOut);
}

std::unique_ptr<SyncSession> SyncSession::open(const Settings& settings,
                                               std::unique_ptr<EmbeddingFunction> embedder,
                                               QString* errorOut)
{
    if (settings.notesDirectory.isEmpty()) {
        if (errorOut) {
            *errorOut = QStringLiteral("notesDirectory is not set");
        }
        return nullptr;
    }

    std::optional<StoreConnection> connection = StoreConnection::open(settings.dbPath, errorOut);
    if (!connection) {
        LOG_ERROR(nvCore, "Cannot open store %s", qUtf8Printable(settings.dbPath));
        return nullptr;
    }

    std::unique_ptr<SyncSession> session(new SyncSession(settings, std::move(*connection)));
    if (!session->m_table.initialize(session->m_connection, settings.notesDirectory,
                                     std::move(embedder))) {
        if (errorOut) {
            *errorOut = session->m_table.lastErrorMessage();
        }
        return nullptr;
    }

    LOG_INFO(nvCore, "Session open: %s -> %s", qUtf8Printable(settings.notesDirectory),
             qUtf8Printable(settings.dbPath));
    return session;
}

std::optional<BatchWriteReport> SyncSession::repopulate(const ProgressCallback& onProgress)
{
    return maybeRePopulateTable(m_table, m_settings.notesDirectory, m_settings.fileExtensions,
                                onProgress);
}

std::optional<int> SyncSession::pruneDeleted()
{
    return pruneDeletedNotes(m_table, m_settings.notesDirectory, m_settings.fileExtensions);
}

bool SyncSession::updateNote(const QString& filePath, const QString& content)
{
    return updateNoteInTable(m_table, filePath, content);
}

std::optional<std::vector<NoteRecord>> SyncSession::search(const QString& queryText)
{
    return m_table.search(queryText, m_settings.searchLimit);
}

bool SyncSession::contains(const QString& filePath)
{
    return isFileInDB(m_table, filePath);
}

} // namespace nv
