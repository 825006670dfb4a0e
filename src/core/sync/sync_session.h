#pragma once

#include "core/shared/settings.h"
#include "core/sync/batch_writer.h"
#include "core/sync/note_table.h"
#include "core/vector/store_connection.h"

#include <QString>

#include <memory>
#include <optional>
#include <vector>

namespace nv {

class EmbeddingFunction;

// SyncSession -- one notes directory bound to its table, built from Settings.
//
// Owns the store connection and the facade; the facade is destroyed first.
class SyncSession {
public:
    // Loads settings.embeddingModelId from settings.modelsDir.
    static std::unique_ptr<SyncSession> open(const Settings& settings, QString* errorOut = nullptr);
    static std::unique_ptr<SyncSession> open(const Settings& settings,
                                             std::unique_ptr<EmbeddingFunction> embedder,
                                             QString* errorOut = nullptr);

    ~SyncSession();

    const Settings& settings() const { return m_settings; }
    NoteTable& table() { return m_table; }

    std::optional<BatchWriteReport> repopulate(const ProgressCallback& onProgress = {});
    std::optional<int> pruneDeleted();
    bool updateNote(const QString& filePath, const QString& content);
    std::optional<std::vector<NoteRecord>> search(const QString& queryText);
    bool contains(const QString& filePath);

private:
    SyncSession(const Settings& settings, StoreConnection connection);

    Settings m_settings;
    StoreConnection m_connection;
    NoteTable m_table;
};

} // namespace nv
