#pragma once

#include "core/shared/note_record.h"
#include "core/sync/batch_writer.h"
#include "core/vector/filter_expression.h"

#include <QString>

#include <memory>
#include <optional>
#include <vector>

namespace nv {

class EmbeddingFunction;
class StoreConnection;
class VectorTable;

// NoteTable -- the typed facade over one notes directory's vector table.
//
// initialize() binds the facade exactly once. Every other operation fails
// with Error::NotInitialized before that, without touching the store.
// Rows read back from the store are validated with parseNoteRow(); rows
// that fail the shape check are dropped from the results.
class NoteTable {
public:
    enum class Error {
        None,
        NotInitialized,
        AlreadyInitialized,
        EmbeddingUnavailable,
        StoreFailure,
    };

    static constexpr const char* kDefaultModelId = "Xenova/bge-base-en-v1.5";
    static constexpr const char* kEmbeddedField = "content";
    static constexpr int kDefaultFilterLimit = 10;

    NoteTable();
    ~NoteTable();

    NoteTable(const NoteTable&) = delete;
    NoteTable& operator=(const NoteTable&) = delete;

    // Loads the default model from modelsDir and opens (or creates) the
    // table named after rootDirectory. The connection must outlive this object.
    bool initialize(StoreConnection& connection, const QString& rootDirectory,
                    const QString& modelsDir);
    bool initialize(StoreConnection& connection, const QString& rootDirectory,
                    std::unique_ptr<EmbeddingFunction> embedder);
    // Adopts an already-open table. The embedder, when given, is kept alive
    // alongside the table.
    bool initialize(std::unique_ptr<VectorTable> table, const QString& rootDirectory,
                    std::unique_ptr<EmbeddingFunction> embedder = nullptr);

    bool isInitialized() const { return m_table != nullptr; }
    const QString& rootDirectory() const { return m_rootDirectory; }

    // std::nullopt only when the table is not initialized; per-chunk
    // failures are reported inside the BatchWriteReport.
    std::optional<BatchWriteReport> add(const std::vector<NoteRecord>& records,
                                        const ProgressCallback& onProgress = {});
    bool remove(const FilterExpression& filter);
    std::optional<std::vector<NoteRecord>> search(const QString& queryText, int limit,
                                                  const std::optional<FilterExpression>& filter = std::nullopt);
    std::optional<std::vector<NoteRecord>> filter(const FilterExpression& filter,
                                                  int limit = kDefaultFilterLimit);
    std::optional<int> countRows();

    Error lastError() const { return m_lastError; }
    const QString& lastErrorMessage() const { return m_lastErrorMessage; }
    // Rows dropped by the shape check during the most recent search/filter.
    int lastDroppedRows() const { return m_lastDroppedRows; }

private:
    bool requireInitialized(const char* operation);
    bool beginInitialize(const QString& rootDirectory);
    void setError(Error error, const QString& message);
    void clearError();
    std::vector<NoteRecord> parseRows(const std::vector<RawRow>& rows, const char* operation);

    std::unique_ptr<EmbeddingFunction> m_embedder;
    std::unique_ptr<VectorTable> m_table;  // declared after m_embedder: it borrows it
    QString m_rootDirectory;
    Error m_lastError = Error::None;
    QString m_lastErrorMessage;
    int m_lastDroppedRows = 0;
};

QString noteTableErrorName(NoteTable::Error error);

} // namespace nv
