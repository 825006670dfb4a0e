#pragma once

#include "core/vector/vector_table.h"

#include <QString>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace nv {

class EmbeddingFunction;
class VectorIndex;

// SqliteVectorTable -- note rows persisted in one SQLite table, with an
// in-memory HNSW index over the stored vectors for nearest-neighbour
// queries. SQLite is the source of truth; the HNSW index is rebuilt from
// it on open and kept in step with every committed write.
//
// Schema (one table per notes directory):
//   id INTEGER PRIMARY KEY AUTOINCREMENT  -- HNSW label
//   notepath TEXT, vector BLOB (float32), content TEXT,
//   subnoteindex INTEGER, timeadded INTEGER (ms since epoch)
//   UNIQUE (notepath, subnoteindex)
class SqliteVectorTable : public VectorTable {
public:
    // The connection and the embedding function must outlive the table.
    static std::unique_ptr<SqliteVectorTable> openOrCreate(sqlite3* db,
                                                           const QString& tableName,
                                                           EmbeddingFunction& embedder,
                                                           QString* errorOut = nullptr);
    ~SqliteVectorTable() override;

    SqliteVectorTable(const SqliteVectorTable&) = delete;
    SqliteVectorTable& operator=(const SqliteVectorTable&) = delete;

    QString name() const override;

    bool add(const std::vector<NoteRecord>& records, QString* errorOut = nullptr) override;
    bool remove(const FilterExpression& filter, QString* errorOut = nullptr) override;
    std::optional<std::vector<RawRow>> query(const QueryRequest& request,
                                             QString* errorOut = nullptr) override;
    std::optional<int> countRows(QString* errorOut = nullptr) override;

    int dimensions() const;

    static bool isValidTableName(const QString& tableName);

private:
    SqliteVectorTable(sqlite3* db, const QString& tableName, EmbeddingFunction& embedder);

    bool ensureSchema(QString* errorOut);
    bool checkBinding(QString* errorOut);
    bool prepareStatements(QString* errorOut);
    bool rebuildIndex(QString* errorOut);

    std::optional<std::vector<RawRow>> scan(const QueryRequest& request, QString* errorOut);
    std::optional<std::vector<RawRow>> nearest(const QueryRequest& request, QString* errorOut);
    std::optional<std::vector<int64_t>> matchingIds(const FilterExpression& filter,
                                                    QString* errorOut);

    bool execSql(const QString& sql, QString* errorOut);
    void rollback();
    QString lastSqliteError() const;

    sqlite3* m_db = nullptr;
    QString m_tableName;
    EmbeddingFunction& m_embedder;
    int m_dimensions = 0;
    std::unique_ptr<VectorIndex> m_index;

    sqlite3_stmt* m_insertStmt = nullptr;
    sqlite3_stmt* m_rowByIdStmt = nullptr;
    sqlite3_stmt* m_countStmt = nullptr;
};

} // namespace nv
