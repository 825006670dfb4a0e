#pragma once

#include "core/fs/file_info.h"
#include "core/shared/note_record.h"

#include <QSet>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace nv {

class NoteTable;

// Every row of a table, read with two complementary filters
// (content non-empty, content empty) each limited to the row count.
// complete is true only when the two partitions add up to that count;
// an incomplete snapshot must not drive writes.
struct TableSnapshot {
    std::vector<NoteRecord> records;
    int expectedRows = 0;
    bool complete = false;

    QSet<QString> notePaths() const;
};

std::optional<TableSnapshot> materializeTable(NoteTable& table);

// Files whose path has no row in the snapshot, in input order.
std::vector<FileInfo> findMissingFiles(const std::vector<FileInfo>& files,
                                       const TableSnapshot& snapshot);

// Distinct note paths in the snapshot with no corresponding file, sorted.
QStringList findStaleNotePaths(const std::vector<FileInfo>& files,
                               const TableSnapshot& snapshot);

// False without querying when tableCount is 0. Otherwise probes the path
// with the same two filters, stopping at the first hit.
bool isFileInDB(NoteTable& table, const QString& filePath, int tableCount);
bool isFileInDB(NoteTable& table, const QString& filePath);

} // namespace nv
