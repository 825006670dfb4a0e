#pragma once

#include "core/fs/file_info.h"
#include "core/sync/batch_writer.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace nv {

class NoteTable;

// Bring the table in line with the files under directoryPath: list, diff
// against a complete table snapshot, convert and write only the missing
// files, then emit a final onProgress(1.0). Running it again with no
// filesystem changes writes nothing.
//
// Returns std::nullopt without writing when the table cannot be read or
// the snapshot does not cover every row.
std::optional<BatchWriteReport> maybeRePopulateTable(NoteTable& table,
                                                     const QString& directoryPath,
                                                     const QStringList& extensions,
                                                     const ProgressCallback& onProgress = {});

// Convert and write with no reconciliation; callers know these are new.
std::optional<BatchWriteReport> populateTableWithFiles(NoteTable& table,
                                                       const std::vector<FileInfo>& files,
                                                       const ProgressCallback& onProgress = {});
std::optional<BatchWriteReport> addTreeToTable(NoteTable& table, const FileInfoTree& tree,
                                               const ProgressCallback& onProgress = {});

// One path-equality delete per file, in listing order. Stops at the first
// failed delete; earlier deletes are not rolled back.
bool removeTreeFromTable(NoteTable& table, const FileInfoTree& tree);

// Delete every row for filePath, then insert a single fresh record stamped
// after every row it replaces. A failed read or delete skips the insert.
bool updateNoteInTable(NoteTable& table, const QString& filePath, const QString& content);

// Best-effort reset: failures are logged, never reported.
void deleteAllRowsInTable(NoteTable& table);

// Delete rows whose notePath is no longer listed under directoryPath.
// Returns the number of paths removed.
std::optional<int> pruneDeletedNotes(NoteTable& table, const QString& directoryPath,
                                     const QStringList& extensions);

} // namespace nv
