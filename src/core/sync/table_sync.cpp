#include "core/sync/table_sync.h"
#include "core/fs/file_lister.h"
#include "core/shared/logging.h"
#include "core/sync/note_converter.h"
#include "core/sync/note_table.h"
#include "core/sync/reconciler.h"
#include "core/vector/filter_expression.h"

#include <QDateTime>
#include <QElapsedTimer>

namespace nv {

std::optional<BatchWriteReport> maybeRePopulateTable(NoteTable& table,
                                                     const QString& directoryPath,
                                                     const QStringList& extensions,
                                                     const ProgressCallback& onProgress)
{
    QElapsedTimer timer;
    timer.start();

    const std::vector<FileInfo> files = getFilesInfoList(directoryPath, extensions);

    const std::optional<TableSnapshot> snapshot = materializeTable(table);
    if (!snapshot) {
        LOG_ERROR(nvSync, "Repopulate of %s aborted: table unreadable",
                  qUtf8Printable(directoryPath));
        return std::nullopt;
    }
    if (!snapshot->complete) {
        LOG_ERROR(nvSync, "Repopulate of %s aborted: table snapshot covers %d of %d rows",
                  qUtf8Printable(directoryPath), static_cast<int>(snapshot->records.size()),
                  snapshot->expectedRows);
        return std::nullopt;
    }

    const std::vector<FileInfo> missing = findMissingFiles(files, *snapshot);
    LOG_INFO(nvSync, "Repopulate %s: %d file(s) listed, %d row(s) indexed, %d missing",
             qUtf8Printable(directoryPath), static_cast<int>(files.size()),
             snapshot->expectedRows, static_cast<int>(missing.size()));

    std::optional<BatchWriteReport> report = populateTableWithFiles(table, missing, onProgress);
    if (!report) {
        return std::nullopt;
    }
    if (onProgress) {
        onProgress(1.0);
    }

    const std::optional<int> finalCount = table.countRows();
    LOG_INFO(nvSync, "Repopulate %s done in %lld ms: %d written, %d chunk(s) failed, %d row(s) total",
             qUtf8Printable(directoryPath), static_cast<long long>(timer.elapsed()),
             report->recordsWritten, report->failedChunks(), finalCount.value_or(-1));
    return report;
}

std::optional<BatchWriteReport> populateTableWithFiles(NoteTable& table,
                                                       const std::vector<FileInfo>& files,
                                                       const ProgressCallback& onProgress)
{
    return table.add(convertFilesToRecords(files), onProgress);
}

std::optional<BatchWriteReport> addTreeToTable(NoteTable& table, const FileInfoTree& tree,
                                               const ProgressCallback& onProgress)
{
    return table.add(convertTreeToRecords(tree), onProgress);
}

bool removeTreeFromTable(NoteTable& table, const FileInfoTree& tree)
{
    for (const FileInfo& file : flattenFileInfoTree(tree)) {
        if (!table.remove(FilterExpression::pathEquals(file.path))) {
            LOG_WARN(nvSync, "Removing tree stopped at %s", qUtf8Printable(file.path));
            return false;
        }
    }
    return true;
}

bool updateNoteInTable(NoteTable& table, const QString& filePath, const QString& content)
{
    const FilterExpression byPath = FilterExpression::pathEquals(filePath);

    // Stored stamps may be ahead of this process's clock.
    const std::optional<std::vector<NoteRecord>> prior = table.filter(byPath);
    if (!prior) {
        LOG_WARN(nvSync, "Update of %s aborted: existing rows unreadable",
                 qUtf8Printable(filePath));
        return false;
    }

    if (!table.remove(byPath)) {
        return false;
    }

    QDateTime stamp = stampTimeAdded();
    for (const NoteRecord& row : *prior) {
        if (row.timeAdded.isValid() && row.timeAdded >= stamp) {
            stamp = row.timeAdded.addMSecs(1);
        }
    }

    NoteRecord record;
    record.notePath = filePath;
    record.content = content;
    record.subNoteIndex = 0;
    record.timeAdded = stamp;

    const std::optional<BatchWriteReport> report = table.add({record});
    return report && report->allSucceeded();
}

void deleteAllRowsInTable(NoteTable& table)
{
    if (!table.remove(FilterExpression::contentNotEmpty())) {
        LOG_WARN(nvSync, "Clearing rows with content failed: %s",
                 qUtf8Printable(table.lastErrorMessage()));
    }
    if (!table.remove(FilterExpression::contentEmpty())) {
        LOG_WARN(nvSync, "Clearing rows without content failed: %s",
                 qUtf8Printable(table.lastErrorMessage()));
    }
}

std::optional<int> pruneDeletedNotes(NoteTable& table, const QString& directoryPath,
                                     const QStringList& extensions)
{
    const std::optional<TableSnapshot> snapshot = materializeTable(table);
    if (!snapshot) {
        return std::nullopt;
    }

    const std::vector<FileInfo> files = getFilesInfoList(directoryPath, extensions);
    const QStringList stale = findStaleNotePaths(files, *snapshot);

    int removed = 0;
    for (const QString& path : stale) {
        if (table.remove(FilterExpression::pathEquals(path))) {
            ++removed;
        }
    }
    if (!stale.isEmpty()) {
        LOG_INFO(nvSync, "Pruned %d of %d stale note(s) from %s",
                 removed, static_cast<int>(stale.size()), qUtf8Printable(directoryPath));
    }
    return removed;
}

} // namespace nv
