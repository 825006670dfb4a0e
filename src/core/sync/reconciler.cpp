#include "core/sync/reconciler.h"
#include "core/shared/logging.h"
#include "core/sync/note_table.h"
#include "core/vector/filter_expression.h"

#include <algorithm>
#include <iterator>

namespace nv {

QSet<QString> TableSnapshot::notePaths() const
{
    QSet<QString> paths;
    paths.reserve(static_cast<int>(records.size()));
    for (const NoteRecord& record : records) {
        paths.insert(record.notePath);
    }
    return paths;
}

std::optional<TableSnapshot> materializeTable(NoteTable& table)
{
    const std::optional<int> count = table.countRows();
    if (!count) {
        return std::nullopt;
    }

    TableSnapshot snapshot;
    snapshot.expectedRows = *count;
    if (*count == 0) {
        snapshot.complete = true;
        return snapshot;
    }

    std::optional<std::vector<NoteRecord>> withContent =
        table.filter(FilterExpression::contentNotEmpty(), *count);
    if (!withContent) {
        return std::nullopt;
    }
    const int droppedWithContent = table.lastDroppedRows();

    std::optional<std::vector<NoteRecord>> withoutContent =
        table.filter(FilterExpression::contentEmpty(), *count);
    if (!withoutContent) {
        return std::nullopt;
    }
    const int dropped = droppedWithContent + table.lastDroppedRows();

    snapshot.records = std::move(*withContent);
    snapshot.records.insert(snapshot.records.end(),
                            std::make_move_iterator(withoutContent->begin()),
                            std::make_move_iterator(withoutContent->end()));
    snapshot.complete = static_cast<int>(snapshot.records.size()) + dropped == *count;

    if (!snapshot.complete) {
        LOG_WARN(nvSync, "Table snapshot incomplete: %d row(s) read, %d dropped, %d expected",
                 static_cast<int>(snapshot.records.size()), dropped, *count);
    } else if (dropped > 0) {
        LOG_WARN(nvSync, "Table snapshot skipped %d malformed row(s)", dropped);
    }
    return snapshot;
}

std::vector<FileInfo> findMissingFiles(const std::vector<FileInfo>& files,
                                       const TableSnapshot& snapshot)
{
    const QSet<QString> indexed = snapshot.notePaths();
    std::vector<FileInfo> missing;
    for (const FileInfo& file : files) {
        if (!indexed.contains(file.path)) {
            missing.push_back(file);
        }
    }
    return missing;
}

QStringList findStaleNotePaths(const std::vector<FileInfo>& files,
                               const TableSnapshot& snapshot)
{
    QSet<QString> onDisk;
    onDisk.reserve(static_cast<int>(files.size()));
    for (const FileInfo& file : files) {
        onDisk.insert(file.path);
    }

    QStringList stale;
    for (const QString& path : snapshot.notePaths()) {
        if (!onDisk.contains(path)) {
            stale.append(path);
        }
    }
    std::sort(stale.begin(), stale.end());
    return stale;
}

bool isFileInDB(NoteTable& table, const QString& filePath, int tableCount)
{
    if (tableCount <= 0) {
        return false;
    }

    const FilterExpression probes[] = {
        FilterExpression::allOf({FilterExpression::pathEquals(filePath),
                                 FilterExpression::contentNotEmpty()}),
        FilterExpression::allOf({FilterExpression::pathEquals(filePath),
                                 FilterExpression::contentEmpty()}),
    };
    for (const FilterExpression& probe : probes) {
        const std::optional<std::vector<NoteRecord>> rows = table.filter(probe, tableCount);
        if (rows && !rows->empty()) {
            return true;
        }
    }
    return false;
}

bool isFileInDB(NoteTable& table, const QString& filePath)
{
    const std::optional<int> count = table.countRows();
    return count && isFileInDB(table, filePath, *count);
}

} // namespace nv
