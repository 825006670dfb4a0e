#include "core/sync/note_converter.h"
#include "core/fs/file_lister.h"
#include "core/shared/logging.h"

#include <QFile>

namespace nv {

QString readFileContent(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(nvSync, "Cannot read %s: %s", qUtf8Printable(filePath),
                 qUtf8Printable(file.errorString()));
        return {};
    }
    return QString::fromUtf8(file.readAll());
}

NoteRecord convertFileToRecord(const FileInfo& file)
{
    NoteRecord record;
    record.notePath = file.path;
    record.content = readFileContent(file.path);
    record.subNoteIndex = 0;
    record.timeAdded = stampTimeAdded();
    return record;
}

std::vector<NoteRecord> convertFilesToRecords(const std::vector<FileInfo>& files)
{
    std::vector<NoteRecord> records;
    records.reserve(files.size());
    for (const FileInfo& file : files) {
        records.push_back(convertFileToRecord(file));
    }
    return records;
}

std::vector<NoteRecord> convertTreeToRecords(const FileInfoTree& tree)
{
    return convertFilesToRecords(flattenFileInfoTree(tree));
}

} // namespace nv
