#pragma once

#include "core/fs/file_info.h"
#include "core/shared/note_record.h"

#include <QString>

#include <vector>

namespace nv {

// Whole file as UTF-8 text. An unreadable file yields an empty string and a
// warning; conversion never fails.
QString readFileContent(const QString& filePath);

// One record per file: subNoteIndex 0, timeAdded stamped now, vector left
// for the table's embedding function.
NoteRecord convertFileToRecord(const FileInfo& file);
std::vector<NoteRecord> convertFilesToRecords(const std::vector<FileInfo>& files);
std::vector<NoteRecord> convertTreeToRecords(const FileInfoTree& tree);

} // namespace nv
