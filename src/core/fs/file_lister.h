#pragma once

#include "core/fs/file_info.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace nv {

// FileLister -- recursive directory listing filtered by file extension.
//
// Extensions match case-insensitively and may be given with or without
// the leading dot. Hidden entries and symlinked directories are skipped.
// An empty extension list matches every file.
class FileLister {
public:
    explicit FileLister(const QStringList& extensions);

    FileInfoTree listTree(const QString& root) const;
    std::vector<FileInfo> listFiles(const QString& root) const;

    bool matchesExtension(const QString& fileName) const;

private:
    void listRecursive(const QString& dirPath, const QString& root,
                       FileInfoTree& nodes, int depth) const;

    static constexpr int kMaxDepth = 64;

    QStringList m_extensions;  // lower-case, without leading dot
};

// Directory nodes are skipped; order is depth-first in listing order.
std::vector<FileInfo> flattenFileInfoTree(const FileInfoTree& tree);

FileInfoTree getFilesInfoTree(const QString& root, const QStringList& extensions);
std::vector<FileInfo> getFilesInfoList(const QString& root, const QStringList& extensions);

} // namespace nv
