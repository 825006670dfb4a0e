#pragma once

#include <QDateTime>
#include <QString>

#include <vector>

namespace nv {

struct FileInfo {
    QString name;
    QString path;          // absolute, cleaned
    QString relativePath;  // relative to the listing root
    QDateTime dateModified;
    QDateTime dateCreated;
};

// Node of a directory listing. Directory nodes carry children; file nodes
// never do.
struct FileInfoNode {
    FileInfo info;
    bool isDirectory = false;
    std::vector<FileInfoNode> children;
};

using FileInfoTree = std::vector<FileInfoNode>;

} // namespace nv
