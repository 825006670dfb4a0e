#include "core/fs/file_lister.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

namespace nv {

namespace {

void flattenInto(const FileInfoTree& tree, std::vector<FileInfo>& out)
{
    for (const FileInfoNode& node : tree) {
        if (node.isDirectory) {
            flattenInto(node.children, out);
        } else {
            out.push_back(node.info);
        }
    }
}

FileInfo makeFileInfo(const QFileInfo& fi, const QDir& rootDir)
{
    FileInfo info;
    info.name = fi.fileName();
    info.path = QDir::cleanPath(fi.absoluteFilePath());
    info.relativePath = rootDir.relativeFilePath(info.path);
    info.dateModified = fi.lastModified();
    info.dateCreated = fi.birthTime().isValid() ? fi.birthTime() : fi.metadataChangeTime();
    return info;
}

} // namespace

FileLister::FileLister(const QStringList& extensions)
{
    for (const QString& extension : extensions) {
        QString normalized = extension.trimmed().toLower();
        while (normalized.startsWith(QLatin1Char('.'))) {
            normalized.remove(0, 1);
        }
        if (!normalized.isEmpty() && !m_extensions.contains(normalized)) {
            m_extensions.append(normalized);
        }
    }
}

bool FileLister::matchesExtension(const QString& fileName) const
{
    if (m_extensions.isEmpty()) {
        return true;
    }
    const QString suffix = QFileInfo(fileName).suffix().toLower();
    return !suffix.isEmpty() && m_extensions.contains(suffix);
}

FileInfoTree FileLister::listTree(const QString& root) const
{
    FileInfoTree tree;
    const QFileInfo rootInfo(root);
    if (!rootInfo.exists() || !rootInfo.isDir()) {
        LOG_WARN(nvFs, "Listing root does not exist: %s", qUtf8Printable(root));
        return tree;
    }

    const QString cleanRoot = QDir::cleanPath(rootInfo.absoluteFilePath());
    listRecursive(cleanRoot, cleanRoot, tree, 0);
    return tree;
}

std::vector<FileInfo> FileLister::listFiles(const QString& root) const
{
    std::vector<FileInfo> files = flattenFileInfoTree(listTree(root));
    LOG_DEBUG(nvFs, "Listed %d file(s) under %s", static_cast<int>(files.size()),
              qUtf8Printable(root));
    return files;
}

void FileLister::listRecursive(const QString& dirPath, const QString& root,
                               FileInfoTree& nodes, int depth) const
{
    if (depth >= kMaxDepth) {
        LOG_WARN(nvFs, "Max listing depth (%d) reached at: %s", kMaxDepth,
                 qUtf8Printable(dirPath));
        return;
    }

    const QDir rootDir(root);
    const QDir dir(dirPath);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name | QDir::DirsFirst);

    for (const QFileInfo& fi : entries) {
        if (fi.isDir()) {
            // Symlinked directories can form cycles.
            if (fi.isSymLink()) {
                continue;
            }
            FileInfoNode directory;
            directory.info = makeFileInfo(fi, rootDir);
            directory.isDirectory = true;
            listRecursive(fi.absoluteFilePath(), root, directory.children, depth + 1);
            nodes.push_back(std::move(directory));
            continue;
        }

        if (!matchesExtension(fi.fileName())) {
            continue;
        }

        FileInfoNode file;
        file.info = makeFileInfo(fi, rootDir);
        nodes.push_back(std::move(file));
    }
}

std::vector<FileInfo> flattenFileInfoTree(const FileInfoTree& tree)
{
    std::vector<FileInfo> files;
    flattenInto(tree, files);
    return files;
}

FileInfoTree getFilesInfoTree(const QString& root, const QStringList& extensions)
{
    return FileLister(extensions).listTree(root);
}

std::vector<FileInfo> getFilesInfoList(const QString& root, const QStringList& extensions)
{
    return FileLister(extensions).listFiles(root);
}

} // namespace nv
