#pragma once

#include <QString>
#include <QStringList>

namespace nv {

struct Settings {
    // Vector store database file (":memory:" allowed)
    QString dbPath;

    // Notes directory kept in sync with the table
    QString notesDirectory;
    QStringList fileExtensions = {QStringLiteral(".md")};

    // Embedding
    QString embeddingModelId = QStringLiteral("Xenova/bge-base-en-v1.5");
    QString modelsDir;

    int searchLimit = 10;
};

} // namespace nv
