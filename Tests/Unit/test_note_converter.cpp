#include <QtTest/QtTest>

#include "core/fs/file_lister.h"
#include "core/sync/note_converter.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

namespace {

void writeTextFile(const QString& path, const QByteArray& content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(content), static_cast<qint64>(content.size()));
}

} // namespace

class TestNoteConverter : public QObject {
    Q_OBJECT

private slots:
    void testReadFileContentUtf8();
    void testUnreadableFileDegradesToEmpty();
    void testConvertFileToRecord();
    void testConvertTreeFlattensInOrder();
};

void TestNoteConverter::testReadFileContentUtf8()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("note.md"));
    writeTextFile(path, QStringLiteral("# Café\n\nline two\n").toUtf8());

    QCOMPARE(nv::readFileContent(path), QStringLiteral("# Café\n\nline two\n"));
}

void TestNoteConverter::testUnreadableFileDegradesToEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(nv::readFileContent(dir.filePath(QStringLiteral("missing.md"))).isEmpty());
    QVERIFY(nv::readFileContent(dir.path()).isEmpty());

    nv::FileInfo missing;
    missing.path = dir.filePath(QStringLiteral("missing.md"));
    const nv::NoteRecord record = nv::convertFileToRecord(missing);
    QCOMPARE(record.notePath, missing.path);
    QVERIFY(record.content.isEmpty());
    QVERIFY(record.timeAdded.isValid());
}

void TestNoteConverter::testConvertFileToRecord()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("a.md"));
    writeTextFile(path, "alpha");

    nv::FileInfo file;
    file.path = path;
    file.name = QStringLiteral("a.md");

    const QDateTime before = QDateTime::currentDateTimeUtc().addSecs(-1);
    const nv::NoteRecord first = nv::convertFileToRecord(file);
    const nv::NoteRecord second = nv::convertFileToRecord(file);

    QCOMPARE(first.notePath, path);
    QCOMPARE(first.content, QStringLiteral("alpha"));
    QCOMPARE(first.subNoteIndex, 0);
    QVERIFY(first.vector.empty());
    QVERIFY(first.timeAdded > before);
    QVERIFY(second.timeAdded > first.timeAdded);
}

void TestNoteConverter::testConvertTreeFlattensInOrder()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    writeTextFile(dir.filePath(QStringLiteral("b.md")), "b");
    writeTextFile(dir.filePath(QStringLiteral("sub/c.md")), "c");
    writeTextFile(dir.filePath(QStringLiteral("a.md")), "a");

    const nv::FileInfoTree tree = nv::getFilesInfoTree(dir.path(), {QStringLiteral("md")});
    const std::vector<nv::NoteRecord> records = nv::convertTreeToRecords(tree);

    QCOMPARE(records.size(), size_t(3));
    // Directories first, then files by name.
    QCOMPARE(records[0].content, QStringLiteral("c"));
    QCOMPARE(records[1].content, QStringLiteral("a"));
    QCOMPARE(records[2].content, QStringLiteral("b"));
    QVERIFY(nv::convertTreeToRecords({}).empty());
}

QTEST_MAIN(TestNoteConverter)
#include "test_note_converter.moc"
