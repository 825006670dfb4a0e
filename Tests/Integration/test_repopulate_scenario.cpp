#include <QtTest/QtTest>

#include "core/sync/reconciler.h"
#include "core/sync/table_sync.h"
#include "fake_embedding_function.h"
#include "note_table_fixture.h"
#include "recording_vector_table.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

namespace {

bool writeNote(const QString& path, const QByteArray& content)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

QString absolutePath(const QTemporaryDir& dir, const QString& relative)
{
    return QDir::cleanPath(QFileInfo(dir.filePath(relative)).absoluteFilePath());
}

} // namespace

class TestRepopulateScenario : public QObject {
    Q_OBJECT

private slots:
    void testRepopulateThenPruneDeletedFile();
    void testEveryListedFileIsIndexed();
    void testChunkFailureIsRepairedByNextPass();
    void testEditEventReplacesRow();
};

void TestRepopulateScenario::testRepopulateThenPruneDeletedFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeNote(dir.filePath(QStringLiteral("a.md")), "# A\nfirst"));
    QVERIFY(writeNote(dir.filePath(QStringLiteral("b.md")), "# B\nsecond"));

    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(dir.path()));
    QCOMPARE(fixture.table.countRows().value_or(-1), 0);

    const QStringList extensions = {QStringLiteral(".md")};
    const auto report = nv::maybeRePopulateTable(fixture.table, dir.path(), extensions);
    QVERIFY(report.has_value());
    QVERIFY(report->allSucceeded());
    QCOMPARE(fixture.table.countRows().value_or(-1), 2);

    QVERIFY(QFile::remove(dir.filePath(QStringLiteral("a.md"))));
    QCOMPARE(nv::pruneDeletedNotes(fixture.table, dir.path(), extensions).value_or(-1), 1);

    QCOMPARE(fixture.table.countRows().value_or(-1), 1);
    QVERIFY(!nv::isFileInDB(fixture.table, absolutePath(dir, QStringLiteral("a.md"))));
    QVERIFY(nv::isFileInDB(fixture.table, absolutePath(dir, QStringLiteral("b.md"))));

    // Repopulating afterwards changes nothing.
    fixture.recorder->resetCounters();
    QVERIFY(nv::maybeRePopulateTable(fixture.table, dir.path(), extensions).has_value());
    QCOMPARE(fixture.recorder->addCalls(), 0);
}

void TestRepopulateScenario::testEveryListedFileIsIndexed()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    for (int i = 0; i < 73; ++i) {
        const QString relative = QStringLiteral("d%1/n%2.md").arg(i % 4).arg(i);
        QVERIFY(writeNote(dir.filePath(relative),
                          i % 7 == 0 ? QByteArray() : QByteArray("note body ") + QByteArray::number(i)));
    }
    QVERIFY(writeNote(dir.filePath(QStringLiteral("skip.txt")), "plain"));

    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(dir.path()));

    const QStringList extensions = {QStringLiteral("md")};
    const auto report = nv::maybeRePopulateTable(fixture.table, dir.path(), extensions);
    QVERIFY(report.has_value());
    QCOMPARE(report->totalChunks, 2);
    QVERIFY(report->allSucceeded());

    const std::optional<int> count = fixture.table.countRows();
    QCOMPARE(count.value_or(-1), 73);
    for (const nv::FileInfo& file : nv::getFilesInfoList(dir.path(), extensions)) {
        QVERIFY2(nv::isFileInDB(fixture.table, file.path, *count), qPrintable(file.path));
    }
}

void TestRepopulateScenario::testChunkFailureIsRepairedByNextPass()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    for (int i = 0; i < 130; ++i) {
        QVERIFY(writeNote(dir.filePath(QStringLiteral("n%1.md").arg(i, 3, 10, QLatin1Char('0'))),
                          QByteArray("body ") + QByteArray::number(i)));
    }

    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(dir.path()));
    fixture.recorder->failAddCall(1);

    std::vector<double> fractions;
    const auto first = nv::maybeRePopulateTable(
        fixture.table, dir.path(), {QStringLiteral("md")},
        [&fractions](double fraction) { fractions.push_back(fraction); });
    QVERIFY(first.has_value());
    QCOMPARE(first->failedChunks(), 1);
    QCOMPARE(fixture.recorder->addCalls(), 3);
    QCOMPARE(fractions.size(), size_t(4));
    QCOMPARE(fractions.back(), 1.0);
    QCOMPARE(fixture.table.countRows().value_or(-1), 80);

    // Only the lost chunk is written again.
    fixture.recorder->resetCounters();
    const auto second = nv::maybeRePopulateTable(fixture.table, dir.path(), {QStringLiteral("md")});
    QVERIFY(second.has_value());
    QVERIFY(second->allSucceeded());
    QCOMPARE(second->recordsWritten, 50);
    QCOMPARE(fixture.table.countRows().value_or(-1), 130);
}

void TestRepopulateScenario::testEditEventReplacesRow()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = absolutePath(dir, QStringLiteral("journal.md"));
    QVERIFY(writeNote(path, "monday: planted tomatoes"));

    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(dir.path()));
    QVERIFY(nv::maybeRePopulateTable(fixture.table, dir.path(), {QStringLiteral("md")}));

    QVERIFY(writeNote(path, "tuesday: watered basil"));
    QVERIFY(nv::updateNoteInTable(fixture.table, path, QStringLiteral("tuesday: watered basil")));

    const auto hits = fixture.table.search(QStringLiteral("watered basil"), 5);
    QVERIFY(hits.has_value());
    QCOMPARE(hits->size(), size_t(1));
    QCOMPARE(hits->front().notePath, path);
    QCOMPARE(hits->front().content, QStringLiteral("tuesday: watered basil"));
    QCOMPARE(fixture.table.countRows().value_or(-1), 1);
}

QTEST_MAIN(TestRepopulateScenario)
#include "test_repopulate_scenario.moc"
