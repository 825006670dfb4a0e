#include <QtTest/QtTest>

#include "core/sync/note_table.h"
#include "core/vector/store_connection.h"
#include "fake_embedding_function.h"
#include "note_table_fixture.h"
#include "recording_vector_table.h"

#include <QDateTime>

namespace {

nv::NoteRecord makeRecord(const QString& path, const QString& content)
{
    nv::NoteRecord record;
    record.notePath = path;
    record.content = content;
    record.timeAdded = nv::stampTimeAdded();
    return record;
}

} // namespace

class TestNoteTable : public QObject {
    Q_OBJECT

private slots:
    void testOperationsBeforeInitializeFail();
    void testInitializeOnlyOnce();
    void testInitializeWithMissingModelFails();
    void testInitializeScopesTableToDirectory();
    void testAddDelegatesInChunks();
    void testSearchRanksAndRoundTrips();
    void testFilterHonoursLimitAndOrder();
    void testMalformedRowsAreDropped();
    void testMalformedRowsOutsideFilterAreIgnored();
    void testRemoveFailureSetsStoreError();
};

void TestNoteTable::testOperationsBeforeInitializeFail()
{
    nv::NoteTable table;
    QVERIFY(!table.isInitialized());

    QVERIFY(!table.add({makeRecord(QStringLiteral("/n/a.md"), QStringLiteral("a"))}).has_value());
    QVERIFY(table.lastError() == nv::NoteTable::Error::NotInitialized);

    QVERIFY(!table.remove(nv::FilterExpression::contentEmpty()));
    QVERIFY(table.lastError() == nv::NoteTable::Error::NotInitialized);

    QVERIFY(!table.search(QStringLiteral("a"), 5).has_value());
    QVERIFY(!table.filter(nv::FilterExpression::contentEmpty()).has_value());
    QVERIFY(!table.countRows().has_value());
    QVERIFY(table.lastError() == nv::NoteTable::Error::NotInitialized);
    QVERIFY(table.lastErrorMessage().contains(QStringLiteral("countRows")));
    QCOMPARE(nv::noteTableErrorName(table.lastError()), QStringLiteral("not_initialized"));
}

void TestNoteTable::testInitializeOnlyOnce()
{
    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(QStringLiteral("/notes")));
    QVERIFY(fixture.table.isInitialized());
    QVERIFY(fixture.table.lastError() == nv::NoteTable::Error::None);

    auto second = std::make_unique<nv::test::FakeEmbeddingFunction>();
    QVERIFY(!fixture.table.initialize(*fixture.connection, QStringLiteral("/other"),
                                      std::move(second)));
    QVERIFY(fixture.table.lastError() == nv::NoteTable::Error::AlreadyInitialized);
    QCOMPARE(fixture.table.rootDirectory(), QStringLiteral("/notes"));
    QVERIFY(fixture.table.countRows().has_value());
}

void TestNoteTable::testInitializeWithMissingModelFails()
{
    auto connection = nv::StoreConnection::open(QStringLiteral(":memory:"));
    QVERIFY(connection.has_value());

    nv::NoteTable table;
    QVERIFY(!table.initialize(*connection, QStringLiteral("/notes"),
                              QStringLiteral("/definitely/missing/models")));
    QVERIFY(table.lastError() == nv::NoteTable::Error::EmbeddingUnavailable);
    QVERIFY(!table.isInitialized());
}

void TestNoteTable::testInitializeScopesTableToDirectory()
{
    auto connection = nv::StoreConnection::open(QStringLiteral(":memory:"));
    QVERIFY(connection.has_value());

    nv::NoteTable first;
    QVERIFY(first.initialize(*connection, QStringLiteral("/notes/one"),
                             std::make_unique<nv::test::FakeEmbeddingFunction>()));
    nv::NoteTable second;
    QVERIFY(second.initialize(*connection, QStringLiteral("/notes/two/"),
                              std::make_unique<nv::test::FakeEmbeddingFunction>()));
    QCOMPARE(second.rootDirectory(), QStringLiteral("/notes/two"));

    QVERIFY(first.add({makeRecord(QStringLiteral("/notes/one/a.md"), QStringLiteral("a"))}));
    QCOMPARE(first.countRows().value_or(-1), 1);
    QCOMPARE(second.countRows().value_or(-1), 0);
    QCOMPARE(connection->tableNames().size(), 2);
}

void TestNoteTable::testAddDelegatesInChunks()
{
    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(QStringLiteral("/notes")));

    std::vector<nv::NoteRecord> records;
    for (int i = 0; i < 101; ++i) {
        records.push_back(makeRecord(QStringLiteral("/notes/%1.md").arg(i), QStringLiteral("x")));
    }
    int progressCalls = 0;
    const auto report = fixture.table.add(records, [&progressCalls](double) { ++progressCalls; });
    QVERIFY(report.has_value());
    QCOMPARE(report->totalChunks, 3);
    QCOMPARE(progressCalls, 3);
    QCOMPARE(fixture.recorder->addCalls(), 3);
    QCOMPARE(fixture.table.countRows().value_or(-1), 101);
}

void TestNoteTable::testSearchRanksAndRoundTrips()
{
    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(QStringLiteral("/notes")));

    const nv::NoteRecord garden =
        makeRecord(QStringLiteral("/notes/garden.md"), QStringLiteral("tomato basil garden"));
    QVERIFY(fixture.table.add({garden,
                               makeRecord(QStringLiteral("/notes/code.md"), QStringLiteral("borrow checker")),
                               makeRecord(QStringLiteral("/notes/empty.md"), QString())})
                ->allSucceeded());

    const auto hits = fixture.table.search(QStringLiteral("basil garden tomato"), 1);
    QVERIFY(hits.has_value());
    QCOMPARE(hits->size(), size_t(1));
    const nv::NoteRecord& hit = hits->front();
    QCOMPARE(hit.notePath, garden.notePath);
    QCOMPARE(hit.content, garden.content);
    QCOMPARE(hit.subNoteIndex, 0);
    QCOMPARE(hit.timeAdded, garden.timeAdded);
    QCOMPARE(static_cast<int>(hit.vector.size()), fixture.embedder->dimensions());

    const auto filtered = fixture.table.search(QStringLiteral("basil garden tomato"), 5,
                                               nv::FilterExpression::contentEmpty());
    QVERIFY(filtered.has_value());
    QCOMPARE(filtered->size(), size_t(1));
    QCOMPARE(filtered->front().notePath, QStringLiteral("/notes/empty.md"));
}

void TestNoteTable::testFilterHonoursLimitAndOrder()
{
    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(QStringLiteral("/notes")));
    QVERIFY(fixture.table.add({makeRecord(QStringLiteral("/notes/a.md"), QStringLiteral("a")),
                               makeRecord(QStringLiteral("/notes/b.md"), QString()),
                               makeRecord(QStringLiteral("/notes/c.md"), QStringLiteral("c"))})
                ->allSucceeded());

    const auto withContent = fixture.table.filter(nv::FilterExpression::contentNotEmpty());
    QVERIFY(withContent.has_value());
    QCOMPARE(withContent->size(), size_t(2));
    QCOMPARE(withContent->at(0).notePath, QStringLiteral("/notes/a.md"));
    QCOMPARE(withContent->at(1).notePath, QStringLiteral("/notes/c.md"));

    const auto limited = fixture.table.filter(nv::FilterExpression::contentNotEmpty(), 1);
    QCOMPARE(limited->size(), size_t(1));

    const auto hostile = fixture.table.filter(
        nv::FilterExpression::pathEquals(QStringLiteral("/notes/a.md' OR '1'='1")));
    QVERIFY(hostile.has_value());
    QVERIFY(hostile->empty());
}

void TestNoteTable::testMalformedRowsAreDropped()
{
    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(QStringLiteral("/notes")));
    QVERIFY(fixture.table.add({makeRecord(QStringLiteral("/notes/a.md"), QStringLiteral("a"))})
                ->allSucceeded());

    nv::RawRow missingVector;
    missingVector.insert(QStringLiteral("notepath"), QStringLiteral("/notes/legacy.md"));
    missingVector.insert(QStringLiteral("content"), QStringLiteral("old"));
    missingVector.insert(QStringLiteral("subnoteindex"), 0);
    missingVector.insert(QStringLiteral("timeadded"), QDateTime::currentDateTimeUtc());
    nv::RawRow empty;
    fixture.recorder->setInjectedRows({missingVector, empty});

    const auto rows = fixture.table.filter(nv::FilterExpression::allOf({}), 10);
    QVERIFY(rows.has_value());
    QCOMPARE(rows->size(), size_t(1));
    QCOMPARE(rows->front().notePath, QStringLiteral("/notes/a.md"));
    QCOMPARE(fixture.table.lastDroppedRows(), 2);
    QVERIFY(fixture.table.lastError() == nv::NoteTable::Error::None);

    const auto hits = fixture.table.search(QStringLiteral("a"), 10);
    QVERIFY(hits.has_value());
    QCOMPARE(hits->size(), size_t(1));
}

void TestNoteTable::testMalformedRowsOutsideFilterAreIgnored()
{
    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(QStringLiteral("/notes")));
    QVERIFY(fixture.table.add({makeRecord(QStringLiteral("/notes/a.md"), QStringLiteral("a"))})
                ->allSucceeded());

    nv::RawRow legacy;
    legacy.insert(QStringLiteral("notepath"), QStringLiteral("/notes/legacy.md"));
    legacy.insert(QStringLiteral("content"), QStringLiteral("old"));
    fixture.recorder->setInjectedRows({legacy});

    const auto own = fixture.table.filter(nv::FilterExpression::pathEquals(QStringLiteral("/notes/a.md")));
    QVERIFY(own.has_value());
    QCOMPARE(own->size(), size_t(1));
    QCOMPARE(fixture.table.lastDroppedRows(), 0);

    const auto other = fixture.table.filter(nv::FilterExpression::pathEquals(QStringLiteral("/notes/legacy.md")));
    QVERIFY(other.has_value());
    QVERIFY(other->empty());
    QCOMPARE(fixture.table.lastDroppedRows(), 1);

    const auto empties = fixture.table.filter(nv::FilterExpression::contentEmpty());
    QVERIFY(empties.has_value());
    QVERIFY(empties->empty());
    QCOMPARE(fixture.table.lastDroppedRows(), 0);
}

void TestNoteTable::testRemoveFailureSetsStoreError()
{
    nv::test::NoteTableFixture fixture;
    QVERIFY(fixture.open(QStringLiteral("/notes")));
    fixture.recorder->setFailRemoves(true);

    QVERIFY(!fixture.table.remove(nv::FilterExpression::pathEquals(QStringLiteral("/notes/a.md"))));
    QVERIFY(fixture.table.lastError() == nv::NoteTable::Error::StoreFailure);
    QVERIFY(!fixture.table.lastErrorMessage().isEmpty());

    // The next successful call clears the error.
    QVERIFY(fixture.table.countRows().has_value());
    QVERIFY(fixture.table.lastError() == nv::NoteTable::Error::None);
}

QTEST_MAIN(TestNoteTable)
#include "test_note_table.moc"
