#include <QtTest/QtTest>

#include "core/shared/settings_manager.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QStandardPaths>
#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void testDefaults();
    void testSaveAndLoadRoundTrip();
    void testMissingFileLoadsNothing();
    void testMalformedJsonLoadsNothing();
    void testPartialJsonKeepsDefaults();
    void testInvalidValuesIgnored();
    void testExtensionsNormalized();
    void testRelativePathsResolveAgainstFile();
    void testDefaultPathUsesGenericDataLocation();
};

void TestSettingsManager::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void TestSettingsManager::testDefaults()
{
    const nv::Settings settings;
    QCOMPARE(settings.fileExtensions, QStringList{QStringLiteral(".md")});
    QCOMPARE(settings.embeddingModelId, QStringLiteral("Xenova/bge-base-en-v1.5"));
    QCOMPARE(settings.searchLimit, 10);
}

void TestSettingsManager::testSaveAndLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/settings.json"));

    nv::Settings settings;
    settings.dbPath = QStringLiteral("/var/lib/notevault/index.db");
    settings.notesDirectory = QStringLiteral("/home/u/notes");
    settings.fileExtensions = {QStringLiteral(".md"), QStringLiteral(".txt")};
    settings.embeddingModelId = QStringLiteral("local/model");
    settings.modelsDir = QStringLiteral("/opt/models");
    settings.searchLimit = 25;
    QVERIFY(nv::SettingsManager::save(settings, path));

    const auto loaded = nv::SettingsManager::load(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->dbPath, settings.dbPath);
    QCOMPARE(loaded->notesDirectory, settings.notesDirectory);
    QCOMPARE(loaded->fileExtensions, settings.fileExtensions);
    QCOMPARE(loaded->embeddingModelId, settings.embeddingModelId);
    QCOMPARE(loaded->modelsDir, settings.modelsDir);
    QCOMPARE(loaded->searchLimit, 25);
}

void TestSettingsManager::testMissingFileLoadsNothing()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(!nv::SettingsManager::load(dir.filePath(QStringLiteral("none.json"))).has_value());
}

void TestSettingsManager::testMalformedJsonLoadsNothing()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("settings.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ \"dbPath\": ");
    file.close();

    QVERIFY(!nv::SettingsManager::load(path).has_value());
}

void TestSettingsManager::testPartialJsonKeepsDefaults()
{
    QJsonObject json;
    json.insert(QStringLiteral("notesDirectory"), QStringLiteral("/notes"));

    const nv::Settings settings = nv::SettingsManager::fromJson(json);
    QCOMPARE(settings.notesDirectory, QStringLiteral("/notes"));
    QCOMPARE(settings.fileExtensions, QStringList{QStringLiteral(".md")});
    QCOMPARE(settings.embeddingModelId, QStringLiteral("Xenova/bge-base-en-v1.5"));
    QCOMPARE(settings.searchLimit, 10);
}

void TestSettingsManager::testInvalidValuesIgnored()
{
    QJsonObject json;
    json.insert(QStringLiteral("searchLimit"), -4);
    json.insert(QStringLiteral("fileExtensions"),
                QJsonArray{QStringLiteral("  "), QStringLiteral(" .org "), 3});

    const nv::Settings settings = nv::SettingsManager::fromJson(json);
    QCOMPARE(settings.searchLimit, 10);
    QCOMPARE(settings.fileExtensions, QStringList{QStringLiteral(".org")});
}

void TestSettingsManager::testExtensionsNormalized()
{
    QJsonObject json;
    json.insert(QStringLiteral("fileExtensions"),
                QJsonArray{QStringLiteral("MD"), QStringLiteral("..txt"), QStringLiteral(".md")});
    QCOMPARE(nv::SettingsManager::fromJson(json).fileExtensions,
             (QStringList{QStringLiteral(".md"), QStringLiteral(".txt")}));

    json.insert(QStringLiteral("fileExtensions"), QStringLiteral(".md"));
    QCOMPARE(nv::SettingsManager::fromJson(json).fileExtensions,
             QStringList{QStringLiteral(".md")});
}

void TestSettingsManager::testRelativePathsResolveAgainstFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("vault/settings.json"));

    nv::Settings settings;
    settings.dbPath = QStringLiteral(":memory:");
    settings.notesDirectory = QStringLiteral("notes");
    settings.modelsDir = QStringLiteral("../models");
    QVERIFY(nv::SettingsManager::save(settings, path));

    const auto loaded = nv::SettingsManager::load(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->dbPath, QStringLiteral(":memory:"));
    QCOMPARE(loaded->notesDirectory,
             QDir::cleanPath(QDir(dir.path()).absoluteFilePath(QStringLiteral("vault/notes"))));
    QCOMPARE(loaded->modelsDir,
             QDir::cleanPath(QDir(dir.path()).absoluteFilePath(QStringLiteral("models"))));
}

void TestSettingsManager::testDefaultPathUsesGenericDataLocation()
{
    const QString path = nv::SettingsManager::settingsFilePath();
    QVERIFY(path.endsWith(QStringLiteral("/notevault/settings.json")));
    QVERIFY(path.startsWith(
        QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
