#include <QtTest/QtTest>
#include "core/embedding/embedding_function.h"
#include "core/embedding/onnx_embedding_function.h"
#include "fake_embedding_function.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <cmath>

class TestEmbeddingFunction : public QObject {
    Q_OBJECT

private slots:
    void testModelDirectoryFor();
    void testCreateWithMissingModel();
    void testCreateRequiresModelAndField();
    void testInitializeWithBadModel();
    void testEmbedWithoutInit();
    void testDefaultEmbedBatchFailsAsAWhole();
    void testRealModelWhenAvailable();
};

void TestEmbeddingFunction::testModelDirectoryFor()
{
    QCOMPARE(nv::modelDirectoryFor(QStringLiteral("/opt/models"),
                                   QStringLiteral("Xenova/bge-base-en-v1.5")),
             QStringLiteral("/opt/models/Xenova__bge-base-en-v1.5"));
    QCOMPARE(nv::modelDirectoryFor(QStringLiteral("/opt/models"), QStringLiteral("local")),
             QStringLiteral("/opt/models/local"));
}

void TestEmbeddingFunction::testCreateWithMissingModel()
{
    QVERIFY(nv::createEmbeddingFunction(QStringLiteral("Xenova/bge-base-en-v1.5"),
                                        QStringLiteral("content"),
                                        QStringLiteral("/nonexistent/models"))
            == nullptr);
}

void TestEmbeddingFunction::testCreateRequiresModelAndField()
{
    QVERIFY(nv::createEmbeddingFunction(QString(), QStringLiteral("content"),
                                        QStringLiteral("/opt/models")) == nullptr);
    QVERIFY(nv::createEmbeddingFunction(QStringLiteral("m"), QString(),
                                        QStringLiteral("/opt/models")) == nullptr);
}

void TestEmbeddingFunction::testInitializeWithBadModel()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString modelPath = dir.filePath(QStringLiteral("model.onnx"));
    const QString vocabPath = dir.filePath(QStringLiteral("vocab.txt"));
    {
        QFile model(modelPath);
        QVERIFY(model.open(QIODevice::WriteOnly));
        model.write("not an onnx graph");
        QFile vocab(vocabPath);
        QVERIFY(vocab.open(QIODevice::WriteOnly));
        vocab.write("[PAD]\nhello\n");
    }

    nv::OnnxEmbeddingFunction function(QStringLiteral("bad"), QStringLiteral("content"));
    QVERIFY(!function.initialize(modelPath, vocabPath));
    QVERIFY(!function.isAvailable());
    QCOMPARE(function.dimensions(), 0);
    QVERIFY(function.embed(QStringLiteral("test")).empty());
}

void TestEmbeddingFunction::testEmbedWithoutInit()
{
    nv::OnnxEmbeddingFunction function(QStringLiteral("m"), QStringLiteral("content"));
    QCOMPARE(function.modelId(), QStringLiteral("m"));
    QCOMPARE(function.sourceField(), QStringLiteral("content"));
    QVERIFY(function.embed(QStringLiteral("hello")).empty());
    QVERIFY(function.embedBatch({QStringLiteral("hello"), QStringLiteral("world")}).empty());
}

void TestEmbeddingFunction::testDefaultEmbedBatchFailsAsAWhole()
{
    nv::test::FakeEmbeddingFunction function(8);
    function.setFailMarker(QStringLiteral("bad"));

    const auto ok = function.embedBatch({QStringLiteral("one"), QStringLiteral("two")});
    QCOMPARE(ok.size(), size_t(2));
    QCOMPARE(ok[0].size(), size_t(8));

    QVERIFY(function.embedBatch({QStringLiteral("one"), QStringLiteral("bad two")}).empty());
}

void TestEmbeddingFunction::testRealModelWhenAvailable()
{
    const QString modelsDir = qEnvironmentVariable("NOTEVAULT_MODELS_DIR");
    if (modelsDir.isEmpty()) {
        QSKIP("NOTEVAULT_MODELS_DIR not set");
    }

    auto function = nv::createEmbeddingFunction(QStringLiteral("Xenova/bge-base-en-v1.5"),
                                                QStringLiteral("content"), modelsDir);
    if (!function) {
        QSKIP("bge-base-en-v1.5 not installed under NOTEVAULT_MODELS_DIR");
    }
    QCOMPARE(function->dimensions(), 768);

    const std::vector<float> a = function->embed(QStringLiteral("how to water tomato plants"));
    const std::vector<float> b = function->embed(QStringLiteral("watering tomatoes in the garden"));
    const std::vector<float> c = function->embed(QStringLiteral("rust borrow checker lifetimes"));
    QCOMPARE(a.size(), size_t(768));

    double norm = 0.0;
    double ab = 0.0;
    double ac = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        norm += static_cast<double>(a[i]) * a[i];
        ab += static_cast<double>(a[i]) * b[i];
        ac += static_cast<double>(a[i]) * c[i];
    }
    QVERIFY(std::abs(norm - 1.0) < 1e-3);
    QVERIFY(ab > ac);

    const auto batch = function->embedBatch({QStringLiteral("one"), QStringLiteral("two words")});
    QCOMPARE(batch.size(), size_t(2));
}

QTEST_MAIN(TestEmbeddingFunction)
#include "test_embedding_function.moc"
