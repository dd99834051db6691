#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include "utils/TestUtils.hpp"
#include "utils/MockComponents.hpp"
#include "../src/core/models/ModelCache.hpp"

#include <algorithm>

using namespace Parfetch;
using namespace Parfetch::Test;

// Archive tests need the unzip tool. A missing tool is logged and the test skipped,
// unless PARFETCH_REQUIRE_UNZIP is set, in which case the test fails.
#define REQUIRE_UNZIP() \
    do { \
        if (!ArchiveExtractor().isAvailable()) { \
            if (qEnvironmentVariableIsSet("PARFETCH_REQUIRE_UNZIP")) { \
                QFAIL("unzip is not installed"); \
            } \
            qWarning("unzip not found on PATH, archive extraction is not exercised by %s", \
                     QTest::currentTestFunction()); \
            TestUtils::logMessage(QString("Skipped %1: unzip is not installed").arg(QTest::currentTestFunction())); \
            QSKIP("unzip is not installed"); \
        } \
    } while (0)

class TestModelCache : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    void testModelPath();
    void testIsDownloadNeeded();
    void testEnsureHuggingfaceModel();
    void testUpToDateModelIsNotFetched();
    void testVersionChangeRefetches();
    void testFailedFileIsRemoved();
    void testPartialFileKeptWhenConfigured();
    void testUnknownModel();
    void testEnsureAllBoundsParallelModels();
    void testEnsureAllReportsFirstFailure();
    void testCleanDirectory();
    void testArchiveModel();
    void testArchiveTopLevelDirectoryIsStripped();
    void testCorruptArchive();

private:
    ModelEntry hfEntry(const QString& name, const QString& directory, const QString& version,
                       const QStringList& files) const;
    void publish(FakeOrigin& origin, const ModelEntry& entry, const QList<QByteArray>& contents) const;
    DownloadRequest smallChunks() const;
};

void TestModelCache::initTestCase() {
    TestUtils::initializeTestEnvironment();
}

void TestModelCache::cleanupTestCase() {
    TestUtils::cleanupTestEnvironment();
}

ModelEntry TestModelCache::hfEntry(const QString& name, const QString& directory, const QString& version,
                                   const QStringList& files) const {
    HuggingfaceSource source;
    source.repo = "org/" + name;
    source.files = files;

    ModelEntry entry;
    entry.name = name;
    entry.directory = directory;
    entry.version = version;
    entry.source = source;
    return entry;
}

void TestModelCache::publish(FakeOrigin& origin, const ModelEntry& entry, const QList<QByteArray>& contents) const {
    const auto& source = std::get<HuggingfaceSource>(entry.source);
    const auto urls = source.fileUrls();
    for (std::size_t i = 0; i < urls.size(); ++i) {
        origin.addResource(urls[i].second.path(), contents.value(static_cast<int>(i)));
    }
}

DownloadRequest TestModelCache::smallChunks() const {
    DownloadRequest defaults;
    defaults.chunkSize = 100;
    defaults.maxFiles = 4;
    return defaults;
}

void TestModelCache::testModelPath() {
    ModelRegistry registry;
    FakeOrigin origin;
    ModelCache cache("/var/cache/parfetch/", registry, origin);

    const ModelEntry entry = hfEntry("tiny", "whisper/tiny", "1", {"a.bin"});
    QCOMPARE(cache.modelPath(entry), QString("/var/cache/parfetch/whisper/tiny"));
}

void TestModelCache::testIsDownloadNeeded() {
    TEST_SCOPE("testIsDownloadNeeded");
    ModelRegistry registry;
    FakeOrigin origin;
    ModelCache cache(_testScope.getTempDirectory(), registry, origin);

    const ModelEntry entry = hfEntry("tiny", "tiny", "3", {"a.bin"});
    QVERIFY(cache.isDownloadNeeded(entry));

    QVERIFY(QDir().mkpath(cache.modelPath(entry)));
    QVERIFY(cache.isDownloadNeeded(entry));

    const QString marker = QDir(cache.modelPath(entry)).filePath("version");
    QVERIFY(TestUtils::writeFile(marker, "2"));
    QVERIFY(cache.isDownloadNeeded(entry));

    QVERIFY(TestUtils::writeFile(marker, "3"));
    QVERIFY(!cache.isDownloadNeeded(entry));
}

void TestModelCache::testEnsureHuggingfaceModel() {
    TEST_SCOPE("testEnsureHuggingfaceModel");
    const QByteArray config = TestUtils::generateRandomData(1000, 1);
    const QByteArray encoder = TestUtils::generateRandomData(250, 2);

    ModelRegistry registry;
    const ModelEntry entry = hfEntry("tiny", "whisper/tiny", "3", {"config.json", "onnx/encoder.onnx"});
    registry.registerModel(entry);

    FakeOrigin origin;
    publish(origin, entry, {config, encoder});

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    cache.setDownloadDefaults(smallChunks());

    QSignalSpy startedSpy(&cache, &ModelCache::modelStarted);
    QSignalSpy fileSpy(&cache, &ModelCache::fileStarted);
    QSignalSpy finishedSpy(&cache, &ModelCache::modelFinished);
    qint64 progressed = 0;
    connect(&cache, &ModelCache::progress, this, [&progressed](const QString&, qint64 delta) {
        progressed += delta;
    });

    auto path = cache.ensureModel("tiny");
    ASSERT_EXPECTED_VALUE(path);

    const QDir dir(path.value());
    QCOMPARE(path.value(), cache.modelPath(entry));
    QCOMPARE(TestUtils::readFile(dir.filePath("config.json")), config);
    QCOMPARE(TestUtils::readFile(dir.filePath("onnx/encoder.onnx")), encoder);
    QCOMPARE(TestUtils::readFile(dir.filePath("version")), QByteArray("3"));
    QVERIFY(!cache.isDownloadNeeded(entry));

    QCOMPARE(startedSpy.count(), 1);
    QCOMPARE(fileSpy.count(), 2);
    QCOMPARE(fileSpy.at(0).at(1).toString(), QString("config.json"));
    QCOMPARE(fileSpy.at(0).at(2).toLongLong(), qint64(1000));
    QCOMPARE(fileSpy.at(1).at(1).toString(), QString("onnx/encoder.onnx"));
    QCOMPARE(progressed, qint64(1250));
    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(finishedSpy.at(0).at(1).toBool(), true);
}

void TestModelCache::testUpToDateModelIsNotFetched() {
    TEST_SCOPE("testUpToDateModelIsNotFetched");
    ModelRegistry registry;
    const ModelEntry entry = hfEntry("tiny", "tiny", "1", {"a.bin"});
    registry.registerModel(entry);

    FakeOrigin origin;
    publish(origin, entry, {TestUtils::generateRandomData(300)});

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    cache.setDownloadDefaults(smallChunks());
    ASSERT_EXPECTED_VALUE(cache.ensureModel("tiny"));

    origin.resetStatistics();
    QSignalSpy startedSpy(&cache, &ModelCache::modelStarted);

    ASSERT_EXPECTED_VALUE(cache.ensureModel("tiny"));
    ASSERT_EXPECTED_VALUE(cache.ensureAll());
    QCOMPARE(origin.requestCount(), 0);
    QCOMPARE(startedSpy.count(), 0);
}

void TestModelCache::testVersionChangeRefetches() {
    TEST_SCOPE("testVersionChangeRefetches");
    ModelRegistry registry;
    ModelEntry entry = hfEntry("tiny", "tiny", "1", {"a.bin"});
    registry.registerModel(entry);

    FakeOrigin origin;
    publish(origin, entry, {TestUtils::generateRandomData(300, 7)});

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    cache.setDownloadDefaults(smallChunks());
    auto first = cache.ensureModel("tiny");
    ASSERT_EXPECTED_VALUE(first);

    // Leftovers of the previous version must not survive a refetch.
    const QString leftover = QDir(first.value()).filePath("old-weights.bin");
    QVERIFY(TestUtils::writeFile(leftover, "stale"));

    entry.version = "2";
    registry.registerModel(entry);
    const QByteArray updated = TestUtils::generateRandomData(420, 8);
    publish(origin, entry, {updated});

    auto second = cache.ensureModel("tiny");
    ASSERT_EXPECTED_VALUE(second);
    QCOMPARE(TestUtils::readFile(QDir(second.value()).filePath("a.bin")), updated);
    QCOMPARE(TestUtils::readFile(QDir(second.value()).filePath("version")), QByteArray("2"));
    ASSERT_FILE_NOT_EXISTS(leftover);
}

void TestModelCache::testFailedFileIsRemoved() {
    TEST_SCOPE("testFailedFileIsRemoved");
    ModelRegistry registry;
    const ModelEntry entry = hfEntry("tiny", "tiny", "1", {"small.json", "weights.bin"});
    registry.registerModel(entry);

    FakeOrigin origin;
    publish(origin, entry, {TestUtils::generateRandomData(50), TestUtils::generateRandomData(1000)});
    origin.failChunk(500, -1);

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    cache.setDownloadDefaults(smallChunks());
    QSignalSpy finishedSpy(&cache, &ModelCache::modelFinished);

    ASSERT_EXPECTED_ERROR(cache.ensureModel("tiny"), ModelError::DownloadFailed);

    QVERIFY(cache.lastDownloadError().has_value());
    QCOMPARE(cache.lastDownloadError()->kind, DownloadErrorKind::StatusError);
    QCOMPARE(cache.lastDownloadError()->httpStatus, 500);

    const QDir dir(cache.modelPath(entry));
    ASSERT_FILE_EXISTS(dir.filePath("small.json"));
    ASSERT_FILE_NOT_EXISTS(dir.filePath("weights.bin"));
    ASSERT_FILE_NOT_EXISTS(dir.filePath("version"));
    QVERIFY(cache.isDownloadNeeded(entry));

    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(finishedSpy.at(0).at(1).toBool(), false);
}

void TestModelCache::testPartialFileKeptWhenConfigured() {
    TEST_SCOPE("testPartialFileKeptWhenConfigured");
    ModelRegistry registry;
    const ModelEntry entry = hfEntry("tiny", "tiny", "1", {"weights.bin"});
    registry.registerModel(entry);

    const QByteArray weights = TestUtils::generateRandomData(1000);
    FakeOrigin origin;
    publish(origin, entry, {weights});
    origin.failChunk(500, -1, FakeOrigin::Failure::TransportError);

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    cache.setDownloadDefaults(smallChunks());
    cache.setRemovePartialOnFailure(false);

    ASSERT_EXPECTED_ERROR(cache.ensureModel("tiny"), ModelError::DownloadFailed);
    QCOMPARE(cache.lastDownloadError()->kind, DownloadErrorKind::TransportError);

    const QString partial = QDir(cache.modelPath(entry)).filePath("weights.bin");
    ASSERT_FILE_EXISTS(partial);
    QCOMPARE(TestUtils::readFile(partial).left(500), weights.left(500));
}

void TestModelCache::testUnknownModel() {
    TEST_SCOPE("testUnknownModel");
    ModelRegistry registry;
    FakeOrigin origin;
    ModelCache cache(_testScope.getTempDirectory(), registry, origin);

    ASSERT_EXPECTED_ERROR(cache.ensureModel("nope"), ModelError::ModelNotFound);
    QCOMPARE(origin.requestCount(), 0);
}

void TestModelCache::testEnsureAllBoundsParallelModels() {
    TEST_SCOPE("testEnsureAllBoundsParallelModels");
    ModelRegistry registry;
    FakeOrigin origin;
    origin.setResponseDelayMs(5);

    for (const QString& name : {QString("a"), QString("b"), QString("c")}) {
        const ModelEntry entry = hfEntry(name, "models/" + name, "1", {"w0.bin", "w1.bin"});
        registry.registerModel(entry);
        publish(origin, entry, {TestUtils::generateRandomData(300), TestUtils::generateRandomData(200)});
    }

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    cache.setDownloadDefaults(smallChunks());

    int active = 0;
    int peak = 0;
    connect(&cache, &ModelCache::modelStarted, this, [&](const QString&) {
        peak = std::max(peak, ++active);
    });
    connect(&cache, &ModelCache::modelFinished, this, [&](const QString&, bool) { --active; });

    ASSERT_EXPECTED_VALUE(cache.ensureAll(2));
    QCOMPARE(peak, 2);
    QCOMPARE(active, 0);

    for (const ModelEntry& entry : registry.entries()) {
        QVERIFY2(!cache.isDownloadNeeded(entry), qPrintable(entry.name));
    }
}

void TestModelCache::testEnsureAllReportsFirstFailure() {
    TEST_SCOPE("testEnsureAllReportsFirstFailure");
    ModelRegistry registry;
    const ModelEntry good = hfEntry("good", "good", "1", {"a.bin"});
    const ModelEntry missing = hfEntry("missing", "missing", "1", {"a.bin"});
    registry.registerModels({good, missing});

    FakeOrigin origin;
    publish(origin, good, {TestUtils::generateRandomData(150)});

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    cache.setDownloadDefaults(smallChunks());

    ASSERT_EXPECTED_ERROR(cache.ensureAll(2), ModelError::DownloadFailed);
    QCOMPARE(cache.lastDownloadError()->kind, DownloadErrorKind::ProbeError);
    QCOMPARE(cache.lastDownloadError()->httpStatus, 404);
    QVERIFY(!cache.isDownloadNeeded(good));
    QVERIFY(cache.isDownloadNeeded(missing));
}

void TestModelCache::testCleanDirectory() {
    TEST_SCOPE("testCleanDirectory");
    const QString root = _testScope.getTempDirectory();
    const QDir rootDir(root);

    ModelRegistry registry;
    registry.registerModel(hfEntry("tiny", "whisper/tiny", "1", {"a.bin"}));
    registry.registerModel(hfEntry("vad", "vad", "1", {"a.bin"}));

    QVERIFY(TestUtils::writeFile(rootDir.filePath("whisper/tiny/a.bin"), "keep"));
    QVERIFY(TestUtils::writeFile(rootDir.filePath("whisper/base/a.bin"), "drop"));
    QVERIFY(TestUtils::writeFile(rootDir.filePath("whisper/notes.txt"), "drop"));
    QVERIFY(TestUtils::writeFile(rootDir.filePath("vad/model.onnx"), "keep"));
    QVERIFY(TestUtils::writeFile(rootDir.filePath("stray.txt"), "drop"));
    QVERIFY(TestUtils::writeFile(rootDir.filePath("old/deep/file.bin"), "drop"));

    FakeOrigin origin;
    ModelCache cache(root, registry, origin);
    ASSERT_EXPECTED_VALUE(cache.cleanDirectory());

    ASSERT_FILE_EXISTS(rootDir.filePath("whisper/tiny/a.bin"));
    ASSERT_FILE_EXISTS(rootDir.filePath("vad/model.onnx"));
    ASSERT_FILE_NOT_EXISTS(rootDir.filePath("whisper/base"));
    ASSERT_FILE_NOT_EXISTS(rootDir.filePath("whisper/notes.txt"));
    ASSERT_FILE_NOT_EXISTS(rootDir.filePath("stray.txt"));
    ASSERT_FILE_NOT_EXISTS(rootDir.filePath("old"));
}

void TestModelCache::testArchiveModel() {
    REQUIRE_UNZIP();
    TEST_SCOPE("testArchiveModel");

    const QByteArray weights = TestUtils::generateRandomData(700);
    const QByteArray zip = TestUtils::buildStoredZip({{"model.onnx", weights}, {"conf/params.txt", "beam=5"}});

    ModelEntry entry;
    entry.name = "vad";
    entry.directory = "vad";
    entry.version = "4";
    entry.source = ArchiveSource{QUrl("https://models.test/vad.zip")};

    ModelRegistry registry;
    registry.registerModel(entry);

    FakeOrigin origin;
    origin.addResource("/vad.zip", zip);

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    cache.setDownloadDefaults(smallChunks());

    auto path = cache.ensureModel("vad");
    ASSERT_EXPECTED_VALUE(path);

    const QDir dir(path.value());
    QCOMPARE(TestUtils::readFile(dir.filePath("model.onnx")), weights);
    QCOMPARE(TestUtils::readFile(dir.filePath("conf/params.txt")), QByteArray("beam=5"));
    QCOMPARE(TestUtils::readFile(dir.filePath("version")), QByteArray("4"));
    ASSERT_FILE_NOT_EXISTS(dir.filePath("archive"));

    // Two top-level entries: nothing is stripped and no staging directory is left.
    const QStringList entries = dir.entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Name);
    QCOMPARE(entries, (QStringList{"conf", "model.onnx", "version"}));
}

void TestModelCache::testArchiveTopLevelDirectoryIsStripped() {
    REQUIRE_UNZIP();
    TEST_SCOPE("testArchiveTopLevelDirectoryIsStripped");

    const QByteArray weights = TestUtils::generateRandomData(900, 7);
    const QByteArray zip = TestUtils::buildStoredZip({{"silero-vad-v4/model.onnx", weights},
                                                      {"silero-vad-v4/conf/params.txt", "threshold=0.5"}});

    ModelEntry entry;
    entry.name = "vad";
    entry.directory = "vad";
    entry.version = "5";
    entry.source = ArchiveSource{QUrl("https://models.test/silero-vad-v4.zip")};

    ModelRegistry registry;
    registry.registerModel(entry);

    FakeOrigin origin;
    origin.addResource("/silero-vad-v4.zip", zip);

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    cache.setDownloadDefaults(smallChunks());

    auto path = cache.ensureModel("vad");
    ASSERT_EXPECTED_VALUE(path);

    const QDir dir(path.value());
    QCOMPARE(TestUtils::readFile(dir.filePath("model.onnx")), weights);
    QCOMPARE(TestUtils::readFile(dir.filePath("conf/params.txt")), QByteArray("threshold=0.5"));
    ASSERT_FILE_NOT_EXISTS(dir.filePath("silero-vad-v4"));
    ASSERT_FILE_NOT_EXISTS(dir.filePath("archive"));

    const QStringList entries = dir.entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Name);
    QCOMPARE(entries, (QStringList{"conf", "model.onnx", "version"}));
}

void TestModelCache::testCorruptArchive() {
    REQUIRE_UNZIP();
    TEST_SCOPE("testCorruptArchive");

    ModelEntry entry;
    entry.name = "vad";
    entry.directory = "vad";
    entry.version = "4";
    entry.source = ArchiveSource{QUrl("https://models.test/vad.zip")};

    ModelRegistry registry;
    registry.registerModel(entry);

    FakeOrigin origin;
    origin.addResource("/vad.zip", QByteArray("this is not a zip archive"));

    ModelCache cache(_testScope.getTempDirectory(), registry, origin);
    ASSERT_EXPECTED_ERROR(cache.ensureModel("vad"), ModelError::ExtractionFailed);

    const QDir dir(cache.modelPath(entry));
    ASSERT_FILE_NOT_EXISTS(dir.filePath("archive"));
    ASSERT_FILE_NOT_EXISTS(dir.filePath("version"));
}

int runTestModelCache(int argc, char** argv) {
    TestModelCache test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_model_cache.moc"
