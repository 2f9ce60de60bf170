#include <QtTest/QtTest>
#include "core/shared/settings_manager.h"

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testSaveAndLoadRoundTrip();
    void testMissingFileReturnsNullopt();
    void testMalformedJsonReturnsNullopt();
    void testMissingKeysKeepDefaults();
    void testOutOfRangeValuesClamped();
    void testCandidateCapsAreIndependent();
    void testEnvironmentOverridesPath();
};

void TestSettingsManager::testDefaults()
{
    const dq::Settings settings;
    QCOMPARE(settings.chunkMaxSize, 1000);
    QCOMPARE(settings.chunkOverlap, 200);
    QCOMPARE(settings.semanticWeight, 0.6);
    QCOMPARE(settings.keywordWeight, 0.4);
    QCOMPARE(settings.cacheSimilarityThreshold, 0.85);
    QCOMPARE(settings.cacheRetentionDays, 90);
    QCOMPARE(settings.cacheMinHits, 3);
    QCOMPARE(settings.maxQuestionLength, 5000);
    QCOMPARE(settings.maxUploadBytes, static_cast<int64_t>(10 * 1024 * 1024));
}

void TestSettingsManager::testSaveAndLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + "/nested/settings.json";

    dq::Settings settings;
    settings.dbPath = dir.path() + "/docqa.db";
    settings.chunkMaxSize = 500;
    settings.semanticWeight = 0.7;
    settings.keywordWeight = 0.3;
    settings.cacheMinHits = 5;
    settings.maxUploadBytes = 2048;

    QVERIFY(dq::SettingsManager::saveTo(settings, path));
    const auto loaded = dq::SettingsManager::loadFrom(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->dbPath, settings.dbPath);
    QCOMPARE(loaded->chunkMaxSize, 500);
    QCOMPARE(loaded->semanticWeight, 0.7);
    QCOMPARE(loaded->keywordWeight, 0.3);
    QCOMPARE(loaded->cacheMinHits, 5);
    QCOMPARE(loaded->maxUploadBytes, static_cast<int64_t>(2048));
}

void TestSettingsManager::testMissingFileReturnsNullopt()
{
    QTemporaryDir dir;
    QVERIFY(!dq::SettingsManager::loadFrom(dir.path() + "/absent.json").has_value());
}

void TestSettingsManager::testMalformedJsonReturnsNullopt()
{
    QTemporaryDir dir;
    const QString path = dir.path() + "/settings.json";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QVERIFY(!dq::SettingsManager::loadFrom(path).has_value());
}

void TestSettingsManager::testMissingKeysKeepDefaults()
{
    QJsonObject json;
    json.insert(QStringLiteral("searchLimit"), 7);
    const dq::Settings settings = dq::SettingsManager::fromJson(json);
    QCOMPARE(settings.searchLimit, 7);
    QCOMPARE(settings.chunkOverlap, 200);
    QCOMPARE(settings.subSearchTimeoutMs, 2000);
    QVERIFY(settings.dbPath.isEmpty());
}

void TestSettingsManager::testOutOfRangeValuesClamped()
{
    QJsonObject json;
    json.insert(QStringLiteral("chunkMaxSize"), 0);
    json.insert(QStringLiteral("chunkOverlap"), -5);
    json.insert(QStringLiteral("embeddingWorkers"), 1000);
    json.insert(QStringLiteral("cacheSimilarityThreshold"), 3.0);
    json.insert(QStringLiteral("maxQuestionLength"), -1);

    const dq::Settings settings = dq::SettingsManager::fromJson(json);
    QCOMPARE(settings.chunkMaxSize, 1);
    QCOMPARE(settings.chunkOverlap, 0);
    QCOMPARE(settings.embeddingWorkers, 64);
    QCOMPARE(settings.cacheSimilarityThreshold, 1.0);
    QCOMPARE(settings.maxQuestionLength, 1);
}

void TestSettingsManager::testCandidateCapsAreIndependent()
{
    const dq::Settings defaults;
    QCOMPARE(defaults.semanticCandidates, 0);
    QCOMPARE(defaults.keywordCandidates, 0);

    QJsonObject json;
    json.insert(QStringLiteral("semanticCandidates"), 40);
    json.insert(QStringLiteral("keywordCandidates"), -3);
    const dq::Settings settings = dq::SettingsManager::fromJson(json);
    QCOMPARE(settings.semanticCandidates, 40);
    QCOMPARE(settings.keywordCandidates, 0);

    const QJsonObject saved = dq::SettingsManager::toJson(settings);
    QCOMPARE(saved.value(QStringLiteral("keywordCandidates")).toInt(), 0);
    QCOMPARE(saved.value(QStringLiteral("semanticCandidates")).toInt(), 40);
}

void TestSettingsManager::testEnvironmentOverridesPath()
{
    QTemporaryDir dir;
    const QString path = dir.path() + "/override.json";
    qputenv("DOCQA_SETTINGS", path.toUtf8());

    QCOMPARE(dq::SettingsManager::settingsFilePath(), path);
    dq::Settings settings;
    settings.searchLimit = 11;
    QVERIFY(dq::SettingsManager::save(settings));
    const auto loaded = dq::SettingsManager::load();
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->searchLimit, 11);

    qunsetenv("DOCQA_SETTINGS");
    QVERIFY(dq::SettingsManager::settingsFilePath() != path);
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
