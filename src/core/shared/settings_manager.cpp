#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace dq {

namespace {

int readInt(const QJsonObject& json, const char* key, int fallback)
{
    const QString name = QLatin1String(key);
    if (!json.contains(name)) {
        return fallback;
    }
    return json.value(name).toVariant().toInt();
}

double readDouble(const QJsonObject& json, const char* key, double fallback)
{
    return json.value(QLatin1String(key)).toDouble(fallback);
}

} // namespace

Settings sanitizedSettings(Settings settings)
{
    settings.chunkMaxSize = std::max(settings.chunkMaxSize, 1);
    settings.chunkOverlap = std::max(settings.chunkOverlap, 0);
    settings.embeddingDimensions = std::max(settings.embeddingDimensions, 1);
    settings.embeddingWorkers = std::clamp(settings.embeddingWorkers, 1, 64);
    settings.semanticWeight = std::max(settings.semanticWeight, 0.0);
    settings.keywordWeight = std::max(settings.keywordWeight, 0.0);
    settings.searchLimit = std::max(settings.searchLimit, 0);
    settings.semanticScoreFloor = std::clamp(settings.semanticScoreFloor, -1.0, 1.0);
    settings.keywordRankScale = std::max(settings.keywordRankScale, 0.0);
    settings.semanticCandidates = std::max(settings.semanticCandidates, 0);
    settings.keywordCandidates = std::max(settings.keywordCandidates, 0);
    settings.subSearchTimeoutMs = std::max(settings.subSearchTimeoutMs, 1);
    settings.cacheSimilarityThreshold = std::clamp(settings.cacheSimilarityThreshold, -1.0, 1.0);
    settings.cacheRetentionDays = std::max(settings.cacheRetentionDays, 0);
    settings.cacheMinHits = std::max(settings.cacheMinHits, 0);
    settings.maxUploadBytes = std::max<int64_t>(settings.maxUploadBytes, 1);
    settings.maxQuestionLength = std::max(settings.maxQuestionLength, 1);
    return settings;
}

std::optional<Settings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(dqCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(dqCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(dqCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(dqCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(dqCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("DOCQA_SETTINGS");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/docqa/settings.json");
}

QString SettingsManager::defaultDatabasePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/docqa/docqa.db");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("chunkMaxSize"), settings.chunkMaxSize);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("embeddingWorkers"), settings.embeddingWorkers);
    json.insert(QStringLiteral("semanticWeight"), settings.semanticWeight);
    json.insert(QStringLiteral("keywordWeight"), settings.keywordWeight);
    json.insert(QStringLiteral("searchLimit"), settings.searchLimit);
    json.insert(QStringLiteral("semanticScoreFloor"), settings.semanticScoreFloor);
    json.insert(QStringLiteral("keywordRankScale"), settings.keywordRankScale);
    json.insert(QStringLiteral("semanticCandidates"), settings.semanticCandidates);
    json.insert(QStringLiteral("keywordCandidates"), settings.keywordCandidates);
    json.insert(QStringLiteral("subSearchTimeoutMs"), settings.subSearchTimeoutMs);
    json.insert(QStringLiteral("cacheSimilarityThreshold"), settings.cacheSimilarityThreshold);
    json.insert(QStringLiteral("cacheRetentionDays"), settings.cacheRetentionDays);
    json.insert(QStringLiteral("cacheMinHits"), settings.cacheMinHits);
    json.insert(QStringLiteral("maxUploadBytes"), static_cast<qint64>(settings.maxUploadBytes));
    json.insert(QStringLiteral("maxQuestionLength"), settings.maxQuestionLength);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);

    settings.chunkMaxSize = readInt(json, "chunkMaxSize", settings.chunkMaxSize);
    settings.chunkOverlap = readInt(json, "chunkOverlap", settings.chunkOverlap);
    settings.embeddingDimensions = readInt(json, "embeddingDimensions", settings.embeddingDimensions);
    settings.embeddingWorkers = readInt(json, "embeddingWorkers", settings.embeddingWorkers);

    settings.semanticWeight = readDouble(json, "semanticWeight", settings.semanticWeight);
    settings.keywordWeight = readDouble(json, "keywordWeight", settings.keywordWeight);
    settings.searchLimit = readInt(json, "searchLimit", settings.searchLimit);
    settings.semanticScoreFloor = readDouble(json, "semanticScoreFloor", settings.semanticScoreFloor);
    settings.keywordRankScale = readDouble(json, "keywordRankScale", settings.keywordRankScale);
    settings.semanticCandidates = readInt(json, "semanticCandidates", settings.semanticCandidates);
    settings.keywordCandidates = readInt(json, "keywordCandidates", settings.keywordCandidates);
    settings.subSearchTimeoutMs = readInt(json, "subSearchTimeoutMs", settings.subSearchTimeoutMs);

    settings.cacheSimilarityThreshold =
        readDouble(json, "cacheSimilarityThreshold", settings.cacheSimilarityThreshold);
    settings.cacheRetentionDays = readInt(json, "cacheRetentionDays", settings.cacheRetentionDays);
    settings.cacheMinHits = readInt(json, "cacheMinHits", settings.cacheMinHits);

    if (json.contains(QStringLiteral("maxUploadBytes"))) {
        settings.maxUploadBytes = static_cast<int64_t>(
            json.value(QStringLiteral("maxUploadBytes")).toVariant().toLongLong());
    }
    settings.maxQuestionLength = readInt(json, "maxQuestionLength", settings.maxQuestionLength);

    return sanitizedSettings(settings);
}

} // namespace dq
