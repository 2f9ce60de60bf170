#include "core/embedding/embedding_client.h"
#include "core/embedding/hashing_embedding_provider.h"
#include "core/engine/qa_engine.h"
#include "core/extraction/plain_text_extractor.h"
#include "core/generation/extractive_answer_generator.h"
#include "core/index/sqlite_store.h"
#include "core/indexing/ingestion_pipeline.h"
#include "core/query/answer_service.h"
#include "core/shared/settings_manager.h"
#include "core/vector/retrieval_store.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMimeDatabase>
#include <QTextStream>

#include <chrono>
#include <cstdio>

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitFailed = 1,
    kExitUsage = 2,
};

void printJson(const QJsonObject& object)
{
    QTextStream out(stdout);
    out << QJsonDocument(object).toJson(QJsonDocument::Indented);
}

int printError(const QString& message, int code = kExitFailed)
{
    QTextStream err(stderr);
    err << "docqa: " << message << Qt::endl;
    return code;
}

QJsonObject errorToJson(const dq::Error& error)
{
    QJsonObject object;
    object[QStringLiteral("kind")] = dq::errorKindToString(error.kind);
    object[QStringLiteral("message")] = error.message;
    return object;
}

QJsonObject documentToJson(const dq::Document& document)
{
    QJsonObject object;
    object[QStringLiteral("id")] = static_cast<qint64>(document.id);
    object[QStringLiteral("filename")] = document.filename;
    object[QStringLiteral("mediaType")] = document.mediaType;
    object[QStringLiteral("sizeBytes")] = static_cast<qint64>(document.sizeBytes);
    object[QStringLiteral("status")] = dq::documentStatusToString(document.status);
    if (document.errorMessage) {
        object[QStringLiteral("error")] = *document.errorMessage;
    }
    object[QStringLiteral("visibleTo")] = QJsonArray::fromStringList(document.visibleTo.toStringList());
    object[QStringLiteral("createdAt")] = document.createdAt.toString(Qt::ISODate);
    object[QStringLiteral("updatedAt")] = document.updatedAt.toString(Qt::ISODate);
    return object;
}

QJsonObject ingestToJson(int64_t documentId, const dq::IngestResult& result)
{
    QJsonObject object;
    object[QStringLiteral("documentId")] = static_cast<qint64>(documentId);
    object[QStringLiteral("result")] = dq::ingestStatusToString(result.status);
    object[QStringLiteral("chunksCreated")] = result.chunksCreated;
    object[QStringLiteral("embeddingsStored")] = result.embeddingsStored;
    object[QStringLiteral("durationMs")] = result.durationMs;
    if (result.error) {
        object[QStringLiteral("error")] = errorToJson(*result.error);
    }
    return object;
}

int ingestExitCode(const dq::IngestResult& result)
{
    switch (result.status) {
    case dq::IngestResult::Status::Completed:
    case dq::IngestResult::Status::AlreadyCompleted:
        return kExitOk;
    default:
        return kExitFailed;
    }
}

bool parseId(const QString& text, int64_t& id)
{
    bool ok = false;
    id = text.toLongLong(&ok);
    return ok && id > 0;
}

dq::Deadline deadlineFrom(const QCommandLineParser& parser, const QCommandLineOption& option)
{
    bool ok = false;
    const int timeoutMs = parser.value(option).toInt(&ok);
    if (!ok || timeoutMs <= 0) {
        return dq::Deadline::never();
    }
    return dq::Deadline::after(std::chrono::milliseconds(timeoutMs));
}

// ── Commands ────────────────────────────────────────────────

int runIngest(dq::QaEngine& engine, const QStringList& args,
              const QCommandLineParser& parser, const QCommandLineOption& visibleTo,
              const QCommandLineOption& mediaTypeOption, const dq::Deadline& deadline)
{
    if (args.size() != 2) {
        return printError(QStringLiteral("usage: docqa ingest <file>"), kExitUsage);
    }

    const QFileInfo info(args.at(1));
    QFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::ReadOnly)) {
        return printError(QStringLiteral("cannot read %1").arg(info.absoluteFilePath()));
    }
    const QByteArray raw = file.readAll();

    dq::UploadRequest upload;
    upload.filename = info.fileName();
    upload.sizeBytes = raw.size();
    upload.mediaType = parser.isSet(mediaTypeOption)
        ? parser.value(mediaTypeOption)
        : QMimeDatabase().mimeTypeForFile(info).name();
    upload.storagePath = info.absoluteFilePath();
    upload.visibleTo = dq::VisibilitySet::fromStringList(
        parser.value(visibleTo).split(QLatin1Char(','), Qt::SkipEmptyParts));

    const dq::RegisterResult registered = engine.pipeline().registerDocument(upload);
    if (!registered.ok()) {
        return printError(registered.error->describe(), kExitUsage);
    }

    const dq::IngestResult result =
        engine.pipeline().ingestRaw(*registered.documentId, raw, upload.mediaType, deadline);
    printJson(ingestToJson(*registered.documentId, result));
    return ingestExitCode(result);
}

int runResume(dq::QaEngine& engine, const QStringList& args, const dq::Deadline& deadline)
{
    int64_t id = 0;
    if (args.size() != 2 || !parseId(args.at(1), id)) {
        return printError(QStringLiteral("usage: docqa resume <document-id>"), kExitUsage);
    }
    const dq::IngestResult result = engine.pipeline().resume(id, deadline);
    printJson(ingestToJson(id, result));
    return ingestExitCode(result);
}

int runAsk(dq::QaEngine& engine, const QStringList& args,
           const QCommandLineParser& parser, const QCommandLineOption& roleOption,
           const dq::Deadline& deadline)
{
    if (args.size() < 2) {
        return printError(QStringLiteral("usage: docqa ask <question>"), kExitUsage);
    }
    const auto role = dq::roleTagFromString(parser.value(roleOption));
    if (!role) {
        return printError(QStringLiteral("unknown role '%1'").arg(parser.value(roleOption)),
                          kExitUsage);
    }

    const QString question = args.mid(1).join(QLatin1Char(' '));
    const dq::AnswerResult result = engine.answers().ask(question, *role, deadline);
    if (!result.ok()) {
        QJsonObject object;
        object[QStringLiteral("error")] = errorToJson(*result.error);
        printJson(object);
        return result.error->kind == dq::ErrorKind::Validation ? kExitUsage : kExitFailed;
    }

    QJsonObject object;
    object[QStringLiteral("answer")] = result.answer;
    object[QStringLiteral("sources")] = result.sources;
    object[QStringLiteral("fromCache")] = result.fromCache;
    object[QStringLiteral("insufficientInformation")] = result.insufficientInformation;
    object[QStringLiteral("degraded")] = result.degraded;
    printJson(object);
    return kExitOk;
}

int runStatus(dq::QaEngine& engine, const QStringList& args)
{
    dq::SQLiteStore& store = engine.store();
    if (args.size() == 2) {
        int64_t id = 0;
        if (!parseId(args.at(1), id)) {
            return printError(QStringLiteral("usage: docqa status [document-id]"), kExitUsage);
        }
        const auto document = store.getDocument(id);
        if (!document) {
            return printError(QStringLiteral("document %1 not found").arg(id));
        }
        QJsonObject object = documentToJson(*document);
        object[QStringLiteral("chunks")] = store.countChunks(id);
        object[QStringLiteral("embeddings")] = store.countEmbeddings(id);
        printJson(object);
        return kExitOk;
    }

    QJsonArray documents;
    for (const dq::Document& document : store.listDocuments()) {
        documents.append(documentToJson(document));
    }
    const dq::EmbeddingClient::Stats embedStats = engine.embedder().stats();
    QJsonObject object;
    object[QStringLiteral("documents")] = documents;
    object[QStringLiteral("cacheEntries")] = store.countCacheEntries();
    object[QStringLiteral("indexedVectors")] =
        static_cast<qint64>(engine.retrieval().vectorIndex().totalElements()
                            - engine.retrieval().vectorIndex().deletedElements());
    object[QStringLiteral("embeddingModel")] = engine.embedder().modelId();
    object[QStringLiteral("embeddingRequests")] = static_cast<qint64>(embedStats.requests);
    printJson(object);
    return kExitOk;
}

int runDelete(dq::QaEngine& engine, const QStringList& args)
{
    int64_t id = 0;
    if (args.size() != 2 || !parseId(args.at(1), id)) {
        return printError(QStringLiteral("usage: docqa delete <document-id>"), kExitUsage);
    }
    if (!engine.pipeline().deleteDocument(id)) {
        return printError(QStringLiteral("document %1 not deleted").arg(id));
    }
    return kExitOk;
}

int runVisibility(dq::QaEngine& engine, const QStringList& args)
{
    int64_t id = 0;
    if (args.size() != 3 || !parseId(args.at(1), id)) {
        return printError(QStringLiteral("usage: docqa visibility <document-id> <role,role,...>"),
                          kExitUsage);
    }
    const dq::VisibilitySet visibleTo = dq::VisibilitySet::fromStringList(
        args.at(2).split(QLatin1Char(','), Qt::SkipEmptyParts));
    if (!engine.store().updateDocumentVisibility(id, visibleTo)) {
        return printError(QStringLiteral("document %1 not found").arg(id));
    }
    QJsonObject object;
    object[QStringLiteral("documentId")] = static_cast<qint64>(id);
    object[QStringLiteral("visibleTo")] = QJsonArray::fromStringList(visibleTo.toStringList());
    printJson(object);
    return kExitOk;
}

int runPrune(dq::QaEngine& engine)
{
    const auto removed = engine.pruneCache();
    if (!removed) {
        return printError(QStringLiteral("cache prune failed"));
    }
    QJsonObject object;
    object[QStringLiteral("removed")] = *removed;
    printJson(object);
    return kExitOk;
}

int runCustomerQuery(dq::QaEngine& engine, const QStringList& args,
                     const QCommandLineParser& parser, const QCommandLineOption& nameOption,
                     const QCommandLineOption& emailOption)
{
    const QString usage = QStringLiteral(
        "usage: docqa customer-query add <question> --name N --email E | "
        "list [status] | set <id> <responded|archived>");
    if (args.size() < 2) {
        return printError(usage, kExitUsage);
    }

    const QString action = args.at(1);
    if (action == QLatin1String("add") && args.size() >= 3) {
        const dq::CustomerQueryResult result = engine.answers().captureCustomerQuery(
            args.mid(2).join(QLatin1Char(' ')), parser.value(nameOption),
            parser.value(emailOption));
        if (!result.ok()) {
            return printError(result.error->describe(), kExitUsage);
        }
        QJsonObject object;
        object[QStringLiteral("id")] = static_cast<qint64>(*result.id);
        object[QStringLiteral("status")] = QStringLiteral("pending");
        printJson(object);
        return kExitOk;
    }

    if (action == QLatin1String("list")) {
        std::optional<dq::CustomerQueryStatus> filter;
        if (args.size() >= 3) {
            filter = dq::customerQueryStatusFromString(args.at(2));
            if (!filter) {
                return printError(usage, kExitUsage);
            }
        }
        QJsonArray queries;
        for (const dq::CustomerQuery& query : engine.store().listCustomerQueries(filter)) {
            QJsonObject object;
            object[QStringLiteral("id")] = static_cast<qint64>(query.id);
            object[QStringLiteral("question")] = query.question;
            object[QStringLiteral("name")] = query.customerName;
            object[QStringLiteral("email")] = query.customerEmail;
            object[QStringLiteral("status")] = dq::customerQueryStatusToString(query.status);
            object[QStringLiteral("createdAt")] = query.createdAt.toString(Qt::ISODate);
            queries.append(object);
        }
        QJsonObject object;
        object[QStringLiteral("customerQueries")] = queries;
        printJson(object);
        return kExitOk;
    }

    int64_t id = 0;
    if (action == QLatin1String("set") && args.size() == 4 && parseId(args.at(2), id)) {
        const auto status = dq::customerQueryStatusFromString(args.at(3));
        if (!status) {
            return printError(usage, kExitUsage);
        }
        const dq::CustomerQueryResult result = engine.answers().setCustomerQueryStatus(id, *status);
        if (!result.ok()) {
            return printError(result.error->describe());
        }
        return kExitOk;
    }

    return printError(usage, kExitUsage);
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("docqa"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Document question answering over a local index"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("ingest | resume | ask | status | delete | visibility | prune | customer-query"));

    const QCommandLineOption settingsOption(
        QStringLiteral("settings"), QStringLiteral("Settings JSON file."), QStringLiteral("path"));
    const QCommandLineOption dbOption(
        QStringLiteral("db"), QStringLiteral("Database file (overrides settings)."),
        QStringLiteral("path"));
    const QCommandLineOption roleOption(
        QStringLiteral("role"), QStringLiteral("Caller role for ask: owner, staff or external."),
        QStringLiteral("role"), QStringLiteral("owner"));
    const QCommandLineOption visibleToOption(
        QStringLiteral("visible-to"), QStringLiteral("Comma separated roles allowed to see the document."),
        QStringLiteral("roles"), QStringLiteral("owner"));
    const QCommandLineOption mediaTypeOption(
        QStringLiteral("media-type"), QStringLiteral("Media type of the ingested file."),
        QStringLiteral("type"));
    const QCommandLineOption timeoutOption(
        QStringLiteral("timeout-ms"), QStringLiteral("Deadline for ingest, resume and ask."),
        QStringLiteral("ms"));
    const QCommandLineOption nameOption(
        QStringLiteral("name"), QStringLiteral("Customer name."), QStringLiteral("name"));
    const QCommandLineOption emailOption(
        QStringLiteral("email"), QStringLiteral("Customer email."), QStringLiteral("email"));
    parser.addOptions({settingsOption, dbOption, roleOption, visibleToOption, mediaTypeOption,
                       timeoutOption, nameOption, emailOption});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(kExitUsage);
    }

    const QString settingsPath = parser.isSet(settingsOption)
        ? parser.value(settingsOption)
        : dq::SettingsManager::settingsFilePath();
    dq::Settings settings = dq::SettingsManager::loadFrom(settingsPath).value_or(dq::Settings{});
    if (parser.isSet(dbOption)) {
        settings.dbPath = parser.value(dbOption);
    }
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = dq::SettingsManager::defaultDatabasePath();
    }
    if (settings.dbPath != QLatin1String(":memory:")) {
        QDir().mkpath(QFileInfo(settings.dbPath).absolutePath());
    }

    dq::HashingEmbeddingProvider provider(settings.embeddingDimensions);
    dq::ExtractiveAnswerGenerator generator;
    dq::PlainTextExtractor extractor;

    auto engine = dq::QaEngine::open(settings, provider, generator, extractor);
    if (!engine) {
        return printError(QStringLiteral("failed to open %1").arg(settings.dbPath));
    }

    const QString command = args.first();
    const dq::Deadline deadline = deadlineFrom(parser, timeoutOption);
    if (command == QLatin1String("ingest")) {
        return runIngest(*engine, args, parser, visibleToOption, mediaTypeOption, deadline);
    }
    if (command == QLatin1String("resume")) {
        return runResume(*engine, args, deadline);
    }
    if (command == QLatin1String("ask")) {
        return runAsk(*engine, args, parser, roleOption, deadline);
    }
    if (command == QLatin1String("status")) {
        return runStatus(*engine, args);
    }
    if (command == QLatin1String("delete")) {
        return runDelete(*engine, args);
    }
    if (command == QLatin1String("visibility")) {
        return runVisibility(*engine, args);
    }
    if (command == QLatin1String("prune")) {
        return runPrune(*engine);
    }
    if (command == QLatin1String("customer-query")) {
        return runCustomerQuery(*engine, args, parser, nameOption, emailOption);
    }

    return printError(QStringLiteral("unknown command '%1'").arg(command), kExitUsage);
}
