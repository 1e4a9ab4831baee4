#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QHash>
#include <QTextStream>
#include <QUrl>
#include <QVariantMap>
#include <QVector>

import ersal.core.uploadmanager;
import ersal.services.http_transport;
import ersal.utils.upload_utils;

namespace utils = ersal::utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

static int usageError(QCommandLineParser& parser, const QString& message)
{
    QTextStream err(stderr);
    err << "ersal: " << message << Qt::endl << Qt::endl << parser.helpText();
    return 2;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("ersal"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Upload files to an HTTP endpoint with a bounded, retrying queue."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("endpoint"), QStringLiteral("Upload URL (http or https)."));
    parser.addPositionalArgument(QStringLiteral("files"), QStringLiteral("Files to upload."), QStringLiteral("<file>..."));

    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Load settings from a JSON file."), QStringLiteral("file"));
    const QCommandLineOption concurrentOption(QStringList{ QStringLiteral("j"), QStringLiteral("max-concurrent") },
                                              QStringLiteral("Maximum concurrent uploads."), QStringLiteral("n"));
    const QCommandLineOption retriesOption(QStringLiteral("retries"),
                                           QStringLiteral("Retries per file for transient errors."), QStringLiteral("n"));
    const QCommandLineOption retryDelayOption(QStringLiteral("retry-delay"),
                                              QStringLiteral("Base retry delay in milliseconds."), QStringLiteral("ms"));
    const QCommandLineOption chunkOption(QStringLiteral("chunk-size"),
                                         QStringLiteral("Chunk size in bytes for large files."), QStringLiteral("bytes"));
    const QCommandLineOption headerOption(QStringList{ QStringLiteral("H"), QStringLiteral("header") },
                                          QStringLiteral("Extra request header \"Name: value\" (repeatable)."),
                                          QStringLiteral("header"));
    const QCommandLineOption tokenOption(QStringLiteral("token"),
                                         QStringLiteral("Bearer token for the Authorization header."), QStringLiteral("token"));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout"),
                                           QStringLiteral("Per-request transfer timeout in milliseconds."), QStringLiteral("ms"));
    const QCommandLineOption quietOption(QStringList{ QStringLiteral("q"), QStringLiteral("quiet") },
                                         QStringLiteral("Only print the final summary."));
    parser.addOptions({ configOption, concurrentOption, retriesOption, retryDelayOption, chunkOption,
                        headerOption, tokenOption, timeoutOption, quietOption });

    if (!parser.parse(QCoreApplication::arguments())) {
        return usageError(parser, parser.errorText());
    }
    if (parser.isSet(QStringLiteral("help"))) {
        parser.showHelp(0);
    }
    if (parser.isSet(QStringLiteral("version"))) {
        parser.showVersion();
    }

    const QStringList args = parser.positionalArguments();
    if (args.size() < 2) {
        return usageError(parser, QStringLiteral("an endpoint and at least one file are required"));
    }

    const QUrl endpoint = QUrl::fromUserInput(args.first());
    if (!endpoint.isValid() || (endpoint.scheme() != "http" && endpoint.scheme() != "https")) {
        return usageError(parser, QStringLiteral("invalid endpoint %1").arg(args.first()));
    }

    UploadConfig config;
    if (parser.isSet(configOption)) {
        bool ok = false;
        QString error;
        config = UploadConfig::fromJsonFile(parser.value(configOption), &ok, &error);
        if (!ok) return usageError(parser, error);
    }

    QVariantMap overrides;
    if (parser.isSet(concurrentOption)) overrides.insert("maxConcurrent", parser.value(concurrentOption));
    if (parser.isSet(retriesOption)) overrides.insert("maxRetries", parser.value(retriesOption));
    if (parser.isSet(retryDelayOption)) overrides.insert("retryBaseDelayMs", parser.value(retryDelayOption));
    if (parser.isSet(chunkOption)) overrides.insert("chunkSizeBytes", parser.value(chunkOption));
    config = UploadConfig::fromVariantMap(overrides, config);

    QVector<UploadPayload> payloads;
    for (int i = 1; i < args.size(); ++i) {
        const QString path = utils::normalizeFilePath(args.at(i));
        if (!utils::fileExistsPath(path)) {
            return usageError(parser, QStringLiteral("no such file %1").arg(args.at(i)));
        }
        payloads.append(UploadPayload::fromFile(path));
    }

    HttpUploadTransport transport(endpoint);
    transport.setCustomHeaders(parser.values(headerOption));
    transport.setBearerToken(parser.value(tokenOption));
    if (parser.isSet(timeoutOption)) {
        transport.setTransferTimeoutMs(parser.value(timeoutOption).toInt());
    }

    UploadManager manager(&transport, config);
    const bool quiet = parser.isSet(quietOption);
    QTextStream out(stdout);
    QHash<QString, int> lastPercent;
    int completed = 0;
    int failed = 0;
    int expected = 0;

    auto finishIfDone = [&]() {
        if (expected == 0 || completed + failed < expected) return;
        out << completed << " uploaded, " << failed << " failed" << Qt::endl;
        QCoreApplication::exit(failed > 0 ? 1 : 0);
    };

    QObject::connect(&manager, &UploadManager::taskProgress, &app, [&](const UploadTask& task) {
        if (quiet || task.status != UploadStatus::Uploading) return;
        const int percent = int(task.progress);
        if (lastPercent.value(task.id, -1) == percent) return;
        lastPercent.insert(task.id, percent);
        out << task.payload.name << " " << percent << "%" << Qt::endl;
    });
    QObject::connect(&manager, &UploadManager::taskRetryScheduled, &app, [&](const UploadTask& task, qint64 delayMs) {
        lastPercent.remove(task.id);
        if (!quiet) out << task.payload.name << " retrying in " << delayMs << " ms" << Qt::endl;
    });
    QObject::connect(&manager, &UploadManager::taskCompleted, &app, [&](const UploadTask& task) {
        ++completed;
        lastPercent.remove(task.id);
        if (!quiet) {
            out << task.payload.name << " done (" << utils::formatBytes(task.payload.size)
                << " in " << task.durationMs() << " ms)" << Qt::endl;
        }
        finishIfDone();
    });
    QObject::connect(&manager, &UploadManager::taskFailed, &app, [&](const UploadTask& task, const TransferError& error) {
        ++failed;
        lastPercent.remove(task.id);
        out << task.payload.name << " failed: " << error.toString() << Qt::endl;
        finishIfDone();
    });

    expected = manager.submit(payloads).size();
    if (expected == 0) {
        return usageError(parser, QStringLiteral("nothing to upload"));
    }

    return app.exec();
}
