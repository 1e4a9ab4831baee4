module;
#include <QByteArray>
#include <QDebug>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QObject>
#include <QSharedPointer>
#include <QUrl>

module ersal.services.http_transport;

HttpUploadTransport::HttpUploadTransport(const QUrl& endpoint, QObject* parent)
    : QObject(parent),
    m_endpoint(endpoint)
{
}

void HttpUploadTransport::setEndpoint(const QUrl& endpoint)
{
    if (m_endpoint == endpoint) return;
    m_endpoint = endpoint;
    emit endpointChanged();
}

void HttpUploadTransport::applyNetworkOptions(QNetworkRequest& req) const
{
    if (!m_bearerToken.isEmpty()) {
        req.setRawHeader("Authorization", QByteArray("Bearer ") + m_bearerToken.toUtf8());
    }
    for (const QString& headerLine : m_customHeaders) {
        const int sep = headerLine.indexOf(':');
        if (sep <= 0) continue;
        const QString key = headerLine.left(sep).trimmed();
        const QString value = headerLine.mid(sep + 1).trimmed();
        if (key.isEmpty()) continue;
        const QString lower = key.toLower();
        if (lower == "content-range" || lower == "content-length" || lower == "upload-offset") continue;
        req.setRawHeader(key.toUtf8(), value.toUtf8());
    }
}

QNetworkRequest HttpUploadTransport::buildRequest(const UploadPayload& payload) const
{
    QNetworkRequest req(m_endpoint);
    req.setRawHeader("User-Agent", "ersal/1.0");
    req.setHeader(QNetworkRequest::ContentTypeHeader, payload.contentType);
    req.setRawHeader("X-File-Name", QUrl::toPercentEncoding(payload.name));
    if (m_transferTimeoutMs > 0) {
        req.setTransferTimeout(m_transferTimeoutMs);
    }
    applyNetworkOptions(req);
    return req;
}

TransferReply* HttpUploadTransport::upload(const UploadPayload& payload, const QSharedPointer<CancelHandle>& cancel)
{
    if (!m_endpoint.isValid()) {
        return TransferReply::createFinished(
            TransferError::make(TransferError::Kind::Client, QStringLiteral("Invalid upload endpoint")));
    }

    QNetworkRequest req = buildRequest(payload);
    req.setHeader(QNetworkRequest::ContentLengthHeader, payload.size);

    if (payload.isInMemory()) {
        return track(m_network.post(req, payload.data), cancel);
    }

    auto* file = new QFile(payload.filePath);
    if (!file->open(QIODevice::ReadOnly)) {
        const QString message = QStringLiteral("Cannot open %1: %2").arg(payload.filePath, file->errorString());
        delete file;
        qWarning() << message;
        return TransferReply::createFinished(TransferError::make(TransferError::Kind::Payload, message));
    }
    QNetworkReply* networkReply = m_network.post(req, file);
    file->setParent(networkReply);
    return track(networkReply, cancel);
}

TransferReply* HttpUploadTransport::uploadChunk(const UploadPayload& payload,
                                                const ChunkSlice& slice,
                                                const QSharedPointer<CancelHandle>& cancel)
{
    if (!m_endpoint.isValid()) {
        return TransferReply::createFinished(
            TransferError::make(TransferError::Kind::Client, QStringLiteral("Invalid upload endpoint")));
    }

    QNetworkRequest req = buildRequest(payload);
    const qint64 last = slice.offset + slice.length - 1;
    req.setRawHeader("Content-Range", QByteArray("bytes ") + QByteArray::number(slice.offset) + "-"
                                          + QByteArray::number(last) + "/" + QByteArray::number(slice.payloadSize));
    req.setRawHeader("Upload-Offset", QByteArray::number(slice.offset));
    req.setRawHeader("X-Chunk-Index", QByteArray::number(slice.index));
    req.setRawHeader("X-Chunk-Count", QByteArray::number(slice.total));
    req.setHeader(QNetworkRequest::ContentLengthHeader, slice.data.size());

    qDebug() << "PATCH chunk" << slice.index + 1 << "/" << slice.total << "of" << payload.name;
    return track(m_network.sendCustomRequest(req, "PATCH", slice.data), cancel);
}

TransferReply* HttpUploadTransport::track(QNetworkReply* networkReply, const QSharedPointer<CancelHandle>& cancel)
{
    auto* reply = new TransferReply();
    networkReply->setParent(reply);

    connect(networkReply, &QNetworkReply::uploadProgress, reply, &TransferReply::reportProgress);
    connect(networkReply, &QNetworkReply::finished, reply, [reply, networkReply, cancel]() {
        const int status = networkReply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QNetworkReply::NetworkError code = networkReply->error();
        TransferError error;
        if (cancel && cancel->isCanceled()) {
            error = TransferError::canceled(cancel->reason());
        } else if (code == QNetworkReply::OperationCanceledError) {
            // Not canceled by the caller: the transfer timeout aborted the request.
            error = TransferError::make(TransferError::Kind::Timeout, networkReply->errorString());
        } else {
            error = classifyNetworkError(code, status, networkReply->errorString());
        }
        if (!error.isNull() && !error.isCanceled()) {
            qWarning() << "Upload request error:" << networkReply->url().toString() << error.toString();
        }
        reply->finish(error);
    });
    connect(reply, &QObject::destroyed, networkReply, [reply, networkReply]() {
        QObject::disconnect(networkReply, nullptr, reply, nullptr);
        if (networkReply->isRunning()) networkReply->abort();
    });
    if (cancel) {
        connect(cancel.data(), &CancelHandle::canceled, networkReply, [networkReply]() {
            if (networkReply->isRunning()) networkReply->abort();
        });
    }
    return reply;
}

TransferError HttpUploadTransport::classifyHttpStatus(int httpStatus, const QString& message)
{
    const QString text = message.isEmpty() ? QStringLiteral("HTTP %1").arg(httpStatus) : message;
    if (httpStatus < 400) return TransferError();
    if (httpStatus == 408 || httpStatus == 429) {
        return TransferError::make(TransferError::Kind::Server, text, httpStatus);
    }
    if (httpStatus == 413 || httpStatus == 415) {
        return TransferError::make(TransferError::Kind::Payload, text, httpStatus);
    }
    if (httpStatus < 500) {
        return TransferError::make(TransferError::Kind::Client, text, httpStatus);
    }
    if (httpStatus < 600) {
        return TransferError::make(TransferError::Kind::Server, text, httpStatus);
    }
    return TransferError::make(TransferError::Kind::Unknown, text, httpStatus);
}

TransferError HttpUploadTransport::classifyNetworkError(QNetworkReply::NetworkError error,
                                                        int httpStatus,
                                                        const QString& message)
{
    if (httpStatus >= 400) return classifyHttpStatus(httpStatus, message);
    if (error == QNetworkReply::NoError) return TransferError();

    const QString text = message.isEmpty() ? QStringLiteral("Network error %1").arg(int(error)) : message;
    switch (error) {
    case QNetworkReply::OperationCanceledError:
        return TransferError::canceled(text);
    case QNetworkReply::TimeoutError:
    case QNetworkReply::ProxyTimeoutError:
        return TransferError::make(TransferError::Kind::Timeout, text);
    default:
        break;
    }

    const int code = int(error);
    if (code < 200) {
        // Connection and proxy level failures.
        return TransferError::make(TransferError::Kind::Network, text);
    }
    if (code < 300) {
        return TransferError::make(TransferError::Kind::Client, text);
    }
    if (code > 400 && code < 500) {
        return TransferError::make(TransferError::Kind::Server, text);
    }
    return TransferError::make(TransferError::Kind::Unknown, text);
}
