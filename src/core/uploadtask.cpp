module;
#include <QDateTime>
#include <QFileInfo>
#include <QString>

module ersal.core.uploadtask;

import ersal.utils.upload_utils;

namespace utils = ersal::utils;

QString uploadStatusName(UploadStatus status)
{
    switch (status) {
    case UploadStatus::Pending: return "Pending";
    case UploadStatus::Uploading: return "Uploading";
    case UploadStatus::Completed: return "Completed";
    case UploadStatus::Failed: return "Failed";
    case UploadStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

UploadPayload UploadPayload::fromFile(const QString& path)
{
    UploadPayload payload;
    payload.filePath = utils::normalizeFilePath(path);
    QFileInfo info(payload.filePath);
    payload.name = info.fileName();
    payload.size = info.exists() && info.isFile() ? info.size() : 0;
    payload.contentType = utils::contentTypeForFile(payload.filePath);
    return payload;
}

UploadPayload UploadPayload::fromData(const QString& name, const QByteArray& bytes, const QString& contentType)
{
    UploadPayload payload;
    payload.name = name;
    payload.data = bytes;
    payload.size = bytes.size();
    payload.contentType = contentType.isEmpty() ? utils::contentTypeForFile(name) : contentType;
    return payload;
}

QString TransferError::kindName() const
{
    switch (kind) {
    case Kind::None: return "None";
    case Kind::Canceled: return "Canceled";
    case Kind::Network: return "Network";
    case Kind::Timeout: return "Timeout";
    case Kind::Server: return "Server";
    case Kind::Client: return "Client";
    case Kind::Payload: return "Payload";
    case Kind::Unknown: return "Unknown";
    }
    return "Unknown";
}

QString TransferError::toString() const
{
    if (isNull()) return QStringLiteral("No error");
    QString out = kindName();
    if (!message.isEmpty()) out += QStringLiteral(": ") + message;
    if (httpStatus > 0) out += QStringLiteral(" (HTTP %1)").arg(httpStatus);
    return out;
}

TransferError TransferError::make(Kind kind, const QString& message, int httpStatus)
{
    TransferError error;
    error.kind = kind;
    error.message = message;
    error.httpStatus = httpStatus;
    return error;
}

TransferError TransferError::canceled(const QString& message)
{
    return make(Kind::Canceled, message.isEmpty() ? QStringLiteral("Upload canceled") : message);
}

bool UploadTask::isFinished() const
{
    return status == UploadStatus::Completed
        || status == UploadStatus::Failed
        || status == UploadStatus::Cancelled;
}

qint64 UploadTask::durationMs() const
{
    if (!startedAt.isValid() || !endedAt.isValid()) return -1;
    return startedAt.msecsTo(endedAt);
}
