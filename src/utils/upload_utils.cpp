module;
#include <QByteArray>
#include <QFile>
#include <QFileInfo>
#include <QMimeDatabase>
#include <QMimeType>
#include <QUrl>
#include <QUuid>
#include <QtGlobal>

module ersal.utils.upload_utils;

namespace ersal::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

bool fileExistsPath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return false;
    QFileInfo info(normalized);
    return info.exists() && info.isFile();
}

QString contentTypeForFile(const QString& fileName)
{
    if (fileName.isEmpty()) return QStringLiteral("application/octet-stream");
    QMimeDatabase db;
    const QString local = normalizeFilePath(fileName);
    const QMimeType type = fileExistsPath(local)
        ? db.mimeTypeForFile(local)
        : db.mimeTypeForFile(local, QMimeDatabase::MatchExtension);
    if (!type.isValid() || type.isDefault()) return QStringLiteral("application/octet-stream");
    return type.name();
}

qint64 chunkCount(qint64 size, qint64 chunkSize)
{
    if (size <= 0 || chunkSize <= 0) return 0;
    return size / chunkSize + (size % chunkSize != 0 ? 1 : 0);
}

bool readFileSlice(const QString& filePath, qint64 offset, qint64 length, QByteArray* out, QString* errorString)
{
    if (!out) return false;
    out->clear();
    QFile file(normalizeFilePath(filePath));
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString) *errorString = file.errorString();
        return false;
    }
    if (offset < 0 || !file.seek(offset)) {
        if (errorString) *errorString = QStringLiteral("Cannot seek to offset %1").arg(offset);
        return false;
    }
    *out = file.read(length);
    if (out->size() != length) {
        if (errorString) {
            *errorString = QStringLiteral("Short read at offset %1: %2 of %3 bytes")
                               .arg(offset).arg(out->size()).arg(length);
        }
        out->clear();
        return false;
    }
    return true;
}

double percentOf(qint64 part, qint64 total)
{
    if (total <= 0) return 0.0;
    const double value = (static_cast<double>(part) * 100.0) / static_cast<double>(total);
    return qBound(0.0, value, 100.0);
}

QString generateTaskId()
{
    return QStringLiteral("upload-") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString formatBytes(qint64 bytes)
{
    if (bytes < 1024) return QStringLiteral("%1 B").arg(bytes);
    const double kib = bytes / 1024.0;
    if (kib < 1024.0) return QStringLiteral("%1 KiB").arg(kib, 0, 'f', 1);
    const double mib = kib / 1024.0;
    if (mib < 1024.0) return QStringLiteral("%1 MiB").arg(mib, 0, 'f', 1);
    return QStringLiteral("%1 GiB").arg(mib / 1024.0, 0, 'f', 2);
}

} // namespace ersal::utils
