module;
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QVariantMap>
#include <QtGlobal>

#include <limits>

module ersal.core.uploadconfig;

import ersal.core.retrypolicy;

namespace {

int intOption(const QVariantMap& options, const char* key, int fallback)
{
    if (!options.contains(key)) return fallback;
    bool ok = false;
    const int value = options.value(key).toInt(&ok);
    if (!ok) {
        qWarning() << "Ignoring malformed option" << key << options.value(key);
        return fallback;
    }
    return value;
}

qint64 int64Option(const QVariantMap& options, const char* key, qint64 fallback)
{
    if (!options.contains(key)) return fallback;
    bool ok = false;
    const qint64 value = options.value(key).toLongLong(&ok);
    if (!ok) {
        qWarning() << "Ignoring malformed option" << key << options.value(key);
        return fallback;
    }
    return value;
}

double doubleOption(const QVariantMap& options, const char* key, double fallback)
{
    if (!options.contains(key)) return fallback;
    bool ok = false;
    const double value = options.value(key).toDouble(&ok);
    if (!ok) {
        qWarning() << "Ignoring malformed option" << key << options.value(key);
        return fallback;
    }
    return value;
}

} // namespace

qint64 UploadConfig::chunkThreshold() const
{
    const qint64 size = qMax<qint64>(1, chunkSizeBytes);
    const qint64 multiplier = qMax(1, chunkThresholdMultiplier);
    // Saturate instead of overflowing for absurd chunk sizes.
    if (size > std::numeric_limits<qint64>::max() / multiplier) return std::numeric_limits<qint64>::max();
    return size * multiplier;
}

UploadConfig UploadConfig::normalized() const
{
    UploadConfig c = *this;
    if (c.maxConcurrent < 1) c.maxConcurrent = 1;
    if (c.maxRetries < 0) c.maxRetries = 0;
    if (c.retryBaseDelayMs < 0) c.retryBaseDelayMs = 0;
    if (c.retryMaxDelayMs < 0) c.retryMaxDelayMs = 0;
    c.retryJitterRatio = qBound(0.0, c.retryJitterRatio, 1.0);
    if (c.chunkSizeBytes < 1) c.chunkSizeBytes = 1;
    if (c.chunkThresholdMultiplier < 1) c.chunkThresholdMultiplier = 1;
    if (c.completedRetentionMs < 0) c.completedRetentionMs = 0;
    return c;
}

RetryPolicy UploadConfig::retryPolicy() const
{
    const UploadConfig c = normalized();
    return RetryPolicy(c.maxRetries, c.retryBaseDelayMs, c.retryMaxDelayMs, c.retryJitterRatio);
}

QVariantMap UploadConfig::toVariantMap() const
{
    QVariantMap map;
    map.insert("maxConcurrent", maxConcurrent);
    map.insert("maxRetries", maxRetries);
    map.insert("retryBaseDelayMs", retryBaseDelayMs);
    map.insert("retryMaxDelayMs", retryMaxDelayMs);
    map.insert("retryJitterRatio", retryJitterRatio);
    map.insert("chunkSizeBytes", chunkSizeBytes);
    map.insert("chunkThresholdMultiplier", chunkThresholdMultiplier);
    map.insert("completedRetentionMs", completedRetentionMs);
    return map;
}

UploadConfig UploadConfig::fromVariantMap(const QVariantMap& options, const UploadConfig& base)
{
    UploadConfig c = base;
    c.maxConcurrent = intOption(options, "maxConcurrent", c.maxConcurrent);
    c.maxRetries = intOption(options, "maxRetries", c.maxRetries);
    c.retryBaseDelayMs = int64Option(options, "retryBaseDelayMs", c.retryBaseDelayMs);
    c.retryMaxDelayMs = int64Option(options, "retryMaxDelayMs", c.retryMaxDelayMs);
    c.retryJitterRatio = doubleOption(options, "retryJitterRatio", c.retryJitterRatio);
    c.chunkSizeBytes = int64Option(options, "chunkSizeBytes", c.chunkSizeBytes);
    c.chunkThresholdMultiplier = intOption(options, "chunkThresholdMultiplier", c.chunkThresholdMultiplier);
    c.completedRetentionMs = intOption(options, "completedRetentionMs", c.completedRetentionMs);
    return c.normalized();
}

UploadConfig UploadConfig::fromJsonFile(const QString& path, bool* ok, QString* errorString, const UploadConfig& base)
{
    if (ok) *ok = false;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString) *errorString = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return base;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorString) *errorString = QStringLiteral("Invalid JSON in %1: %2").arg(path, parseError.errorString());
        return base;
    }
    if (!doc.isObject()) {
        if (errorString) *errorString = QStringLiteral("%1 does not contain a JSON object").arg(path);
        return base;
    }
    if (ok) *ok = true;
    return fromVariantMap(doc.object().toVariantMap(), base);
}
