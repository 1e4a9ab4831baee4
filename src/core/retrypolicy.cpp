module;
#include <QRandomGenerator>
#include <QtGlobal>

#include <functional>
#include <limits>
#include <utility>

module ersal.core.retrypolicy;

import ersal.core.uploadtask;

RetryPolicy::RetryPolicy()
    : m_classifier(&RetryPolicy::isTransientError)
{
}

RetryPolicy::RetryPolicy(int maxRetries, qint64 baseDelayMs, qint64 maxDelayMs, double jitterRatio)
    : m_maxRetries(qMax(0, maxRetries)),
    m_baseDelayMs(qMax<qint64>(0, baseDelayMs)),
    m_maxDelayMs(qMax<qint64>(0, maxDelayMs)),
    m_jitterRatio(qBound(0.0, jitterRatio, 1.0)),
    m_classifier(&RetryPolicy::isTransientError)
{
}

void RetryPolicy::setClassifier(Classifier classifier)
{
    m_classifier = classifier ? std::move(classifier) : Classifier(&RetryPolicy::isTransientError);
}

bool RetryPolicy::isRetryable(const TransferError& error) const
{
    if (error.isNull() || error.isCanceled()) return false;
    return m_classifier(error);
}

bool RetryPolicy::shouldRetry(const TransferError& error, int retryCount) const
{
    return retryCount < m_maxRetries && isRetryable(error);
}

qint64 RetryPolicy::delayForAttempt(int attempt) const
{
    const int exponent = qBound(0, attempt - 1, 40);
    qint64 delay = m_baseDelayMs;
    for (int i = 0; i < exponent; ++i) {
        if (delay > std::numeric_limits<qint64>::max() / 2) {
            delay = std::numeric_limits<qint64>::max();
            break;
        }
        delay *= 2;
    }
    if (m_maxDelayMs > 0 && delay > m_maxDelayMs) delay = m_maxDelayMs;
    return delay;
}

qint64 RetryPolicy::jitteredDelay(int attempt, QRandomGenerator* generator) const
{
    const qint64 delay = delayForAttempt(attempt);
    if (m_jitterRatio <= 0.0 || delay <= 0) return delay;
    QRandomGenerator* rng = generator ? generator : QRandomGenerator::global();
    const qint64 spread = static_cast<qint64>(static_cast<double>(delay) * m_jitterRatio);
    if (spread <= 0) return delay;
    return delay + static_cast<qint64>(rng->bounded(static_cast<double>(spread)));
}

bool RetryPolicy::isTransientError(const TransferError& error)
{
    switch (error.kind) {
    case TransferError::Kind::Network:
    case TransferError::Kind::Timeout:
    case TransferError::Kind::Server:
        return true;
    case TransferError::Kind::None:
    case TransferError::Kind::Canceled:
    case TransferError::Kind::Client:
    case TransferError::Kind::Payload:
    case TransferError::Kind::Unknown:
        return false;
    }
    return false;
}
