module;
#include <QDateTime>
#include <QDebug>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <utility>

module ersal.core.uploadmanager;
import ersal.utils.upload_utils;

namespace utils = ersal::utils;

UploadManager::UploadManager(UploadTransport* transport, const UploadConfig& config, QObject* parent)
    : QObject(parent)
{
    m_dispatcher = new UploadDispatcher(&m_registry, transport, config, this);

    connect(m_dispatcher, &UploadDispatcher::taskProgress, this, &UploadManager::taskProgress);
    connect(m_dispatcher, &UploadDispatcher::taskCompleted, this, &UploadManager::taskCompleted);
    connect(m_dispatcher, &UploadDispatcher::taskFailed, this, &UploadManager::taskFailed);
    connect(m_dispatcher, &UploadDispatcher::taskCanceled, this, &UploadManager::taskCanceled);
    connect(m_dispatcher, &UploadDispatcher::taskRetryScheduled, this, &UploadManager::taskRetryScheduled);
    connect(m_dispatcher, &UploadDispatcher::queueChanged, this, &UploadManager::notifyQueueChanged);
}

UploadManager::~UploadManager()
{
    cancelAll();
    // The dispatcher holds a pointer to the registry member.
    delete m_dispatcher;
    m_dispatcher = nullptr;
}

QStringList UploadManager::submit(const QVector<UploadPayload>& payloads)
{
    QStringList ids;
    ids.reserve(payloads.size());
    for (const UploadPayload& payload : payloads) {
        UploadTask task;
        task.id = utils::generateTaskId();
        task.payload = payload;
        task.status = UploadStatus::Pending;
        if (!m_registry.insert(task)) {
            qWarning() << "Duplicate task id generated, skipping" << payload.name;
            continue;
        }
        ids.append(task.id);
        qDebug() << "Queued" << task.id << payload.name << utils::formatBytes(payload.size);
    }
    if (!ids.isEmpty()) notifyQueueChanged();
    m_dispatcher->schedule();
    return ids;
}

QString UploadManager::submit(const UploadPayload& payload)
{
    const QStringList ids = submit(QVector<UploadPayload>{ payload });
    return ids.isEmpty() ? QString() : ids.first();
}

bool UploadManager::cancel(const QString& id)
{
    const UploadTask* existing = m_registry.find(id);
    if (!existing) return false;

    const UploadStatus status = existing->status;
    if (status == UploadStatus::Uploading) {
        m_dispatcher->abortTask(id, QStringLiteral("Canceled by user"));
        m_registry.remove(id);
    } else if (status == UploadStatus::Pending) {
        UploadTask snapshot = *existing;
        snapshot.status = UploadStatus::Cancelled;
        m_registry.remove(id);
        emit taskCanceled(snapshot);
    } else {
        m_registry.remove(id);
    }

    notifyQueueChanged();
    m_dispatcher->schedule();
    return true;
}

void UploadManager::cancelAll()
{
    if (!m_dispatcher) return;
    QVector<UploadTask> pending;
    for (const QString& id : m_registry.idsWithStatus(UploadStatus::Pending)) {
        UploadTask snapshot = *m_registry.find(id);
        snapshot.status = UploadStatus::Cancelled;
        pending.append(snapshot);
    }
    m_dispatcher->abortAll(QStringLiteral("Canceled by user"));
    m_registry.clear();
    for (const UploadTask& snapshot : std::as_const(pending)) {
        emit taskCanceled(snapshot);
    }
    notifyQueueChanged();
}

void UploadManager::retryFailed()
{
    const QStringList failed = m_registry.idsWithStatus(UploadStatus::Failed);
    for (const QString& id : failed) {
        UploadTask* task = m_registry.find(id);
        if (!task) continue;
        task->status = UploadStatus::Pending;
        task->retryCount = 0;
        task->progress = 0.0;
        task->error = TransferError();
        task->endedAt = QDateTime();
        task->nextAttemptAt = QDateTime();
    }
    if (!failed.isEmpty()) {
        qDebug() << "Retrying" << failed.size() << "failed uploads";
        notifyQueueChanged();
    }
    m_dispatcher->schedule();
}

void UploadManager::clearCompleted()
{
    const QStringList completed = m_registry.idsWithStatus(UploadStatus::Completed);
    for (const QString& id : completed) {
        m_registry.remove(id);
    }
    if (!completed.isEmpty()) notifyQueueChanged();
}

UploadTask UploadManager::task(const QString& id) const
{
    const UploadTask* found = m_registry.find(id);
    return found ? *found : UploadTask();
}

void UploadManager::setMaxConcurrent(int value)
{
    if (value < 1) value = 1;
    UploadConfig next = m_dispatcher->config();
    if (next.maxConcurrent == value) return;
    next.maxConcurrent = value;
    m_dispatcher->setConfig(next);
    emit maxConcurrentChanged();
}

void UploadManager::setRetryClassifier(RetryPolicy::Classifier classifier)
{
    m_dispatcher->setRetryClassifier(classifier);
}

void UploadManager::notifyQueueChanged()
{
    emit queueUpdated(m_registry.tasks());
    emit countsChanged();
}
