module;
#include <QDateTime>
#include <QDebug>
#include <QHash>
#include <QObject>
#include <QSharedPointer>
#include <QStringList>
#include <QTimer>
#include <QtGlobal>
#include <utility>

module ersal.core.dispatcher;

UploadDispatcher::UploadDispatcher(TaskRegistry* registry,
                                   UploadTransport* transport,
                                   const UploadConfig& config,
                                   QObject* parent)
    : QObject(parent),
    m_registry(registry),
    m_transport(transport),
    m_config(config.normalized()),
    m_retryPolicy(m_config.retryPolicy())
{
}

UploadDispatcher::~UploadDispatcher()
{
    for (TransferDriver* driver : std::as_const(m_drivers)) {
        QObject::disconnect(driver, nullptr, this, nullptr);
    }
    m_drivers.clear();
}

void UploadDispatcher::setConfig(const UploadConfig& config)
{
    m_config = config.normalized();
    m_retryPolicy = m_config.retryPolicy();
    if (m_classifier) m_retryPolicy.setClassifier(m_classifier);
    schedule();
}

void UploadDispatcher::setRetryClassifier(RetryPolicy::Classifier classifier)
{
    m_classifier = classifier;
    m_retryPolicy.setClassifier(classifier);
}

void UploadDispatcher::schedule()
{
    if (!m_registry) return;
    if (m_dispatching) {
        m_passRequested = true;
        return;
    }
    m_dispatching = true;
    bool admitted = false;
    do {
        m_passRequested = false;
        admitted = admitPending() || admitted;
    } while (m_passRequested);
    m_dispatching = false;
    if (admitted) emit queueChanged();
}

bool UploadDispatcher::admitPending()
{
    bool admitted = false;
    while (activeCount() < m_config.maxConcurrent) {
        UploadTask* next = m_registry->nextPending();
        if (!next) break;
        startTask(next);
        admitted = true;
    }
    return admitted;
}

void UploadDispatcher::startTask(UploadTask* task)
{
    task->status = UploadStatus::Uploading;
    task->startedAt = QDateTime::currentDateTime();
    task->endedAt = QDateTime();
    task->nextAttemptAt = QDateTime();
    task->progress = 0.0;
    task->error = TransferError();
    task->cancelHandle = QSharedPointer<CancelHandle>::create();

    const QString id = task->id;
    auto* driver = new TransferDriver(m_transport,
                                      task->payload,
                                      task->cancelHandle,
                                      m_config.chunkSizeBytes,
                                      m_config.chunkThreshold(),
                                      this);
    m_drivers.insert(id, driver);

    connect(driver, &TransferDriver::progressChanged, this, [this, id, driver](double percent) {
        onDriverProgress(id, driver, percent);
    });
    connect(driver, &TransferDriver::finished, this, [this, id, driver](const TransferError& error) {
        onDriverFinished(id, driver, error);
    });

    qDebug() << "Admitted" << id << task->payload.name
             << "attempt" << task->retryCount + 1
             << "active" << activeCount() << "/" << m_config.maxConcurrent;

    // The task pointer must not be used past this point: observers reached
    // from start() may insert into the registry.
    driver->start();
}

void UploadDispatcher::onDriverProgress(const QString& id, TransferDriver* driver, double percent)
{
    if (m_drivers.value(id) != driver) return;
    UploadTask* task = m_registry->find(id);
    if (!task || task->status != UploadStatus::Uploading) return;
    const double next = qBound(0.0, percent, 100.0);
    if (next <= task->progress) return;
    task->progress = next;
    const UploadTask snapshot = *task;
    emit taskProgress(snapshot);
}

void UploadDispatcher::onDriverFinished(const QString& id, TransferDriver* driver, const TransferError& error)
{
    if (m_drivers.value(id) == driver) m_drivers.remove(id);
    driver->deleteLater();

    UploadTask* task = m_registry->find(id);
    if (!task || task->status != UploadStatus::Uploading) {
        // Cancelled and removed while in flight; only the slot is released here.
        qDebug() << "Transfer unwound for" << id;
        schedule();
        return;
    }

    task->cancelHandle.reset();
    task->endedAt = QDateTime::currentDateTime();

    if (error.isNull()) {
        task->status = UploadStatus::Completed;
        task->progress = 100.0;
        const UploadTask snapshot = *task;
        qDebug() << "Completed" << id << snapshot.payload.name << "in" << snapshot.durationMs() << "ms";
        scheduleRemoval(id);
        emit taskProgress(snapshot);
        emit taskCompleted(snapshot);
    } else if (error.isCanceled()) {
        task->status = UploadStatus::Cancelled;
        const UploadTask snapshot = *task;
        m_registry->remove(id);
        emit taskCanceled(snapshot);
    } else if (m_retryPolicy.shouldRetry(error, task->retryCount)) {
        task->retryCount++;
        const qint64 delayMs = m_retryPolicy.jitteredDelay(task->retryCount);
        task->status = UploadStatus::Pending;
        task->progress = 0.0;
        task->error = TransferError();
        task->nextAttemptAt = QDateTime::currentDateTime().addMSecs(delayMs);
        const UploadTask snapshot = *task;
        qInfo() << "Retrying" << snapshot.payload.name << "in" << delayMs << "ms"
                << "(retry" << snapshot.retryCount << "of" << m_retryPolicy.maxRetries() << "):"
                << error.toString();
        scheduleRetry(id, delayMs);
        emit taskProgress(snapshot);
        emit taskRetryScheduled(snapshot, delayMs);
    } else {
        task->status = UploadStatus::Failed;
        task->error = error;
        const UploadTask snapshot = *task;
        qWarning() << "Upload failed:" << snapshot.payload.name << error.toString()
                   << "after" << snapshot.retryCount << "retries";
        emit taskFailed(snapshot, error);
    }

    emit queueChanged();
    schedule();
}

bool UploadDispatcher::abortTask(const QString& id, const QString& reason)
{
    UploadTask* task = m_registry ? m_registry->find(id) : nullptr;
    if (!task || task->status != UploadStatus::Uploading) return false;

    task->status = UploadStatus::Cancelled;
    task->endedAt = QDateTime::currentDateTime();
    const QSharedPointer<CancelHandle> handle = task->cancelHandle;
    task->cancelHandle.reset();
    const UploadTask snapshot = *task;

    qDebug() << "Aborting" << id << snapshot.payload.name;
    if (handle) handle->cancel(reason);
    emit taskCanceled(snapshot);
    return true;
}

void UploadDispatcher::abortAll(const QString& reason)
{
    if (!m_registry) return;
    const QStringList uploading = m_registry->idsWithStatus(UploadStatus::Uploading);
    for (const QString& id : uploading) {
        abortTask(id, reason);
    }
}

void UploadDispatcher::scheduleRetry(const QString& id, qint64 delayMs)
{
    QTimer::singleShot(qMax<qint64>(0, delayMs), this, [this, id]() {
        UploadTask* task = m_registry->find(id);
        if (!task || !task->isAwaitingRetry()) return;
        task->nextAttemptAt = QDateTime();
        emit queueChanged();
        schedule();
    });
}

void UploadDispatcher::scheduleRemoval(const QString& id)
{
    QTimer::singleShot(m_config.completedRetentionMs, this, [this, id]() {
        const UploadTask* task = m_registry->find(id);
        if (!task || task->status != UploadStatus::Completed) return;
        m_registry->remove(id);
        emit queueChanged();
    });
}
