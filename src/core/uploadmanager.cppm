/*!
 * @file        uploadmanager.cppm
 * @brief       Public facade of the concurrent upload queue.
 * @details     UploadManager accepts payloads, hands out task ids and
 *              exposes cancellation, bulk retry and aggregate status. It
 *              owns the task registry and the dispatcher; the transport is
 *              supplied by the caller.
 *
 *              Responsibilities include:
 *              - Submission of payloads as Pending tasks
 *              - Cancellation of single tasks and of the whole queue
 *              - Bulk retry of failed tasks
 *              - Aggregate status and per-task snapshots
 *              - Forwarding of dispatcher notifications to observers
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module ersal.core.uploadmanager;
export import ersal.core.dispatcher;
export import ersal.core.taskregistry;
export import ersal.core.transport;
export import ersal.core.uploadconfig;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief Queue manager for concurrent uploads.
 *
 * Every call must be made from the thread that owns the manager. Signals
 * carry snapshots and are emitted synchronously while the queue changes.
 * Destroying the manager cancels every task.
 */
ERSAL_MODULE_EXPORT class UploadManager : public QObject {

    Q_OBJECT

    //!< @brief Maximum number of concurrent uploads.
    Q_PROPERTY(int maxConcurrent READ maxConcurrent WRITE setMaxConcurrent NOTIFY maxConcurrentChanged)

    //!< @brief Number of occupied upload slots.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY countsChanged)

    //!< @brief Number of pending uploads.
    Q_PROPERTY(int pendingCount READ pendingCount NOTIFY countsChanged)

    //!< @brief Number of failed uploads.
    Q_PROPERTY(int failedCount READ failedCount NOTIFY countsChanged)

public:
    /**
     * @brief Construct a manager.
     * @param transport Transport used for every transfer (not owned).
     * @param config Initial configuration.
     * @param parent Optional parent QObject.
     */
    explicit UploadManager(UploadTransport* transport,
                           const UploadConfig& config = UploadConfig(),
                           QObject* parent = nullptr);

    ~UploadManager() override;

    /**
     * @brief Submit payloads for upload.
     *
     * Each payload becomes one Pending task, registered in order, then an
     * admission pass runs. Submission never blocks.
     *
     * @param payloads Payloads to upload.
     * @return Task ids in payload order.
     */
    QStringList submit(const QVector<UploadPayload>& payloads);

    /**
     * @brief Submit a single payload.
     * @param payload Payload to upload.
     * @return Task id.
     */
    QString submit(const UploadPayload& payload);

    /**
     * @brief Cancel a task and remove it from the queue.
     * @param id Task id.
     * @return False if the id is unknown.
     */
    Q_INVOKABLE bool cancel(const QString& id);

    /**
     * @brief Cancel every task and clear the queue.
     *
     * taskCanceled is emitted for every Uploading and Pending task.
     * Completed and Failed tasks are dropped silently.
     */
    Q_INVOKABLE void cancelAll();

    //!< @brief Return every failed task to Pending with a fresh retry budget.
    Q_INVOKABLE void retryFailed();

    //!< @brief Remove every completed task immediately.
    Q_INVOKABLE void clearCompleted();

    //!< @brief Aggregate counts and average progress.
    QueueStatus status() const { return m_registry.summarize(); }

    /**
     * @brief Snapshot of one task.
     * @param id Task id.
     * @return The task, or a task with an empty id when unknown.
     */
    UploadTask task(const QString& id) const;

    //!< @brief Check whether a task id is known.
    bool contains(const QString& id) const { return m_registry.contains(id); }

    //!< @brief Snapshots of all tasks in submission order.
    QVector<UploadTask> tasks() const { return m_registry.tasks(); }

    //!< @brief Active configuration.
    UploadConfig config() const { return m_dispatcher->config(); }

    //!< @brief Concurrency ceiling.
    int maxConcurrent() const { return m_dispatcher->config().maxConcurrent; }

    /**
     * @brief Change the concurrency ceiling.
     * @param value New ceiling, clamped to at least 1.
     */
    void setMaxConcurrent(int value);

    /**
     * @brief Replace the retryable-error classifier.
     * @param classifier Classifier, empty for the default.
     */
    void setRetryClassifier(RetryPolicy::Classifier classifier);

    int activeCount() const { return m_dispatcher->activeCount(); }
    int pendingCount() const { return m_registry.countWithStatus(UploadStatus::Pending); }
    int failedCount() const { return m_registry.countWithStatus(UploadStatus::Failed); }

signals:
    void taskProgress(const UploadTask& task);
    void taskCompleted(const UploadTask& task);
    void taskFailed(const UploadTask& task, const TransferError& error);
    void taskCanceled(const UploadTask& task);
    void taskRetryScheduled(const UploadTask& task, qint64 delayMs);

    /**
     * @brief Emitted after every queue change.
     * @param tasks Snapshots of all tasks in submission order.
     */
    void queueUpdated(const QVector<UploadTask>& tasks);

    void countsChanged();
    void maxConcurrentChanged();

private:
    //!< @brief Publish queueUpdated and countsChanged.
    void notifyQueueChanged();

    TaskRegistry m_registry;                        //!< Task records.
    UploadDispatcher* m_dispatcher = nullptr;       //!< Scheduler (owned).
};

#include "uploadmanager.moc"
