/*!
 * @file        dispatcher.cppm
 * @brief       Admission and state-transition authority of the upload core.
 * @details     The dispatcher keeps as many tasks uploading as the concurrency
 *              ceiling allows while pending tasks remain. It is event driven:
 *              submission, completion, failure, retry timers and cancellation
 *              each trigger one admission pass, and passes requested while a
 *              pass is running are coalesced into it.
 *
 *              It is the only component that moves tasks between Pending,
 *              Uploading and the terminal states, applies the retry policy to
 *              failures, and schedules the deferred removal of completed
 *              tasks. Observers are notified synchronously through signals
 *              carrying task snapshots.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QObject>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ersal.core.dispatcher;
export import ersal.core.taskregistry;
export import ersal.core.transferdriver;
export import ersal.core.uploadconfig;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief Concurrency-bounded scheduler driving tasks through their lifecycle.
 *
 * The dispatcher does not own the registry or the transport; both must
 * outlive it. All calls must be made from the thread that owns it.
 */
ERSAL_MODULE_EXPORT class UploadDispatcher : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a dispatcher.
     * @param registry Task registry shared with the manager.
     * @param transport Transport performing the transfers.
     * @param config Initial configuration.
     * @param parent Optional parent QObject.
     */
    UploadDispatcher(TaskRegistry* registry,
                     UploadTransport* transport,
                     const UploadConfig& config,
                     QObject* parent = nullptr);

    ~UploadDispatcher() override;

    //!< @brief Return the active configuration.
    UploadConfig config() const { return m_config; }

    /**
     * @brief Replace the configuration and run an admission pass.
     * @param config New configuration (normalized on entry).
     */
    void setConfig(const UploadConfig& config);

    /**
     * @brief Replace the retryable-error classifier.
     * @param classifier Classifier, empty for the default.
     */
    void setRetryClassifier(RetryPolicy::Classifier classifier);

    //!< @brief Return the retry policy in use.
    const RetryPolicy& retryPolicy() const { return m_retryPolicy; }

    /**
     * @brief Number of occupied concurrency slots.
     *
     * Counts transfers that have not unwound yet, including cancelled
     * transfers whose I/O is still returning.
     */
    int activeCount() const { return m_drivers.size(); }

    //!< @brief Run an admission pass (coalesced when already running).
    void schedule();

    /**
     * @brief Cancel the transfer of an uploading task.
     *
     * Marks the task Cancelled and signals its cancel handle. The caller
     * removes the record; the slot is released when the transfer unwinds.
     *
     * @param id Task id.
     * @param reason Cancellation reason.
     * @return False if the task is unknown or not uploading.
     */
    bool abortTask(const QString& id, const QString& reason = QString());

    /**
     * @brief Cancel every uploading task.
     * @param reason Cancellation reason.
     */
    void abortAll(const QString& reason = QString());

signals:
    /**
     * @brief Emitted when a task's progress changes.
     * @param task Task snapshot.
     */
    void taskProgress(const UploadTask& task);

    /**
     * @brief Emitted when a task completes.
     * @param task Task snapshot.
     */
    void taskCompleted(const UploadTask& task);

    /**
     * @brief Emitted when a task fails permanently.
     * @param task Task snapshot.
     * @param error Failure reason.
     */
    void taskFailed(const UploadTask& task, const TransferError& error);

    /**
     * @brief Emitted when an uploading task is cancelled.
     * @param task Task snapshot.
     */
    void taskCanceled(const UploadTask& task);

    /**
     * @brief Emitted when a failed attempt is scheduled for retry.
     * @param task Task snapshot.
     * @param delayMs Backoff delay.
     */
    void taskRetryScheduled(const UploadTask& task, qint64 delayMs);

    //!< @brief Emitted after any change to the registry's task states.
    void queueChanged();

private:
    //!< @brief Admit eligible pending tasks while slots are free.
    bool admitPending();

    /**
     * @brief Move a pending task to Uploading and start its transfer.
     * @param task Task to start.
     */
    void startTask(UploadTask* task);

    /**
     * @brief Handle transfer progress.
     * @param id Task id.
     * @param driver Reporting driver.
     * @param percent Progress 0-100.
     */
    void onDriverProgress(const QString& id, TransferDriver* driver, double percent);

    /**
     * @brief Handle transfer outcome.
     * @param id Task id.
     * @param driver Reporting driver.
     * @param error Failure reason, null on success.
     */
    void onDriverFinished(const QString& id, TransferDriver* driver, const TransferError& error);

    /**
     * @brief Arm the backoff timer of a task.
     * @param id Task id.
     * @param delayMs Backoff delay.
     */
    void scheduleRetry(const QString& id, qint64 delayMs);

    /**
     * @brief Arm the deferred removal of a completed task.
     * @param id Task id.
     */
    void scheduleRemoval(const QString& id);

    TaskRegistry* m_registry = nullptr;             //!< Task store (not owned).
    UploadTransport* m_transport = nullptr;         //!< Transport (not owned).
    UploadConfig m_config;                          //!< Active configuration.
    RetryPolicy m_retryPolicy;                      //!< Retry policy from config.
    RetryPolicy::Classifier m_classifier;           //!< Custom classifier, empty for default.
    QHash<QString, TransferDriver*> m_drivers;      //!< Live transfers by task id.
    bool m_dispatching = false;                     //!< Admission pass running.
    bool m_passRequested = false;                   //!< Pass requested while running.
};

#include "dispatcher.moc"
