/*!
 * @file        uploadtask.cppm
 * @brief       Upload task record, payload reference, and error value types.
 * @details     Defines the plain value types shared by every layer of the
 *              upload core:
 *              - UploadPayload: an opaque reference to the bytes to send
 *              - TransferError: classified failure reason of a transfer
 *              - UploadTask: the per-upload lifecycle record
 *              - QueueStatus: aggregate counters over all known tasks
 *
 *              Records are mutated only by the dispatcher and by explicit
 *              cancel/retry calls on the manager; everything handed to
 *              observers is a snapshot copy.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QDateTime>
#include <QSharedPointer>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ersal.core.uploadtask;
export import ersal.core.cancelhandle;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief Upload task state machine.
 *
 * Pending -> Uploading -> Completed
 *                      -> Failed    (retryFailed() moves it back to Pending)
 *                      -> Pending   (transient failure with retries left)
 *                      -> Cancelled
 * Pending -> Cancelled
 */
ERSAL_MODULE_EXPORT enum class UploadStatus {
    Pending,        //!< Waiting for a concurrency slot (or a retry backoff).
    Uploading,      //!< Transfer in flight; holds a slot and a cancel handle.
    Completed,      //!< Transfer succeeded.
    Failed,         //!< Permanent failure or retries exhausted.
    Cancelled       //!< Caller-initiated abort.
};

/**
 * @brief Return the display name of a status.
 * @param status Task status.
 * @return Status name ("Pending", "Uploading", ...).
 */
ERSAL_MODULE_EXPORT QString uploadStatusName(UploadStatus status);

/**
 * @brief Opaque reference to the data of one upload.
 *
 * A payload points either at a local file or at an in-memory buffer.
 * The buffer is a QByteArray, which is implicitly shared: copying a payload
 * never duplicates its bytes.
 */
ERSAL_MODULE_EXPORT struct UploadPayload {

    //!< @brief Remote file name.
    QString name;

    //!< @brief Local source file path, empty for in-memory payloads.
    QString filePath;

    //!< @brief In-memory bytes for buffer payloads.
    QByteArray data;

    //!< @brief MIME content type sent with the request.
    QString contentType;

    //!< @brief Payload size in bytes.
    qint64 size = 0;

    /**
     * @brief Build a payload referencing a local file.
     * @param path File path or file:// URL.
     * @return Payload; size is 0 when the file does not exist.
     */
    static UploadPayload fromFile(const QString& path);

    /**
     * @brief Build a payload over an in-memory buffer.
     * @param name Remote file name.
     * @param bytes Buffer to send (shared, not copied).
     * @param contentType MIME type; detected from @p name when empty.
     * @return Payload.
     */
    static UploadPayload fromData(const QString& name, const QByteArray& bytes, const QString& contentType = QString());

    //!< @brief True when the payload carries its bytes in memory.
    bool isInMemory() const { return filePath.isEmpty(); }
};

/**
 * @brief Classified failure of a transfer.
 *
 * A default-constructed error is the "no error" value.
 */
ERSAL_MODULE_EXPORT struct TransferError {

    /**
     * @brief Error taxonomy used by the retry classifier.
     */
    enum class Kind {
        None,           //!< No error.
        Canceled,       //!< Caller-initiated cancellation, never retried.
        Network,        //!< Connection-level failure (transient).
        Timeout,        //!< Request timed out (transient).
        Server,         //!< 5xx, 408, 429 responses (transient).
        Client,         //!< 4xx validation errors (permanent).
        Payload,        //!< Unsupported or unreadable payload (permanent).
        Unknown         //!< Unclassified failure (treated as permanent).
    };

    Kind kind = Kind::None;     //!< Error class.
    int httpStatus = 0;         //!< HTTP status code, 0 when none.
    QString message;            //!< Human-readable reason.

    //!< @brief True for the "no error" value.
    bool isNull() const { return kind == Kind::None; }

    //!< @brief True for cancellation errors.
    bool isCanceled() const { return kind == Kind::Canceled; }

    //!< @brief Return the kind name ("Network", "Client", ...).
    QString kindName() const;

    //!< @brief Return "<kind>: <message> (HTTP <status>)" for logs.
    QString toString() const;

    /**
     * @brief Build an error value.
     * @param kind Error class.
     * @param message Reason.
     * @param httpStatus HTTP status, 0 when none.
     * @return Error value.
     */
    static TransferError make(Kind kind, const QString& message, int httpStatus = 0);

    /**
     * @brief Build a cancellation error.
     * @param message Optional reason.
     * @return Error value of kind Canceled.
     */
    static TransferError canceled(const QString& message = QString());
};

/**
 * @brief Lifecycle record of one upload.
 */
ERSAL_MODULE_EXPORT struct UploadTask {

    QString id;                                     //!< Unique id assigned at submission.
    UploadPayload payload;                          //!< Data to transfer.
    UploadStatus status = UploadStatus::Pending;    //!< Current state.
    double progress = 0.0;                          //!< Progress 0-100.
    TransferError error;                            //!< Last failure, set only when Failed.
    int retryCount = 0;                             //!< Completed retry attempts.
    QDateTime startedAt;                            //!< Last transition to Uploading.
    QDateTime endedAt;                              //!< Last terminal transition.
    QDateTime nextAttemptAt;                        //!< Retry eligibility time, null when none.
    QSharedPointer<CancelHandle> cancelHandle;      //!< Present only while Uploading.

    //!< @brief True while the task holds a concurrency slot.
    bool isActive() const { return status == UploadStatus::Uploading; }

    //!< @brief True while a retry backoff is running.
    bool isAwaitingRetry() const { return status == UploadStatus::Pending && nextAttemptAt.isValid(); }

    //!< @brief True for Completed, Failed and Cancelled.
    bool isFinished() const;

    //!< @brief Duration of the last attempt in ms, -1 when not ended.
    qint64 durationMs() const;
};

/**
 * @brief Aggregate counters over the task registry.
 */
ERSAL_MODULE_EXPORT struct QueueStatus {
    int total = 0;                  //!< Known tasks.
    int pending = 0;                //!< Pending tasks (including retry backoff).
    int uploading = 0;              //!< Uploading tasks.
    int completed = 0;              //!< Completed tasks not yet removed.
    int failed = 0;                 //!< Failed tasks.
    double averageProgress = 0.0;   //!< Simple mean of all task progress values.
};
