/*!
 * @file        transferdriver.cppm
 * @brief       Per-task transfer strategy: simple or chunked upload.
 * @details     A TransferDriver runs one upload attempt of one task against
 *              the transport. It makes the chunking decision (payloads larger
 *              than chunkSize * multiplier are sent as sequential chunks),
 *              converts transport progress into a 0-100 percentage, observes
 *              the task's cancel handle between chunks, and reports a single
 *              finished() outcome.
 *
 *              finished() is always delivered from the event loop, never from
 *              inside start() or a transport callback, so the dispatcher can
 *              react to it without re-entering itself.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QSharedPointer>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ersal.core.transferdriver;
export import ersal.core.transport;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief Drives one upload attempt through the transport.
 *
 * The driver does not own the transport. It owns every reply it receives.
 */
ERSAL_MODULE_EXPORT class TransferDriver : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a driver for one attempt.
     * @param transport Transport performing the requests.
     * @param payload Payload to send.
     * @param cancel Cancellation handle of the task.
     * @param chunkSizeBytes Chunk size for chunked transfers.
     * @param chunkThreshold Payloads larger than this are chunked.
     * @param parent Optional parent QObject.
     */
    TransferDriver(UploadTransport* transport,
                   const UploadPayload& payload,
                   const QSharedPointer<CancelHandle>& cancel,
                   qint64 chunkSizeBytes,
                   qint64 chunkThreshold,
                   QObject* parent = nullptr);

    ~TransferDriver() override;

    //!< @brief Start the attempt. Has no effect when called twice.
    void start();

    //!< @brief Check whether the payload is sent in chunks.
    bool isChunked() const { return m_chunked; }

    //!< @brief Return the chunk count (0 for simple transfers).
    qint64 totalChunks() const { return m_totalChunks; }

    //!< @brief Return the number of chunks acknowledged so far.
    qint64 completedChunks() const { return m_completedChunks; }

    //!< @brief Check whether the attempt has reached its outcome.
    bool isFinished() const { return m_finished; }

    //!< @brief Return the outcome (null on success).
    TransferError error() const { return m_error; }

    /**
     * @brief Chunking decision.
     * @param payloadSize Payload size in bytes.
     * @param chunkThreshold Threshold in bytes.
     * @return True when the payload must be chunked.
     */
    static bool shouldChunk(qint64 payloadSize, qint64 chunkThreshold) { return payloadSize > chunkThreshold; }

signals:
    /**
     * @brief Emitted when the attempt's progress changes.
     * @param percent Progress 0-100.
     */
    void progressChanged(double percent);

    /**
     * @brief Emitted once with the attempt's outcome.
     * @param error Failure reason, null on success.
     */
    void finished(const TransferError& error);

private:
    //!< @brief Issue the single request of a simple transfer.
    void startSimple();

    //!< @brief Issue the next chunk request, or finish when none is left.
    void sendNextChunk();

    /**
     * @brief Take ownership of a reply and observe it.
     * @param reply Reply returned by the transport (may be null).
     */
    void attachReply(TransferReply* reply);

    /**
     * @brief Handle reply progress.
     * @param bytesSent Bytes sent.
     * @param bytesTotal Total bytes.
     */
    void onReplyProgress(qint64 bytesSent, qint64 bytesTotal);

    //!< @brief Handle reply completion.
    void onReplyFinished();

    //!< @brief Detach and dispose of the current reply.
    void releaseReply();

    /**
     * @brief Record the outcome and schedule finished().
     * @param error Failure reason, null on success.
     */
    void finish(const TransferError& error);

    /**
     * @brief Emit progress if it moved forward.
     * @param percent New progress 0-100.
     */
    void updateProgress(double percent);

    UploadTransport* m_transport = nullptr;     //!< Transport (not owned).
    UploadPayload m_payload;                    //!< Payload reference.
    QSharedPointer<CancelHandle> m_cancel;      //!< Task cancel handle.
    qint64 m_chunkSize = 0;                     //!< Chunk size in bytes.
    bool m_chunked = false;                     //!< Chunked transfer flag.
    qint64 m_totalChunks = 0;                   //!< Chunk count.
    qint64 m_completedChunks = 0;               //!< Acknowledged chunks.
    double m_progress = 0.0;                    //!< Last emitted progress.
    TransferReply* m_reply = nullptr;           //!< Outstanding reply.
    bool m_started = false;                     //!< start() guard.
    bool m_finished = false;                    //!< Outcome recorded.
    TransferError m_error;                      //!< Outcome.
};

#include "transferdriver.moc"
