/*!
 * @file        transport.cppm
 * @brief       Transport abstraction used by the upload core.
 * @details     The upload core never talks to the network itself. It drives an
 *              UploadTransport supplied by the embedding application, which
 *              performs either a simple single-request transfer or one chunk
 *              of a chunked transfer and answers with a TransferReply.
 *
 *              A TransferReply is the asynchronous result of one request:
 *              it reports byte progress, finishes exactly once, and carries a
 *              TransferError (null on success). Every request receives the
 *              task's CancelHandle and is expected to stop promptly once it
 *              fires.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QObject>
#include <QSharedPointer>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ersal.core.transport;
export import ersal.core.uploadtask;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief One piece of a chunked transfer.
 */
ERSAL_MODULE_EXPORT struct ChunkSlice {
    qint64 index = 0;       //!< Zero-based chunk index.
    qint64 total = 0;       //!< Total chunk count.
    qint64 offset = 0;      //!< Byte offset of the chunk in the payload.
    qint64 length = 0;      //!< Chunk length in bytes.
    qint64 payloadSize = 0; //!< Full payload size.
    QByteArray data;        //!< Chunk bytes.

    //!< @brief True for the final chunk.
    bool isLast() const { return index == total - 1; }
};

/**
 * @brief Asynchronous result of one transport request.
 *
 * Transports create a reply per request and complete it with finish().
 * The caller takes ownership of the reply. A reply may already be finished
 * when it is returned.
 */
ERSAL_MODULE_EXPORT class TransferReply : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct an unfinished reply.
     * @param parent Optional parent QObject.
     */
    explicit TransferReply(QObject* parent = nullptr);

    //!< @brief Check whether the request has finished.
    bool isFinished() const { return m_finished; }

    //!< @brief Return the request error (null on success or while running).
    TransferError error() const { return m_error; }

    //!< @brief Return bytes sent so far.
    qint64 bytesSent() const { return m_bytesSent; }

    //!< @brief Return total bytes of the request (0 if unknown).
    qint64 bytesTotal() const { return m_bytesTotal; }

    /**
     * @brief Report transfer progress.
     *
     * Ignored once the reply has finished.
     *
     * @param bytesSent Bytes sent so far.
     * @param bytesTotal Total bytes (0 if unknown).
     */
    void reportProgress(qint64 bytesSent, qint64 bytesTotal);

    /**
     * @brief Complete the request.
     *
     * Only the first call has an effect.
     *
     * @param error Failure reason, null for success.
     */
    void finish(const TransferError& error = TransferError());

    /**
     * @brief Create a reply that is already finished.
     * @param error Failure reason, null for success.
     * @param parent Optional parent QObject.
     * @return New reply.
     */
    static TransferReply* createFinished(const TransferError& error, QObject* parent = nullptr);

signals:
    /**
     * @brief Emitted on progress updates.
     * @param bytesSent Bytes sent so far.
     * @param bytesTotal Total bytes.
     */
    void uploadProgress(qint64 bytesSent, qint64 bytesTotal);

    //!< @brief Emitted once when the request finishes.
    void finished();

private:
    bool m_finished = false;    //!< Finished flag.
    TransferError m_error;      //!< Request error.
    qint64 m_bytesSent = 0;     //!< Bytes sent.
    qint64 m_bytesTotal = 0;    //!< Total bytes.
};

/**
 * @brief Byte transfer driver supplied by the embedding application.
 */
ERSAL_MODULE_EXPORT class UploadTransport {
public:
    virtual ~UploadTransport() = default;

    /**
     * @brief Start a simple single-request transfer.
     * @param payload Payload to send.
     * @param cancel Cancellation handle to observe.
     * @return Reply owned by the caller, or null if the request could not be issued.
     */
    virtual TransferReply* upload(const UploadPayload& payload,
                                  const QSharedPointer<CancelHandle>& cancel) = 0;

    /**
     * @brief Send one chunk of a chunked transfer.
     * @param payload Payload the chunk belongs to.
     * @param slice Chunk description and bytes.
     * @param cancel Cancellation handle to observe.
     * @return Reply owned by the caller, or null if the request could not be issued.
     */
    virtual TransferReply* uploadChunk(const UploadPayload& payload,
                                       const ChunkSlice& slice,
                                       const QSharedPointer<CancelHandle>& cancel) = 0;
};

#include "transport.moc"
