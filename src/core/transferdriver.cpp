module;
#include <QDebug>
#include <QMetaObject>
#include <QObject>
#include <QSharedPointer>
#include <QtGlobal>

module ersal.core.transferdriver;

import ersal.utils.upload_utils;

namespace utils = ersal::utils;

TransferDriver::TransferDriver(UploadTransport* transport,
                               const UploadPayload& payload,
                               const QSharedPointer<CancelHandle>& cancel,
                               qint64 chunkSizeBytes,
                               qint64 chunkThreshold,
                               QObject* parent)
    : QObject(parent),
    m_transport(transport),
    m_payload(payload),
    m_cancel(cancel),
    m_chunkSize(qMax<qint64>(1, chunkSizeBytes))
{
    m_chunked = shouldChunk(m_payload.size, chunkThreshold);
    if (m_chunked) {
        m_totalChunks = utils::chunkCount(m_payload.size, m_chunkSize);
    }
}

TransferDriver::~TransferDriver()
{
    if (m_reply) {
        QObject::disconnect(m_reply, nullptr, this, nullptr);
    }
}

void TransferDriver::start()
{
    if (m_started) return;
    m_started = true;

    if (!m_transport) {
        finish(TransferError::make(TransferError::Kind::Unknown, QStringLiteral("No transport configured")));
        return;
    }
    if (m_cancel && m_cancel->isCanceled()) {
        finish(TransferError::canceled());
        return;
    }

    if (m_chunked) {
        qDebug() << "Chunked upload of" << m_payload.name << "in" << m_totalChunks << "chunks";
        sendNextChunk();
    } else {
        startSimple();
    }
}

void TransferDriver::startSimple()
{
    qDebug() << "Simple upload of" << m_payload.name << utils::formatBytes(m_payload.size);
    attachReply(m_transport->upload(m_payload, m_cancel));
}

void TransferDriver::sendNextChunk()
{
    if (m_finished) return;
    if (m_cancel && m_cancel->isCanceled()) {
        finish(TransferError::canceled());
        return;
    }
    if (m_completedChunks >= m_totalChunks) {
        finish(TransferError());
        return;
    }

    ChunkSlice slice;
    slice.index = m_completedChunks;
    slice.total = m_totalChunks;
    slice.offset = slice.index * m_chunkSize;
    slice.length = qMin(m_chunkSize, m_payload.size - slice.offset);
    slice.payloadSize = m_payload.size;

    if (m_payload.isInMemory()) {
        slice.data = m_payload.data.mid(slice.offset, slice.length);
        if (slice.data.size() != slice.length) {
            finish(TransferError::make(TransferError::Kind::Payload,
                                       QStringLiteral("Payload buffer is shorter than its declared size")));
            return;
        }
    } else {
        QString readError;
        if (!utils::readFileSlice(m_payload.filePath, slice.offset, slice.length, &slice.data, &readError)) {
            qWarning() << "Cannot read chunk" << slice.index << "of" << m_payload.filePath << readError;
            finish(TransferError::make(TransferError::Kind::Payload, readError));
            return;
        }
    }

    attachReply(m_transport->uploadChunk(m_payload, slice, m_cancel));
}

void TransferDriver::attachReply(TransferReply* reply)
{
    if (!reply) {
        finish(TransferError::make(TransferError::Kind::Unknown, QStringLiteral("Transport rejected the request")));
        return;
    }
    m_reply = reply;
    reply->setParent(this);
    connect(reply, &TransferReply::uploadProgress, this, &TransferDriver::onReplyProgress);
    connect(reply, &TransferReply::finished, this, &TransferDriver::onReplyFinished);
    if (reply->isFinished()) {
        // Answered synchronously; continue from the event loop to keep the chunk loop flat.
        QMetaObject::invokeMethod(this, &TransferDriver::onReplyFinished, Qt::QueuedConnection);
    }
}

void TransferDriver::onReplyProgress(qint64 bytesSent, qint64 bytesTotal)
{
    if (m_chunked || m_finished) return;
    updateProgress(utils::percentOf(bytesSent, bytesTotal));
}

void TransferDriver::onReplyFinished()
{
    if (!m_reply || m_finished) return;
    const TransferError error = m_reply->error();
    releaseReply();

    if (!error.isNull()) {
        if (m_cancel && m_cancel->isCanceled()) {
            finish(TransferError::canceled(error.message));
        } else {
            finish(error);
        }
        return;
    }

    if (!m_chunked) {
        updateProgress(100.0);
        finish(TransferError());
        return;
    }

    ++m_completedChunks;
    updateProgress(utils::percentOf(m_completedChunks, m_totalChunks));
    sendNextChunk();
}

void TransferDriver::releaseReply()
{
    if (!m_reply) return;
    QObject::disconnect(m_reply, nullptr, this, nullptr);
    m_reply->deleteLater();
    m_reply = nullptr;
}

void TransferDriver::finish(const TransferError& error)
{
    if (m_finished) return;
    m_finished = true;
    m_error = error;
    releaseReply();
    if (!error.isNull() && !error.isCanceled()) {
        qWarning() << "Upload attempt failed for" << m_payload.name << error.toString();
    }
    QMetaObject::invokeMethod(this, [this, error]() { emit finished(error); }, Qt::QueuedConnection);
}

void TransferDriver::updateProgress(double percent)
{
    if (percent <= m_progress) return;
    m_progress = qMin(percent, 100.0);
    emit progressChanged(m_progress);
}
