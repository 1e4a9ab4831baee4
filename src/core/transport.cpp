module;
#include <QObject>
#include <QtGlobal>

module ersal.core.transport;

TransferReply::TransferReply(QObject* parent) : QObject(parent) {}

void TransferReply::reportProgress(qint64 bytesSent, qint64 bytesTotal)
{
    if (m_finished) return;
    m_bytesSent = bytesSent;
    m_bytesTotal = bytesTotal;
    emit uploadProgress(bytesSent, bytesTotal);
}

void TransferReply::finish(const TransferError& error)
{
    if (m_finished) return;
    m_finished = true;
    m_error = error;
    emit finished();
}

TransferReply* TransferReply::createFinished(const TransferError& error, QObject* parent)
{
    auto* reply = new TransferReply(parent);
    reply->finish(error);
    return reply;
}
