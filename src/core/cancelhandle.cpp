module;
#include <QDebug>
#include <QObject>

module ersal.core.cancelhandle;

CancelHandle::CancelHandle(QObject* parent) : QObject(parent) {}

void CancelHandle::cancel(const QString& reason)
{
    if (m_canceled) return;
    m_canceled = true;
    m_reason = reason;
    qDebug() << "Cancel requested" << (reason.isEmpty() ? QStringLiteral("(no reason)") : reason);
    emit canceled();
}
