module;
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

module ersal.core.taskregistry;

bool TaskRegistry::insert(const UploadTask& task)
{
    if (task.id.isEmpty() || m_tasks.contains(task.id)) return false;
    m_tasks.insert(task.id, task);
    m_order.append(task.id);
    return true;
}

UploadTask* TaskRegistry::find(const QString& id)
{
    auto it = m_tasks.find(id);
    return it == m_tasks.end() ? nullptr : &it.value();
}

const UploadTask* TaskRegistry::find(const QString& id) const
{
    auto it = m_tasks.constFind(id);
    return it == m_tasks.constEnd() ? nullptr : &it.value();
}

bool TaskRegistry::remove(const QString& id)
{
    if (!m_tasks.remove(id)) return false;
    m_order.removeOne(id);
    return true;
}

void TaskRegistry::clear()
{
    m_tasks.clear();
    m_order.clear();
}

QStringList TaskRegistry::idsWithStatus(UploadStatus status) const
{
    QStringList out;
    for (const QString& id : m_order) {
        const UploadTask* task = find(id);
        if (task && task->status == status) out.append(id);
    }
    return out;
}

int TaskRegistry::countWithStatus(UploadStatus status) const
{
    int count = 0;
    for (auto it = m_tasks.constBegin(); it != m_tasks.constEnd(); ++it) {
        if (it.value().status == status) count++;
    }
    return count;
}

QVector<UploadTask> TaskRegistry::tasks() const
{
    QVector<UploadTask> out;
    out.reserve(m_order.size());
    for (const QString& id : m_order) {
        if (const UploadTask* task = find(id)) out.append(*task);
    }
    return out;
}

UploadTask* TaskRegistry::nextPending()
{
    for (const QString& id : m_order) {
        UploadTask* task = find(id);
        if (task && task->status == UploadStatus::Pending && !task->isAwaitingRetry()) return task;
    }
    return nullptr;
}

QueueStatus TaskRegistry::summarize() const
{
    QueueStatus status;
    double progressSum = 0.0;
    for (auto it = m_tasks.constBegin(); it != m_tasks.constEnd(); ++it) {
        const UploadTask& task = it.value();
        status.total++;
        progressSum += task.progress;
        switch (task.status) {
        case UploadStatus::Pending: status.pending++; break;
        case UploadStatus::Uploading: status.uploading++; break;
        case UploadStatus::Completed: status.completed++; break;
        case UploadStatus::Failed: status.failed++; break;
        case UploadStatus::Cancelled: break;
        }
    }
    if (status.total > 0) status.averageProgress = progressSum / status.total;
    return status;
}
