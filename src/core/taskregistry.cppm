/*!
 * @file        taskregistry.cppm
 * @brief       Keyed store of upload task records.
 * @details     The registry holds every known task by id and remembers
 *              submission order, which defines admission order (FIFO).
 *              It performs no policy of its own; the dispatcher and the
 *              manager are its only mutators.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module ersal.core.taskregistry;
export import ersal.core.uploadtask;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief Task store ordered by submission.
 *
 * Pointers returned by find() and nextPending() stay valid only until the
 * next insert() or remove().
 */
ERSAL_MODULE_EXPORT class TaskRegistry {
public:
    /**
     * @brief Insert a new task at the end of the submission order.
     * @param task Task record; its id must be unique.
     * @return False if the id is empty or already present.
     */
    bool insert(const UploadTask& task);

    /**
     * @brief Lookup a task.
     * @param id Task id.
     * @return Task pointer or null.
     */
    UploadTask* find(const QString& id);

    /**
     * @brief Lookup a task (read-only).
     * @param id Task id.
     * @return Task pointer or null.
     */
    const UploadTask* find(const QString& id) const;

    //!< @brief Check whether a task id is known.
    bool contains(const QString& id) const { return m_tasks.contains(id); }

    /**
     * @brief Remove a task.
     * @param id Task id.
     * @return False if the id was unknown.
     */
    bool remove(const QString& id);

    //!< @brief Remove every task.
    void clear();

    //!< @brief Return the number of known tasks.
    int size() const { return m_tasks.size(); }

    //!< @brief Check whether the registry is empty.
    bool isEmpty() const { return m_tasks.isEmpty(); }

    //!< @brief Return task ids in submission order.
    QStringList ids() const { return m_order; }

    /**
     * @brief Return ids of tasks in a given state, in submission order.
     * @param status Task status.
     * @return Id list.
     */
    QStringList idsWithStatus(UploadStatus status) const;

    /**
     * @brief Count tasks in a given state.
     * @param status Task status.
     * @return Task count.
     */
    int countWithStatus(UploadStatus status) const;

    //!< @brief Return snapshots of all tasks in submission order.
    QVector<UploadTask> tasks() const;

    /**
     * @brief Earliest-submitted task eligible for admission.
     *
     * A task is eligible when it is Pending and not waiting out a retry backoff.
     *
     * @return Task pointer or null.
     */
    UploadTask* nextPending();

    /**
     * @brief Aggregate counters over all tasks.
     *
     * averageProgress is the simple (unweighted) mean of every task's progress.
     *
     * @return Queue status.
     */
    QueueStatus summarize() const;

private:
    QHash<QString, UploadTask> m_tasks;     //!< Tasks by id.
    QStringList m_order;                    //!< Ids in submission order.
};
