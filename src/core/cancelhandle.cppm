/*!
 * @file        cancelhandle.cppm
 * @brief       Cooperative cancellation signal for in-flight transfers.
 * @details     A CancelHandle is created by the dispatcher when a task starts
 *              uploading and is handed down the whole transfer call chain
 *              (driver, transport, network reply). Cancelling it is a request,
 *              not a kill: every holder observes the flag or the canceled()
 *              signal and unwinds on its own.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module ersal.core.cancelhandle;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief One-shot cancellation token.
 *
 * The first call to cancel() latches the handle and emits canceled();
 * later calls are ignored.
 */
ERSAL_MODULE_EXPORT class CancelHandle : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct an armed (not canceled) handle.
     * @param parent Optional parent QObject.
     */
    explicit CancelHandle(QObject* parent = nullptr);

    //!< @brief Check whether cancellation was requested.
    bool isCanceled() const { return m_canceled; }

    //!< @brief Return the reason passed to cancel(), if any.
    QString reason() const { return m_reason; }

public slots:
    /**
     * @brief Request cancellation.
     * @param reason Optional human-readable reason.
     */
    void cancel(const QString& reason = QString());

signals:
    //!< @brief Emitted once, when cancellation is first requested.
    void canceled();

private:
    bool m_canceled = false;    //!< Latched cancellation flag.
    QString m_reason;           //!< Cancellation reason.
};

#include "cancelhandle.moc"
