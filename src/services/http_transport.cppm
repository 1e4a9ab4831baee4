/*!
 * @file        http_transport.cppm
 * @brief       HTTP upload transport built on Qt Network.
 * @details     Provides the default UploadTransport used by the ersal command
 *              line tool. A simple transfer is a single POST of the whole
 *              payload; a chunked transfer sends one PATCH per chunk with
 *              range headers describing the slice.
 *
 *              Key responsibilities include:
 *              - Request construction (endpoint, custom headers, bearer token)
 *              - Streaming file payloads without loading them in memory
 *              - Aborting requests when the task's cancel handle fires
 *              - Optional per-request transfer timeout
 *              - Classification of network and HTTP failures
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QUrl>

#ifndef Q_MOC_RUN
export module ersal.services.http_transport;
export import ersal.core.transport;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief UploadTransport sending payloads to a single HTTP endpoint.
 *
 * Replies returned by upload() and uploadChunk() own their QNetworkReply;
 * destroying a reply aborts the request.
 */
ERSAL_MODULE_EXPORT class HttpUploadTransport : public QObject, public UploadTransport {

    Q_OBJECT

    //!< @brief Upload endpoint.
    Q_PROPERTY(QUrl endpoint READ endpoint WRITE setEndpoint NOTIFY endpointChanged)

public:
    /**
     * @brief Construct a transport.
     * @param endpoint Upload endpoint.
     * @param parent Optional parent QObject.
     */
    explicit HttpUploadTransport(const QUrl& endpoint = QUrl(), QObject* parent = nullptr);

    QUrl endpoint() const { return m_endpoint; }
    void setEndpoint(const QUrl& endpoint);

    /**
     * @brief Extra request headers.
     * @param headers Lines of the form "Name: value".
     */
    void setCustomHeaders(const QStringList& headers) { m_customHeaders = headers; }
    QStringList customHeaders() const { return m_customHeaders; }

    //!< @brief Bearer token sent in the Authorization header, empty for none.
    void setBearerToken(const QString& token) { m_bearerToken = token.trimmed(); }
    QString bearerToken() const { return m_bearerToken; }

    /**
     * @brief Per-request transfer timeout.
     * @param ms Timeout in milliseconds, 0 disables it.
     */
    void setTransferTimeoutMs(int ms) { m_transferTimeoutMs = qMax(0, ms); }
    int transferTimeoutMs() const { return m_transferTimeoutMs; }

    TransferReply* upload(const UploadPayload& payload,
                          const QSharedPointer<CancelHandle>& cancel) override;

    TransferReply* uploadChunk(const UploadPayload& payload,
                               const ChunkSlice& slice,
                               const QSharedPointer<CancelHandle>& cancel) override;

    /**
     * @brief Classify a finished network request.
     * @param error Qt network error code.
     * @param httpStatus HTTP status code, 0 when none was received.
     * @param message Human readable error text.
     * @return Classified error, null on success.
     */
    static TransferError classifyNetworkError(QNetworkReply::NetworkError error,
                                              int httpStatus,
                                              const QString& message = QString());

    /**
     * @brief Classify an HTTP status code.
     * @param httpStatus HTTP status code.
     * @param message Human readable error text.
     * @return Classified error, null for statuses below 400.
     */
    static TransferError classifyHttpStatus(int httpStatus, const QString& message = QString());

signals:
    void endpointChanged();

private:
    /**
     * @brief Build a request carrying the common headers.
     * @param payload Payload being sent.
     * @return Request for the endpoint.
     */
    QNetworkRequest buildRequest(const UploadPayload& payload) const;

    //!< @brief Apply custom headers and authorization to a request.
    void applyNetworkOptions(QNetworkRequest& req) const;

    /**
     * @brief Wrap a network reply into a TransferReply.
     * @param networkReply Running request.
     * @param cancel Cancel handle of the task.
     * @return Reply owning @p networkReply.
     */
    TransferReply* track(QNetworkReply* networkReply, const QSharedPointer<CancelHandle>& cancel);

    QNetworkAccessManager m_network;    //!< Network access manager.
    QUrl m_endpoint;                    //!< Upload endpoint.
    QStringList m_customHeaders;        //!< Extra header lines.
    QString m_bearerToken;              //!< Authorization token.
    int m_transferTimeoutMs = 0;        //!< Per-request timeout, 0 disables it.
};

#include "http_transport.moc"
