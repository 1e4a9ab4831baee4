#include <gtest/gtest.h>

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QList>
#include <QNetworkReply>
#include <QPointer>
#include <QScopedPointer>
#include <QSharedPointer>
#include <QTcpServer>
#include <QTcpSocket>
#include <QUrl>

import ersal.services.http_transport;
import ersal.core.retrypolicy;
import ersal.tests.support;

using ersal::tests::waitUntil;

namespace {

/**
 * @brief Minimal HTTP endpoint answering every request with a fixed status.
 */
class RecordingServer {
public:
    struct Request {
        QByteArray method;
        QList<QByteArray> headerLines;
        QByteArray body;

        QByteArray header(const QByteArray& name) const
        {
            for (const QByteArray& line : headerLines) {
                const int sep = line.indexOf(':');
                if (sep > 0 && line.left(sep).trimmed().toLower() == name.toLower()) {
                    return line.mid(sep + 1).trimmed();
                }
            }
            return QByteArray();
        }
    };

    explicit RecordingServer(int status = 201) : m_status(status)
    {
        QObject::connect(&m_server, &QTcpServer::newConnection, [this]() {
            while (QTcpSocket* socket = m_server.nextPendingConnection()) {
                QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket]() { onReadyRead(socket); });
                QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
            }
        });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }
    QUrl url() const { return QUrl(QStringLiteral("http://127.0.0.1:%1/upload").arg(m_server.serverPort())); }
    const QList<Request>& requests() const { return m_requests; }

private:
    void onReadyRead(QTcpSocket* socket)
    {
        QByteArray& buffer = m_buffers[socket];
        buffer += socket->readAll();
        for (;;) {
            const int end = buffer.indexOf("\r\n\r\n");
            if (end < 0) return;
            Request request;
            const QList<QByteArray> lines = buffer.left(end).split('\n');
            if (lines.isEmpty()) return;
            request.method = lines.first().split(' ').first().trimmed();
            for (int i = 1; i < lines.size(); ++i) request.headerLines.append(lines.at(i).trimmed());
            const int length = request.header("Content-Length").toInt();
            if (buffer.size() < end + 4 + length) return;
            request.body = buffer.mid(end + 4, length);
            buffer.remove(0, end + 4 + length);
            m_requests.append(request);

            const QByteArray reason = m_status < 400 ? "OK" : "Error";
            socket->write("HTTP/1.1 " + QByteArray::number(m_status) + " " + reason
                          + "\r\nContent-Length: 0\r\n\r\n");
            socket->flush();
        }
    }

    QTcpServer m_server;
    QHash<QTcpSocket*, QByteArray> m_buffers;
    QList<Request> m_requests;
    int m_status = 201;
};

struct ReplyProbe {
    bool finished = false;
    TransferError error;

    void attach(TransferReply* reply)
    {
        if (reply->isFinished()) {
            finished = true;
            error = reply->error();
            return;
        }
        QObject::connect(reply, &TransferReply::finished, [this, reply]() {
            finished = true;
            error = reply->error();
        });
    }
};

} // namespace

TEST(HttpUploadTransportTest, ClassifiesHttpStatuses)
{
    using Kind = TransferError::Kind;
    EXPECT_TRUE(HttpUploadTransport::classifyHttpStatus(200).isNull());
    EXPECT_TRUE(HttpUploadTransport::classifyHttpStatus(308).isNull());
    EXPECT_EQ(HttpUploadTransport::classifyHttpStatus(400).kind, Kind::Client);
    EXPECT_EQ(HttpUploadTransport::classifyHttpStatus(404).kind, Kind::Client);
    EXPECT_EQ(HttpUploadTransport::classifyHttpStatus(408).kind, Kind::Server);
    EXPECT_EQ(HttpUploadTransport::classifyHttpStatus(413).kind, Kind::Payload);
    EXPECT_EQ(HttpUploadTransport::classifyHttpStatus(415).kind, Kind::Payload);
    EXPECT_EQ(HttpUploadTransport::classifyHttpStatus(429).kind, Kind::Server);
    EXPECT_EQ(HttpUploadTransport::classifyHttpStatus(500).kind, Kind::Server);
    EXPECT_EQ(HttpUploadTransport::classifyHttpStatus(503).httpStatus, 503);
}

TEST(HttpUploadTransportTest, ClassifiesNetworkErrors)
{
    using Kind = TransferError::Kind;
    EXPECT_TRUE(HttpUploadTransport::classifyNetworkError(QNetworkReply::NoError, 201).isNull());
    EXPECT_EQ(HttpUploadTransport::classifyNetworkError(QNetworkReply::ConnectionRefusedError, 0).kind, Kind::Network);
    EXPECT_EQ(HttpUploadTransport::classifyNetworkError(QNetworkReply::HostNotFoundError, 0).kind, Kind::Network);
    EXPECT_EQ(HttpUploadTransport::classifyNetworkError(QNetworkReply::ProxyConnectionRefusedError, 0).kind, Kind::Network);
    EXPECT_EQ(HttpUploadTransport::classifyNetworkError(QNetworkReply::TimeoutError, 0).kind, Kind::Timeout);
    EXPECT_EQ(HttpUploadTransport::classifyNetworkError(QNetworkReply::OperationCanceledError, 0).kind, Kind::Canceled);
    EXPECT_EQ(HttpUploadTransport::classifyNetworkError(QNetworkReply::ContentNotFoundError, 0).kind, Kind::Client);
    EXPECT_EQ(HttpUploadTransport::classifyNetworkError(QNetworkReply::ServiceUnavailableError, 0).kind, Kind::Server);
    EXPECT_EQ(HttpUploadTransport::classifyNetworkError(QNetworkReply::ProtocolFailure, 0).kind, Kind::Unknown);
    // A received status code takes precedence over the generic error.
    EXPECT_EQ(HttpUploadTransport::classifyNetworkError(QNetworkReply::UnknownContentError, 413).kind, Kind::Payload);
}

TEST(HttpUploadTransportTest, ClassificationDrivesRetryDecisions)
{
    const RetryPolicy policy(3, 10);
    EXPECT_TRUE(policy.isRetryable(HttpUploadTransport::classifyHttpStatus(503)));
    EXPECT_TRUE(policy.isRetryable(HttpUploadTransport::classifyHttpStatus(429)));
    EXPECT_FALSE(policy.isRetryable(HttpUploadTransport::classifyHttpStatus(413)));
    EXPECT_FALSE(policy.isRetryable(HttpUploadTransport::classifyHttpStatus(422)));
}

TEST(HttpUploadTransportTest, InvalidEndpointFailsImmediately)
{
    HttpUploadTransport transport;
    QScopedPointer<TransferReply> reply(
        transport.upload(UploadPayload::fromData("a.txt", "hello"), QSharedPointer<CancelHandle>::create()));
    ASSERT_TRUE(reply);
    EXPECT_TRUE(reply->isFinished());
    EXPECT_EQ(reply->error().kind, TransferError::Kind::Client);
}

TEST(HttpUploadTransportTest, SimpleUploadPostsPayloadWithHeaders)
{
    RecordingServer server;
    ASSERT_TRUE(server.listen());
    HttpUploadTransport transport(server.url());
    transport.setBearerToken("secret");
    transport.setCustomHeaders({ "X-Client: ersal-tests", "malformed header" });

    ReplyProbe probe;
    QScopedPointer<TransferReply> reply(
        transport.upload(UploadPayload::fromData("hello world.txt", "hello", "text/plain"),
                         QSharedPointer<CancelHandle>::create()));
    ASSERT_TRUE(reply);
    probe.attach(reply.data());
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }, 5000));

    EXPECT_TRUE(probe.error.isNull()) << qPrintable(probe.error.toString());
    ASSERT_EQ(server.requests().size(), 1);
    const RecordingServer::Request& request = server.requests().first();
    EXPECT_EQ(request.method, QByteArray("POST"));
    EXPECT_EQ(request.body, QByteArray("hello"));
    EXPECT_EQ(request.header("Content-Type"), QByteArray("text/plain"));
    EXPECT_EQ(request.header("X-File-Name"), QByteArray("hello%20world.txt"));
    EXPECT_EQ(request.header("Authorization"), QByteArray("Bearer secret"));
    EXPECT_EQ(request.header("X-Client"), QByteArray("ersal-tests"));
}

TEST(HttpUploadTransportTest, ChunkUploadSendsRangeHeaders)
{
    RecordingServer server;
    ASSERT_TRUE(server.listen());
    HttpUploadTransport transport(server.url());

    ChunkSlice slice;
    slice.index = 1;
    slice.total = 3;
    slice.offset = 10;
    slice.length = 10;
    slice.payloadSize = 25;
    slice.data = QByteArray(10, 'c');

    ReplyProbe probe;
    QScopedPointer<TransferReply> reply(
        transport.uploadChunk(UploadPayload::fromData("big.bin", QByteArray(25, 'c')), slice,
                              QSharedPointer<CancelHandle>::create()));
    ASSERT_TRUE(reply);
    probe.attach(reply.data());
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }, 5000));

    EXPECT_TRUE(probe.error.isNull()) << qPrintable(probe.error.toString());
    ASSERT_EQ(server.requests().size(), 1);
    const RecordingServer::Request& request = server.requests().first();
    EXPECT_EQ(request.method, QByteArray("PATCH"));
    EXPECT_EQ(request.body, slice.data);
    EXPECT_EQ(request.header("Content-Range"), QByteArray("bytes 10-19/25"));
    EXPECT_EQ(request.header("Upload-Offset"), QByteArray("10"));
    EXPECT_EQ(request.header("X-Chunk-Index"), QByteArray("1"));
    EXPECT_EQ(request.header("X-Chunk-Count"), QByteArray("3"));
}

TEST(HttpUploadTransportTest, ServerErrorIsClassified)
{
    RecordingServer server(503);
    ASSERT_TRUE(server.listen());
    HttpUploadTransport transport(server.url());

    ReplyProbe probe;
    QScopedPointer<TransferReply> reply(
        transport.upload(UploadPayload::fromData("a.bin", "abc"), QSharedPointer<CancelHandle>::create()));
    ASSERT_TRUE(reply);
    probe.attach(reply.data());
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }, 5000));

    EXPECT_EQ(probe.error.kind, TransferError::Kind::Server);
    EXPECT_EQ(probe.error.httpStatus, 503);
}

TEST(HttpUploadTransportTest, MissingFileIsPayloadError)
{
    HttpUploadTransport transport(QUrl("http://127.0.0.1:9/upload"));
    UploadPayload payload;
    payload.name = "missing.bin";
    payload.filePath = "/nonexistent/ersal/missing.bin";
    QScopedPointer<TransferReply> reply(transport.upload(payload, QSharedPointer<CancelHandle>::create()));
    ASSERT_TRUE(reply);
    EXPECT_TRUE(reply->isFinished());
    EXPECT_EQ(reply->error().kind, TransferError::Kind::Payload);
}
