#include <gtest/gtest.h>

#include <QByteArray>
#include <QFile>
#include <QSharedPointer>
#include <QTemporaryDir>
#include <QVector>

import ersal.core.transferdriver;
import ersal.tests.support;

using ersal::tests::FakeTransport;
using ersal::tests::waitUntil;

namespace {

struct DriverProbe {
    QVector<double> progress;
    bool finished = false;
    TransferError error;

    void attach(TransferDriver& driver)
    {
        QObject::connect(&driver, &TransferDriver::progressChanged, [this](double percent) {
            progress.append(percent);
        });
        QObject::connect(&driver, &TransferDriver::finished, [this](const TransferError& e) {
            finished = true;
            error = e;
        });
    }
};

QByteArray patternBytes(int size)
{
    QByteArray bytes(size, Qt::Uninitialized);
    for (int i = 0; i < size; ++i) bytes[i] = char('a' + (i % 26));
    return bytes;
}

class NullTransport : public UploadTransport {
public:
    TransferReply* upload(const UploadPayload&, const QSharedPointer<CancelHandle>&) override { return nullptr; }
    TransferReply* uploadChunk(const UploadPayload&, const ChunkSlice&, const QSharedPointer<CancelHandle>&) override
    {
        return nullptr;
    }
};

} // namespace

TEST(TransferDriverTest, SmallPayloadUsesSingleRequest)
{
    FakeTransport transport;
    transport.setAutoComplete(true);
    const UploadPayload payload = UploadPayload::fromData("small.bin", patternBytes(100));
    TransferDriver driver(&transport, payload, QSharedPointer<CancelHandle>::create(), 10, 100);
    DriverProbe probe;
    probe.attach(driver);

    EXPECT_FALSE(driver.isChunked());
    driver.start();
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }));

    EXPECT_TRUE(probe.error.isNull());
    ASSERT_EQ(transport.calls().size(), 1);
    EXPECT_FALSE(transport.calls().first().chunked);
    ASSERT_FALSE(probe.progress.isEmpty());
    EXPECT_DOUBLE_EQ(probe.progress.first(), 50.0);
    EXPECT_DOUBLE_EQ(probe.progress.last(), 100.0);
}

TEST(TransferDriverTest, LargePayloadIssuesCeilChunkCalls)
{
    FakeTransport transport;
    transport.setAutoComplete(true);
    const QByteArray bytes = patternBytes(95);
    const UploadPayload payload = UploadPayload::fromData("large.bin", bytes);
    TransferDriver driver(&transport, payload, QSharedPointer<CancelHandle>::create(), 10, 20);
    DriverProbe probe;
    probe.attach(driver);

    EXPECT_TRUE(driver.isChunked());
    EXPECT_EQ(driver.totalChunks(), 10);
    driver.start();
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }));

    EXPECT_TRUE(probe.error.isNull());
    const QVector<FakeTransport::Call>& calls = transport.calls();
    ASSERT_EQ(calls.size(), 10);
    for (int i = 0; i < calls.size(); ++i) {
        const ChunkSlice& slice = calls.at(i).slice;
        EXPECT_TRUE(calls.at(i).chunked);
        EXPECT_EQ(slice.index, i);
        EXPECT_EQ(slice.total, 10);
        EXPECT_EQ(slice.offset, i * 10);
        EXPECT_EQ(slice.payloadSize, 95);
        EXPECT_EQ(slice.data, bytes.mid(i * 10, 10));
    }
    EXPECT_EQ(calls.last().slice.length, 5);
    EXPECT_TRUE(calls.last().slice.isLast());

    ASSERT_EQ(probe.progress.size(), 10);
    for (int i = 1; i < probe.progress.size(); ++i) {
        EXPECT_GT(probe.progress.at(i), probe.progress.at(i - 1));
    }
    EXPECT_DOUBLE_EQ(probe.progress.first(), 10.0);
    EXPECT_DOUBLE_EQ(probe.progress.last(), 100.0);
}

TEST(TransferDriverTest, PayloadAtThresholdIsNotChunked)
{
    EXPECT_FALSE(TransferDriver::shouldChunk(50, 50));
    EXPECT_TRUE(TransferDriver::shouldChunk(51, 50));
}

TEST(TransferDriverTest, FilePayloadChunksAreReadFromDisk)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QByteArray bytes = patternBytes(25);
    const QString path = dir.filePath("disk.bin");
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(bytes);
    }

    FakeTransport transport;
    transport.setAutoComplete(true);
    const UploadPayload payload = UploadPayload::fromFile(path);
    ASSERT_EQ(payload.size, 25);
    TransferDriver driver(&transport, payload, QSharedPointer<CancelHandle>::create(), 10, 10);
    DriverProbe probe;
    probe.attach(driver);
    driver.start();
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }));

    EXPECT_TRUE(probe.error.isNull());
    ASSERT_EQ(transport.calls().size(), 3);
    EXPECT_EQ(transport.calls().at(2).slice.data, bytes.mid(20));
}

TEST(TransferDriverTest, MultiGigabytePayloadKeepsFullChunkCount)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("huge.bin");
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write("abcd");
    }

    FakeTransport transport;
    UploadPayload payload = UploadPayload::fromFile(path);
    payload.size = 3000000000LL;
    TransferDriver driver(&transport, payload, QSharedPointer<CancelHandle>::create(), 1, 1);
    DriverProbe probe;
    probe.attach(driver);

    ASSERT_TRUE(driver.isChunked());
    EXPECT_EQ(driver.totalChunks(), 3000000000LL);
    driver.start();

    ASSERT_EQ(transport.calls().size(), 1);
    const ChunkSlice& slice = transport.calls().first().slice;
    EXPECT_EQ(slice.index, 0);
    EXPECT_EQ(slice.total, 3000000000LL);
    EXPECT_EQ(slice.length, 1);
    EXPECT_EQ(slice.data, QByteArray("a"));
    EXPECT_FALSE(driver.isFinished());

    ersal::tests::spinEventLoop(20);
    EXPECT_FALSE(probe.finished);
}

TEST(TransferDriverTest, UnreadableFileIsPayloadError)
{
    FakeTransport transport;
    UploadPayload payload;
    payload.name = "gone.bin";
    payload.filePath = "/nonexistent/ersal/gone.bin";
    payload.size = 100;
    TransferDriver driver(&transport, payload, QSharedPointer<CancelHandle>::create(), 10, 10);
    DriverProbe probe;
    probe.attach(driver);
    driver.start();
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }));

    EXPECT_EQ(probe.error.kind, TransferError::Kind::Payload);
    EXPECT_TRUE(transport.calls().isEmpty());
}

TEST(TransferDriverTest, ChunkFailureFailsTransfer)
{
    FakeTransport transport;
    transport.setAutoComplete(true);
    transport.script("large.bin", { TransferError(), TransferError::make(TransferError::Kind::Network, "reset") });
    const UploadPayload payload = UploadPayload::fromData("large.bin", patternBytes(50));
    TransferDriver driver(&transport, payload, QSharedPointer<CancelHandle>::create(), 10, 10);
    DriverProbe probe;
    probe.attach(driver);
    driver.start();
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }));

    EXPECT_EQ(probe.error.kind, TransferError::Kind::Network);
    EXPECT_EQ(transport.calls().size(), 2);
    EXPECT_EQ(driver.completedChunks(), 1);
}

TEST(TransferDriverTest, CancellationIsCheckedBeforeEachChunk)
{
    FakeTransport transport;
    transport.setHonorCancel(false);
    const auto cancel = QSharedPointer<CancelHandle>::create();
    const UploadPayload payload = UploadPayload::fromData("large.bin", patternBytes(50));
    TransferDriver driver(&transport, payload, cancel, 10, 10);
    DriverProbe probe;
    probe.attach(driver);
    driver.start();

    ASSERT_TRUE(transport.complete("large.bin"));
    ASSERT_EQ(transport.calls().size(), 2);

    cancel->cancel("stop");
    ASSERT_TRUE(transport.complete("large.bin"));
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }));

    EXPECT_TRUE(probe.error.isCanceled());
    EXPECT_EQ(transport.calls().size(), 2);
}

TEST(TransferDriverTest, CanceledRequestReportsCancellation)
{
    FakeTransport transport;
    const auto cancel = QSharedPointer<CancelHandle>::create();
    const UploadPayload payload = UploadPayload::fromData("small.bin", patternBytes(10));
    TransferDriver driver(&transport, payload, cancel, 10, 100);
    DriverProbe probe;
    probe.attach(driver);
    driver.start();

    cancel->cancel();
    EXPECT_FALSE(probe.finished);
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }));
    EXPECT_TRUE(probe.error.isCanceled());
}

TEST(TransferDriverTest, AlreadyCanceledHandleSendsNothing)
{
    FakeTransport transport;
    const auto cancel = QSharedPointer<CancelHandle>::create();
    cancel->cancel();
    TransferDriver driver(&transport, UploadPayload::fromData("x.bin", patternBytes(10)), cancel, 10, 100);
    DriverProbe probe;
    probe.attach(driver);
    driver.start();
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }));

    EXPECT_TRUE(probe.error.isCanceled());
    EXPECT_TRUE(transport.calls().isEmpty());
}

TEST(TransferDriverTest, FinishedIsDeliveredAsynchronously)
{
    NullTransport transport;
    TransferDriver driver(&transport, UploadPayload::fromData("x.bin", patternBytes(10)),
                          QSharedPointer<CancelHandle>::create(), 10, 100);
    DriverProbe probe;
    probe.attach(driver);
    driver.start();

    EXPECT_TRUE(driver.isFinished());
    EXPECT_FALSE(probe.finished);
    ASSERT_TRUE(waitUntil([&] { return probe.finished; }));
    EXPECT_EQ(probe.error.kind, TransferError::Kind::Unknown);
}
