#include <QtTest/QtTest>
#include <QJsonDocument>
#include <ssap/Session/CommandCorrelator.hpp>
#include <ssap/Transport/ReplayChannel.hpp>

class TestCommandCorrelator : public QObject {
    Q_OBJECT

private:
    static QJsonObject sentFrame(const ssap::ReplayChannel& channel, int index)
    {
        return QJsonDocument::fromJson(channel.writtenFrames().at(index).toUtf8()).object();
    }

private slots:
    void testRequestIdsIncrease()
    {
        ssap::ReplayChannel channel;
        channel.simulateOpen();
        channel.setResponder([](ssap::ReplayChannel* ch, const QString&) {
            ch->feedText(R"({"type":"response","payload":{"returnValue":true}})");
        });
        ssap::CommandCorrelator correlator(500);
        QVERIFY(correlator.lastRequestId().isEmpty());

        int replies = 0;
        correlator.send(&channel, "ssap://audio/volumeUp", {}, [&](const ssap::CommandCorrelator::Reply& reply) {
            QVERIFY(reply.ok());
            ++replies;
            correlator.send(&channel, "ssap://audio/volumeDown", {}, [&](const ssap::CommandCorrelator::Reply&) {
                ++replies;
            });
        });

        QTRY_COMPARE(replies, 2);
        QCOMPARE(sentFrame(channel, 0)["id"].toString(), QString("cmd_1"));
        QCOMPARE(sentFrame(channel, 1)["id"].toString(), QString("cmd_2"));
        QCOMPARE(sentFrame(channel, 1)["uri"].toString(), QString("ssap://audio/volumeDown"));
        QCOMPARE(correlator.lastRequestId(), QString("cmd_2"));
    }

    void testReplyIsFirstDecodableFrame()
    {
        ssap::ReplayChannel channel;
        channel.simulateOpen();
        ssap::CommandCorrelator correlator(500);

        QJsonObject envelope;
        bool done = false;
        correlator.send(&channel, "ssap://x", {}, [&](const ssap::CommandCorrelator::Reply& reply) {
            envelope = reply.envelope;
            done = true;
        });
        channel.feedText("garbage");
        channel.feedText(R"({"type":"response","id":"other","payload":{"n":1}})");
        channel.feedText(R"({"type":"response","id":"cmd_1","payload":{"n":2}})");

        QTRY_VERIFY(done);
        QCOMPARE(envelope["payload"].toObject()["n"].toInt(), 1);
        QVERIFY(!correlator.isBusy());
    }

    void testTimeout()
    {
        ssap::ReplayChannel channel;
        channel.simulateOpen();
        ssap::CommandCorrelator correlator(50);

        ssap::CommandCorrelator::Reply result;
        bool done = false;
        correlator.send(&channel, "ssap://x", {}, [&](const ssap::CommandCorrelator::Reply& reply) {
            result = reply;
            done = true;
        });
        QVERIFY(correlator.isBusy());
        QTRY_VERIFY(done);
        QCOMPARE(result.kind, ssap::ErrorKind::ResponseTimeout);
        QCOMPARE(result.error, QString("Command timeout (disconnected)"));
    }

    void testWriteFailure()
    {
        ssap::ReplayChannel channel;
        channel.simulateOpen();
        channel.setFailWrites(true);
        ssap::CommandCorrelator correlator(500);

        ssap::CommandCorrelator::Reply result;
        correlator.send(&channel, "ssap://x", {}, [&](const ssap::CommandCorrelator::Reply& reply) {
            result = reply;
        });
        QCOMPARE(result.kind, ssap::ErrorKind::SendError);
        QCOMPARE(result.error, QString("Send failed (disconnected)"));
        QVERIFY(!correlator.isBusy());
    }

    void testNoChannel()
    {
        ssap::CommandCorrelator correlator(500);
        ssap::CommandCorrelator::Reply result;
        correlator.send(nullptr, "ssap://x", {}, [&](const ssap::CommandCorrelator::Reply& reply) {
            result = reply;
        });
        QCOMPARE(result.kind, ssap::ErrorKind::SendError);
    }

    void testChannelClosedWhileWaiting()
    {
        ssap::ReplayChannel channel;
        channel.simulateOpen();
        ssap::CommandCorrelator correlator(500);

        ssap::CommandCorrelator::Reply result;
        correlator.send(&channel, "ssap://x", {}, [&](const ssap::CommandCorrelator::Reply& reply) {
            result = reply;
        });
        channel.simulateClose();
        QCOMPARE(result.kind, ssap::ErrorKind::ChannelClosed);
        QVERIFY(!correlator.isBusy());
    }

    void testSecondCallWhileBusyRejected()
    {
        ssap::ReplayChannel channel;
        channel.simulateOpen();
        ssap::CommandCorrelator correlator(500);

        correlator.send(&channel, "ssap://first", {}, [](const ssap::CommandCorrelator::Reply&) {});
        ssap::CommandCorrelator::Reply second;
        correlator.send(&channel, "ssap://second", {}, [&](const ssap::CommandCorrelator::Reply& reply) {
            second = reply;
        });
        QCOMPARE(second.kind, ssap::ErrorKind::SendError);
        QCOMPARE(channel.writtenFrames().size(), 1);
    }
};

QTEST_MAIN(TestCommandCorrelator)
#include "test_command_correlator.moc"
