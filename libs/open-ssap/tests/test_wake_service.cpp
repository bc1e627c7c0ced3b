#include <QtTest/QtTest>
#include <QTcpServer>
#include <QTcpSocket>
#include <ssap/Wake/MagicPacket.hpp>
#include <ssap/Wake/WakeService.hpp>
#include <ssap/Version.hpp>
#include "WakeMocks.hpp"

namespace {

ssap::CommandResult waitFor(std::function<void(ssap::ResultCallback)> op)
{
    ssap::CommandResult result;
    bool done = false;
    op([&](const ssap::CommandResult& r) { result = r; done = true; });
    QTest::qWaitFor([&]() { return done; }, 7000);
    return result;
}

} // namespace

class TestWakeService : public QObject {
    Q_OBJECT
private slots:
    void testWakeOnLanBroadcast()
    {
        MockDatagramSender sender;
        MockProcessRunner runner;
        ssap::WakeService wake(&sender, &runner);

        const auto result = wake.wakeOnLan("AA:BB:CC:DD:EE:FF");
        QVERIFY(result.success);
        QCOMPARE(result.message, QString("Wake-on-LAN packet sent"));
        QCOMPARE(sender.sent.size(), 1);
        QCOMPARE(sender.sent.first().host, QHostAddress(QHostAddress::Broadcast));
        QCOMPARE(sender.sent.first().port, ssap::WOL_PORT);
        QCOMPARE(int(sender.sent.first().data.size()), ssap::MAGIC_PACKET_SIZE);
        QVERIFY(sender.sent.first().data.startsWith(QByteArray(6, char(0xFF))));
        QCOMPARE(sender.sent.first().data.mid(6, 6), QByteArray::fromHex("AABBCCDDEEFF"));
    }

    void testWakeOnLanSubnetBroadcast()
    {
        MockDatagramSender sender;
        MockProcessRunner runner;
        ssap::WakeService wake(&sender, &runner);

        QVERIFY(wake.wakeOnLan("aa-bb-cc-dd-ee-ff", "  10.0.0.255 ").success);
        QCOMPARE(sender.sent.size(), 3);
        QCOMPARE(sender.sent.at(1).host, QHostAddress("10.0.0.255"));
        QCOMPARE(sender.sent.at(1).port, quint16(9));
        QCOMPARE(sender.sent.at(2).port, quint16(7));
    }

    void testWakeOnLanEmptyBroadcastIgnored()
    {
        MockDatagramSender sender;
        MockProcessRunner runner;
        ssap::WakeService wake(&sender, &runner);

        QVERIFY(wake.wakeOnLan("AABBCCDDEEFF", "   ").success);
        QCOMPARE(sender.sent.size(), 1);
    }

    void testSecondaryFailureIsNotAnError()
    {
        MockDatagramSender sender;
        sender.failHosts << QHostAddress("10.0.0.255");
        MockProcessRunner runner;
        ssap::WakeService wake(&sender, &runner);

        QVERIFY(wake.wakeOnLan("AABBCCDDEEFF", "10.0.0.255").success);
        QCOMPARE(sender.sent.size(), 3);
    }

    void testPrimaryFailureIsAnError()
    {
        MockDatagramSender sender;
        sender.failHosts << QHostAddress(QHostAddress::Broadcast);
        MockProcessRunner runner;
        ssap::WakeService wake(&sender, &runner);

        const auto result = wake.wakeOnLan("AABBCCDDEEFF", "10.0.0.255");
        QCOMPARE(result.kind, ssap::ErrorKind::WakeError);
        QVERIFY(result.error.startsWith("WoL send failed"));
        QCOMPARE(sender.sent.size(), 1);
    }

    void testInvalidMacSendsNothing()
    {
        MockDatagramSender sender;
        MockProcessRunner runner;
        ssap::WakeService wake(&sender, &runner);

        const auto result = wake.wakeOnLan("AA:BB:CC");
        QCOMPARE(result.kind, ssap::ErrorKind::FormatError);
        QVERIFY(sender.sent.isEmpty());
    }

    void testAdbWake()
    {
        MockDatagramSender sender;
        MockProcessRunner runner;
        runner.results << MockProcessRunner::exited(0) << MockProcessRunner::exited(0);
        ssap::WakeService wake(&sender, &runner);

        const auto result = waitFor([&](ssap::ResultCallback cb) {
            wake.wake(ssap::WakeTarget::adb("10.0.0.9"), cb);
        });
        QVERIFY(result.success);
        QCOMPARE(runner.calls.size(), 2);
        QCOMPARE(runner.calls.at(0), QStringList({"adb", "connect", "10.0.0.9:5555"}));
        QCOMPARE(runner.calls.at(1), QStringList({"adb", "-s", "10.0.0.9:5555", "shell", "input",
                                                  "keyevent", "KEYCODE_WAKEUP"}));
    }

    void testAdbCustomPort()
    {
        MockDatagramSender sender;
        MockProcessRunner runner;
        runner.results << MockProcessRunner::exited(0) << MockProcessRunner::exited(0);
        ssap::WakeService wake(&sender, &runner);

        waitFor([&](ssap::ResultCallback cb) { wake.wakeAdb("10.0.0.9", 5556, cb); });
        QCOMPARE(runner.calls.at(0).last(), QString("10.0.0.9:5556"));
    }

    void testAdbConnectFails()
    {
        MockDatagramSender sender;
        MockProcessRunner runner;
        runner.results << MockProcessRunner::exited(1, "failed to connect to 10.0.0.9:5555");
        ssap::WakeService wake(&sender, &runner);

        const auto result = waitFor([&](ssap::ResultCallback cb) { wake.wakeAdb("10.0.0.9", 0, cb); });
        QCOMPARE(result.kind, ssap::ErrorKind::WakeError);
        QCOMPARE(result.error, QString("adb connect failed: failed to connect to 10.0.0.9:5555"));
        QCOMPARE(runner.calls.size(), 1);
    }

    void testAdbWakeStepFails()
    {
        MockDatagramSender sender;
        MockProcessRunner runner;
        runner.results << MockProcessRunner::exited(0) << MockProcessRunner::exited(1, "device offline");
        ssap::WakeService wake(&sender, &runner);

        const auto result = waitFor([&](ssap::ResultCallback cb) { wake.wakeAdb("10.0.0.9", 0, cb); });
        QCOMPARE(result.error, QString("adb wake failed: device offline"));
    }

    void testAdbMissing()
    {
        MockDatagramSender sender;
        MockProcessRunner runner;
        ssap::ProcessResult notStarted;
        notStarted.errorString = "No such file or directory";
        runner.results << notStarted;
        ssap::WakeService wake(&sender, &runner);

        const auto result = waitFor([&](ssap::ResultCallback cb) { wake.wakeAdb("10.0.0.9", 0, cb); });
        QCOMPARE(result.error, QString("adb not found or failed: No such file or directory"));
    }

    void testRokuRequestFormat()
    {
        QCOMPARE(ssap::RokuWaker::powerOnRequest("10.0.0.7"),
                 QByteArray("POST /keypress/PowerOn HTTP/1.1\r\nHost: 10.0.0.7\r\n"
                            "Content-Length: 0\r\nConnection: close\r\n\r\n"));
    }

    void testRokuWake()
    {
        QTcpServer server;
        QVERIFY(server.listen(QHostAddress::LocalHost));
        QByteArray received;
        connect(&server, &QTcpServer::newConnection, this, [&]() {
            QTcpSocket* peer = server.nextPendingConnection();
            connect(peer, &QTcpSocket::readyRead, this, [&, peer]() { received += peer->readAll(); });
        });

        MockDatagramSender sender;
        MockProcessRunner runner;
        ssap::WakeService wake(&sender, &runner);
        wake.setRokuEndpoint(server.serverPort(), 2000);

        const auto result = waitFor([&](ssap::ResultCallback cb) {
            wake.wake(ssap::WakeTarget::roku("127.0.0.1"), cb);
        });
        QVERIFY(result.success);
        QCOMPARE(result.message, QString("Roku wake sent"));
        QTRY_VERIFY(received.contains("\r\n\r\n"));
        QVERIFY(received.startsWith("POST /keypress/PowerOn HTTP/1.1\r\n"));
        QVERIFY(received.contains("Host: 127.0.0.1\r\n"));
    }

    void testRokuUnreachable()
    {
        QTcpServer server;
        QVERIFY(server.listen(QHostAddress::LocalHost));
        const quint16 port = server.serverPort();
        server.close();

        MockDatagramSender sender;
        MockProcessRunner runner;
        ssap::WakeService wake(&sender, &runner);
        wake.setRokuEndpoint(port, 2000);

        const auto result = waitFor([&](ssap::ResultCallback cb) { wake.wakeRoku("127.0.0.1", cb); });
        QCOMPARE(result.kind, ssap::ErrorKind::WakeError);
        QVERIFY(result.error.startsWith("Could not reach Roku at 127.0.0.1:"));
    }
};

QTEST_MAIN(TestWakeService)
#include "test_wake_service.moc"
