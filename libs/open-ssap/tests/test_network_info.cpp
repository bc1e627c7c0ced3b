#include <QtTest/QtTest>
#include <QJsonDocument>
#include <ssap/Protocol/NetworkInfo.hpp>

class TestNetworkInfo : public QObject {
    Q_OBJECT

private:
    static QJsonObject json(const char* text)
    {
        return QJsonDocument::fromJson(QByteArray(text)).object();
    }

    static ssap::InterfaceMacs bothMacs()
    {
        ssap::InterfaceMacs macs;
        macs.wifi = "aa:aa:aa:aa:aa:aa";
        macs.wired = "bb:bb:bb:bb:bb:bb";
        return macs;
    }

private slots:
    void testExtractMacs()
    {
        const auto macs = ssap::extractMacs(json(R"({"type":"response","payload":{
            "wifiInfo":{"macAddress":"aa:aa:aa:aa:aa:aa"},
            "wiredInfo":{"macAddress":"bb:bb:bb:bb:bb:bb"}}})"));
        QCOMPARE(macs.wifi, QString("aa:aa:aa:aa:aa:aa"));
        QCOMPARE(macs.wired, QString("bb:bb:bb:bb:bb:bb"));
    }

    void testExtractMacsMissing()
    {
        const auto macs = ssap::extractMacs(json(R"({"payload":{"wiredInfo":{"macAddress":"bb:bb:bb:bb:bb:bb"}}})"));
        QVERIFY(macs.wifi.isNull());
        QCOMPARE(macs.firstAvailable(), QString("bb:bb:bb:bb:bb:bb"));
    }

    void testWiredWins()
    {
        const QJsonObject status = json(R"({"payload":{"wired":{"state":"connected"},"wifi":{"state":"connected"}}})");
        QCOMPARE(ssap::selectConnectedMac(bothMacs(), status), QString("bb:bb:bb:bb:bb:bb"));
    }

    void testWifiShapes_data()
    {
        QTest::addColumn<QByteArray>("status");
        QTest::newRow("payload.wifi.state") << QByteArray(R"({"payload":{"wifi":{"state":"connected"},"wired":{"state":"disconnected"}}})");
        QTest::newRow("payload.wifiInfo.state") << QByteArray(R"({"payload":{"wifiInfo":{"state":"connected"}}})");
        QTest::newRow("payload.isConnected") << QByteArray(R"({"payload":{"isConnected":true}})");
        QTest::newRow("payload.status") << QByteArray(R"({"payload":{"status":"connectionStateChanged"}})");
        QTest::newRow("status") << QByteArray(R"({"status":"connectionStateChanged","payload":{}})");
        QTest::newRow("payload.networkInfo") << QByteArray(R"({"payload":{"networkInfo":{"ssid":"home"}}})");
        QTest::newRow("networkInfo") << QByteArray(R"({"networkInfo":{},"payload":{}})");
    }

    void testWifiShapes()
    {
        QFETCH(QByteArray, status);
        const QJsonObject envelope = QJsonDocument::fromJson(status).object();
        QVERIFY(ssap::isWifiConnected(envelope));
        QVERIFY(!ssap::isWiredConnected(envelope));

        ssap::InterfaceMacs macs = bothMacs();
        macs.wifi = "cc:cc:cc:cc:cc:cc";
        QCOMPARE(ssap::selectConnectedMac(macs, envelope), QString("cc:cc:cc:cc:cc:cc"));
    }

    void testIsConnectedFalseDoesNotMatch()
    {
        QVERIFY(!ssap::isWifiConnected(json(R"({"payload":{"isConnected":false}})")));
    }

    void testFallbackWithoutStatus()
    {
        QCOMPARE(ssap::selectConnectedMac(bothMacs(), QJsonObject()), QString("aa:aa:aa:aa:aa:aa"));
    }

    void testFallbackWhenNothingConnected()
    {
        ssap::InterfaceMacs macs;
        macs.wired = "bb:bb:bb:bb:bb:bb";
        QCOMPARE(ssap::selectConnectedMac(macs, json(R"({"payload":{"returnValue":true}})")),
                 QString("bb:bb:bb:bb:bb:bb"));
    }

    void testNoMacAtAll()
    {
        QVERIFY(ssap::selectConnectedMac(ssap::InterfaceMacs(), QJsonObject()).isNull());
    }

    void testConnectedWiredWithoutMacFallsThrough()
    {
        ssap::InterfaceMacs macs;
        macs.wifi = "aa:aa:aa:aa:aa:aa";
        const QJsonObject status = json(R"({"payload":{"wired":{"state":"connected"}}})");
        QCOMPARE(ssap::selectConnectedMac(macs, status), QString("aa:aa:aa:aa:aa:aa"));
    }

    void testStatusEndpointOrder()
    {
        const auto& endpoints = ssap::statusEndpoints();
        QCOMPARE(int(endpoints.size()), 3);
        QCOMPARE(QString(endpoints.at(0)), QString("ssap://com.webos.service.connectionmanager/getStatus"));
        QCOMPARE(QString(endpoints.at(2)), QString("ssap://com.palm.wifi/getStatus"));
    }
};

QTEST_MAIN(TestNetworkInfo)
#include "test_network_info.moc"
