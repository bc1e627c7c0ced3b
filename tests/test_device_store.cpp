#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"
#include "core/services/DeviceStore.hpp"

class TestDeviceStore : public QObject {
    Q_OBJECT
private:
    static ltr::TvDevice makeTv(const QString& name, const QString& ip)
    {
        ltr::TvDevice device;
        device.name = name;
        device.ip = ip;
        return device;
    }

private slots:
    void testNoDevices()
    {
        ltr::YamlConfig config;
        ltr::DeviceStore store(&config, QString());
        ltr::TvDevice device;
        QVERIFY(!store.activeDevice(device));
    }

    void testFirstDeviceBecomesActive()
    {
        ltr::YamlConfig config;
        ltr::DeviceStore store(&config, QString());
        store.setDevice(makeTv("den", "10.0.0.5"));
        store.setDevice(makeTv("office", "10.0.0.6"));

        ltr::TvDevice active;
        QVERIFY(store.activeDevice(active));
        QCOMPARE(active.name, QString("den"));
        QCOMPARE(config.activeTv(), QString("den"));
    }

    void testSetActiveDevice()
    {
        ltr::YamlConfig config;
        ltr::DeviceStore store(&config, QString());
        store.setDevice(makeTv("den", "10.0.0.5"));
        store.setDevice(makeTv("office", "10.0.0.6"));

        QVERIFY(store.setActiveDevice("office"));
        ltr::TvDevice active;
        QVERIFY(store.activeDevice(active));
        QCOMPARE(active.ip, QString("10.0.0.6"));

        QVERIFY(!store.setActiveDevice("attic"));
        QVERIFY(store.activeDevice(active));
        QCOMPARE(active.name, QString("office"));
    }

    void testFallsBackToFirstWhenNoneActive()
    {
        ltr::YamlConfig config;
        config.setTv(makeTv("den", "10.0.0.5"));
        ltr::DeviceStore store(&config, QString());

        ltr::TvDevice active;
        QVERIFY(store.activeDevice(active));
        QCOMPARE(active.name, QString("den"));
    }

    void testDanglingActiveName()
    {
        ltr::YamlConfig config;
        config.setTv(makeTv("den", "10.0.0.5"));
        config.setActiveTv("gone");
        ltr::DeviceStore store(&config, QString());

        ltr::TvDevice active;
        QVERIFY(!store.activeDevice(active));
    }

    void testUpdateClientKeyAndMac()
    {
        ltr::YamlConfig config;
        ltr::DeviceStore store(&config, QString());
        store.setDevice(makeTv("den", "10.0.0.5"));
        QSignalSpy changedSpy(&store, &ltr::DeviceStore::devicesChanged);

        store.updateClientKey("den", "k3y");
        store.updateMac("den", "AA:BB:CC:DD:EE:FF");
        QCOMPARE(changedSpy.count(), 2);

        ltr::TvDevice device;
        QVERIFY(config.tv("den", device));
        QCOMPARE(device.clientKey, QString("k3y"));
        QCOMPARE(device.mac, QString("AA:BB:CC:DD:EE:FF"));
        QCOMPARE(device.ip, QString("10.0.0.5"));

        // Unknown names are ignored
        store.updateClientKey("attic", "nope");
        QCOMPARE(changedSpy.count(), 2);
        QVERIFY(!config.tv("attic", device));
    }

    void testStreamingDevice()
    {
        ltr::YamlConfig config;
        ltr::DeviceStore store(&config, QString());
        store.setStreamingDevice(ssap::WakeTarget::adb("10.0.0.9"));
        store.setWakeStreamingOnPowerOn(true);

        ssap::WakeTarget target;
        QVERIFY(store.streamingDevice(target));
        QCOMPARE(target.kind, ssap::WakeTarget::Kind::Adb);
        QCOMPARE(target.port, quint16(5555));
        QVERIFY(store.wakeStreamingOnPowerOn());

        store.clearStreamingDevice();
        QVERIFY(!store.streamingDevice(target));
    }

    void testSaveWritesConfigPath()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("config.yaml");

        ltr::YamlConfig config;
        ltr::DeviceStore store(&config, path);
        store.setDevice(makeTv("den", "10.0.0.5"));
        store.updateClientKey("den", "k3y");
        QVERIFY(store.save());

        ltr::YamlConfig reloaded;
        QVERIFY(reloaded.load(path));
        ltr::TvDevice device;
        QVERIFY(reloaded.tv("den", device));
        QCOMPARE(device.clientKey, QString("k3y"));
        QCOMPARE(reloaded.activeTv(), QString("den"));
    }
};

QTEST_MAIN(TestDeviceStore)
#include "test_device_store.moc"
