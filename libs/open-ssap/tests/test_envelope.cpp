#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <ssap/Protocol/Envelope.hpp>
#include <ssap/Protocol/Endpoints.hpp>
#include <ssap/Protocol/Manifest.hpp>

class TestEnvelope : public QObject {
    Q_OBJECT

private:
    static QJsonObject parse(const QString& text)
    {
        return QJsonDocument::fromJson(text.toUtf8()).object();
    }

private slots:
    void testEncodeRequest()
    {
        QJsonObject payload;
        payload["mute"] = true;
        const QJsonObject msg = parse(ssap::Envelope::encodeRequest("cmd_7", ssap::Endpoint::SetMute, payload));

        QCOMPARE(msg["type"].toString(), QString("request"));
        QCOMPARE(msg["id"].toString(), QString("cmd_7"));
        QCOMPARE(msg["uri"].toString(), QString("ssap://audio/setMute"));
        QCOMPARE(msg["payload"].toObject()["mute"].toBool(), true);
    }

    void testEncodeRequestIsCompact()
    {
        const QString text = ssap::Envelope::encodeRequest("cmd_1", ssap::Endpoint::VolumeUp);
        QVERIFY(!text.contains('\n'));
        QVERIFY(parse(text)["payload"].toObject().isEmpty());
    }

    void testDecodeResponse()
    {
        ssap::Envelope env;
        QVERIFY(ssap::Envelope::decode(
            R"({"type":"response","id":"cmd_2","payload":{"socketPath":"ws://tv/input"}})", env));
        QCOMPARE(env.type, QString("response"));
        QCOMPARE(env.id, QString("cmd_2"));
        QCOMPARE(env.payload["socketPath"].toString(), QString("ws://tv/input"));
        QVERIFY(env.error.isNull());
        QCOMPARE(env.raw["id"].toString(), QString("cmd_2"));
    }

    void testDecodeError()
    {
        ssap::Envelope env;
        QVERIFY(ssap::Envelope::decode(R"({"type":"error","id":"cmd_3","error":"404 no such service"})", env));
        QCOMPARE(env.type, QString("error"));
        QCOMPARE(env.error, QString("404 no such service"));
    }

    void testDecodeRejectsNonObjects()
    {
        ssap::Envelope env;
        QVERIFY(!ssap::Envelope::decode("type:button\nname:UP\n\n", env));
        QVERIFY(!ssap::Envelope::decode("[1,2,3]", env));
        QVERIFY(!ssap::Envelope::decode("", env));
    }

    void testButtonFrame()
    {
        QCOMPARE(ssap::buttonFrame("up"), QString("type:button\nname:UP\n\n"));
        QCOMPARE(ssap::buttonFrame("ENTER"), QString("type:button\nname:ENTER\n\n"));
    }

    void testRegisterWithoutKeyRequestsPrompt()
    {
        const QJsonObject msg = parse(ssap::encodeRegister(QString()));
        QCOMPARE(msg["type"].toString(), QString("register"));
        QCOMPARE(msg["id"].toString(), QString("register_0"));

        const QJsonObject payload = msg["payload"].toObject();
        QCOMPARE(payload["forcePairing"].toBool(), false);
        QCOMPARE(payload["pairingType"].toString(), QString("PROMPT"));
        QVERIFY(!payload.contains("client-key"));
        QVERIFY(payload["manifest"].isObject());
    }

    void testRegisterWithKey()
    {
        const QJsonObject payload = parse(ssap::encodeRegister("abc123"))["payload"].toObject();
        QCOMPARE(payload["client-key"].toString(), QString("abc123"));
    }

    void testManifestPermissions()
    {
        const QJsonObject manifest = ssap::registrationManifest();
        const QJsonArray permissions = manifest["permissions"].toArray();
        QCOMPARE(permissions.size(), ssap::manifestPermissions().size());
        QVERIFY(ssap::manifestPermissions().contains("CONTROL_INPUT_MEDIA_PLAYBACK"));
        QVERIFY(ssap::manifestPermissions().contains("CONTROL_POWER"));
    }
};

QTEST_MAIN(TestEnvelope)
#include "test_envelope.moc"
