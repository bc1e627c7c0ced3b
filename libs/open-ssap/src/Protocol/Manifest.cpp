#include <ssap/Protocol/Manifest.hpp>
#include <ssap/Protocol/Endpoints.hpp>
#include <ssap/Version.hpp>
#include <QJsonArray>
#include <QJsonDocument>

namespace ssap {

namespace {

const char* const kSignature =
    "eyJhbGdvcml0aG0iOiJSU0EtU0hBMjU2Iiwia2V5SWQiOiJ0ZXN0LXNpZ25pbmctY2VydCIsInNpZ25hdHVyZVZl"
    "cnNpb24iOjF9.hrVRgjCwXVvE2OOSpDZ58hR+59aFNwYDyjQgKk3auukd7pcegmE2CzPCa0bJ0ZsRAcKkCTJrWo5i"
    "DzNhMBWRyaMOv5zWSrthlf7G128qvIlpMT0YNY+n/FaOHE73uLrS/g7swl3/qH/BGFG2Hu4RlL48eb3lLKqTt2xK"
    "HdCs6Cd4RMfJPYnzgvI4BNrFUKsjkcu+WD4OO2A27Pq1n50cMchmcaXadJhGrOqH5YmHdOCj5NSHzJYrsW0HPlpu"
    "Ax/ECMeIZYDh6RMqaFM2DXzdKX9NmmyqzJ3o/0lkk/N97gfVRLW5hA29yeAwaCViZNCP8iC9aO0q9fQojoa7NQnAtw==";

QJsonObject localized(const char* name)
{
    QJsonObject obj;
    obj[""] = QLatin1String(name);
    return obj;
}

} // namespace

const QStringList& manifestPermissions()
{
    static const QStringList permissions = {
        "LAUNCH", "LAUNCH_WEBAPP", "APP_TO_APP", "CLOSE",
        "TEST_OPEN", "TEST_PROTECTED", "CONTROL_AUDIO",
        "CONTROL_DISPLAY", "CONTROL_INPUT_JOYSTICK",
        "CONTROL_INPUT_MEDIA_RECORDING",
        "CONTROL_INPUT_MEDIA_PLAYBACK", "CONTROL_INPUT_TV",
        "CONTROL_POWER", "READ_APP_STATUS", "READ_CURRENT_CHANNEL",
        "READ_INPUT_DEVICE_LIST", "READ_NETWORK_STATE",
        "READ_RUNNING_APPS", "READ_TV_CHANNEL_LIST",
        "WRITE_NOTIFICATION_TOAST", "READ_POWER_STATE",
        "READ_COUNTRY_INFO", "CONTROL_MOUSE_AND_KEYBOARD",
        "CONTROL_INPUT_TEXT"
    };
    return permissions;
}

QJsonObject registrationManifest()
{
    const QJsonArray permissions = QJsonArray::fromStringList(manifestPermissions());

    QJsonObject signedBlock;
    signedBlock["created"] = "20140509";
    signedBlock["appId"] = "com.lge.test";
    signedBlock["vendorId"] = "com.lge";
    signedBlock["localizedAppNames"] = localized("LG Remote");
    signedBlock["localizedVendorNames"] = localized("LG Electronics");
    signedBlock["permissions"] = permissions;
    signedBlock["serial"] = "2f930e2d2cfe083771f68e4fe7bb07";

    QJsonObject signature;
    signature["signatureVersion"] = 1;
    signature["signature"] = QLatin1String(kSignature);

    QJsonObject manifest;
    manifest["manifestVersion"] = MANIFEST_VERSION;
    manifest["appVersion"] = QLatin1String(MANIFEST_APP_VERSION);
    manifest["signed"] = signedBlock;
    manifest["permissions"] = permissions;
    manifest["signatures"] = QJsonArray{signature};
    return manifest;
}

QString encodeRegister(const QString& clientKey)
{
    QJsonObject payload;
    payload["forcePairing"] = false;
    payload["pairingType"] = "PROMPT";
    payload["manifest"] = registrationManifest();
    if (!clientKey.isEmpty())
        payload["client-key"] = clientKey;

    QJsonObject msg;
    msg["type"] = QLatin1String(MessageType::Register);
    msg["id"] = "register_0";
    msg["payload"] = payload;
    return QString::fromUtf8(QJsonDocument(msg).toJson(QJsonDocument::Compact));
}

} // namespace ssap
