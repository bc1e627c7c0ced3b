#include <ssap/Protocol/Envelope.hpp>
#include <ssap/Protocol/Endpoints.hpp>
#include <QJsonDocument>
#include <QJsonParseError>

namespace ssap {

bool Envelope::decode(const QString& text, Envelope& out)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return false;

    const QJsonObject obj = doc.object();
    out.raw = obj;
    out.type = obj.value("type").toString();
    out.id = obj.value("id").toString();
    out.uri = obj.value("uri").toString();
    out.payload = obj.value("payload").toObject();
    out.error = obj.value("error").isString() ? obj.value("error").toString() : QString();
    return true;
}

QString Envelope::encodeRequest(const QString& id, const QString& uri, const QJsonObject& payload)
{
    QJsonObject msg;
    msg["type"] = QLatin1String(MessageType::Request);
    msg["id"] = id;
    msg["uri"] = uri;
    msg["payload"] = payload;
    return QString::fromUtf8(QJsonDocument(msg).toJson(QJsonDocument::Compact));
}

QString buttonFrame(const QString& buttonName)
{
    return QStringLiteral("type:button\nname:%1\n\n").arg(buttonName.toUpper());
}

} // namespace ssap
