#pragma once

#include <QJsonObject>
#include <QString>

namespace ssap {

/// One JSON frame on the command channel.
struct Envelope {
    QString type;
    QString id;
    QString uri;
    QJsonObject payload;
    QString error;      // top-level "error" string, null if absent
    QJsonObject raw;    // the whole decoded object, as received

    /// Returns false for frames that are not a JSON object.
    static bool decode(const QString& text, Envelope& out);

    static QString encodeRequest(const QString& id, const QString& uri,
                                 const QJsonObject& payload = {});
};

/// Pointer input channel frame: "type:button\nname:<NAME>\n\n".
QString buttonFrame(const QString& buttonName);

} // namespace ssap
