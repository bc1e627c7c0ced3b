#pragma once

#include <QObject>
#include <ssap/Session/CommandResult.hpp>
#include <ssap/Version.hpp>

namespace ssap {

/// Roku External Control Protocol: a bodiless POST /keypress/PowerOn. The reply is
/// not read; a completed write counts as success.
class RokuWaker : public QObject {
    Q_OBJECT
public:
    explicit RokuWaker(quint16 port = ECP_PORT, int timeoutMs = 5000, QObject* parent = nullptr);

    void wake(const QString& address, ResultCallback done);

    static QByteArray powerOnRequest(const QString& address);

private:
    quint16 port_;
    int timeoutMs_;
};

} // namespace ssap
