#include <ssap/Wake/RokuWaker.hpp>
#include <QDebug>
#include <QTcpSocket>
#include <QTimer>
#include <memory>

namespace ssap {

RokuWaker::RokuWaker(quint16 port, int timeoutMs, QObject* parent)
    : QObject(parent)
    , port_(port)
    , timeoutMs_(timeoutMs)
{
}

QByteArray RokuWaker::powerOnRequest(const QString& address)
{
    return QStringLiteral("POST /keypress/PowerOn HTTP/1.1\r\n"
                          "Host: %1\r\n"
                          "Content-Length: 0\r\n"
                          "Connection: close\r\n"
                          "\r\n").arg(address).toLatin1();
}

void RokuWaker::wake(const QString& address, ResultCallback done)
{
    auto* socket = new QTcpSocket(this);
    auto* timer = new QTimer(socket);
    timer->setSingleShot(true);

    const QByteArray request = powerOnRequest(address);
    auto remaining = std::make_shared<qint64>(request.size());
    auto finished = std::make_shared<bool>(false);
    auto finish = [socket, timer, finished, done](const CommandResult& result) {
        if (*finished) return;
        *finished = true;
        timer->stop();
        socket->disconnect();
        socket->close();
        socket->deleteLater();
        done(result);
    };

    const QString target = QStringLiteral("%1:%2").arg(address).arg(port_);

    connect(socket, &QTcpSocket::connected, this, [socket, request, target, finish]() {
        if (socket->write(request) != request.size())
            finish(CommandResult::failure(ErrorKind::WakeError,
                QStringLiteral("Failed to send Roku wake: %1").arg(socket->errorString())));
        else
            qDebug() << "[RokuWaker] request queued for" << target;
    });
    connect(socket, &QTcpSocket::bytesWritten, this, [remaining, finish](qint64 bytes) {
        *remaining -= bytes;
        if (*remaining <= 0)
            finish(CommandResult::okWithMessage(QStringLiteral("Roku wake sent")));
    });
    connect(socket, &QAbstractSocket::errorOccurred, this,
            [socket, target, finish](QAbstractSocket::SocketError) {
        finish(CommandResult::failure(ErrorKind::WakeError,
            QStringLiteral("Could not reach Roku at %1: %2").arg(target, socket->errorString())));
    });
    connect(timer, &QTimer::timeout, this, [target, finish]() {
        finish(CommandResult::failure(ErrorKind::WakeError,
            QStringLiteral("Could not reach Roku at %1: connection timeout").arg(target)));
    });

    qInfo() << "[RokuWaker] waking" << target;
    timer->start(timeoutMs_);
    socket->connectToHost(address, port_);
}

} // namespace ssap
