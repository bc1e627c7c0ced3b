#pragma once

#include <QJsonObject>
#include <QObject>
#include <QPointer>
#include <QTimer>
#include <functional>

#include <ssap/Transport/IChannel.hpp>
#include <ssap/Session/SessionState.hpp>

namespace ssap {

/// Request/response over the command channel, one call in flight at a time.
///
/// The first frame that decodes as a JSON object after the write is taken as the
/// reply. Ids are not matched against the request: the protocol does not promise
/// they line up, and the session queue guarantees nobody else is on the channel.
class CommandCorrelator : public QObject {
    Q_OBJECT
public:
    struct Reply {
        ErrorKind kind = ErrorKind::None;
        QString error;
        QJsonObject envelope;

        bool ok() const { return kind == ErrorKind::None; }
    };
    using ReplyCallback = std::function<void(const Reply&)>;

    explicit CommandCorrelator(int responseTimeoutMs, QObject* parent = nullptr);
    ~CommandCorrelator() override;

    void send(IChannel* channel, const QString& uri, const QJsonObject& payload, ReplyCallback done);
    bool isBusy() const { return static_cast<bool>(pending_); }
    /// Id of the most recent request ("cmd_<n>"), empty before the first.
    QString lastRequestId() const;

private:
    void onText(const QString& text);
    void complete(const Reply& reply);

    int responseTimeoutMs_;
    quint64 counter_ = 0;
    QPointer<IChannel> channel_;
    ReplyCallback pending_;
    QTimer timer_;
};

} // namespace ssap
