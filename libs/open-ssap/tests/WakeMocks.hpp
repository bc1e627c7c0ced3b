#pragma once

#include <QHostAddress>
#include <QList>
#include <QStringList>
#include <ssap/Wake/IDatagramSender.hpp>
#include <ssap/Wake/IProcessRunner.hpp>

// Records datagrams instead of sending them; hosts in failHosts report a send error.
class MockDatagramSender : public ssap::IDatagramSender {
public:
    struct Sent {
        QByteArray data;
        QHostAddress host;
        quint16 port;
    };

    bool sendDatagram(const QByteArray& data, const QHostAddress& host, quint16 port,
                      QString& error) override
    {
        sent.append({data, host, port});
        if (failHosts.contains(host)) {
            error = "Network is unreachable";
            return false;
        }
        return true;
    }

    QList<Sent> sent;
    QList<QHostAddress> failHosts;
};

// Records invocations and answers from a queue of scripted results.
class MockProcessRunner : public ssap::IProcessRunner {
public:
    void run(const QString& program, const QStringList& arguments, Callback done) override
    {
        calls.append(QStringList{program} + arguments);
        ssap::ProcessResult result;
        if (!results.isEmpty())
            result = results.takeFirst();
        done(result);
    }

    static ssap::ProcessResult exited(int code, const QString& stderrText = QString())
    {
        ssap::ProcessResult result;
        result.started = true;
        result.exitCode = code;
        result.standardError = stderrText;
        return result;
    }

    QList<QStringList> calls;
    QList<ssap::ProcessResult> results;
};
