#include <ssap/Wake/AdbWaker.hpp>
#include <ssap/Version.hpp>
#include <QDebug>

namespace ssap {

namespace {

CommandResult toolFailure(const QString& step, const ProcessResult& result)
{
    if (!result.started)
        return CommandResult::failure(ErrorKind::WakeError,
            QStringLiteral("adb not found or failed: %1").arg(result.errorString));
    return CommandResult::failure(ErrorKind::WakeError,
        QStringLiteral("adb %1 failed: %2").arg(step, result.standardError));
}

} // namespace

AdbWaker::AdbWaker(IProcessRunner* runner, const QString& program)
    : runner_(runner)
    , program_(program)
{
}

void AdbWaker::wake(const QString& address, quint16 port, ResultCallback done)
{
    const QString serial = QStringLiteral("%1:%2").arg(address).arg(port ? port : ADB_DEFAULT_PORT);
    qInfo() << "[AdbWaker] waking" << serial;

    runner_->run(program_, {QStringLiteral("connect"), serial},
                 [this, serial, done](const ProcessResult& connected) {
        if (!connected.started || connected.exitCode != 0) {
            done(toolFailure(QStringLiteral("connect"), connected));
            return;
        }
        runner_->run(program_,
                     {QStringLiteral("-s"), serial, QStringLiteral("shell"), QStringLiteral("input"),
                      QStringLiteral("keyevent"), QStringLiteral("KEYCODE_WAKEUP")},
                     [done](const ProcessResult& woken) {
            if (!woken.started || woken.exitCode != 0) {
                done(toolFailure(QStringLiteral("wake"), woken));
                return;
            }
            done(CommandResult::okWithMessage(QStringLiteral("ADB wake sent")));
        });
    });
}

} // namespace ssap
