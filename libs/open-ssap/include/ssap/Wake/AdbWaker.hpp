#pragma once

#include <ssap/Session/CommandResult.hpp>
#include <ssap/Wake/IProcessRunner.hpp>

namespace ssap {

/// Wakes an Android device over the network debug bridge:
/// "adb connect host:port", then a KEYCODE_WAKEUP key event.
class AdbWaker {
public:
    explicit AdbWaker(IProcessRunner* runner, const QString& program = QStringLiteral("adb"));

    void wake(const QString& address, quint16 port, ResultCallback done);

private:
    IProcessRunner* runner_;
    QString program_;
};

} // namespace ssap
