// Exposes Qt's message handler (qInstallMessageHandler) as an interceptable
// hook, so qDebug/qWarning/qCritical output can be scrubbed.
#pragma once
#include "logscrubber/HookPoint.hpp"

#include <QtGlobal>

#include <string>
#include <utility>
#include <vector>

namespace logscrubber {

class Diagnostics;

class QtMessageHook : public HookPoint {
public:
    QtMessageHook();
    ~QtMessageHook() override;

    QtMessageHook(const QtMessageHook&) = delete;
    QtMessageHook& operator=(const QtMessageHook&) = delete;

    // The logscrubber handler currently routed to, or a stable handler
    // object standing for whatever plain Qt handler is installed.
    Handler current() const override;
    // Installing one of the objects returned by current() puts the original
    // Qt function pointer back.
    void install(Handler handler) override;
    // Writes through Qt's default handler.
    void fallback(const std::vector<Value>& args) override;

private:
    static void dispatch(QtMsgType type, const QMessageLogContext& context,
                         const QString& message);
    Handler wrapForeign(QtMessageHandler fn) const;

    Handler installed_;
    mutable std::vector<std::pair<QtMessageHandler, Handler>> foreign_;
};

// Registers a QtMessageHook with the diagnostics table under id.
void registerQtMessageHook(Diagnostics& diagnostics,
                           const std::string& id = "Qt::message");

} // namespace logscrubber
