#include "QtMessageHook.hpp"

#include "logscrubber/Diagnostics.hpp"

#include <QLoggingCategory>
#include <QString>

#include <memory>

Q_LOGGING_CATEGORY(lsQt, "logscrubber.qt")

namespace logscrubber {

namespace {

// Only one Qt message handler exists per process.
QtMessageHook* g_hook = nullptr;

// Type and context of the Qt message being dispatched, so that handlers
// which only see the text can still forward a faithful call.
struct DispatchInfo {
    QtMsgType type = QtWarningMsg;
    const QMessageLogContext* context = nullptr;
};

thread_local DispatchInfo t_dispatch;

class DispatchScope {
public:
    DispatchScope(QtMsgType type, const QMessageLogContext& context)
        : saved_(t_dispatch) {
        t_dispatch.type = type;
        t_dispatch.context = &context;
    }
    ~DispatchScope() { t_dispatch = saved_; }

private:
    DispatchInfo saved_;
};

QtMessageHandler peekHandler() {
    const QtMessageHandler live = qInstallMessageHandler(nullptr);
    qInstallMessageHandler(live);
    return live;
}

void forwardTo(QtMessageHandler fn, const std::vector<Value>& args) {
    const QMessageLogContext empty;
    const QMessageLogContext& context = t_dispatch.context ? *t_dispatch.context : empty;
    const QString text = QString::fromStdString(joinArgs(args));
    if (fn) {
        fn(t_dispatch.type, context, text);
        return;
    }
    const QtMessageHandler previous = qInstallMessageHandler(nullptr);
    qt_message_output(t_dispatch.type, context, text);
    qInstallMessageHandler(previous);
}

} // namespace

QtMessageHook::QtMessageHook() {
    if (g_hook)
        qCWarning(lsQt) << "a QtMessageHook already exists; the newest one takes over";
    g_hook = this;
}

QtMessageHook::~QtMessageHook() {
    if (peekHandler() == &QtMessageHook::dispatch) {
        qInstallMessageHandler(nullptr);
        qCWarning(lsQt) << "message hook destroyed while installed; default handler restored";
    }
    if (g_hook == this)
        g_hook = nullptr;
}

void QtMessageHook::dispatch(QtMsgType type, const QMessageLogContext& context,
                             const QString& message) {
    QtMessageHook* hook = g_hook;
    if (!hook || !hook->installed_) {
        forwardTo(nullptr, {Value(message.toStdString())});
        return;
    }
    DispatchScope scope(type, context);
    const Handler handler = hook->installed_;
    (*handler)({Value(message.toStdString())});
}

Handler QtMessageHook::wrapForeign(QtMessageHandler fn) const {
    for (const auto& entry : foreign_) {
        if (entry.first == fn)
            return entry.second;
    }
    Handler h = makeHandler([fn](const std::vector<Value>& args) { forwardTo(fn, args); });
    foreign_.emplace_back(fn, h);
    return h;
}

Handler QtMessageHook::current() const {
    const QtMessageHandler live = peekHandler();
    if (live == &QtMessageHook::dispatch)
        return installed_;
    return wrapForeign(live);
}

void QtMessageHook::install(Handler handler) {
    if (!handler) {
        installed_.reset();
        qInstallMessageHandler(nullptr);
        return;
    }
    for (const auto& entry : foreign_) {
        if (entry.second == handler) {
            installed_.reset();
            qInstallMessageHandler(entry.first);
            qCDebug(lsQt) << "restored previous Qt message handler";
            return;
        }
    }
    // Adapter logging must reach the foreign handler, not the wrapper, so it
    // is written while that handler is still live.
    if (peekHandler() != &QtMessageHook::dispatch)
        qCDebug(lsQt) << "scrubbing Qt message handler installed";
    installed_ = std::move(handler);
    qInstallMessageHandler(&QtMessageHook::dispatch);
}

void QtMessageHook::fallback(const std::vector<Value>& args) {
    forwardTo(nullptr, args);
}

void registerQtMessageHook(Diagnostics& diagnostics, const std::string& id) {
    diagnostics.registerHook(id, std::make_unique<QtMessageHook>());
}

} // namespace logscrubber
