#pragma once

#include <QtGlobal>
#include <QString>
#include <functional>
#include <mutex>

namespace pickcal {

// Process-wide log entry point. Every line is mirrored to the Qt message
// handlers and forwarded to the installed sink (the coordinator's StatusLog).
class Logger {
public:
    static void info(const QString &message);
    static void warning(const QString &message);
    static void error(const QString &message);

    using Sink = std::function<void(QtMsgType, const QString &)>;
    static void setSink(Sink sink);
    static void clearSink();

    static QString levelToken(QtMsgType type);

private:
    static void write(QtMsgType type, const QString &message);

    static Sink s_sink;
    static std::mutex s_mutex;
};

} // namespace pickcal
