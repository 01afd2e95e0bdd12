#include "pickcal/Logger.h"

#include <QDateTime>
#include <QDebug>
#include <utility>

namespace pickcal {

namespace {

QString prefix(QtMsgType type)
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz") +
           QStringLiteral(" [") + Logger::levelToken(type) + QStringLiteral("] ");
}

} // namespace

Logger::Sink Logger::s_sink;
std::mutex Logger::s_mutex;

QString Logger::levelToken(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtWarningMsg:
        return QStringLiteral("WARNING");
    case QtCriticalMsg:
    case QtFatalMsg:
        return QStringLiteral("ERROR");
    case QtInfoMsg:
    default:
        return QStringLiteral("INFO");
    }
}

void Logger::info(const QString &message)
{
    write(QtInfoMsg, message);
}

void Logger::warning(const QString &message)
{
    write(QtWarningMsg, message);
}

void Logger::error(const QString &message)
{
    write(QtCriticalMsg, message);
}

void Logger::write(QtMsgType type, const QString &message)
{
    const QString text = prefix(type) + message;
    switch (type) {
    case QtWarningMsg:
        qWarning().noquote() << text;
        break;
    case QtCriticalMsg:
    case QtFatalMsg:
        qCritical().noquote() << text;
        break;
    default:
        qInfo().noquote() << text;
        break;
    }

    // The sink is invoked outside the lock so it may log on its own.
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        sink = s_sink;
    }
    if (sink) {
        sink(type, message);
    }
}

void Logger::setSink(Sink sink)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_sink = std::move(sink);
}

void Logger::clearSink()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_sink = nullptr;
}

} // namespace pickcal
