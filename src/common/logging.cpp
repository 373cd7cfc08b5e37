#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <cstdio>
#include <mutex>

namespace focuslens::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;

thread_local QString t_sessionId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("focuslens")
        : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(logsDirPath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }

    file.write(line);
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_traceEnabled;
}

void setSessionId(const QString &sessionId)
{
    t_sessionId = sessionId;
}

QString currentSessionId()
{
    return t_sessionId;
}

SessionScope::SessionScope(const QString &sessionId)
    : m_prev(t_sessionId)
{
    t_sessionId = sessionId;
}

SessionScope::SessionScope(const std::string &sessionId)
    : SessionScope(QString::fromStdString(sessionId))
{
}

SessionScope::~SessionScope()
{
    t_sessionId = m_prev;
}

QString defaultProcessName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("focuslens");
}

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("FOCUSLENS_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/focuslens/logs");
    }
    return home + QStringLiteral("/.local/share/focuslens/logs");
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context)
{
    QString process;
    bool trace = false;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        trace = g_traceEnabled;
        process = g_processName;
    }
    if (level == LogLevel::Debug && !trace) {
        return;
    }
    if (process.isEmpty()) {
        process = defaultProcessName();
    }

    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"session", t_sessionId.toStdString()},
        {"context", context.is_null() ? nlohmann::json::object() : context}
    };

    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine(logFilePath(process, QStringLiteral(".log")), line);
    if (g_traceEnabled) {
        writeLine(logFilePath(process, QStringLiteral("-trace.log")), line);
    }
}

} // namespace focuslens::logging
