#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace focuslens::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Debug lines are dropped unless tracing is enabled.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local session id stamped on every line, so events handled for one
// focus session can be grepped together.
void setSessionId(const QString &sessionId);
QString currentSessionId();

class SessionScope {
public:
    explicit SessionScope(const QString &sessionId);
    explicit SessionScope(const std::string &sessionId);
    ~SessionScope();

    SessionScope(const SessionScope &) = delete;
    SessionScope &operator=(const SessionScope &) = delete;

private:
    QString m_prev;
};

// One JSON object per line.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString logsDirPath();

} // namespace focuslens::logging

#define FLOG_DEBUG(component, where, what, ctxJson) \
    ::focuslens::logging::logEvent(::focuslens::logging::LogLevel::Debug, \
                                   QStringLiteral(component), QStringLiteral(where), \
                                   QStringLiteral(what), (ctxJson))

#define FLOG_INFO(component, where, what, ctxJson) \
    ::focuslens::logging::logEvent(::focuslens::logging::LogLevel::Info, \
                                   QStringLiteral(component), QStringLiteral(where), \
                                   QStringLiteral(what), (ctxJson))

#define FLOG_WARN(component, where, what, ctxJson) \
    ::focuslens::logging::logEvent(::focuslens::logging::LogLevel::Warn, \
                                   QStringLiteral(component), QStringLiteral(where), \
                                   QStringLiteral(what), (ctxJson))

#define FLOG_ERROR(component, where, what, ctxJson) \
    ::focuslens::logging::logEvent(::focuslens::logging::LogLevel::Error, \
                                   QStringLiteral(component), QStringLiteral(where), \
                                   QStringLiteral(what), (ctxJson))
