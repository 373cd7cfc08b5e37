#include "common/time_utils.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>

namespace focuslens {

namespace {

QDateTime toLocalDateTime(std::chrono::system_clock::time_point timestamp)
{
    const qint64 msecs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             timestamp.time_since_epoch())
                             .count();
    return QDateTime::fromMSecsSinceEpoch(msecs).toLocalTime();
}

std::chrono::system_clock::time_point fromDateTime(const QDateTime &dt)
{
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{dt.toMSecsSinceEpoch()}};
}

} // namespace

std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

int localHour(std::chrono::system_clock::time_point timestamp)
{
    return toLocalDateTime(timestamp).time().hour();
}

int localWeekday(std::chrono::system_clock::time_point timestamp)
{
    // QDate::dayOfWeek() is Monday = 1 ... Sunday = 7.
    return toLocalDateTime(timestamp).date().dayOfWeek() - 1;
}

int localMonth(std::chrono::system_clock::time_point timestamp)
{
    return toLocalDateTime(timestamp).date().month();
}

std::string localDateKey(std::chrono::system_clock::time_point timestamp)
{
    return toLocalDateTime(timestamp).date().toString(QStringLiteral("yyyy-MM-dd")).toStdString();
}

std::string isoWeekKey(std::chrono::system_clock::time_point timestamp)
{
    const QDate date = toLocalDateTime(timestamp).date();
    int year = 0;
    const int week = date.weekNumber(&year);
    return QStringLiteral("%1-W%2")
        .arg(year)
        .arg(week, 2, 10, QLatin1Char('0'))
        .toStdString();
}

std::chrono::system_clock::time_point startOfLocalDay(
    std::chrono::system_clock::time_point timestamp)
{
    const QDate date = toLocalDateTime(timestamp).date();
    return fromDateTime(QDateTime(date, QTime(0, 0)));
}

std::chrono::system_clock::time_point startOfLocalWeek(
    std::chrono::system_clock::time_point timestamp)
{
    const QDate date = toLocalDateTime(timestamp).date();
    return fromDateTime(QDateTime(date.addDays(1 - date.dayOfWeek()), QTime(0, 0)));
}

std::chrono::system_clock::time_point startOfLocalMonth(
    std::chrono::system_clock::time_point timestamp)
{
    const QDate date = toLocalDateTime(timestamp).date();
    return fromDateTime(QDateTime(QDate(date.year(), date.month(), 1), QTime(0, 0)));
}

std::chrono::system_clock::time_point addLocalDays(
    std::chrono::system_clock::time_point timestamp, int days)
{
    const QDate date = toLocalDateTime(timestamp).date();
    return fromDateTime(QDateTime(date.addDays(days), QTime(0, 0)));
}

std::chrono::system_clock::time_point daysBefore(
    std::chrono::system_clock::time_point timestamp, long long days)
{
    constexpr long long kMaxDays = 36500;
    const long long clamped = std::clamp(days, 0LL, kMaxDays);
    return timestamp - std::chrono::hours(24) * clamped;
}

std::chrono::system_clock::time_point fromLocalDateTime(int year, int month, int day,
                                                        int hour, int minute,
                                                        int second)
{
    return fromDateTime(QDateTime(QDate(year, month, day), QTime(hour, minute, second)));
}

bool parseDateOrTimestamp(const std::string &value,
                          std::chrono::system_clock::time_point *out)
{
    const QString text = QString::fromStdString(value).trimmed();
    const QDate date = QDate::fromString(text, QStringLiteral("yyyy-MM-dd"));
    if (date.isValid()) {
        if (out) {
            *out = fromDateTime(QDateTime(date, QTime(0, 0)));
        }
        return true;
    }

    QDateTime dt = QDateTime::fromString(text, Qt::ISODate);
    if (!dt.isValid()) {
        return false;
    }
    if (out) {
        *out = fromDateTime(dt);
    }
    return true;
}

double minutesBetween(std::chrono::system_clock::time_point from,
                      std::chrono::system_clock::time_point to)
{
    return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

} // namespace focuslens
