#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <QTimeZone>
#include <optional>
#include <vector>

#include "tempo/data/TimeRange.hpp"

namespace tempo {
namespace temporal {

// Turns phrases such as "next friday at 2pm for 2 hours" or "wednesday and
// thursday evening" into concrete ranges in the user's time zone.
//
// Pattern classes are tried in a fixed order and the first one that matches
// decides the days:
//   now/currently, today, tonight, tomorrow, next <weekday>, this <weekday>,
//   <weekday> and <weekday>, <weekday>, in N days/weeks, next week,
//   at <h>[:mm] am|pm.
// Duration and time of day are extracted independently of the day pattern.
// Text that matches none of them yields an empty result.
class TemporalResolver
{
public:
    static constexpr qint64 DEFAULT_DURATION_SECS = 60 * 60;
    static constexpr qint64 MAX_DURATION_SECS = 7 * 24 * 60 * 60;

    // A reference with Qt::LocalTime spec is read as a wall clock of timeZone.
    explicit TemporalResolver(const QTimeZone &timeZone, const QDateTime &reference = QDateTime());

    std::vector<data::TimeRange> resolve(const QString &text) const;

    const QTimeZone &timeZone() const;
    const QDateTime &reference() const;

    static qint64 extractDurationSecs(const QString &text);
    static QTime extractTimeOfDay(const QString &text);
    // ISO day number (Monday = 1) for a full or abbreviated weekday name.
    static std::optional<int> weekdayFromName(const QString &name);

private:
    QDateTime atTime(const QDate &date, const QTime &time) const;
    QDate nextWeekday(int weekday) const;
    QDate thisWeekday(int weekday) const;
    std::vector<data::TimeRange> weekdaySpan(int firstWeekday, int secondWeekday, const QTime &time,
                                             qint64 durationSecs) const;

    QTimeZone m_timeZone;
    QDateTime m_reference;
};

// Throws core::ValidationError for an unknown time zone id.
std::vector<data::TimeRange> resolve(const QString &text, const QString &timeZoneId,
                                     const QDateTime &reference = QDateTime());

} // namespace temporal
} // namespace tempo
