#include "tempo/temporal/TemporalResolver.hpp"

#include "tempo/core/Errors.hpp"
#include "tempo/core/Logging.hpp"

#include <QObject>
#include <QRegularExpression>
#include <QStringList>
#include <QtGlobal>
#include <algorithm>
#include <array>

namespace tempo {
namespace temporal {

namespace {

struct WeekdayName
{
    const char *name;
    int day;
};

// Longer spellings first so the alternation prefers them.
constexpr std::array<WeekdayName, 17> WEEKDAY_NAMES = { {
    { "monday", 1 },
    { "mon", 1 },
    { "tuesday", 2 },
    { "tues", 2 },
    { "tue", 2 },
    { "wednesday", 3 },
    { "wed", 3 },
    { "thursday", 4 },
    { "thurs", 4 },
    { "thur", 4 },
    { "thu", 4 },
    { "friday", 5 },
    { "fri", 5 },
    { "saturday", 6 },
    { "sat", 6 },
    { "sunday", 7 },
    { "sun", 7 },
} };

struct DayPart
{
    const char *word;
    int hour;
};

constexpr std::array<DayPart, 4> DAY_PARTS = { {
    { "morning", 9 },
    { "afternoon", 14 },
    { "evening", 18 },
    { "night", 20 },
} };

constexpr int DEFAULT_HOUR = 14;
constexpr int TONIGHT_THRESHOLD_HOUR = 18;
constexpr int TONIGHT_HOUR = 20;

QString weekdayAlternation()
{
    QStringList names;
    for (const auto &entry : WEEKDAY_NAMES) {
        names << QString::fromLatin1(entry.name);
    }
    return names.join('|');
}

QRegularExpression pattern(const QString &source)
{
    return QRegularExpression(source, QRegularExpression::CaseInsensitiveOption);
}

const QRegularExpression &nowPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\b(right now|currently|now)\\b"));
    return re;
}

const QRegularExpression &todayPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\btoday\\b"));
    return re;
}

const QRegularExpression &tonightPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\btonight\\b"));
    return re;
}

const QRegularExpression &tomorrowPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\btomorrow\\b"));
    return re;
}

const QRegularExpression &nextWeekdayPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\bnext\\s+(%1)\\b").arg(weekdayAlternation()));
    return re;
}

const QRegularExpression &thisWeekdayPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\bthis\\s+(%1)\\b").arg(weekdayAlternation()));
    return re;
}

const QRegularExpression &weekdayPairPattern()
{
    static const QRegularExpression re =
        pattern(QStringLiteral("\\b(%1)\\s+and\\s+(%1)\\b").arg(weekdayAlternation()));
    return re;
}

const QRegularExpression &weekdayPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\b(%1)\\b").arg(weekdayAlternation()));
    return re;
}

const QRegularExpression &inDaysPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\bin\\s+(\\d+)\\s+days?\\b"));
    return re;
}

const QRegularExpression &inWeeksPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\bin\\s+(\\d+)\\s+weeks?\\b"));
    return re;
}

const QRegularExpression &nextWeekPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\bnext\\s+week\\b"));
    return re;
}

const QRegularExpression &atClockPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\bat\\s+(\\d{1,2})(?::(\\d{2}))?\\s*(am|pm)\\b"));
    return re;
}

const QRegularExpression &meridiemPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("(?:\\bat\\s+)?\\b(\\d{1,2})(?::(\\d{2}))?\\s*(am|pm)\\b"));
    return re;
}

const QRegularExpression &twentyFourHourPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("\\b([01]?\\d|2[0-3]):([0-5]\\d)\\b"));
    return re;
}

const QRegularExpression &hoursPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("(?:for\\s+)?\\b(\\d+(?:\\.\\d+)?)\\s*(?:hours?|hrs?)\\b"));
    return re;
}

const QRegularExpression &minutesPattern()
{
    static const QRegularExpression re = pattern(QStringLiteral("(?:for\\s+)?\\b(\\d+)\\s*(?:minutes?|mins?)\\b"));
    return re;
}

} // namespace

TemporalResolver::TemporalResolver(const QTimeZone &timeZone, const QDateTime &reference)
    : m_timeZone(timeZone)
{
    if (!reference.isValid()) {
        m_reference = QDateTime::currentDateTimeUtc().toTimeZone(m_timeZone);
    } else if (reference.timeSpec() == Qt::LocalTime) {
        m_reference = QDateTime(reference.date(), reference.time(), m_timeZone);
    } else {
        m_reference = reference.toTimeZone(m_timeZone);
    }
}

std::vector<data::TimeRange> TemporalResolver::resolve(const QString &input) const
{
    const QString text = input.toLower();
    const qint64 duration = extractDurationSecs(text);
    const QTime time = extractTimeOfDay(text);
    const QDate today = m_reference.date();

    auto single = [duration](const QDateTime &start) {
        return std::vector<data::TimeRange>{ { start, start.addSecs(duration) } };
    };

    if (nowPattern().match(text).hasMatch()) {
        return single(m_reference);
    }

    if (todayPattern().match(text).hasMatch()) {
        return single(atTime(today, time));
    }

    if (tonightPattern().match(text).hasMatch()) {
        QDateTime start = atTime(today, time);
        if (start.time().hour() < TONIGHT_THRESHOLD_HOUR) {
            start = atTime(today, QTime(TONIGHT_HOUR, 0));
        }
        return single(start);
    }

    if (tomorrowPattern().match(text).hasMatch()) {
        return single(atTime(today.addDays(1), time));
    }

    QRegularExpressionMatch match = nextWeekdayPattern().match(text);
    if (match.hasMatch()) {
        return single(atTime(nextWeekday(*weekdayFromName(match.captured(1))), time));
    }

    match = thisWeekdayPattern().match(text);
    if (match.hasMatch()) {
        return single(atTime(thisWeekday(*weekdayFromName(match.captured(1))), time));
    }

    match = weekdayPairPattern().match(text);
    if (match.hasMatch()) {
        return weekdaySpan(*weekdayFromName(match.captured(1)), *weekdayFromName(match.captured(2)), time,
                           duration);
    }

    match = weekdayPattern().match(text);
    if (match.hasMatch()) {
        return single(atTime(nextWeekday(*weekdayFromName(match.captured(1))), time));
    }

    match = inDaysPattern().match(text);
    if (match.hasMatch()) {
        return single(atTime(today.addDays(match.captured(1).toLongLong()), time));
    }

    match = inWeeksPattern().match(text);
    if (match.hasMatch()) {
        return single(atTime(today.addDays(7 * match.captured(1).toLongLong()), time));
    }

    if (nextWeekPattern().match(text).hasMatch()) {
        return single(atTime(today.addDays(7), time));
    }

    if (atClockPattern().match(text).hasMatch()) {
        QDateTime start = atTime(today, time);
        if (start < m_reference) {
            start = atTime(today.addDays(1), time);
        }
        return single(start);
    }

    qCDebug(lcTemporal) << "no temporal pattern in" << input;
    return {};
}

const QTimeZone &TemporalResolver::timeZone() const
{
    return m_timeZone;
}

const QDateTime &TemporalResolver::reference() const
{
    return m_reference;
}

qint64 TemporalResolver::extractDurationSecs(const QString &text)
{
    // Clamped in floating point so oversized figures never overflow qint64.
    auto toSecs = [](double amount, double unitSecs) -> qint64 {
        if (!(amount > 0.0)) {
            return 0;
        }
        return qRound64(std::min(amount * unitSecs, static_cast<double>(MAX_DURATION_SECS)));
    };

    const QRegularExpressionMatch hours = hoursPattern().match(text);
    if (hours.hasMatch()) {
        const qint64 secs = toSecs(hours.captured(1).toDouble(), 3600.0);
        if (secs > 0) {
            return secs;
        }
    }

    const QRegularExpressionMatch minutes = minutesPattern().match(text);
    if (minutes.hasMatch()) {
        const qint64 secs = toSecs(minutes.captured(1).toDouble(), 60.0);
        if (secs > 0) {
            return secs;
        }
    }

    return DEFAULT_DURATION_SECS;
}

QTime TemporalResolver::extractTimeOfDay(const QString &text)
{
    auto clocks = meridiemPattern().globalMatch(text);
    while (clocks.hasNext()) {
        const QRegularExpressionMatch clock = clocks.next();
        int hour = clock.captured(1).toInt();
        const int minute = clock.captured(2).isEmpty() ? 0 : clock.captured(2).toInt();
        if (hour < 1 || hour > 12 || minute > 59) {
            continue;
        }
        const bool pm = clock.captured(3).compare(QLatin1String("pm"), Qt::CaseInsensitive) == 0;
        if (pm && hour != 12) {
            hour += 12;
        } else if (!pm && hour == 12) {
            hour = 0;
        }
        return QTime(hour, minute);
    }

    const QRegularExpressionMatch twentyFour = twentyFourHourPattern().match(text);
    if (twentyFour.hasMatch()) {
        return QTime(twentyFour.captured(1).toInt(), twentyFour.captured(2).toInt());
    }

    for (const auto &part : DAY_PARTS) {
        if (text.contains(QLatin1String(part.word), Qt::CaseInsensitive)) {
            return QTime(part.hour, 0);
        }
    }
    return QTime(DEFAULT_HOUR, 0);
}

std::optional<int> TemporalResolver::weekdayFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    for (const auto &entry : WEEKDAY_NAMES) {
        if (normalized == QLatin1String(entry.name)) {
            return entry.day;
        }
    }
    return std::nullopt;
}

QDateTime TemporalResolver::atTime(const QDate &date, const QTime &time) const
{
    QDateTime result(date, time, m_timeZone);
    if (!result.isValid()) {
        // Wall clock skipped by a daylight-saving jump.
        result = QDateTime(date, time.addSecs(60 * 60), m_timeZone);
    }
    return result;
}

QDate TemporalResolver::nextWeekday(int weekday) const
{
    const QDate today = m_reference.date();
    int daysAhead = weekday - today.dayOfWeek();
    if (daysAhead <= 0) {
        daysAhead += 7;
    }
    return today.addDays(daysAhead);
}

QDate TemporalResolver::thisWeekday(int weekday) const
{
    const QDate today = m_reference.date();
    int daysAhead = weekday - today.dayOfWeek();
    if (daysAhead < 0) {
        daysAhead += 7;
    }
    return today.addDays(daysAhead);
}

std::vector<data::TimeRange> TemporalResolver::weekdaySpan(int firstWeekday, int secondWeekday, const QTime &time,
                                                           qint64 durationSecs) const
{
    const QDate first = nextWeekday(firstWeekday);
    if (firstWeekday == secondWeekday) {
        const QDateTime start = atTime(first, time);
        return { { start, start.addSecs(durationSecs) } };
    }

    QDate last = nextWeekday(secondWeekday);
    if (last <= first) {
        last = last.addDays(7);
    }

    std::vector<data::TimeRange> ranges;
    for (QDate day = first; day <= last; day = day.addDays(1)) {
        const QDateTime start = atTime(day, time);
        ranges.push_back({ start, start.addSecs(durationSecs) });
    }
    return ranges;
}

std::vector<data::TimeRange> resolve(const QString &text, const QString &timeZoneId, const QDateTime &reference)
{
    const QTimeZone timeZone(timeZoneId.toUtf8());
    if (!timeZone.isValid()) {
        throw core::ValidationError(QObject::tr("Unknown time zone '%1'").arg(timeZoneId));
    }
    return TemporalResolver(timeZone, reference).resolve(text);
}

} // namespace temporal
} // namespace tempo
