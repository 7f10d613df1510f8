#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QUuid>

#include "tempo/data/TimeRange.hpp"

namespace tempo {
namespace data {

struct CalendarEvent
{
    QUuid id = QUuid::createUuid();
    QString owner;
    QString title;
    QString description;
    QString category;
    QDateTime start;
    QDateTime end;
    bool flexible = true; // false: never moved by conflict resolution
    bool completed = false;
    QString externalId; // remote calendar reference, empty until synced

    TimeRange range() const { return { start, end }; }
    qint64 durationSecs() const { return start.secsTo(end); }
    bool hasValidRange() const { return start.isValid() && end.isValid() && end > start; }
    bool overlaps(const CalendarEvent &other) const { return start < other.end && other.start < end; }
};

} // namespace data
} // namespace tempo

Q_DECLARE_METATYPE(tempo::data::CalendarEvent)
