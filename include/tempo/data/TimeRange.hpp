#pragma once

#include <QDateTime>
#include <QMetaType>

namespace tempo {
namespace data {

// Half-open interval [start, end) between two zone-aware instants.
struct TimeRange
{
    QDateTime start;
    QDateTime end;

    bool isValid() const { return start.isValid() && end.isValid() && start < end; }
    qint64 durationSecs() const { return start.secsTo(end); }
    bool overlaps(const TimeRange &other) const { return start < other.end && other.start < end; }

    bool operator==(const TimeRange &other) const { return start == other.start && end == other.end; }
    bool operator!=(const TimeRange &other) const { return !(*this == other); }
};

} // namespace data
} // namespace tempo

Q_DECLARE_METATYPE(tempo::data::TimeRange)
