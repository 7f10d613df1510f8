#pragma once

#include <QString>
#include <QTimeZone>

#include "tempo/data/CategoryTable.hpp"

class QSettings;

namespace tempo {
namespace core {

struct SchedulerSettings
{
    QString timeZoneId = QStringLiteral("UTC");
    int searchHorizonDays = 30;
    int studySessionCount = 3;
    int studySessionMinutes = 120;
    int studySessionHour = 14;
    QString studyCategory = QStringLiteral("Study");
    QString examCategory = QStringLiteral("Exam");
    QString storagePath; // empty: application data location
    data::CategoryTable categories = data::CategoryTable::defaultHierarchy();

    QTimeZone timeZone() const;
    void validate() const;

    static SchedulerSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace tempo
