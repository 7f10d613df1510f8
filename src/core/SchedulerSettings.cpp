#include "tempo/core/SchedulerSettings.hpp"

#include "tempo/core/Errors.hpp"

#include <QObject>
#include <QSettings>

namespace tempo {
namespace core {

namespace {
constexpr int MAX_STUDY_SESSIONS = 7;

data::CategoryTable loadCategories(QSettings &settings)
{
    const int size = settings.beginReadArray(QStringLiteral("categories"));
    std::vector<data::Category> categories;
    categories.reserve(static_cast<size_t>(size));
    for (int i = 0; i < size; ++i) {
        settings.setArrayIndex(i);
        data::Category category;
        category.name = settings.value(QStringLiteral("name")).toString();
        category.priority = settings.value(QStringLiteral("priority")).toInt();
        category.color = settings.value(QStringLiteral("color")).toString();
        category.description = settings.value(QStringLiteral("description")).toString();
        categories.push_back(std::move(category));
    }
    settings.endArray();
    if (categories.empty()) {
        return data::CategoryTable::defaultHierarchy();
    }
    return data::CategoryTable(std::move(categories));
}
} // namespace

QTimeZone SchedulerSettings::timeZone() const
{
    return QTimeZone(timeZoneId.toUtf8());
}

void SchedulerSettings::validate() const
{
    if (!timeZone().isValid()) {
        throw ValidationError(QObject::tr("Unknown time zone '%1'").arg(timeZoneId));
    }
    if (searchHorizonDays <= 0) {
        throw ValidationError(QObject::tr("Search horizon must be at least one day"));
    }
    if (studySessionCount < 1 || studySessionCount > MAX_STUDY_SESSIONS) {
        throw ValidationError(QObject::tr("Study session count must be between 1 and %1").arg(MAX_STUDY_SESSIONS));
    }
    if (studySessionMinutes <= 0) {
        throw ValidationError(QObject::tr("Study session duration must be positive"));
    }
    if (studySessionHour < 0 || studySessionHour > 23) {
        throw ValidationError(QObject::tr("Study session hour %1 is out of range").arg(studySessionHour));
    }
    if (!categories.contains(studyCategory)) {
        throw ValidationError(QObject::tr("Study category '%1' is not configured").arg(studyCategory));
    }
    if (!categories.contains(examCategory)) {
        throw ValidationError(QObject::tr("Exam category '%1' is not configured").arg(examCategory));
    }
}

SchedulerSettings SchedulerSettings::load(QSettings &settings)
{
    SchedulerSettings result;
    settings.beginGroup(QStringLiteral("scheduler"));
    result.timeZoneId = settings.value(QStringLiteral("timeZone"), result.timeZoneId).toString();
    result.searchHorizonDays = settings.value(QStringLiteral("searchHorizonDays"), result.searchHorizonDays).toInt();
    result.studySessionCount = settings.value(QStringLiteral("studySessionCount"), result.studySessionCount).toInt();
    result.studySessionMinutes = settings.value(QStringLiteral("studySessionMinutes"), result.studySessionMinutes).toInt();
    result.studySessionHour = settings.value(QStringLiteral("studySessionHour"), result.studySessionHour).toInt();
    result.studyCategory = settings.value(QStringLiteral("studyCategory"), result.studyCategory).toString();
    result.examCategory = settings.value(QStringLiteral("examCategory"), result.examCategory).toString();
    result.storagePath = settings.value(QStringLiteral("storagePath"), result.storagePath).toString();
    result.categories = loadCategories(settings);
    settings.endGroup();

    result.validate();
    return result;
}

void SchedulerSettings::save(QSettings &settings) const
{
    settings.beginGroup(QStringLiteral("scheduler"));
    settings.setValue(QStringLiteral("timeZone"), timeZoneId);
    settings.setValue(QStringLiteral("searchHorizonDays"), searchHorizonDays);
    settings.setValue(QStringLiteral("studySessionCount"), studySessionCount);
    settings.setValue(QStringLiteral("studySessionMinutes"), studySessionMinutes);
    settings.setValue(QStringLiteral("studySessionHour"), studySessionHour);
    settings.setValue(QStringLiteral("studyCategory"), studyCategory);
    settings.setValue(QStringLiteral("examCategory"), examCategory);
    settings.setValue(QStringLiteral("storagePath"), storagePath);

    const auto &list = categories.categories();
    settings.beginWriteArray(QStringLiteral("categories"), static_cast<int>(list.size()));
    for (int i = 0; i < static_cast<int>(list.size()); ++i) {
        settings.setArrayIndex(i);
        const auto &category = list[static_cast<size_t>(i)];
        settings.setValue(QStringLiteral("name"), category.name);
        settings.setValue(QStringLiteral("priority"), category.priority);
        settings.setValue(QStringLiteral("color"), category.color);
        settings.setValue(QStringLiteral("description"), category.description);
    }
    settings.endArray();
    settings.endGroup();
}

} // namespace core
} // namespace tempo
