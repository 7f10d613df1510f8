#include "tempo/engine/StudySessionGenerator.hpp"

#include "tempo/core/Errors.hpp"

#include <QObject>

namespace tempo {
namespace engine {

namespace {
constexpr int MAX_SESSIONS = 7;
}

StudySessionGenerator::StudySessionGenerator(const core::SchedulerSettings &settings)
    : m_settings(settings)
{
}

std::vector<data::CalendarEvent> StudySessionGenerator::generate(const data::CalendarEvent &exam) const
{
    return generate(exam, m_settings.studySessionCount, m_settings.studySessionMinutes);
}

std::vector<data::CalendarEvent> StudySessionGenerator::generate(const data::CalendarEvent &exam, int count,
                                                                 int durationMinutes) const
{
    if (!exam.hasValidRange()) {
        throw core::ValidationError(QObject::tr("Exam \"%1\" has no valid time range").arg(exam.title));
    }
    if (exam.category.compare(m_settings.examCategory, Qt::CaseInsensitive) != 0) {
        throw core::ValidationError(
            QObject::tr("Event \"%1\" is not in category %2").arg(exam.title, m_settings.examCategory));
    }
    if (count < 1 || count > MAX_SESSIONS) {
        throw core::ValidationError(QObject::tr("Session count must be between 1 and %1").arg(MAX_SESSIONS));
    }
    if (durationMinutes <= 0) {
        throw core::ValidationError(QObject::tr("Session duration must be positive"));
    }

    const QTimeZone zone = m_settings.timeZone();
    const QDate examDate = exam.start.toTimeZone(zone).date();
    const QTime sessionTime(m_settings.studySessionHour, 0);

    std::vector<data::CalendarEvent> sessions;
    sessions.reserve(count);
    for (int i = 0; i < count; ++i) {
        QDateTime start(examDate.addDays(-(count - i)), sessionTime, zone);
        if (!start.isValid()) {
            start = QDateTime(examDate.addDays(-(count - i)), sessionTime.addSecs(3600), zone);
        }

        data::CalendarEvent session;
        session.owner = exam.owner;
        session.title = QStringLiteral("Study for %1").arg(exam.title);
        session.description = QStringLiteral("Preparation session %1 for %2").arg(i + 1).arg(exam.title);
        session.category = m_settings.studyCategory;
        session.start = start;
        session.end = start.addSecs(qint64(durationMinutes) * 60);
        session.flexible = true;
        sessions.push_back(session);
    }
    return sessions;
}

} // namespace engine
} // namespace tempo
