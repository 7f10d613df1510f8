#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <QUuid>
#include <memory>

#include "version.h"

#include "tempo/core/AppContext.hpp"
#include "tempo/core/Errors.hpp"
#include "tempo/data/AuditLog.hpp"
#include "tempo/data/EventRepository.hpp"
#include "tempo/engine/SchedulingEngine.hpp"
#include "tempo/temporal/TaskExtractor.hpp"
#include "tempo/temporal/TemporalResolver.hpp"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

// Accepts an ISO date-time or a bare ISO date (midnight in zone).
QDateTime parseInstant(const QString &value, const QTimeZone &zone)
{
    QDateTime instant = QDateTime::fromString(value, Qt::ISODate);
    if (instant.isValid()) {
        if (instant.timeSpec() == Qt::LocalTime) {
            instant = QDateTime(instant.date(), instant.time(), zone);
        }
        return instant;
    }
    const QDate date = QDate::fromString(value, Qt::ISODate);
    if (!date.isValid()) {
        throw tempo::core::ValidationError(QObject::tr("Cannot read date \"%1\"").arg(value));
    }
    return QDateTime(date, QTime(0, 0), zone);
}

QUuid parseId(const QString &value)
{
    const QUuid id = QUuid::fromString(value.startsWith('{') ? value : QStringLiteral("{%1}").arg(value));
    if (id.isNull()) {
        throw tempo::core::ValidationError(QObject::tr("Invalid event id \"%1\"").arg(value));
    }
    return id;
}

QString formatEvent(const tempo::data::CalendarEvent &event, const QTimeZone &zone)
{
    return QStringLiteral("%1  %2 - %3  [%4]%5  %6")
        .arg(event.id.toString(QUuid::WithoutBraces))
        .arg(event.start.toTimeZone(zone).toString(QStringLiteral("yyyy-MM-dd hh:mm")))
        .arg(event.end.toTimeZone(zone).toString(QStringLiteral("hh:mm")))
        .arg(event.category)
        .arg(event.flexible ? QString() : QStringLiteral(" fixed"))
        .arg(event.title);
}

void printResult(const tempo::engine::ResolutionResult &result, const QTimeZone &zone)
{
    for (const auto &event : result.events) {
        QString marker;
        if (result.wasMoved(event.id)) {
            marker = QStringLiteral(" (moved)");
        } else if (result.isUnresolved(event.id)) {
            marker = QStringLiteral(" (unresolved)");
        }
        out() << formatEvent(event, zone) << marker << '\n';
    }
    if (result.hasUnresolved()) {
        err() << QObject::tr("%n event(s) still conflict and need attention", nullptr,
                             static_cast<int>(result.unresolved.size()))
              << '\n';
    }
}

int run(const QCommandLineParser &parser, tempo::core::AppContext &context, const QString &owner)
{
    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0);
    const QTimeZone zone = context.settings().timeZone();
    auto &engine = context.engine();

    if (command == QLatin1String("resolve")) {
        const tempo::temporal::TemporalResolver resolver(zone);
        for (const auto &range : resolver.resolve(args.mid(1).join(' '))) {
            out() << range.start.toString(Qt::ISODate) << " / " << range.end.toString(Qt::ISODate) << '\n';
        }
        return 0;
    }

    if (command == QLatin1String("add")) {
        const QString text = args.mid(1).join(' ');
        const tempo::temporal::TaskExtractor extractor;
        if (extractor.isAmbiguous(text)) {
            err() << QObject::tr("Please describe the event in more detail") << '\n';
            return 1;
        }
        const tempo::temporal::TemporalResolver resolver(zone);
        const auto ranges = resolver.resolve(text);
        if (ranges.empty()) {
            err() << QObject::tr("No date or time found in \"%1\"").arg(text) << '\n';
            return 1;
        }
        const QString category = parser.isSet(QStringLiteral("category"))
            ? parser.value(QStringLiteral("category"))
            : extractor.extractCategory(text).value_or(context.settings().studyCategory);
        for (const auto &range : ranges) {
            tempo::data::CalendarEvent event;
            event.owner = owner;
            event.title = extractor.extractTitle(text);
            event.category = category;
            event.start = range.start;
            event.end = range.end;
            event.flexible = !parser.isSet(QStringLiteral("fixed"));
            printResult(engine.scheduleEvent(event), zone);
        }
        return 0;
    }

    if (command == QLatin1String("list")) {
        std::vector<tempo::data::CalendarEvent> events;
        if (parser.isSet(QStringLiteral("from")) && parser.isSet(QStringLiteral("to"))) {
            tempo::engine::EventQuery query;
            query.owner = owner;
            query.window = { parseInstant(parser.value(QStringLiteral("from")), zone),
                             parseInstant(parser.value(QStringLiteral("to")), zone) };
            query.category = parser.value(QStringLiteral("category"));
            events = engine.queryEvents(query);
        } else {
            events = context.eventRepository().fetchAll(owner);
        }
        for (const auto &event : events) {
            out() << formatEvent(event, zone) << '\n';
        }
        return 0;
    }

    if (command == QLatin1String("optimize")) {
        if (!parser.isSet(QStringLiteral("from")) || !parser.isSet(QStringLiteral("to"))) {
            err() << QObject::tr("optimize needs --from and --to") << '\n';
            return 1;
        }
        const tempo::data::TimeRange window{ parseInstant(parser.value(QStringLiteral("from")), zone),
                                             parseInstant(parser.value(QStringLiteral("to")), zone) };
        printResult(engine.optimize(owner, window), zone);
        return 0;
    }

    if (command == QLatin1String("study")) {
        const auto exam = context.eventRepository().findById(parseId(args.value(1)));
        if (!exam || exam->owner != owner) {
            err() << QObject::tr("No such event: %1").arg(args.value(1)) << '\n';
            return 1;
        }
        for (const auto &session : engine.createExamStudySessions(*exam)) {
            out() << formatEvent(session, zone) << '\n';
        }
        return 0;
    }

    if (command == QLatin1String("delete")) {
        std::vector<QUuid> ids;
        for (const QString &value : args.mid(1)) {
            ids.push_back(parseId(value));
        }
        const int removed = ids.size() == 1 ? (engine.deleteEvent(owner, ids.front()) ? 1 : 0)
                                            : engine.bulkDelete(owner, ids);
        out() << QObject::tr("%n event(s) deleted", nullptr, removed) << '\n';
        return 0;
    }

    if (command == QLatin1String("history")) {
        for (const auto &record : context.auditLog().records(owner)) {
            out() << record.timestamp.toTimeZone(zone).toString(Qt::ISODate) << "  "
                  << tempo::data::auditActionToString(record.action) << "  "
                  << QJsonDocument(record.details).toJson(QJsonDocument::Compact) << '\n';
        }
        return 0;
    }

    err() << QObject::tr("Unknown command \"%1\"").arg(command) << '\n';
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Tempo"));
    QCoreApplication::setApplicationName(QStringLiteral("tempo"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTempoVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Priority aware calendar scheduling"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QObject::tr("resolve | add | list | optimize | study | delete | history"));
    parser.addOptions({
        { QStringLiteral("owner"), QObject::tr("Calendar owner."), QStringLiteral("name"),
          qEnvironmentVariable("USER", QStringLiteral("default")) },
        { QStringLiteral("config"), QObject::tr("Settings file (INI)."), QStringLiteral("file") },
        { QStringLiteral("storage"), QObject::tr("Calendar file."), QStringLiteral("file") },
        { QStringLiteral("timezone"), QObject::tr("IANA time zone id."), QStringLiteral("zone") },
        { QStringLiteral("category"), QObject::tr("Event category."), QStringLiteral("name") },
        { QStringLiteral("fixed"), QObject::tr("The new event may not be moved.") },
        { QStringLiteral("from"), QObject::tr("Window start (ISO date or date-time)."), QStringLiteral("when") },
        { QStringLiteral("to"), QObject::tr("Window end (ISO date or date-time)."), QStringLiteral("when") },
    });
    parser.process(app);

    if (parser.positionalArguments().isEmpty()) {
        parser.showHelp(1);
    }

    try {
        std::unique_ptr<QSettings> settingsStore = parser.isSet(QStringLiteral("config"))
            ? std::make_unique<QSettings>(parser.value(QStringLiteral("config")), QSettings::IniFormat)
            : std::make_unique<QSettings>();
        tempo::core::SchedulerSettings settings = tempo::core::SchedulerSettings::load(*settingsStore);
        if (parser.isSet(QStringLiteral("timezone"))) {
            settings.timeZoneId = parser.value(QStringLiteral("timezone"));
        }
        if (parser.isSet(QStringLiteral("storage"))) {
            settings.storagePath = parser.value(QStringLiteral("storage"));
        }
        settings.validate();

        tempo::core::AppContext context(std::move(settings));
        return run(parser, context, parser.value(QStringLiteral("owner")));
    } catch (const tempo::core::SchedulingError &error) {
        err() << error.message() << '\n';
        return 1;
    }
}
