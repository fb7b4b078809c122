#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QString>
#include <QTextStream>

#include <cstdio>
#include <memory>

#include "version.h"

#include "headsup/Logging.hpp"
#include "headsup/core/AppContext.hpp"
#include "headsup/core/Preferences.hpp"
#include "headsup/data/FileCalendarStorage.hpp"
#include "headsup/data/FileEventRepository.hpp"
#include "headsup/ui/ConsoleGateway.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("HeadsUp"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("headsup.example.org"));
    QCoreApplication::setApplicationName(QStringLiteral("Heads Up"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kHeadsUpVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Blocking reminders ahead of calendar meetings"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption calendarOption(QStringList{QStringLiteral("c"), QStringLiteral("calendar")},
                                            QObject::tr("iCalendar file to read meetings from."),
                                            QObject::tr("file"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QObject::tr("Enable debug logging."));
    const QCommandLineOption overlayMinutesOption(QStringLiteral("overlay-minutes"),
                                                  QObject::tr("Show the alert this many minutes before a meeting (1-60)."),
                                                  QObject::tr("minutes"));
    const QCommandLineOption soundMinutesOption(QStringLiteral("sound-minutes"),
                                                QObject::tr("Sound alert this many minutes before a meeting (0-60)."),
                                                QObject::tr("minutes"));
    const QCommandLineOption lengthBasedOption(QStringLiteral("length-based"),
                                               QObject::tr("Pick the alert time from the meeting length."));
    const QCommandLineOption noSoundOption(QStringLiteral("no-sound"), QObject::tr("Disable sound alerts."));
    const QCommandLineOption autoJoinOption(QStringLiteral("auto-join"),
                                            QObject::tr("Open the meeting link when a meeting starts."));
    parser.addOptions({calendarOption, verboseOption, overlayMinutesOption, soundMinutesOption, lengthBasedOption,
                       noSoundOption, autoJoinOption});
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("headsup.*.debug=true"));
    }

    const QString calendarPath = parser.value(calendarOption);
    if (calendarPath.isEmpty()) {
        qCritical().noquote() << QObject::tr("No calendar given, use --calendar <file.ics>");
        return 1;
    }
    if (!QFileInfo::exists(calendarPath)) {
        qCritical().noquote() << QObject::tr("Calendar file %1 does not exist").arg(calendarPath);
        return 1;
    }

    QTextStream output(stdout);
    headsup::ui::ConsoleGateway gateway(output);

    auto storage = std::make_shared<headsup::data::FileCalendarStorage>(calendarPath);
    headsup::core::AppContext context(std::make_unique<headsup::data::FileEventRepository>(storage), gateway);
    gateway.setSnoozeController(&context.snoozeController());

    auto &preferences = context.preferences();
    if (parser.isSet(overlayMinutesOption)) {
        preferences.setOverlayMinutesBefore(parser.value(overlayMinutesOption).toInt());
    }
    if (parser.isSet(soundMinutesOption)) {
        preferences.setDefaultAlertMinutes(parser.value(soundMinutesOption).toInt());
    }
    if (parser.isSet(lengthBasedOption)) {
        preferences.setUseLengthBasedTiming(true);
    }
    if (parser.isSet(noSoundOption)) {
        preferences.setPlaySound(false);
    }
    if (parser.isSet(autoJoinOption)) {
        preferences.setAutoJoin(true);
    }

    qCInfo(HEADSUP_SYNC_LOG) << "Heads Up" << kHeadsUpVersion << "watching" << calendarPath;
    context.start();
    gateway.listenOnStdin();

    return app.exec();
}
