#include <QtTest/QtTest>

#include <QSettings>
#include <QStandardPaths>

#include "headsup/core/AppContext.hpp"
#include "headsup/core/Preferences.hpp"
#include "headsup/core/Scheduler.hpp"
#include "headsup/core/SnoozeController.hpp"
#include "headsup/core/SyncCoordinator.hpp"
#include "headsup/data/InMemoryEventRepository.hpp"
#include "support/RecordingGateway.hpp"

using namespace headsup::core;
using headsup::data::InMemoryEventRepository;
using headsup::data::MeetingEvent;
using headsup::test::RecordingGateway;

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();

    void startSchedulesRepositoryEvents();
    void timingChangesReachScheduler();
    void snoozePreferenceReachesController();
    void syncSettingsReachCoordinator();
};

void AppContextTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QCoreApplication::setOrganizationName(QStringLiteral("HeadsUpTests"));
    QCoreApplication::setApplicationName(QStringLiteral("AppContextTest"));
}

void AppContextTest::init()
{
    QSettings settings;
    settings.clear();
    settings.sync();
}

void AppContextTest::startSchedulesRepositoryEvents()
{
    auto repository = std::make_unique<InMemoryEventRepository>();
    MeetingEvent event;
    event.id = QStringLiteral("e1");
    event.title = QStringLiteral("Retro");
    event.start = QDateTime::currentDateTimeUtc().addSecs(3600);
    event.end = event.start.addSecs(1800);
    repository->addEvent(event);

    RecordingGateway gateway;
    AppContext context(std::move(repository), gateway);
    context.start();

    QVERIFY(context.syncCoordinator().isRunning());
    QCOMPARE(context.scheduler().state(), Scheduler::State::Scheduled);
    QVERIFY(context.scheduler().hasEvent(QStringLiteral("e1")));
    QVERIFY(context.eventRepository().findById(QStringLiteral("e1")).has_value());

    context.stop();
    QVERIFY(!context.syncCoordinator().isRunning());
    QCOMPARE(context.scheduler().state(), Scheduler::State::Stopped);
}

void AppContextTest::timingChangesReachScheduler()
{
    RecordingGateway gateway;
    AppContext context(std::make_unique<InMemoryEventRepository>(), gateway);
    QVERIFY(context.scheduler().timingPreferences() == context.preferences().timing());

    context.preferences().setOverlayMinutesBefore(9);
    context.preferences().setAutoJoin(true);
    QCOMPARE(context.scheduler().timingPreferences().defaultMinutes, 9);
    QVERIFY(context.scheduler().timingPreferences().autoJoinEnabled);
}

void AppContextTest::snoozePreferenceReachesController()
{
    RecordingGateway gateway;
    AppContext context(std::make_unique<InMemoryEventRepository>(), gateway);
    QVERIFY(context.snoozeController().isSnoozeAllowed());

    context.preferences().setAllowSnooze(false);
    QVERIFY(!context.snoozeController().isSnoozeAllowed());
}

void AppContextTest::syncSettingsReachCoordinator()
{
    RecordingGateway gateway;
    AppContext context(std::make_unique<InMemoryEventRepository>(), gateway);
    QCOMPARE(context.syncCoordinator().intervalSeconds(), 60);

    context.start();
    QSignalSpy synced(&context.syncCoordinator(), &SyncCoordinator::synced);
    context.preferences().setSyncIntervalSeconds(300);
    QCOMPARE(context.syncCoordinator().intervalSeconds(), 300);
    QCOMPARE(synced.count(), 1);
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
