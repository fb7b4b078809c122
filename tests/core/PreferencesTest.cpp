#include <QtTest/QtTest>

#include <QSettings>
#include <QStandardPaths>

#include "headsup/core/Preferences.hpp"

using namespace headsup::core;

class PreferencesTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();

    void defaults();
    void settersPersist();
    void valuesAreClamped();
    void storedValuesAreClamped();
    void changeSignals();
    void reloadPicksUpExternalChanges();
    void timingSnapshot();
};

void PreferencesTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QCoreApplication::setOrganizationName(QStringLiteral("HeadsUpTests"));
    QCoreApplication::setApplicationName(QStringLiteral("PreferencesTest"));
}

void PreferencesTest::init()
{
    QSettings settings;
    settings.clear();
    settings.sync();
}

void PreferencesTest::defaults()
{
    Preferences prefs;
    QCOMPARE(prefs.overlayMinutesBefore(), 5);
    QCOMPARE(prefs.defaultAlertMinutes(), 1);
    QCOMPARE(prefs.useLengthBasedTiming(), false);
    QCOMPARE(prefs.shortMeetingMinutes(), 1);
    QCOMPARE(prefs.mediumMeetingMinutes(), 2);
    QCOMPARE(prefs.longMeetingMinutes(), 5);
    QCOMPARE(prefs.playSound(), true);
    QCOMPARE(prefs.autoJoin(), false);
    QCOMPARE(prefs.allowSnooze(), true);
    QCOMPARE(prefs.syncIntervalSeconds(), 60);
    QCOMPARE(prefs.includeAllDayEvents(), false);
    QCOMPARE(prefs.lookAheadDays(), 7);
}

void PreferencesTest::settersPersist()
{
    {
        Preferences prefs;
        prefs.setOverlayMinutesBefore(10);
        prefs.setUseLengthBasedTiming(true);
        prefs.setLongMeetingMinutes(8);
        prefs.setAutoJoin(true);
        prefs.setSyncIntervalSeconds(120);
    }

    Preferences reloaded;
    QCOMPARE(reloaded.overlayMinutesBefore(), 10);
    QCOMPARE(reloaded.useLengthBasedTiming(), true);
    QCOMPARE(reloaded.longMeetingMinutes(), 8);
    QCOMPARE(reloaded.autoJoin(), true);
    QCOMPARE(reloaded.syncIntervalSeconds(), 120);
    QCOMPARE(QSettings().value(QStringLiteral("alerts/overlayMinutesBefore")).toInt(), 10);
}

void PreferencesTest::valuesAreClamped()
{
    Preferences prefs;
    prefs.setOverlayMinutesBefore(0);
    QCOMPARE(prefs.overlayMinutesBefore(), 1);
    prefs.setOverlayMinutesBefore(500);
    QCOMPARE(prefs.overlayMinutesBefore(), 60);
    prefs.setDefaultAlertMinutes(-4);
    QCOMPARE(prefs.defaultAlertMinutes(), 0);
    prefs.setSyncIntervalSeconds(5);
    QCOMPARE(prefs.syncIntervalSeconds(), 30);
    prefs.setLookAheadDays(90);
    QCOMPARE(prefs.lookAheadDays(), 31);
}

void PreferencesTest::storedValuesAreClamped()
{
    {
        QSettings settings;
        settings.setValue(QStringLiteral("alerts/overlayMinutesBefore"), 240);
        settings.setValue(QStringLiteral("alerts/shortMeetingMinutes"), -1);
        settings.setValue(QStringLiteral("sync/intervalSeconds"), 1);
    }

    Preferences prefs;
    QCOMPARE(prefs.overlayMinutesBefore(), 60);
    QCOMPARE(prefs.shortMeetingMinutes(), 0);
    QCOMPARE(prefs.syncIntervalSeconds(), 30);
}

void PreferencesTest::changeSignals()
{
    Preferences prefs;
    QSignalSpy timingSpy(&prefs, &Preferences::alertTimingChanged);
    QSignalSpy syncSpy(&prefs, &Preferences::syncSettingsChanged);
    QSignalSpy snoozeSpy(&prefs, &Preferences::snoozeAllowedChanged);

    prefs.setOverlayMinutesBefore(5);
    QCOMPARE(timingSpy.count(), 0);

    prefs.setOverlayMinutesBefore(7);
    prefs.setPlaySound(false);
    QCOMPARE(timingSpy.count(), 2);

    prefs.setLookAheadDays(3);
    prefs.setIncludeAllDayEvents(true);
    QCOMPARE(syncSpy.count(), 2);
    QCOMPARE(timingSpy.count(), 2);

    prefs.setAllowSnooze(false);
    QCOMPARE(snoozeSpy.count(), 1);
    QCOMPARE(snoozeSpy.takeFirst().at(0).toBool(), false);
}

void PreferencesTest::reloadPicksUpExternalChanges()
{
    Preferences prefs;
    QSignalSpy timingSpy(&prefs, &Preferences::alertTimingChanged);
    QSignalSpy syncSpy(&prefs, &Preferences::syncSettingsChanged);

    prefs.reload();
    QCOMPARE(timingSpy.count(), 0);
    QCOMPARE(syncSpy.count(), 0);

    {
        QSettings settings;
        settings.setValue(QStringLiteral("alerts/mediumMeetingMinutes"), 4);
    }
    prefs.reload();
    QCOMPARE(prefs.mediumMeetingMinutes(), 4);
    QCOMPARE(timingSpy.count(), 1);
    QCOMPARE(syncSpy.count(), 0);
}

void PreferencesTest::timingSnapshot()
{
    Preferences prefs;
    prefs.setOverlayMinutesBefore(12);
    prefs.setDefaultAlertMinutes(3);
    prefs.setPlaySound(true);
    prefs.setAutoJoin(true);

    const TimingPreferences timing = prefs.timing();
    QCOMPARE(timing.defaultMinutes, 12);
    QCOMPARE(timing.soundMinutes, 3);
    QCOMPARE(timing.soundEnabled, true);
    QCOMPARE(timing.autoJoinEnabled, true);
    QCOMPARE(timing.useLengthBasedTiming, false);
    QCOMPARE(timing.mediumMeetingMinutes, 2);
}

QTEST_GUILESS_MAIN(PreferencesTest)
#include "PreferencesTest.moc"
