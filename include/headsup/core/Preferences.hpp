#pragma once

#include <QObject>
#include <QString>

#include "headsup/core/TimingPreferences.hpp"

namespace headsup {
namespace core {

/**
 * User preferences, persisted with QSettings.
 *
 * Every value is clamped to its valid range on load and on set, so consumers
 * such as the scheduler only ever see validated snapshots.
 */
class Preferences : public QObject
{
    Q_OBJECT

public:
    explicit Preferences(QObject *parent = nullptr);

    int overlayMinutesBefore() const;
    void setOverlayMinutesBefore(int minutes);
    int defaultAlertMinutes() const;
    void setDefaultAlertMinutes(int minutes);
    bool useLengthBasedTiming() const;
    void setUseLengthBasedTiming(bool enabled);
    int shortMeetingMinutes() const;
    void setShortMeetingMinutes(int minutes);
    int mediumMeetingMinutes() const;
    void setMediumMeetingMinutes(int minutes);
    int longMeetingMinutes() const;
    void setLongMeetingMinutes(int minutes);
    bool playSound() const;
    void setPlaySound(bool enabled);
    bool autoJoin() const;
    void setAutoJoin(bool enabled);
    bool allowSnooze() const;
    void setAllowSnooze(bool allowed);

    int syncIntervalSeconds() const;
    void setSyncIntervalSeconds(int seconds);
    bool includeAllDayEvents() const;
    void setIncludeAllDayEvents(bool include);
    int lookAheadDays() const;
    void setLookAheadDays(int days);

    TimingPreferences timing() const;

    // Re-reads all values from QSettings, emitting change signals as needed.
    void reload();

signals:
    void alertTimingChanged();
    void syncSettingsChanged();
    void snoozeAllowedChanged(bool allowed);

private:
    bool storeInt(const QString &key, int &member, int value, int minimum, int maximum);
    bool storeBool(const QString &key, bool &member, bool value);

    int m_overlayMinutesBefore = 5;
    int m_defaultAlertMinutes = 1;
    bool m_useLengthBasedTiming = false;
    int m_shortMeetingMinutes = 1;
    int m_mediumMeetingMinutes = 2;
    int m_longMeetingMinutes = 5;
    bool m_playSound = true;
    bool m_autoJoin = false;
    bool m_allowSnooze = true;
    int m_syncIntervalSeconds = 60;
    bool m_includeAllDayEvents = false;
    int m_lookAheadDays = 7;
};

} // namespace core
} // namespace headsup
