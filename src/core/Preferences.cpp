#include "headsup/core/Preferences.hpp"

#include "headsup/Logging.hpp"

#include <QSettings>
#include <QtGlobal>

namespace headsup {
namespace core {

namespace {
const QString kOverlayMinutesKey = QStringLiteral("alerts/overlayMinutesBefore");
const QString kDefaultAlertMinutesKey = QStringLiteral("alerts/defaultAlertMinutes");
const QString kLengthBasedKey = QStringLiteral("alerts/useLengthBasedTiming");
const QString kShortMinutesKey = QStringLiteral("alerts/shortMeetingMinutes");
const QString kMediumMinutesKey = QStringLiteral("alerts/mediumMeetingMinutes");
const QString kLongMinutesKey = QStringLiteral("alerts/longMeetingMinutes");
const QString kPlaySoundKey = QStringLiteral("alerts/playSound");
const QString kAutoJoinKey = QStringLiteral("alerts/autoJoin");
const QString kAllowSnoozeKey = QStringLiteral("alerts/allowSnooze");
const QString kSyncIntervalKey = QStringLiteral("sync/intervalSeconds");
const QString kIncludeAllDayKey = QStringLiteral("sync/includeAllDayEvents");
const QString kLookAheadKey = QStringLiteral("sync/lookAheadDays");

constexpr int kMinAlertMinutes = 0;
constexpr int kMaxAlertMinutes = 60;
} // namespace

Preferences::Preferences(QObject *parent)
    : QObject(parent)
{
    reload();
}

int Preferences::overlayMinutesBefore() const
{
    return m_overlayMinutesBefore;
}

void Preferences::setOverlayMinutesBefore(int minutes)
{
    if (storeInt(kOverlayMinutesKey, m_overlayMinutesBefore, minutes, 1, kMaxAlertMinutes)) {
        emit alertTimingChanged();
    }
}

int Preferences::defaultAlertMinutes() const
{
    return m_defaultAlertMinutes;
}

void Preferences::setDefaultAlertMinutes(int minutes)
{
    if (storeInt(kDefaultAlertMinutesKey, m_defaultAlertMinutes, minutes, kMinAlertMinutes, kMaxAlertMinutes)) {
        emit alertTimingChanged();
    }
}

bool Preferences::useLengthBasedTiming() const
{
    return m_useLengthBasedTiming;
}

void Preferences::setUseLengthBasedTiming(bool enabled)
{
    if (storeBool(kLengthBasedKey, m_useLengthBasedTiming, enabled)) {
        emit alertTimingChanged();
    }
}

int Preferences::shortMeetingMinutes() const
{
    return m_shortMeetingMinutes;
}

void Preferences::setShortMeetingMinutes(int minutes)
{
    if (storeInt(kShortMinutesKey, m_shortMeetingMinutes, minutes, kMinAlertMinutes, kMaxAlertMinutes)) {
        emit alertTimingChanged();
    }
}

int Preferences::mediumMeetingMinutes() const
{
    return m_mediumMeetingMinutes;
}

void Preferences::setMediumMeetingMinutes(int minutes)
{
    if (storeInt(kMediumMinutesKey, m_mediumMeetingMinutes, minutes, kMinAlertMinutes, kMaxAlertMinutes)) {
        emit alertTimingChanged();
    }
}

int Preferences::longMeetingMinutes() const
{
    return m_longMeetingMinutes;
}

void Preferences::setLongMeetingMinutes(int minutes)
{
    if (storeInt(kLongMinutesKey, m_longMeetingMinutes, minutes, kMinAlertMinutes, kMaxAlertMinutes)) {
        emit alertTimingChanged();
    }
}

bool Preferences::playSound() const
{
    return m_playSound;
}

void Preferences::setPlaySound(bool enabled)
{
    if (storeBool(kPlaySoundKey, m_playSound, enabled)) {
        emit alertTimingChanged();
    }
}

bool Preferences::autoJoin() const
{
    return m_autoJoin;
}

void Preferences::setAutoJoin(bool enabled)
{
    if (storeBool(kAutoJoinKey, m_autoJoin, enabled)) {
        emit alertTimingChanged();
    }
}

bool Preferences::allowSnooze() const
{
    return m_allowSnooze;
}

void Preferences::setAllowSnooze(bool allowed)
{
    if (storeBool(kAllowSnoozeKey, m_allowSnooze, allowed)) {
        emit snoozeAllowedChanged(m_allowSnooze);
    }
}

int Preferences::syncIntervalSeconds() const
{
    return m_syncIntervalSeconds;
}

void Preferences::setSyncIntervalSeconds(int seconds)
{
    if (storeInt(kSyncIntervalKey, m_syncIntervalSeconds, seconds, 30, 3600)) {
        emit syncSettingsChanged();
    }
}

bool Preferences::includeAllDayEvents() const
{
    return m_includeAllDayEvents;
}

void Preferences::setIncludeAllDayEvents(bool include)
{
    if (storeBool(kIncludeAllDayKey, m_includeAllDayEvents, include)) {
        emit syncSettingsChanged();
    }
}

int Preferences::lookAheadDays() const
{
    return m_lookAheadDays;
}

void Preferences::setLookAheadDays(int days)
{
    if (storeInt(kLookAheadKey, m_lookAheadDays, days, 1, 31)) {
        emit syncSettingsChanged();
    }
}

TimingPreferences Preferences::timing() const
{
    TimingPreferences timing;
    timing.defaultMinutes = m_overlayMinutesBefore;
    timing.useLengthBasedTiming = m_useLengthBasedTiming;
    timing.shortMeetingMinutes = m_shortMeetingMinutes;
    timing.mediumMeetingMinutes = m_mediumMeetingMinutes;
    timing.longMeetingMinutes = m_longMeetingMinutes;
    timing.soundEnabled = m_playSound;
    timing.soundMinutes = m_defaultAlertMinutes;
    timing.autoJoinEnabled = m_autoJoin;
    return timing;
}

void Preferences::reload()
{
    QSettings settings;
    const TimingPreferences before = timing();
    const int syncInterval = m_syncIntervalSeconds;
    const bool includeAllDay = m_includeAllDayEvents;
    const int lookAhead = m_lookAheadDays;
    const bool allowSnooze = m_allowSnooze;

    auto clamped = [&settings](const QString &key, int fallback, int minimum, int maximum) {
        const int stored = settings.value(key, fallback).toInt();
        const int value = qBound(minimum, stored, maximum);
        if (value != stored) {
            qCWarning(HEADSUP_PREFS_LOG) << "Preferences::reload:" << key << "=" << stored << "out of range, using" << value;
        }
        return value;
    };

    m_overlayMinutesBefore = clamped(kOverlayMinutesKey, 5, 1, kMaxAlertMinutes);
    m_defaultAlertMinutes = clamped(kDefaultAlertMinutesKey, 1, kMinAlertMinutes, kMaxAlertMinutes);
    m_useLengthBasedTiming = settings.value(kLengthBasedKey, false).toBool();
    m_shortMeetingMinutes = clamped(kShortMinutesKey, 1, kMinAlertMinutes, kMaxAlertMinutes);
    m_mediumMeetingMinutes = clamped(kMediumMinutesKey, 2, kMinAlertMinutes, kMaxAlertMinutes);
    m_longMeetingMinutes = clamped(kLongMinutesKey, 5, kMinAlertMinutes, kMaxAlertMinutes);
    m_playSound = settings.value(kPlaySoundKey, true).toBool();
    m_autoJoin = settings.value(kAutoJoinKey, false).toBool();
    m_allowSnooze = settings.value(kAllowSnoozeKey, true).toBool();
    m_syncIntervalSeconds = clamped(kSyncIntervalKey, 60, 30, 3600);
    m_includeAllDayEvents = settings.value(kIncludeAllDayKey, false).toBool();
    m_lookAheadDays = clamped(kLookAheadKey, 7, 1, 31);

    if (timing() != before) {
        emit alertTimingChanged();
    }
    if (syncInterval != m_syncIntervalSeconds || includeAllDay != m_includeAllDayEvents || lookAhead != m_lookAheadDays) {
        emit syncSettingsChanged();
    }
    if (allowSnooze != m_allowSnooze) {
        emit snoozeAllowedChanged(m_allowSnooze);
    }
}

bool Preferences::storeInt(const QString &key, int &member, int value, int minimum, int maximum)
{
    const int validated = qBound(minimum, value, maximum);
    if (validated != value) {
        qCWarning(HEADSUP_PREFS_LOG) << "Preferences:" << key << "=" << value << "out of range, clamped to" << validated;
    }
    if (validated == member) {
        return false;
    }
    member = validated;
    QSettings settings;
    settings.setValue(key, validated);
    return true;
}

bool Preferences::storeBool(const QString &key, bool &member, bool value)
{
    if (value == member) {
        return false;
    }
    member = value;
    QSettings settings;
    settings.setValue(key, value);
    return true;
}

} // namespace core
} // namespace headsup
