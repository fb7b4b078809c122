#pragma once

namespace headsup {
namespace core {

// Snapshot of the alert timing settings, already validated by Preferences.
struct TimingPreferences
{
    int defaultMinutes = 5;
    bool useLengthBasedTiming = false;
    int shortMeetingMinutes = 1;
    int mediumMeetingMinutes = 2;
    int longMeetingMinutes = 5;
    bool soundEnabled = false;
    int soundMinutes = 1;
    bool autoJoinEnabled = false;

    bool operator==(const TimingPreferences &other) const
    {
        return defaultMinutes == other.defaultMinutes
            && useLengthBasedTiming == other.useLengthBasedTiming
            && shortMeetingMinutes == other.shortMeetingMinutes
            && mediumMeetingMinutes == other.mediumMeetingMinutes
            && longMeetingMinutes == other.longMeetingMinutes
            && soundEnabled == other.soundEnabled
            && soundMinutes == other.soundMinutes
            && autoJoinEnabled == other.autoJoinEnabled;
    }
    bool operator!=(const TimingPreferences &other) const { return !(*this == other); }
};

} // namespace core
} // namespace headsup
